#include <sebbu-collections/optional.hh>

#include "check-asserts.hh"

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <type_traits>

// int slots keep rings of ints bytewise copyable
static_assert(std::is_trivially_copyable_v<sc::optional<int>>);
static_assert(!std::is_copy_constructible_v<sc::optional<std::unique_ptr<int>>>);
static_assert(!std::is_convertible_v<std::unique_ptr<int>::pointer, sc::optional<std::unique_ptr<int>>>);

namespace
{
struct counted
{
    static inline int alive = 0;
    int value = 0;

    explicit counted(int v) : value(v) { ++alive; }
    counted(counted const& rhs) : value(rhs.value) { ++alive; }
    counted(counted&& rhs) noexcept : value(rhs.value) { ++alive; }
    counted& operator=(counted const&) = default;
    counted& operator=(counted&&) noexcept = default;
    ~counted() { --alive; }
};

struct throws_on_construction
{
    explicit throws_on_construction(int) { throw 42; }
};
} // namespace

TEST("optional - slot lifecycle")
{
    counted::alive = 0;
    {
        sc::optional<counted> slot;
        CHECK(!slot.has_value());

        auto& v = slot.emplace(1);
        CHECK(v.value == 1);
        CHECK(counted::alive == 1);

        slot.emplace(2); // replaces
        CHECK(slot.value().value == 2);
        CHECK(counted::alive == 1);

        slot.reset();
        slot.reset();
        CHECK(!slot.has_value());
        CHECK(counted::alive == 0);

        slot.emplace(3);
    }
    CHECK(counted::alive == 0);
}

TEST("optional - throwing construction leaves the slot empty")
{
    sc::optional<throws_on_construction> slot;
    auto threw = false;
    try
    {
        slot.emplace(0);
    }
    catch (int)
    {
        threw = true;
    }
    CHECK(threw);
    CHECK(!slot.has_value());
}

TEST("optional - moving a value out of a slot")
{
    sc::optional<std::unique_ptr<int>> slot = std::make_unique<int>(5);

    SECTION("value() on an rvalue moves, the slot stays engaged until reset")
    {
        sc::optional<std::unique_ptr<int>> taken = sc::move(slot).value();
        CHECK(*taken.value() == 5);
        CHECK(slot.has_value());
        CHECK(!slot.value());

        slot.reset();
        CHECK(!slot.has_value());
    }

    SECTION("moving the optional itself empties the source")
    {
        auto moved = sc::move(slot);
        CHECK(moved.has_value());
        CHECK(!slot.has_value());

        sc::optional<std::unique_ptr<int>> target;
        target = sc::move(moved);
        CHECK(target.has_value());
        CHECK(!moved.has_value());
    }
}

TEST("optional - copies")
{
    counted::alive = 0;
    {
        sc::optional<counted> a = counted(1);
        auto b = a;
        b.value().value = 2;
        CHECK(a.value().value == 1);

        sc::optional<counted> c;
        c = b;
        CHECK(c.value().value == 2);

        c = sc::optional<counted>();
        CHECK(!c.has_value());
        CHECK(counted::alive == 2);
    }
    CHECK(counted::alive == 0);
}

TEST("optional - equality")
{
    sc::optional<std::string> const empty = sc::nullopt;
    sc::optional<std::string> const x = std::string("x");

    CHECK(bool(empty == sc::nullopt));
    CHECK(bool(x != sc::nullopt));
    CHECK(bool(x == std::string("x")));
    CHECK(bool(empty != std::string("x")));
    CHECK(bool(x == sc::optional<std::string>(std::string("x"))));
    CHECK(bool(x != empty));
    CHECK(bool(sc::optional<int>() == sc::optional<int>()));
}

TEST("optional - reading an empty slot is misuse")
{
    sc::optional<int> empty;
    sc::optional<int> const cempty = sc::nullopt;
    SC_CHECK_ASSERTS(empty.value());
    SC_CHECK_ASSERTS(cempty.value());
    SC_CHECK_ASSERTS(sc::move(empty).value());
}
