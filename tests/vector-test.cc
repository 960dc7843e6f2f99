#include <sebbu-collections/vector.hh>

#include "check-asserts.hh"
#include "counting-resource.hh"

#include <nexus/test.hh>

#include <memory>
#include <string>

namespace
{
struct tracked
{
    static inline int alive = 0;
    static inline int copies = 0;

    int value = 0;

    explicit tracked(int v) : value(v) { ++alive; }
    tracked(tracked const& rhs) : value(rhs.value)
    {
        ++alive;
        ++copies;
    }
    tracked(tracked&& rhs) noexcept : value(rhs.value) { ++alive; }
    tracked& operator=(tracked const&) = default;
    tracked& operator=(tracked&&) noexcept = default;
    ~tracked() { --alive; }
};
} // namespace

TEST("vector - growth at the back")
{
    SECTION("elements survive reallocation")
    {
        sc::test::counting_resource res;
        {
            auto v = sc::vector<sc::isize>::create_with_capacity(0, &res);
            for (sc::isize i = 0; i < 1000; ++i)
                v.push_back(i * 3);

            REQUIRE(v.size() == 1000);
            auto mismatches = 0;
            for (sc::isize i = 0; i < 1000; ++i)
                if (v[i] != i * 3)
                    ++mismatches;
            CHECK(mismatches == 0);

            // capacity doubles
            CHECK(res.allocations < 12);
            CHECK(v.capacity() >= 1000);
        }
        CHECK(res.balanced());
    }

    SECTION("reserved capacity is used first")
    {
        auto v = sc::vector<std::string>::create_with_capacity(8);
        CHECK(v.empty());
        CHECK(v.capacity_back() == 8);

        auto const* const block = v.data();
        for (auto i = 0; i < 8; ++i)
            v.emplace_back(3, 'a');
        CHECK(v.data() == block);
        CHECK(v.capacity_back() == 0);
    }

    SECTION("pushing a copy of an own element while full")
    {
        sc::vector<std::string> v;
        v.push_back(std::string(50, 'k'));
        while (v.capacity_back() > 0)
            v.push_back("filler");

        v.push_back(v.front());
        CHECK(v.back() == std::string(50, 'k'));
    }

    SECTION("lvalues are copied, rvalues moved")
    {
        tracked::copies = 0;
        sc::vector<tracked> v;
        tracked const t(1);
        v.push_back(t);
        v.push_back(tracked(2));
        CHECK(tracked::copies == 1);
    }

    SECTION("move-only elements")
    {
        sc::vector<std::unique_ptr<int>> v;
        for (auto i = 0; i < 10; ++i)
            v.push_back(std::make_unique<int>(i));
        CHECK(*v[9] == 9);
    }
}

TEST("vector - removal")
{
    SECTION("pop_back and remove_back")
    {
        sc::vector<int> v = {1, 2, 3};
        CHECK(v.pop_back() == 3);
        v.remove_back();
        CHECK(v.size() == 1);
    }

    SECTION("empty vector is misuse")
    {
        sc::vector<int> v;
        SC_CHECK_ASSERTS(v.pop_back());
        SC_CHECK_ASSERTS(v.remove_back());
        SC_CHECK_ASSERTS(v.back());
    }

    SECTION("clear keeps the block")
    {
        tracked::alive = 0;
        {
            sc::vector<tracked> v;
            for (auto i = 0; i < 5; ++i)
                v.emplace_back(i);
            auto const capacity = v.capacity();

            v.clear();
            CHECK(tracked::alive == 0);
            CHECK(v.capacity() == capacity);
        }
        CHECK(tracked::alive == 0);
    }
}

TEST("vector - remove_if compacts in order")
{
    SECTION("tombstone-style compaction")
    {
        tracked::alive = 0;
        {
            sc::vector<tracked> v;
            for (auto i = 0; i < 10; ++i)
                v.emplace_back(i);
            auto const capacity = v.capacity();

            CHECK(v.remove_if([](tracked const& t) { return t.value % 3 != 0; }) == 6);
            REQUIRE(v.size() == 4);
            CHECK(v[0].value == 0);
            CHECK(v[1].value == 3);
            CHECK(v[2].value == 6);
            CHECK(v[3].value == 9);
            CHECK(tracked::alive == 4);
            CHECK(v.capacity() == capacity);
        }
        CHECK(tracked::alive == 0);
    }

    SECTION("nothing and everything")
    {
        sc::vector<int> v = {1, 2};
        CHECK(v.remove_if([](int) { return false; }) == 0);
        CHECK(v.size() == 2);
        CHECK(v.remove_if([](int) { return true; }) == 2);
        CHECK(v.empty());
    }
}

TEST("vector - value semantics")
{
    sc::test::counting_resource res_a;
    sc::test::counting_resource res_b;

    auto lhs = sc::vector<int>::create_filled(3, 1, &res_a);
    auto rhs = sc::vector<int>::create_filled(5, 2, &res_b);
    res_a.reset();
    res_b.reset();

    lhs = rhs;
    CHECK(lhs.size() == 5);
    CHECK(lhs[4] == 2);
    CHECK(lhs.custom_resource() == &res_a); // the target keeps its resource
    CHECK(res_a.allocations == 1);
    CHECK(res_a.deallocations == 1);
    CHECK(res_b.allocations == 0);

    auto const* const block = rhs.data();
    auto moved = sc::move(rhs);
    CHECK(moved.data() == block);
    CHECK(rhs.empty());
}
