#include <sebbu-collections/assert-handler.hh>
#include <sebbu-collections/assert.hh>
#include <sebbu-collections/bitset.hh>
#include <sebbu-collections/devector.hh>
#include <sebbu-collections/ringbuffer.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
// what the recording handler throws to leave the violating call
struct misuse
{
    std::string message;
};

// collects every violation it sees and unwinds out of the failing call
struct recording_handler
{
    std::vector<sc::impl::assertion_info> seen;
    sc::impl::scoped_assertion_handler guard{[this](sc::impl::assertion_info const& info)
                                             {
                                                 seen.push_back(info);
                                                 throw misuse{info.message};
                                             }};

    template <class F>
    bool violates(F&& f)
    {
        try
        {
            f();
        }
        catch (misuse const&)
        {
            return true;
        }
        return false;
    }
};
} // namespace

TEST("assertions - container misuse reaches the handler")
{
    recording_handler handler;
    auto ring = sc::ringbuffer<int>::create_with_capacity(3);

    CHECK(handler.violates([&] { (void)ring.pop_front(); }));
    CHECK(handler.violates([&] { (void)ring.back(); }));
    CHECK(handler.violates([] { (void)sc::ringbuffer<int>::create_with_capacity(2); }));
    CHECK(handler.violates([] { (void)sc::bitset::create(0); }));

    REQUIRE(handler.seen.size() == 4);
    CHECK(handler.seen[0].message == "cannot pop from empty container");
    CHECK(handler.seen[1].message == "back() called on empty container");
    CHECK(handler.seen[2].message == "ringbuffer capacity must be greater than 2");
    CHECK(handler.seen[3].message == "bitset size must be positive");
    CHECK(handler.seen[2].expression.find("size > 2") != std::string::npos);

    // the failed calls did not touch the ring
    CHECK(ring.empty());
    CHECK(ring.try_push_back(5));
    CHECK(ring.pop_front() == 5);
}

TEST("assertions - expected absence is not a violation")
{
    recording_handler handler;
    auto ring = sc::ringbuffer<int>::create_with_capacity(3);
    sc::devector<int> dv;

    CHECK(!handler.violates([&] { (void)ring.try_pop_front(); }));
    CHECK(!handler.violates([&] { (void)dv.try_pop_back(); }));
    CHECK(!handler.violates(
        [&]
        {
            for (auto i = 0; i < 10; ++i)
                (void)ring.try_push_back(i); // fails silently once full
        }));

    CHECK(handler.seen.empty());
    CHECK(ring.size() == 3);
}

TEST("assertions - location of the violation")
{
    recording_handler handler;
    int const line = __LINE__ + 1;
    CHECK(handler.violates([] { SC_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic"); }));

    REQUIRE(handler.seen.size() == 1);
    auto const& where = handler.seen[0].location;
    CHECK(std::string(where.file_name()).ends_with("assert-test.cc"));
    CHECK(int(where.line()) == line);
    CHECK(handler.seen[0].expression == "1 + 1 == 3");
}

TEST("assertions - handlers nest")
{
    std::vector<std::string> order;

    recording_handler outer;
    {
        sc::impl::scoped_assertion_handler inner(
            [&](sc::impl::assertion_info const& info)
            {
                order.push_back("inner: " + info.message);
                throw misuse{info.message};
            });

        CHECK(outer.violates([] { SC_ASSERT_ALWAYS(false, "first"); }));
    }
    CHECK(outer.violates([] { SC_ASSERT_ALWAYS(false, "second"); }));

    REQUIRE(order.size() == 1);
    CHECK(order[0] == "inner: first");
    REQUIRE(outer.seen.size() == 1);
    CHECK(outer.seen[0].message == "second");
}
