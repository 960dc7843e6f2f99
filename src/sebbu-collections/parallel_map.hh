#pragma once

#include <sebbu-collections/allocation.hh>
#include <sebbu-collections/array.hh>
#include <sebbu-collections/map_to_array.hh>
#include <sebbu-collections/vector.hh>

#include <atomic>
#include <exception>
#include <thread>

/// Tuning knobs for sc::parallel_map. Zero selects the default.
struct sc::parallel_map_config
{
    /// Number of workers including the calling thread.
    /// 0: std::thread::hardware_concurrency() (at least 1).
    isize parallelism = 0;

    /// Number of consecutive elements a worker processes per claim.
    /// 0: ceil(size / parallelism), i.e. one block per worker.
    isize block_size = 0;
};


namespace sc::impl
{
/// parallel_map with the helper threads started by spawn(work), which returns a running std::thread
/// or throws. parallel_map passes `std::thread(work)`, which throws std::system_error when the
/// system is out of threads.
///
/// A failed spawn is handled like a throwing f: the threads that did start stop at their next
/// block claim, every result built so far is destroyed, and the spawn exception is rethrown.
template <class Range, class F, class Spawn, class U = mapped_element_t<Range, F>>
[[nodiscard]] sc::array<U> parallel_map_with(Range const& range, F&& f, sc::parallel_map_config config, Spawn&& spawn)
{
    SC_ASSERT(config.parallelism >= 0, "parallelism must be non-negative");
    SC_ASSERT(config.block_size >= 0, "block size must be non-negative");

    auto const count = isize(range.size());
    if (count == 0)
        return {};

    auto parallelism = config.parallelism;
    if (parallelism == 0)
        parallelism = sc::max(isize(1), isize(std::thread::hardware_concurrency()));

    auto const block_size = config.block_size > 0 ? config.block_size : sc::int_div_round_up(count, parallelism);
    auto const block_count = sc::int_div_round_up(count, block_size);
    auto const worker_count = sc::min(parallelism, block_count);

    // blocks finish out of order, so the live range of `result` stays empty until all of them succeeded
    auto result = sc::allocation<U>::create_empty(count, nullptr);
    U* const out = result.obj_start;

    // built[b] counts the constructed results of block b, only the worker that claimed b writes it
    auto built = sc::array<isize>::create_filled(block_count, 0);

    isize next_block = 0;
    bool failed = false;
    std::exception_ptr first_error; // written once by whoever sets `failed`, read after all joins

    auto const record_failure = [&]
    {
        if (!std::atomic_ref<bool>(failed).exchange(true))
            first_error = std::current_exception();
    };

    auto const work = [&]
    {
        while (!std::atomic_ref<bool>(failed).load())
        {
            auto const block = std::atomic_ref<isize>(next_block).fetch_add(1);
            if (block >= block_count)
                return;

            auto const first = block * block_size;
            auto const last = sc::min(first + block_size, count);
            try
            {
                for (auto i = first; i < last; ++i)
                {
                    new (sc::placement_new, out + i) U(f(range[i]));
                    ++built[block];
                }
            }
            catch (...)
            {
                record_failure();
                return;
            }
        }
    };

    {
        auto helpers = sc::vector<std::thread>::create_with_capacity(worker_count - 1);
        SC_DEFER
        {
            for (auto& t : helpers)
                t.join();
        };

        try
        {
            for (isize i = 1; i < worker_count; ++i)
                helpers.push_back(spawn(work));
        }
        catch (...)
        {
            record_failure();
        }

        work(); // returns right away after a failed spawn
    }

    if (first_error)
    {
        for (isize b = 0; b < block_count; ++b)
            impl::destroy_reverse(out + b * block_size, out + b * block_size + built[b]);
        std::rethrow_exception(first_error); // the empty live range leaves ~allocation only the block to free
    }

    result.obj_end = result.obj_start + count;
    return sc::array<U>::create_from_allocation(sc::move(result));
}
} // namespace sc::impl

namespace sc
{
/// map_to_array on several threads: returns an array with f(range[i]) at index i.
///
/// The input is cut into blocks of config.block_size elements. The calling thread and up to
/// parallelism - 1 helper threads keep claiming the next unclaimed block and construct its results
/// in place, so the output is identical to map_to_array(range, f).
/// f runs concurrently and must tolerate that, range is only read.
///
/// If f throws, no further blocks are claimed, all threads are joined, the results built so far are
/// destroyed and the first exception is rethrown. Failing to start a helper thread behaves the same.
///
/// Usage:
///   auto squares = sc::parallel_map(values, [](i64 v) { return v * v; }, {.parallelism = 4, .block_size = 1024});
template <class Range, class F, class U = mapped_element_t<Range, F>>
[[nodiscard]] sc::array<U> parallel_map(Range const& range, F&& f, sc::parallel_map_config config = {})
{
    return impl::parallel_map_with(range, sc::forward<F>(f), config, [](auto& work) { return std::thread(work); });
}
} // namespace sc
