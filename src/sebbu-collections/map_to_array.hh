#pragma once

#include <sebbu-collections/allocation.hh>
#include <sebbu-collections/array.hh>

#include <type_traits>

namespace sc
{
/// Element type produced by applying F to the elements of Range.
template <class Range, class F>
using mapped_element_t = std::remove_cvref_t<std::invoke_result_t<F&, decltype(std::declval<Range const&>()[isize(0)])>>;

/// Returns an array holding f(range[i]) for every i in [0, range.size()), in order.
/// Range must provide size() and operator[].
/// Results are constructed directly into uninitialized storage, U needs no default constructor.
///
/// If f throws, all results constructed so far are destroyed (in reverse), the storage is
/// released, and the exception propagates unchanged.
///
/// Usage:
///   auto lengths = sc::map_to_array(names, [](std::string const& s) { return isize(s.size()); });
template <class Range, class F, class U = mapped_element_t<Range, F>>
[[nodiscard]] sc::array<U> map_to_array(Range const& range, F&& f, sc::memory_resource const* resource = nullptr)
{
    auto const count = isize(range.size());

    // the live range of `result` grows one element at a time,
    // so an exception in f leaves exactly the constructed prefix for ~allocation to clean up
    auto result = sc::allocation<U>::create_empty(count, resource);
    for (isize i = 0; i < count; ++i)
    {
        new (sc::placement_new, result.obj_end) U(f(range[i]));
        ++result.obj_end;
    }

    return sc::array<U>::create_from_allocation(sc::move(result));
}
} // namespace sc
