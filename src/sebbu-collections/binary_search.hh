#pragma once

#include <sebbu-collections/fwd.hh>
#include <sebbu-collections/optional.hh>

namespace sc
{
/// Searches a sorted random-access range for an element equivalent to value.
/// Range must provide size() and operator[] (span, array, vector, devector, ringbuffer, ...)
/// and be sorted ascending w.r.t. operator<.
/// Equivalence is !(a < b) && !(b < a), operator== is never used.
///
/// Returns the position of a matching element, or sc::nullopt.
/// If several elements match, any one of their positions may be returned.
///
/// Usage:
///   sc::vector<int> sorted = {1, 3, 5, 7};
///   auto idx = sc::binary_search(sorted, 5); // idx.value() == 2
template <class Range, class T>
[[nodiscard]] constexpr sc::optional<isize> binary_search(Range const& range, T const& value)
{
    static_assert(requires { range[isize(0)] < value; value < range[isize(0)]; }, "elements must be comparable with operator<");

    isize lo = 0;
    isize hi = isize(range.size());
    while (lo < hi)
    {
        auto const mid = lo + (hi - lo) / 2;
        auto const& elem = range[mid];

        if (elem < value)
            lo = mid + 1;
        else if (value < elem)
            hi = mid;
        else
            return mid;
    }
    return sc::nullopt;
}
} // namespace sc
