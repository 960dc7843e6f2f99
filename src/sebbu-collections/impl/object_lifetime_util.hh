#pragma once

#include <sebbu-collections/fwd.hh>
#include <sebbu-collections/utility.hh>

#include <cstring>
#include <type_traits>

// Construction helpers for the live window of an allocation.
//
// Every append_* constructs into the uninitialized memory at `end` and bumps `end` right after
// each successful construction. When a constructor throws, [live start, end) is still exactly the
// set of objects that exist, so the owning allocation destroys precisely those.

namespace sc::impl
{
/// Destroys [first, last), last element first.
template <class T>
void destroy_reverse(T* first, T* last)
{
    if constexpr (!std::is_trivially_destructible_v<T>)
        while (last != first)
            (--last)->~T();
}

/// count value-initialized Ts: zeroed ints, empty optional slots.
template <class T>
void append_defaulted(T*& end, isize count)
{
    for (isize i = 0; i < count; ++i, ++end)
        new (sc::placement_new, end) T();
}

/// count copies of value.
template <class T>
void append_filled(T*& end, isize count, T const& value)
{
    for (isize i = 0; i < count; ++i, ++end)
        new (sc::placement_new, end) T(value);
}

/// Copies of [first, last). Trivially copyable Ts are copied in one block.
template <class T>
void append_copies_of(T*& end, T const* first, T const* last)
{
    if constexpr (std::is_trivially_copyable_v<T>)
    {
        if (first != last)
        {
            std::memcpy(static_cast<void*>(end), first, std::size_t(last - first) * sizeof(T));
            end += last - first;
        }
    }
    else
    {
        for (; first != last; ++first, ++end)
            new (sc::placement_new, end) T(*first);
    }
}

/// Move-constructs [first, last) behind end. The moved-from sources stay alive for their owner to destroy.
/// Used when a vector grows, a throwing move constructor leaves the old elements in an unspecified state.
template <class T>
void append_moved_from(T*& end, T* first, T* last)
{
    if constexpr (std::is_trivially_copyable_v<T>)
    {
        append_copies_of(end, static_cast<T const*>(first), static_cast<T const*>(last));
    }
    else
    {
        for (; first != last; ++first, ++end)
            new (sc::placement_new, end) T(sc::move(*first));
    }
}
} // namespace sc::impl
