#pragma once

#include <sebbu-collections/assert.hh>
#include <sebbu-collections/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Borrowed view of `size` consecutive Ts, the input type of every range operation
/// (try_push_back_range, push_front_range, ticket_map::push_back_range, the create_copy_of factories).
///
/// Implicit from C arrays, from braced lists (span<T const> only) and from span<U> when only const is added.
/// Explicit from any container with data() and size(), e.g. sc::span<int const>(vec).
///
/// A braced list only lives until the end of the full expression, so
///   ring.try_push_back_range({1, 2, 3});
/// is fine, storing the span is not.
template <class T>
struct sc::span
{
    constexpr span() = default;

    constexpr explicit span(T* first, isize count) : _first(first), _count(count)
    {
        SC_ASSERT(count >= 0, "span size must be non-negative");
    }

    template <std::size_t N>
    constexpr span(T (&elements)[N]) : _first(elements), _count(isize(N))
    {
    }

    constexpr span(std::initializer_list<std::remove_const_t<T>> elements)
        requires std::is_const_v<T>
      : _first(elements.begin()), _count(isize(elements.size()))
    {
    }

    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U (*)[], T (*)[]>)
    constexpr span(span<U> other) : _first(other.data()), _count(other.size())
    {
    }

    template <class Container>
        requires requires(Container& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _first(c.data()), _count(isize(c.size()))
    {
    }

public:
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        SC_ASSERT(0 <= i && i < _count, "index out of bounds");
        return _first[i];
    }
    [[nodiscard]] constexpr T& front() const
    {
        SC_ASSERT(_count > 0, "front() called on empty span");
        return _first[0];
    }
    [[nodiscard]] constexpr T& back() const
    {
        SC_ASSERT(_count > 0, "back() called on empty span");
        return _first[_count - 1];
    }

    [[nodiscard]] constexpr T* data() const { return _first; }
    [[nodiscard]] constexpr isize size() const { return _count; }
    [[nodiscard]] constexpr bool empty() const { return _count == 0; }

    [[nodiscard]] constexpr T* begin() const { return _first; }
    [[nodiscard]] constexpr T* end() const { return _first + _count; }

private:
    T* _first = nullptr;
    isize _count = 0;
};
