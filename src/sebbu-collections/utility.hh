#pragma once

#include <sebbu-collections/assert.hh>
#include <sebbu-collections/fwd.hh>

#include <type_traits>

// Small building blocks the containers share:
//   move / forward / exchange           value categories without <utility>
//   min / max                           operator< only
//   wrapped_increment / _decrement      slot positions of circular containers
//   int_div_round_up                    word counts (bitset), block counts (parallel_map)
//   placement_new, storage_for<T>       constructing into raw or union storage (allocation, optional)
//   SC_DEFER                            scope-exit actions (joining parallel_map workers)
//   sentinel                            end() of the cursor-based containers

namespace sc
{
template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept
{
    static_assert(!std::is_lvalue_reference_v<T>, "cannot forward an rvalue as an lvalue");
    return static_cast<T&&>(value);
}

/// Stores next in target and returns what target held before.
/// Moved-from containers use it to hand over and reset their cursors:
///   _head(sc::exchange(rhs._head, 0))
template <class T, class U = T>
[[nodiscard]] constexpr T exchange(T& target, U&& next)
{
    T previous = sc::move(target);
    target = sc::forward<U>(next);
    return previous;
}

// on ties, min returns a and max returns b
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return b < a ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return b < a ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Next slot position in a ring of slot_count slots: slot_count - 1 wraps to 0.
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T pos, T slot_count)
{
    SC_ASSERT(slot_count > 0, "a ring needs at least one slot");
    return pos + 1 == slot_count ? T(0) : pos + 1;
}

/// Previous slot position in a ring of slot_count slots: 0 wraps to slot_count - 1.
template <class T>
[[nodiscard]] constexpr T wrapped_decrement(T pos, T slot_count)
{
    SC_ASSERT(slot_count > 0, "a ring needs at least one slot");
    return pos == 0 ? slot_count - 1 : pos - 1;
}

/// ceil(count / per_group) for positive operands, e.g. the number of u64 words for 65 bits is 2.
template <class T>
[[nodiscard]] constexpr T int_div_round_up(T count, T per_group)
{
    SC_ASSERT(count > 0 && per_group > 0, "int_div_round_up expects positive operands");
    return (count - 1) / per_group + 1;
}

// tag that selects the non-allocating operator new below, so the containers need no <new>
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};

/// Raw, correctly aligned room for one T whose lifetime the owner manages by hand.
/// Stays trivially copyable and destructible for trivial T, which keeps optional<int> trivial.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}
    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

/// End marker of the cursor-based iterators (circular containers, ticket_map).
/// Cursors compare against it instead of against a second cursor.
struct sentinel
{
};

namespace impl
{
template <class F>
struct scope_exit
{
    F action;

    ~scope_exit() noexcept(false) { action(); }
};

struct scope_exit_builder
{
    template <class F>
    scope_exit<F> operator->*(F&& action) const
    {
        return scope_exit<F>{sc::forward<F>(action)};
    }
};
} // namespace impl
} // namespace sc

/// Runs the following block when the enclosing scope is left, by return or by exception.
/// Blocks run in reverse order of declaration and capture by reference.
///   SC_DEFER { for (auto& t : helpers) t.join(); };
#define SC_DEFER auto const SC_MACRO_JOIN(_sc_scope_exit_, __COUNTER__) = ::sc::impl::scope_exit_builder{}->*[&]

[[nodiscard]] SC_FORCE_INLINE void* operator new(std::size_t, sc::placement_new_t, void* where) noexcept
{
    return where;
}
// only invoked by the compiler when the constructor of a placement-new expression throws
SC_FORCE_INLINE void operator delete(void*, sc::placement_new_t, void*) noexcept {}
