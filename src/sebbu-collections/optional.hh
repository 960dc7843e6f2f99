#pragma once

#include <sebbu-collections/assert.hh>
#include <sebbu-collections/fwd.hh>
#include <sebbu-collections/utility.hh>

#include <type_traits>

struct sc::nullopt_t
{
    // not default constructible, so `slot = {}` never picks the nullopt overload
    struct make_tag
    {
    };
    explicit constexpr nullopt_t(make_tag) {}
};

namespace sc
{
inline constexpr nullopt_t nullopt{nullopt_t::make_tag{}};
}

/// A T or nothing.
///
/// This is the slot type of every circular container (array<optional<T>>) and of ticket_map
/// entries (an empty entry is a tombstone), and the result of every try_pop / get that may
/// find nothing. Access goes through value() only, which asserts on an empty optional.
///
/// Moving out of a slot is two steps, so the slot stays consistent if T's move throws:
///   T v = sc::move(slot).value(); // slot still engaged, holds a moved-from T
///   slot.reset();
///
/// Move construction and move assignment leave the source empty.
/// optional<T> is trivially copyable whenever T is, so int rings copy their slots bytewise.
template <class T>
struct sc::optional
{
    optional() = default;
    optional(nullopt_t) {}

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& v) // NOLINT
    {
        construct(sc::forward<U>(v));
    }

    // trivial T: everything stays bytewise
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial T
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._engaged)
            construct(rhs._storage.value);
    }
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        take_from(rhs);
    }
    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (!rhs._engaged)
            reset();
        else if (_engaged)
            _storage.value = rhs._storage.value;
        else
            construct(rhs._storage.value);
        return *this;
    }
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            take_from(rhs);
        }
        return *this;
    }
    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

public:
    /// Replaces the content by T(args...) and returns it.
    /// If T(args...) throws, the optional is left empty.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        construct(sc::forward<Args>(args)...);
        return _storage.value;
    }

    void reset()
    {
        if (!_engaged)
            return;
        _storage.value.~T();
        _engaged = false;
    }

    [[nodiscard]] bool has_value() const { return _engaged; }

    [[nodiscard]] T& value() &
    {
        SC_ASSERT(_engaged, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        SC_ASSERT(_engaged, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        SC_ASSERT(_engaged, "value() called on an empty optional");
        return sc::move(_storage.value);
    }

    [[nodiscard]] friend bool operator==(optional const& a, optional const& b)
        requires requires(T const& v) { bool(v == v); }
    {
        if (!a._engaged || !b._engaged)
            return a._engaged == b._engaged;
        return a._storage.value == b._storage.value;
    }
    [[nodiscard]] friend bool operator==(optional const& a, T const& b)
        requires requires(T const& v) { bool(v == v); }
    {
        return a._engaged && a._storage.value == b;
    }
    [[nodiscard]] friend bool operator==(optional const& a, nullopt_t) { return !a._engaged; }

    // optional<int> == true would otherwise compare the contained int
    bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

private:
    template <class... Args>
    void construct(Args&&... args)
    {
        new (sc::placement_new, &_storage.value) T(sc::forward<Args>(args)...);
        _engaged = true; // only after T(...) returned
    }

    void take_from(optional& rhs)
    {
        if (!rhs._engaged)
            return;
        construct(sc::move(rhs._storage.value));
        rhs.reset();
    }

    sc::storage_for<T> _storage;
    bool _engaged = false;
};
