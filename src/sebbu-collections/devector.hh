#pragma once

#include <sebbu-collections/impl/circular_container.hh>

#include <cmath>
#include <initializer_list>


/// Growable double-ended array: a circular buffer that grows instead of failing when full.
/// O(1) random access, amortized O(1) push/pop at both ends.
/// Elements are not contiguous (the live range may wrap around the end of the storage).
///
/// Growth: when an insertion finds the storage full, the slot count grows to
/// ceil(growth_factor * slot_count) (at least 2), moving the elements to index 0.
///
/// Usage:
///   sc::devector<int> dv;
///   dv.push_back(1);
///   dv.push_front(0); // dv == [0, 1]
///   auto first = dv.pop_front();
template <class T>
struct sc::devector : private sc::circular_container<T, devector<T>>
{
    using base = sc::circular_container<T, devector<T>>;

    /// Slot count multiplier applied on each growth event
    static constexpr f64 growth_factor = 1.618;

    // element access
public:
    using base::operator[]; // access element by logical index
    using base::back;       // access last element
    using base::front;      // access first element

    // iterators
public:
    using base::begin; // cursor at logical index 0
    using base::end;   // sc::sentinel

    // queries
public:
    using base::capacity;        // elements storable before the next growth
    using base::custom_resource; // memory resource of the slot storage
    using base::empty;           // check if devector is empty
    using base::size;            // get number of elements
    using base::slot_count;      // number of physical slots, capacity() + 1

    // removals
public:
    using base::pop_back;      // remove and return last element (asserts non-empty)
    using base::pop_front;     // remove and return first element (asserts non-empty)
    using base::remove_back;   // remove last element (asserts non-empty)
    using base::remove_front;  // remove first element (asserts non-empty)
    using base::try_pop_back;  // remove and return last element, nullopt if empty
    using base::try_pop_front; // remove and return first element, nullopt if empty

    /// Destroys all elements, keeps the slot count.
    using base::clear;

    /// Destroys all elements and drops back to the initial 2 slots.
    void clear_and_shrink()
    {
        base::clear();
        base::reallocate_slots(2);
    }

    // insertion (never fails)
public:
    /// Appends a new element, growing the storage if necessary.
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        if (base::is_full()) [[unlikely]]
        {
            // args may reference an element that grow() is about to move
            T value(sc::forward<Args>(args)...);
            grow();
            return base::emplace_back_stable(sc::move(value));
        }
        return base::emplace_back_stable(sc::forward<Args>(args)...);
    }

    /// Prepends a new element, growing the storage if necessary.
    template <class... Args>
    T& emplace_front(Args&&... args)
    {
        if (base::is_full()) [[unlikely]]
        {
            T value(sc::forward<Args>(args)...);
            grow();
            return base::emplace_front_stable(sc::move(value));
        }
        return base::emplace_front_stable(sc::forward<Args>(args)...);
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(sc::move(value)); }
    T& push_front(T const& value) { return emplace_front(value); }
    T& push_front(T&& value) { return emplace_front(sc::move(value)); }

    /// Appends all elements of source in order, returns source.size().
    isize push_back_range(sc::span<T const> source)
    {
        for (auto const& v : source)
            emplace_back(v);
        return source.size();
    }

    /// Prepends the elements of source one by one, so they end up reversed at the front.
    /// Returns source.size().
    isize push_front_range(sc::span<T const> source)
    {
        for (auto const& v : source)
            emplace_front(v);
        return source.size();
    }

    // capacity
public:
    /// Grows the storage to exactly new_capacity + 1 slots if capacity() < new_capacity.
    void reserve(isize new_capacity)
    {
        if (capacity() < new_capacity)
            base::reallocate_slots(new_capacity + 1);
    }

    // factories
public:
    /// Creates an empty devector with capacity() >= capacity.
    [[nodiscard]] static devector create_with_capacity(isize capacity, sc::memory_resource const* resource = nullptr)
    {
        SC_ASSERT(capacity >= 0, "capacity must be non-negative");
        return base::create_with_slot_count(sc::max(isize(2), capacity + 1), resource);
    }

    /// Creates a devector holding copies of source, in order.
    [[nodiscard]] static devector create_copy_of(sc::span<T const> source, sc::memory_resource const* resource = nullptr)
    {
        auto result = devector::create_with_capacity(source.size(), resource);
        for (auto const& v : source)
            result.emplace_back_stable(v);
        return result;
    }

    // devector has deep-copy value semantics
    devector() : base(base::slot_array::create_defaulted(2)) {}
    devector(std::initializer_list<T> init) : devector(devector::create_copy_of(sc::span<T const>(init))) {}
    ~devector() = default;
    devector(devector&&) = default;
    devector& operator=(devector&&) = default;
    devector(devector const&) = default;
    devector& operator=(devector const&) = default;

    friend base;

private:
    explicit devector(typename base::slot_array slots) : base(sc::move(slots)) {}

    SC_COLD_FUNC void grow()
    {
        auto const grown = isize(std::ceil(f64(slot_count()) * growth_factor));
        base::reallocate_slots(sc::max(isize(2), grown));
    }
};
