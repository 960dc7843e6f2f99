#pragma once

#include <sebbu-collections/impl/circular_container.hh>


/// Fixed-capacity circular buffer with O(1) insertion and removal at both ends.
/// Insertion never grows the storage: try_push_* return false once the ring is full.
/// Eviction of old elements is up to the caller (pop_front / try_pop_front).
///
/// Usage:
///   auto ring = sc::ringbuffer<int>::create_with_capacity(64);
///   if (ring.is_full())
///       ring.remove_front(); // drop the oldest sample
///   (void)ring.try_push_back(42);
///   for (auto const& v : ring)
///       consume(v);
///
/// A default-constructed ring has zero slots, every try_push fails.
/// Assign a ring from create_with_capacity to it to make it usable.
template <class T>
struct sc::ringbuffer : private sc::circular_container<T, ringbuffer<T>>
{
    using base = sc::circular_container<T, ringbuffer<T>>;

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
    using base::capacity;        // number of storable elements (fixed)
    using base::custom_resource; // memory resource of the slot storage
    using base::empty;           // check if ring is empty
    using base::is_full;         // check if no further element fits
    using base::size;            // get number of elements
    using base::slot_count;      // number of physical slots, capacity() + 1

    // insertion (fails when full)
public:
    using base::try_emplace_back;     // construct at back, false if full
    using base::try_emplace_front;    // construct at front, false if full
    using base::try_push_back;        // add at back, false if full
    using base::try_push_back_range;  // add at back until full, returns count
    using base::try_push_front;       // add at front, false if full
    using base::try_push_front_range; // add at front until full, returns count

    // removals
public:
    using base::clear;         // destroy all elements, capacity stays
    using base::pop_back;      // remove and return last element (asserts non-empty)
    using base::pop_front;     // remove and return first element (asserts non-empty)
    using base::remove_back;   // remove last element (asserts non-empty)
    using base::remove_front;  // remove first element (asserts non-empty)
    using base::try_pop_back;  // remove and return last element, nullopt if empty
    using base::try_pop_front; // remove and return first element, nullopt if empty

    // capacity
public:
    /// Creates an empty ring that holds up to `size` elements (size + 1 slots).
    /// Precondition: size > 2.
    [[nodiscard]] static ringbuffer create_with_capacity(isize size, sc::memory_resource const* resource = nullptr)
    {
        SC_ASSERT(size > 2, "ringbuffer capacity must be greater than 2");
        return base::create_with_slot_count(size + 1, resource);
    }

    /// Returns a new ring of capacity new_size holding the first min(size(), new_size) elements.
    /// Elements beyond new_size are dropped, oldest are kept.
    /// Precondition: new_size > 2.
    [[nodiscard]] ringbuffer resized(isize new_size) const
    {
        auto result = ringbuffer::create_with_capacity(new_size, custom_resource());
        auto const keep = sc::min(size(), new_size);
        for (isize i = 0; i < keep; ++i)
            result.emplace_back_stable((*this)[i]);
        return result;
    }

    /// In-place version of resized(new_size).
    /// Precondition: new_size > 2.
    void resize(isize new_size)
    {
        SC_ASSERT(new_size > 2, "ringbuffer capacity must be greater than 2");
        base::reallocate_slots(new_size + 1);
    }

    /// Grows the ring so that capacity() >= new_capacity. Never shrinks.
    void reserve(isize new_capacity)
    {
        if (capacity() < new_capacity)
            base::reallocate_slots(new_capacity + 1);
    }

    // ringbuffer has deep-copy value semantics
    ringbuffer() = default;
    ~ringbuffer() = default;
    ringbuffer(ringbuffer&&) = default;
    ringbuffer& operator=(ringbuffer&&) = default;
    ringbuffer(ringbuffer const&) = default;
    ringbuffer& operator=(ringbuffer const&) = default;

    friend base;

private:
    explicit ringbuffer(typename base::slot_array slots) : base(sc::move(slots)) {}
};
