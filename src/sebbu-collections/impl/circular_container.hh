#pragma once

#include <sebbu-collections/array.hh>
#include <sebbu-collections/optional.hh>
#include <sebbu-collections/utility.hh>


/// Mixin implementing the shared "circular buffer over array<optional<T>>" surface area.
///
/// Same CRTP scheme as allocating_container: concrete containers privately inherit it as
/// `sc::circular_container<T, Derived>` and re-expose members via `using`.
/// ringbuffer<T> exposes the failing try_push_* family, devector<T> grows before inserting.
///
/// Layout:
///   _slots is a fixed-length array of optional<T> slots, _head and _tail are positions in it.
///   The live elements are the slots from _head (inclusive) to _tail (exclusive), wrapping around.
///   Slots outside the live range are always empty, so no stale element is kept alive.
///
/// Invariants:
/// - _head == _tail iff the container is empty.
/// - one slot is always held back, so capacity() == slot_count() - 1
///   and wrapped_increment(_tail) == _head iff the container is full.
/// - size() is derived from _head and _tail, never stored.
/// - a container with zero slots (default-constructed ring or moved-from) is empty and full at the same time.
///
/// Iteration:
///   begin() returns a cursor over logical indices [0, size()), end() returns sc::sentinel.
///   Each step is one O(1) operator[] read.
///   Mutating the container while a cursor is outstanding is unsupported and not detected.
template <class T, class ContainerT>
struct sc::circular_container
{
    using container_t = ContainerT;
    using slot_array = sc::array<sc::optional<T>>;

    /// Forward cursor over the logical indices of a circular container.
    template <class ElementT, class ContainerRefT>
    struct index_cursor
    {
        ContainerRefT* container = nullptr;
        isize idx = 0;

        [[nodiscard]] ElementT& operator*() const { return (*container)[idx]; }
        index_cursor& operator++()
        {
            ++idx;
            return *this;
        }
        [[nodiscard]] bool operator!=(sc::sentinel) const { return idx < container->size(); }
        [[nodiscard]] bool operator==(sc::sentinel) const { return idx >= container->size(); }
    };

    using iterator = index_cursor<T, circular_container>;
    using const_iterator = index_cursor<T const, circular_container const>;

    // element access
public:
    /// Returns a reference to the element at logical index i, i.e. slot (head + i) mod slot_count.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i) { return _slots[physical_index_of(i)].value(); }
    [[nodiscard]] T const& operator[](isize i) const { return _slots[physical_index_of(i)].value(); }

    /// Precondition: !empty().
    [[nodiscard]] T& front()
    {
        SC_ASSERT(!empty(), "front() called on empty container");
        return _slots[_head].value();
    }
    [[nodiscard]] T const& front() const
    {
        SC_ASSERT(!empty(), "front() called on empty container");
        return _slots[_head].value();
    }

    /// Precondition: !empty().
    [[nodiscard]] T& back()
    {
        SC_ASSERT(!empty(), "back() called on empty container");
        return _slots[sc::wrapped_decrement(_tail, slot_count())].value();
    }
    [[nodiscard]] T const& back() const
    {
        SC_ASSERT(!empty(), "back() called on empty container");
        return _slots[sc::wrapped_decrement(_tail, slot_count())].value();
    }

    // iterators
public:
    [[nodiscard]] iterator begin() { return iterator{this, 0}; }
    [[nodiscard]] const_iterator begin() const { return const_iterator{this, 0}; }
    [[nodiscard]] sc::sentinel end() const { return {}; }

    // queries
public:
    [[nodiscard]] isize size() const { return _tail >= _head ? _tail - _head : slot_count() - _head + _tail; }
    [[nodiscard]] bool empty() const { return _head == _tail; }

    /// Number of physical slots, including the held-back one.
    [[nodiscard]] isize slot_count() const { return _slots.size(); }

    /// Maximum number of elements storable without reallocation.
    [[nodiscard]] isize capacity() const { return slot_count() == 0 ? 0 : slot_count() - 1; }

    /// True iff no further element fits without reallocation.
    /// Equivalent to size() == capacity().
    [[nodiscard]] bool is_full() const { return slot_count() == 0 || sc::wrapped_increment(_tail, slot_count()) == _head; }

    /// Memory resource of the slot storage (nullptr for the default resource)
    [[nodiscard]] sc::memory_resource const* custom_resource() const { return _slots.custom_resource(); }

    // insertion without growth
public:
    /// Constructs a new element behind the last one.
    /// Precondition: !is_full().
    template <class... Args>
    T& emplace_back_stable(Args&&... args)
    {
        SC_ASSERT(!is_full(), "not enough capacity for emplace_back_stable");
        auto& value = _slots[_tail].emplace(sc::forward<Args>(args)...);
        _tail = sc::wrapped_increment(_tail, slot_count()); // _after_ so exceptions in T(...) leave state valid
        return value;
    }

    /// Constructs a new element in front of the first one.
    /// Precondition: !is_full().
    template <class... Args>
    T& emplace_front_stable(Args&&... args)
    {
        SC_ASSERT(!is_full(), "not enough capacity for emplace_front_stable");
        auto const new_head = sc::wrapped_decrement(_head, slot_count());
        auto& value = _slots[new_head].emplace(sc::forward<Args>(args)...);
        _head = new_head;
        return value;
    }

    /// Appends an element if there is room.
    /// Returns false without any mutation if the container is full.
    template <class... Args>
    [[nodiscard]] bool try_emplace_back(Args&&... args)
    {
        if (is_full())
            return false;

        emplace_back_stable(sc::forward<Args>(args)...);
        return true;
    }

    /// Prepends an element if there is room.
    /// Returns false without any mutation if the container is full.
    template <class... Args>
    [[nodiscard]] bool try_emplace_front(Args&&... args)
    {
        if (is_full())
            return false;

        emplace_front_stable(sc::forward<Args>(args)...);
        return true;
    }

    [[nodiscard]] bool try_push_back(T const& value) { return try_emplace_back(value); }
    [[nodiscard]] bool try_push_back(T&& value) { return try_emplace_back(sc::move(value)); }
    [[nodiscard]] bool try_push_front(T const& value) { return try_emplace_front(value); }
    [[nodiscard]] bool try_push_front(T&& value) { return try_emplace_front(sc::move(value)); }

    /// Appends the elements of source in order until the container is full.
    /// Returns the number of appended elements.
    isize try_push_back_range(sc::span<T const> source)
    {
        isize count = 0;
        for (auto const& v : source)
        {
            if (!try_emplace_back(v))
                break;
            ++count;
        }
        return count;
    }

    /// Prepends the elements of source one by one until the container is full.
    /// The inserted elements end up in reverse order at the front.
    /// Returns the number of prepended elements.
    isize try_push_front_range(sc::span<T const> source)
    {
        isize count = 0;
        for (auto const& v : source)
        {
            if (!try_emplace_front(v))
                break;
            ++count;
        }
        return count;
    }

    // removals
public:
    /// Moves the first element out, or returns sc::nullopt if empty.
    [[nodiscard]] sc::optional<T> try_pop_front()
    {
        if (empty())
            return sc::nullopt;

        auto& slot = _slots[_head];
        sc::optional<T> result = sc::move(slot).value();
        slot.reset();
        _head = sc::wrapped_increment(_head, slot_count());
        return result;
    }

    /// Moves the last element out, or returns sc::nullopt if empty.
    [[nodiscard]] sc::optional<T> try_pop_back()
    {
        if (empty())
            return sc::nullopt;

        auto const new_tail = sc::wrapped_decrement(_tail, slot_count());
        auto& slot = _slots[new_tail];
        sc::optional<T> result = sc::move(slot).value();
        slot.reset();
        _tail = new_tail;
        return result;
    }

    /// Removes and returns the first element.
    /// Precondition: !empty().
    [[nodiscard("use remove_front() if you don't need the return value")]] T pop_front()
    {
        SC_ASSERT(!empty(), "cannot pop from empty container");
        auto& slot = _slots[_head];
        T value = sc::move(slot).value();
        slot.reset();
        _head = sc::wrapped_increment(_head, slot_count());
        return value;
    }

    /// Removes and returns the last element.
    /// Precondition: !empty().
    [[nodiscard("use remove_back() if you don't need the return value")]] T pop_back()
    {
        SC_ASSERT(!empty(), "cannot pop from empty container");
        _tail = sc::wrapped_decrement(_tail, slot_count());
        auto& slot = _slots[_tail];
        T value = sc::move(slot).value();
        slot.reset();
        return value;
    }

    /// Removes the first element.
    /// Precondition: !empty().
    void remove_front()
    {
        SC_ASSERT(!empty(), "cannot remove from empty container");
        _slots[_head].reset();
        _head = sc::wrapped_increment(_head, slot_count());
    }

    /// Removes the last element.
    /// Precondition: !empty().
    void remove_back()
    {
        SC_ASSERT(!empty(), "cannot remove from empty container");
        _tail = sc::wrapped_decrement(_tail, slot_count());
        _slots[_tail].reset();
    }

    /// Destroys all elements, keeps the slot count.
    void clear()
    {
        auto const count = size();
        for (isize i = 0; i < count; ++i)
            _slots[physical_index_of(i)].reset();

        _head = 0;
        _tail = 0;
    }

    // reallocation
public:
    /// Replaces the slot storage by new_slot_count fresh slots (same memory resource).
    /// Live elements are moved over in logical order to physical index 0, 1, ...
    /// If the new storage is too small, only the first new_slot_count - 1 elements are kept.
    /// Afterwards head == 0 and tail == size().
    void reallocate_slots(isize new_slot_count)
    {
        SC_ASSERT(new_slot_count >= 0, "slot count must be non-negative");

        auto new_slots = slot_array::create_defaulted(new_slot_count, _slots.custom_resource());
        auto const keep = sc::min(size(), new_slot_count == 0 ? isize(0) : new_slot_count - 1);

        for (isize i = 0; i < keep; ++i)
            new_slots[i].emplace(sc::move(_slots[physical_index_of(i)]).value());

        _slots = sc::move(new_slots);
        _head = 0;
        _tail = keep;
    }

    // ctors
public:
    /// Creates an empty container_t with slot_count empty slots.
    [[nodiscard]] static container_t create_with_slot_count(isize slot_count, sc::memory_resource const* resource = nullptr)
    {
        SC_ASSERT(slot_count >= 0, "slot count must be non-negative");
        return container_t(slot_array::create_defaulted(slot_count, resource));
    }

    circular_container() = default;
    ~circular_container() = default;

    explicit circular_container(slot_array slots) : _slots(sc::move(slots)) {}

    // deep copy via array
    circular_container(circular_container const&) = default;
    circular_container& operator=(circular_container const&) = default;

    // moved-from containers are empty with zero slots
    circular_container(circular_container&& rhs) noexcept
      : _slots(sc::move(rhs._slots)), _head(sc::exchange(rhs._head, 0)), _tail(sc::exchange(rhs._tail, 0))
    {
    }
    circular_container& operator=(circular_container&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _slots = sc::move(rhs._slots);
            _head = sc::exchange(rhs._head, 0);
            _tail = sc::exchange(rhs._tail, 0);
        }
        return *this;
    }

private:
    [[nodiscard]] isize physical_index_of(isize i) const
    {
        SC_ASSERT(0 <= i && i < size(), "index out of bounds");
        auto const idx = _head + i;
        return idx >= slot_count() ? idx - slot_count() : idx;
    }

    slot_array _slots;
    isize _head = 0;
    isize _tail = 0;
};
