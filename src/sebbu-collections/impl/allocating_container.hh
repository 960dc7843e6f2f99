#pragma once

#include <sebbu-collections/allocation.hh>
#include <sebbu-collections/span.hh>

#include <initializer_list>


/// Shared implementation of the two contiguous containers, array<T> and vector<T>.
///
/// Concrete containers inherit privately and publish the parts that fit their policy:
///
///     template <class T>
///     struct sc::array : private sc::allocating_container<T, array<T>>
///     {
///         using base = sc::allocating_container<T, array<T>>;
///         using base::operator[];
///         using base::create_defaulted;
///         ...
///         friend base;
///     };
///
/// array<T> never changes its size and is the slot storage of the circular containers,
/// vector<T> grows at the back and holds the entries of ticket_map.
///
/// Growth doubles the capacity. The new element is constructed in the new block before the old
/// elements are moved over, so `v.push_back(v.front())` is fine even when it reallocates.
/// A throwing element constructor leaves size() and contents unchanged.
template <class T, class ContainerT>
struct sc::allocating_container
{
    using container_t = ContainerT;

    // access
public:
    [[nodiscard]] T& operator[](isize i)
    {
        SC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        SC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }

    [[nodiscard]] T& front()
    {
        SC_ASSERT(!empty(), "front() called on empty container");
        return _data.obj_start[0];
    }
    [[nodiscard]] T const& front() const
    {
        SC_ASSERT(!empty(), "front() called on empty container");
        return _data.obj_start[0];
    }
    [[nodiscard]] T& back()
    {
        SC_ASSERT(!empty(), "back() called on empty container");
        return _data.obj_end[-1];
    }
    [[nodiscard]] T const& back() const
    {
        SC_ASSERT(!empty(), "back() called on empty container");
        return _data.obj_end[-1];
    }

    /// nullptr while nothing was ever allocated
    [[nodiscard]] T* data() { return _data.obj_start; }
    [[nodiscard]] T const* data() const { return _data.obj_start; }

    [[nodiscard]] T* begin() { return _data.obj_start; }
    [[nodiscard]] T* end() { return _data.obj_end; }
    [[nodiscard]] T const* begin() const { return _data.obj_start; }
    [[nodiscard]] T const* end() const { return _data.obj_end; }

    // size
public:
    [[nodiscard]] isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] bool empty() const { return _data.obj_end == _data.obj_start; }

    /// Elements that push_back can still add without reallocating.
    [[nodiscard]] isize capacity_back() const
    {
        return isize((_data.alloc_end - reinterpret_cast<sc::byte const*>(_data.obj_end)) / isize(sizeof(T)));
    }

    [[nodiscard]] sc::memory_resource const* custom_resource() const { return _data.custom_resource; }

    // back insertion and removal
public:
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        if (capacity_back() == 0) [[unlikely]]
            return emplace_back_reallocating(sc::forward<Args>(args)...);

        auto* const p = new (sc::placement_new, _data.obj_end) T(sc::forward<Args>(args)...);
        ++_data.obj_end;
        return *p;
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(sc::move(value)); }

    [[nodiscard("use remove_back() to drop the element")]] T pop_back()
    {
        SC_ASSERT(!empty(), "cannot pop from empty container");
        T value = sc::move(back());
        remove_back();
        return value;
    }

    void remove_back()
    {
        SC_ASSERT(!empty(), "cannot remove from empty container");
        --_data.obj_end;
        _data.obj_end->~T();
    }

    /// Drops every element matching pred, the survivors keep their order. Returns how many were dropped.
    /// The capacity stays. ticket_map compacts its tombstones with this.
    template <class Pred>
    isize remove_if(Pred&& pred)
    {
        T* kept_end = _data.obj_start;
        for (T* it = _data.obj_start; it != _data.obj_end; ++it)
        {
            if (pred(*it))
                continue;
            if (it != kept_end)
                *kept_end = sc::move(*it);
            ++kept_end;
        }

        auto const dropped = _data.obj_end - kept_end;
        impl::destroy_reverse(kept_end, _data.obj_end);
        _data.obj_end = kept_end;
        return dropped;
    }

    /// Destroys all elements, keeps the block.
    void clear()
    {
        impl::destroy_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    // factories
public:
    /// Adopts the live objects of `data` as the elements.
    [[nodiscard]] static container_t create_from_allocation(sc::allocation<T> data)
    {
        container_t c;
        c._data = sc::move(data);
        return c;
    }

    [[nodiscard]] static container_t create_defaulted(isize size, sc::memory_resource const* resource = nullptr)
    {
        auto data = sc::allocation<T>::create_empty(size, resource);
        impl::append_defaulted(data.obj_end, size);
        return container_t::create_from_allocation(sc::move(data));
    }

    [[nodiscard]] static container_t create_filled(isize size, T const& value, sc::memory_resource const* resource = nullptr)
    {
        auto data = sc::allocation<T>::create_empty(size, resource);
        impl::append_filled(data.obj_end, size, value);
        return container_t::create_from_allocation(sc::move(data));
    }

    [[nodiscard]] static container_t create_copy_of(sc::span<T const> source, sc::memory_resource const* resource = nullptr)
    {
        auto data = sc::allocation<T>::create_empty(source.size(), resource);
        impl::append_copies_of(data.obj_end, source.begin(), source.end());
        return container_t::create_from_allocation(sc::move(data));
    }

    [[nodiscard]] static container_t create_with_capacity(isize capacity, sc::memory_resource const* resource = nullptr)
    {
        return container_t::create_from_allocation(sc::allocation<T>::create_empty(capacity, resource));
    }

    // lifetime
public:
    allocating_container() = default;
    ~allocating_container() = default;

    allocating_container(std::initializer_list<T> elements)
      : _data(copy_elements(sc::span<T const>(elements), nullptr))
    {
    }

    allocating_container(allocating_container&&) = default;
    allocating_container& operator=(allocating_container&&) = default;

    // copies are tight and use the resource of the destination (the source's for copy construction)
    allocating_container(allocating_container const& rhs)
      : _data(copy_elements(sc::span<T const>(rhs.data(), rhs.size()), rhs._data.custom_resource))
    {
    }
    allocating_container& operator=(allocating_container const& rhs)
    {
        if (this != &rhs)
            _data = copy_elements(sc::span<T const>(rhs.data(), rhs.size()), _data.custom_resource);
        return *this;
    }

private:
    [[nodiscard]] static sc::allocation<T> copy_elements(sc::span<T const> source, sc::memory_resource const* resource)
    {
        auto data = sc::allocation<T>::create_empty(source.size(), resource);
        impl::append_copies_of(data.obj_end, source.begin(), source.end());
        return data;
    }

    template <class... Args>
    SC_COLD_FUNC T& emplace_back_reallocating(Args&&... args)
    {
        auto const old_size = size();
        auto grown = sc::allocation<T>::create_empty(sc::max(isize(4), 2 * old_size), _data.custom_resource);

        // new element first, args may refer to one of the elements about to be moved
        grown.obj_start += old_size;
        grown.obj_end = grown.obj_start;
        auto* const p = new (sc::placement_new, grown.obj_end) T(sc::forward<Args>(args)...);
        ++grown.obj_end;

        T* moved_end = reinterpret_cast<T*>(grown.alloc_start);
        impl::append_moved_from(moved_end, _data.obj_start, _data.obj_end);
        grown.obj_start = reinterpret_cast<T*>(grown.alloc_start);

        _data = sc::move(grown); // destroys the moved-from originals and releases the old block
        return *p;
    }

    sc::allocation<T> _data;
};
