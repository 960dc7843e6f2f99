#pragma once

#include <sebbu-collections/impl/allocating_container.hh>


/// Heap array that grows at the back.
/// ticket_map keeps its (id, slot) entries in one and compacts them with remove_if.
template <class T>
struct sc::vector : private sc::allocating_container<T, vector<T>>
{
    using base = sc::allocating_container<T, vector<T>>;

public:
    using base::operator[];
    using base::back;
    using base::data;
    using base::front;

    using base::begin;
    using base::end;

    using base::capacity_back; // appends left before the next reallocation
    using base::custom_resource;
    using base::empty;
    using base::size;

    [[nodiscard]] isize capacity() const { return size() + capacity_back(); }

    // modification
public:
    using base::clear; // keeps the capacity
    using base::emplace_back;
    using base::pop_back;
    using base::push_back;
    using base::remove_back;
    using base::remove_if;

    // factories
public:
    using base::create_copy_of;
    using base::create_defaulted;
    using base::create_filled;
    using base::create_from_allocation;
    using base::create_with_capacity; // nothing constructed yet

    using base::allocating_container; // sc::vector<int> v = {1, 2, 3};
    vector() = default;

    friend base;
};
