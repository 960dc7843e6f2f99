#pragma once

#include <sebbu-collections/impl/allocating_container.hh>


/// Heap array whose length is fixed when it is created.
/// Ring and devector slots live in an array<optional<T>>, map_to_array and parallel_map return one.
template <class T>
struct sc::array : private sc::allocating_container<T, array<T>>
{
    using base = sc::allocating_container<T, array<T>>;

public:
    using base::operator[];
    using base::back;
    using base::data;
    using base::front;

    using base::begin;
    using base::end;

    using base::custom_resource; // nullptr for the default resource
    using base::empty;
    using base::size;

    // factories
public:
    using base::create_copy_of;
    using base::create_defaulted; // value-initialized, so slot arrays start out empty
    using base::create_filled;
    using base::create_from_allocation;

    using base::allocating_container; // sc::array<int> a = {1, 2, 3};
    array() = default;

    friend base;
};
