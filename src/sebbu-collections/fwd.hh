#pragma once

#include <cstddef>
#include <cstdint>

namespace sc
{
// sizes, logical indices, slot positions and ticket ids are all isize
// (signed, so head - 1 or tail - head on an empty ring needs no special casing)
using i64 = std::int64_t;
using isize = i64;

// bitset words
using u64 = std::uint64_t;

// devector growth factor
using f64 = double;

// raw storage of memory_resource blocks
using byte = std::byte;

// storage
struct memory_resource;
template <class T>
struct allocation;

// views and the slot type
template <class T>
struct span;
struct nullopt_t;
template <class T>
struct optional;

// contiguous containers
template <class T, class ContainerT>
struct allocating_container;
template <class T>
struct array;
template <class T>
struct vector;

// circular containers
template <class T, class ContainerT>
struct circular_container;
template <class T>
struct ringbuffer;
template <class T>
struct devector;

template <class T>
struct ticket_map;
struct bitset;

struct parallel_map_config;
} // namespace sc
