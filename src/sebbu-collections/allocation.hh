#pragma once

#include <sebbu-collections/assert.hh>
#include <sebbu-collections/fwd.hh>
#include <sebbu-collections/impl/object_lifetime_util.hh>
#include <sebbu-collections/utility.hh>

/// Where container storage comes from.
/// A plain struct of function pointers, so resources can be constant-initialized globals
/// and containers store a single pointer instead of an allocator template parameter.
///
///   sc::memory_resource const arena_resource = {
///       .allocate_bytes = arena_allocate,
///       .deallocate_bytes = arena_deallocate,
///       .userdata = &arena,
///   };
///   auto samples = sc::ringbuffer<f64>::create_with_capacity(1024, &arena_resource);
///
/// allocate_bytes(0, ...) must return nullptr, any other size a block of at least `alignment`.
/// Running out of memory is not reported back: a resource aborts or throws.
struct sc::memory_resource
{
    sc::byte* (*allocate_bytes)(isize bytes, isize alignment, void* userdata) = nullptr;
    void (*deallocate_bytes)(sc::byte* block, isize bytes, isize alignment, void* userdata) = nullptr;
    void* userdata = nullptr;
};

namespace sc
{
/// Aligned operator new / delete. Used whenever a container was created without a resource.
extern sc::memory_resource const* const default_memory_resource;
}

/// One owned block from a memory_resource plus the window of live Ts inside it.
///
///   alloc_start <= obj_start <= obj_end <= alloc_end
///
/// [alloc_start, alloc_end) is returned to the resource on destruction,
/// [obj_start, obj_end) is destroyed before that, last object first.
/// Owners move obj_end (and obj_start, while a vector regrows) as they construct and destroy objects.
///
/// This is the storage of array<T> and vector<T>, so also of every ring and devector slot array
/// and of ticket_map's entries. map_to_array and parallel_map construct their results directly into one.
template <class T>
struct sc::allocation
{
    T* obj_start = nullptr;
    T* obj_end = nullptr;

    sc::byte* alloc_start = nullptr;
    sc::byte* alloc_end = nullptr;
    isize alignment = 0;

    /// nullptr selects default_memory_resource. Survives moves, so a moved-from container keeps its resource.
    sc::memory_resource const* custom_resource = nullptr;

    [[nodiscard]] sc::memory_resource const& resource() const
    {
        return custom_resource != nullptr ? *custom_resource : *default_memory_resource;
    }

    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Ts that fit between obj_start and the end of the block.
    [[nodiscard]] isize capacity() const { return isize((alloc_end - (sc::byte*)obj_start) / isize(sizeof(T))); }

    /// Room for `count` Ts, none of them alive yet: obj_start == obj_end == alloc_start.
    /// count == 0 never calls the resource.
    [[nodiscard]] static allocation create_empty(isize count, sc::memory_resource const* resource)
    {
        SC_ASSERT(count >= 0, "cannot allocate a negative number of elements");

        allocation result;
        result.custom_resource = resource;
        if (count == 0)
            return result;

        auto const bytes = count * isize(sizeof(T));
        auto const& res = result.resource();
        result.alignment = isize(alignof(T));
        result.alloc_start = res.allocate_bytes(bytes, result.alignment, res.userdata);
        result.alloc_end = result.alloc_start + bytes;
        result.obj_start = reinterpret_cast<T*>(result.alloc_start);
        result.obj_end = result.obj_start;
        return result;
    }

public:
    allocation() = default;
    ~allocation() { release(); }

    // copying needs a policy (which resource, how much room), the containers decide that
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept { steal(rhs); }

    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            // rhs may live inside one of our objects (a nested container), take it before destroying them
            allocation incoming;
            incoming.steal(rhs);
            release();
            steal(incoming);
        }
        return *this;
    }

private:
    void release()
    {
        impl::destroy_reverse(obj_start, obj_end);
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }

    void steal(allocation& rhs)
    {
        obj_start = sc::exchange(rhs.obj_start, nullptr);
        obj_end = sc::exchange(rhs.obj_end, nullptr);
        alloc_start = sc::exchange(rhs.alloc_start, nullptr);
        alloc_end = sc::exchange(rhs.alloc_end, nullptr);
        alignment = sc::exchange(rhs.alignment, 0);
        custom_resource = rhs.custom_resource;
    }
};
