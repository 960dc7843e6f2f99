#pragma once

#include <sebbu-collections/allocation.hh>

#include <new>

namespace sc::test
{
// forwards to aligned operator new and keeps a tally, so tests can see which resource a container
// allocates from and that every block comes back
// a container stores a pointer to its resource, keep the resource alive and in place
struct counting_resource : sc::memory_resource
{
    int allocations = 0;
    int deallocations = 0;
    sc::isize bytes_in_use = 0;

    counting_resource()
    {
        userdata = this;
        allocate_bytes = [](sc::isize bytes, sc::isize alignment, void* self) -> sc::byte*
        {
            if (bytes == 0)
                return nullptr;
            auto& tally = *static_cast<counting_resource*>(self);
            tally.allocations += 1;
            tally.bytes_in_use += bytes;
            return static_cast<sc::byte*>(::operator new(std::size_t(bytes), std::align_val_t(alignment)));
        };
        deallocate_bytes = [](sc::byte* block, sc::isize bytes, sc::isize alignment, void* self)
        {
            auto& tally = *static_cast<counting_resource*>(self);
            tally.deallocations += 1;
            tally.bytes_in_use -= bytes;
            ::operator delete(block, std::align_val_t(alignment));
        };
    }

    counting_resource(counting_resource const&) = delete;
    counting_resource& operator=(counting_resource const&) = delete;

    void reset()
    {
        allocations = 0;
        deallocations = 0;
    }

    [[nodiscard]] bool balanced() const { return allocations == deallocations && bytes_in_use == 0; }
};
} // namespace sc::test
