#include "allocation.hh"

#include <new>

namespace
{
sc::byte* aligned_new_allocate(sc::isize bytes, sc::isize alignment, void*)
{
    if (bytes == 0)
        return nullptr;

    auto* const block = ::operator new(std::size_t(bytes), std::align_val_t(alignment), std::nothrow);
    SC_ASSERT_ALWAYS(block != nullptr, "out of memory while allocating container storage");
    return static_cast<sc::byte*>(block);
}

void aligned_new_deallocate(sc::byte* block, sc::isize, sc::isize alignment, void*)
{
    ::operator delete(block, std::align_val_t(alignment));
}

constinit sc::memory_resource const aligned_new_resource = {
    .allocate_bytes = aligned_new_allocate,
    .deallocate_bytes = aligned_new_deallocate,
    .userdata = nullptr,
};
} // namespace

constinit sc::memory_resource const* const sc::default_memory_resource = &aligned_new_resource;
