#pragma once

#include <sebbu-collections/array.hh>
#include <sebbu-collections/fwd.hh>


/// Fixed-size set of bit flags, size chosen at creation.
/// Bits are packed into u64 words, bit i lives in word i / 64 at position i % 64.
/// Bits beyond size() in the last word are always zero, so cardinality() can popcount whole words.
///
/// Usage:
///   auto visited = sc::bitset::create(node_count);
///   visited.set(start);
///   if (!visited[next])
///       ...
struct sc::bitset
{
    static constexpr isize bits_per_word = 64;

    /// Creates a bitset of `size` bits, all clear.
    /// Precondition: size > 0.
    [[nodiscard]] static bitset create(isize size);

    // single bits
public:
    /// Precondition (for all single-bit operations): 0 <= i < size().
    void set(isize i)
    {
        check_index(i);
        _words[i / bits_per_word] |= bit_mask(i);
    }
    void clear(isize i)
    {
        check_index(i);
        _words[i / bits_per_word] &= ~bit_mask(i);
    }
    void assign(isize i, bool value)
    {
        if (value)
            set(i);
        else
            clear(i);
    }
    [[nodiscard]] bool is_set(isize i) const
    {
        check_index(i);
        return (_words[i / bits_per_word] & bit_mask(i)) != 0;
    }
    [[nodiscard]] bool operator[](isize i) const { return is_set(i); }

    // all bits
public:
    void clear_all();
    void set_all();

    /// Number of set bits.
    [[nodiscard]] isize cardinality() const;

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] isize word_count() const { return _words.size(); }
    [[nodiscard]] sc::span<u64 const> words() const { return sc::span<u64 const>(_words.data(), _words.size()); }

    // bitset has deep-copy value semantics, a default-constructed bitset has size 0
    bitset() = default;

private:
    [[nodiscard]] static u64 bit_mask(isize i) { return u64(1) << (i % bits_per_word); }

    void check_index(isize i) const { SC_ASSERT(0 <= i && i < _size, "bit index out of bounds"); }

    sc::array<u64> _words;
    isize _size = 0;
};
