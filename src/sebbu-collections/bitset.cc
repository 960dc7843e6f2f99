#include "bitset.hh"

#include <sebbu-collections/utility.hh>

#include <bit>

sc::bitset sc::bitset::create(isize size)
{
    SC_ASSERT(size > 0, "bitset size must be positive");

    bitset result;
    result._words = sc::array<u64>::create_filled(sc::int_div_round_up(size, bits_per_word), u64(0));
    result._size = size;
    return result;
}

void sc::bitset::clear_all()
{
    for (auto& w : _words)
        w = 0;
}

void sc::bitset::set_all()
{
    for (auto& w : _words)
        w = ~u64(0);

    // keep the bits past size() zero
    auto const tail_bits = _size % bits_per_word;
    if (tail_bits != 0)
        _words.back() = (u64(1) << tail_bits) - 1;
}

sc::isize sc::bitset::cardinality() const
{
    isize count = 0;
    for (auto const w : _words)
        count += std::popcount(w);
    return count;
}
