#ifndef BLOCK_INDEX_HPP
#define BLOCK_INDEX_HPP

#include <ostream>

namespace Kilonova {

/// Position of a block in the radial block lattice. Block b owns radial
/// faces [b * blockSize, (b + 1) * blockSize]; b may be negative when
/// the domain extends inside the reference radius.
struct BlockIndex {
    long radial = 0;

    BlockIndex() = default;
    explicit BlockIndex(long r) : radial(r) {}

    BlockIndex next() const { return BlockIndex(radial + 1); }
    BlockIndex prev() const { return BlockIndex(radial - 1); }
};

inline bool operator==(BlockIndex a, BlockIndex b) { return a.radial == b.radial; }
inline bool operator!=(BlockIndex a, BlockIndex b) { return a.radial != b.radial; }
inline bool operator<(BlockIndex a, BlockIndex b)  { return a.radial < b.radial; }
inline bool operator>(BlockIndex a, BlockIndex b)  { return a.radial > b.radial; }
inline bool operator<=(BlockIndex a, BlockIndex b) { return a.radial <= b.radial; }
inline bool operator>=(BlockIndex a, BlockIndex b) { return a.radial >= b.radial; }

inline std::ostream& operator<<(std::ostream& os, BlockIndex b) {
    return os << "(" << b.radial << ")";
}

} // namespace Kilonova

#endif // BLOCK_INDEX_HPP
