#pragma once

#include <array>
#include <cstddef>

namespace tar_chunker {

/// Size of one tar block; every header and payload is aligned to it.
inline constexpr std::size_t kBlockSize = 512;

/// One fixed-size unit of an archive stream.
using Block = std::array<char, kBlockSize>;

/**
 * @brief Check whether a 512-byte TAR block is entirely zeros.
 *
 * TAR archives are terminated by at least two consecutive 512-byte blocks
 * of zero.
 */
bool is_zero_block(const Block &block) noexcept;

} // namespace tar_chunker
