#pragma once

#include <tar-chunker/block.hxx>

#include <cstdint>
#include <istream>
#include <optional>

namespace tar_chunker {

/**
 * @class BlockCursor
 * @brief Pulls an archive stream one 512-byte block at a time.
 *
 * The cursor is the single point of block-alignment enforcement: a stream
 * that ends inside a block with any non-zero byte raises TruncatedStream.
 * A partial block of zero bytes carries no structure and is dropped with a
 * warning. No data beyond the current block is buffered.
 */
class BlockCursor {
public:
  explicit BlockCursor(std::istream &input);

  /**
   * @brief Read the next block.
   *
   * @return std::nullopt once the stream ends on a block boundary.
   * @throws TruncatedStream when the stream ends inside a non-zero block.
   */
  std::optional<Block> next_block();

  /// Bytes consumed from the stream so far, dropped zero tails included.
  std::uint64_t offset() const noexcept { return offset_; }

private:
  std::istream &input_;
  std::uint64_t offset_ = 0;
};

} // namespace tar_chunker
