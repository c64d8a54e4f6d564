#include <tar-chunker/block-cursor.hxx>
#include <tar-chunker/errors.hxx>

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <string>

namespace tar_chunker {

BlockCursor::BlockCursor(std::istream &input) : input_(input) {}

std::optional<Block> BlockCursor::next_block() {
  Block block;
  std::size_t filled = 0;
  while (filled < kBlockSize) {
    input_.read(block.data() + filled,
                static_cast<std::streamsize>(kBlockSize - filled));
    const auto got = input_.gcount();
    if (got <= 0)
      break;
    filled += static_cast<std::size_t>(got);
  }

  if (input_.bad())
    throw std::ios_base::failure("read error at offset " +
                                 std::to_string(offset_ + filled));

  const auto start = offset_;
  offset_ += filled;
  if (filled == kBlockSize)
    return block;
  if (filled == 0)
    return std::nullopt;

  const bool all_zero = std::all_of(block.begin(), block.begin() + filled,
                                    [](char c) { return c == '\0'; });
  if (!all_zero)
    throw TruncatedStream(start, "stream ended " + std::to_string(filled) +
                                     " bytes into a block");

  BOOST_LOG_TRIVIAL(warning) << "Dropping " << filled
                             << " trailing zero bytes at offset " << start;
  return std::nullopt;
}

} // namespace tar_chunker
