#pragma once

#include <tar-chunker/block.hxx>
#include <tar-chunker/chunk-sink.hxx>
#include <tar-chunker/entry-tracker.hxx>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace tar_chunker {

/// Smallest usable chunk: a continuation record plus one payload block.
inline constexpr std::uint64_t kMinChunkBlocks = 2;

/// Totals of one split run.
struct SplitSummary {
  std::size_t chunks = 0;
  std::uint64_t input_bytes = 0;
  std::uint64_t entries = 0;
  std::size_t continuation_records = 0;
};

/**
 * @brief Whole blocks that fit in @p max_chunk_bytes.
 * @throws UsageError when fewer than kMinChunkBlocks fit.
 */
std::uint64_t chunk_blocks_for(std::uint64_t max_chunk_bytes);

/**
 * @class Splitter
 * @brief Cuts an archive stream into chunks of at most N blocks.
 *
 * Blocks are pulled one at a time through a BlockCursor and an
 * EntryTracker and pushed to the ChunkSink. Cuts fall on block boundaries;
 * a cut in front of a header is preferred, and a cut inside a payload opens
 * the next chunk with a continuation record. Removing the continuation
 * records from the concatenated chunks gives back the input exactly.
 */
class Splitter {
public:
  Splitter(ChunkSink &sink, std::uint64_t max_chunk_blocks);

  /**
   * @brief Split @p input to the sink.
   *
   * On failure every chunk written so far is removed before the exception
   * propagates, so nothing on disk passes for a complete sequence.
   *
   * @throws TruncatedStream, MalformedHeader
   */
  SplitSummary split(std::istream &input);

private:
  void run(std::istream &input, RunState &state, SplitSummary &summary);
  void place_header_group(const RunState &state);
  void place_boundary(const Block &block);
  void append(const Block &block);
  void cut();

  ChunkSink &sink_;
  std::uint64_t max_chunk_blocks_;
  std::uint64_t chunk_blocks_ = 0;
  std::vector<Block> header_group_;
};

} // namespace tar_chunker
