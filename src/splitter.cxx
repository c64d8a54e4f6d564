#include <tar-chunker/block-cursor.hxx>
#include <tar-chunker/continuation-record.hxx>
#include <tar-chunker/detail/tar-header.hxx>
#include <tar-chunker/errors.hxx>
#include <tar-chunker/splitter.hxx>

#include <boost/log/trivial.hpp>

#include <string>

namespace tar_chunker {

std::uint64_t chunk_blocks_for(std::uint64_t max_chunk_bytes) {
  const auto blocks = max_chunk_bytes / kBlockSize;
  if (blocks < kMinChunkBlocks)
    throw UsageError("split size of " + std::to_string(max_chunk_bytes) +
                     " bytes is below the minimum of " +
                     std::to_string(kMinChunkBlocks * kBlockSize) + " bytes");
  return blocks;
}

Splitter::Splitter(ChunkSink &sink, std::uint64_t max_chunk_blocks)
    : sink_(sink), max_chunk_blocks_(max_chunk_blocks) {
  if (max_chunk_blocks_ < kMinChunkBlocks)
    throw UsageError("chunks need room for at least " +
                     std::to_string(kMinChunkBlocks) + " blocks");
}

SplitSummary Splitter::split(std::istream &input) {
  RunState state;
  SplitSummary summary;
  chunk_blocks_ = 0;
  header_group_.clear();

  try {
    run(input, state, summary);
    sink_.close_chunk();
  } catch (...) {
    sink_.discard();
    throw;
  }

  summary.chunks = sink_.chunks_closed();
  summary.entries = state.entries;
  BOOST_LOG_TRIVIAL(info) << "Split " << summary.input_bytes << " bytes ("
                          << summary.entries << " entries) into "
                          << summary.chunks << " chunks with "
                          << summary.continuation_records
                          << " continuation records";
  return summary;
}

/**
 * @brief Pull every block through the tracker and place it.
 *
 * Header blocks are held back until their group (old GNU sparse headers
 * are followed by extension blocks) is complete, so a group is never cut.
 */
void Splitter::run(std::istream &input, RunState &state,
                   SplitSummary &summary) {
  BlockCursor cursor(input);
  EntryTracker tracker(state);

  while (auto block = cursor.next_block()) {
    const auto info = tracker.consume(*block);
    switch (info.kind) {
    case BlockKind::Header:
      // Chunks after the first may open with such a header; one in the
      // middle of the input would be mistaken for a continuation record.
      if (state.current.typeflag == detail::typeflag::kGnuMultiVolume &&
          info.stream_offset != 0)
        throw MalformedHeader(info.stream_offset,
                              "multi-volume header inside the archive");
      header_group_.assign(1, *block);
      if (!state.expect_sparse_extension)
        place_header_group(state);
      break;
    case BlockKind::HeaderExtension:
      header_group_.push_back(*block);
      if (!state.expect_sparse_extension)
        place_header_group(state);
      break;
    case BlockKind::Payload:
      if (chunk_blocks_ + 1 > max_chunk_blocks_) {
        cut();
        const auto record =
            continuation_for(state.current, info.payload_offset);
        BOOST_LOG_TRIVIAL(debug)
            << "Continuing '" << state.current.name << "' at payload offset "
            << record.offset << " of " << record.total_size;
        append(encode_continuation(record, state.current_header));
        ++summary.continuation_records;
      }
      append(*block);
      break;
    case BlockKind::ZeroBlock:
    case BlockKind::Trailer:
      place_boundary(*block);
      break;
    }
  }

  summary.input_bytes = cursor.offset();
  tracker.finish();
}

void Splitter::place_header_group(const RunState &state) {
  const auto group = static_cast<std::uint64_t>(header_group_.size());
  if (group > max_chunk_blocks_)
    throw UsageError("header of '" + state.current.name + "' spans " +
                     std::to_string(group) + " blocks, more than a chunk holds");

  // Keep at least one payload block with its header so a chunk does not
  // end on a header whose payload only starts in the next chunk.
  const auto needed = group + (state.mid_payload() ? 1 : 0);
  if (chunk_blocks_ > 0 && chunk_blocks_ + needed > max_chunk_blocks_)
    cut();

  for (const auto &block : header_group_)
    append(block);
  header_group_.clear();
}

void Splitter::place_boundary(const Block &block) {
  if (chunk_blocks_ + 1 > max_chunk_blocks_)
    cut();
  append(block);
}

void Splitter::append(const Block &block) {
  sink_.write(block);
  ++chunk_blocks_;
}

void Splitter::cut() {
  sink_.close_chunk();
  chunk_blocks_ = 0;
}

} // namespace tar_chunker
