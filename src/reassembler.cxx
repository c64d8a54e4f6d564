#include <tar-chunker/block-cursor.hxx>
#include <tar-chunker/continuation-record.hxx>
#include <tar-chunker/errors.hxx>
#include <tar-chunker/reassembler.hxx>

#include <boost/log/trivial.hpp>

#include <ios>
#include <optional>
#include <string>

namespace tar_chunker {
namespace {

/// Translate one classified block into consumer callbacks.
void dispatch(const Block &block, const BlockInfo &info, const RunState &state,
              ReassemblyConsumer &consumer) {
  consumer.on_block(block, info);

  const auto &entry = state.current;
  switch (info.kind) {
  case BlockKind::Header:
    if (entry.metadata)
      break;
    consumer.on_entry(entry);
    if (info.entry_complete)
      consumer.on_entry_end(entry);
    break;
  case BlockKind::HeaderExtension:
    if (info.entry_complete)
      consumer.on_entry_end(entry);
    break;
  case BlockKind::Payload:
    if (entry.metadata)
      break;
    consumer.on_payload(block.data(), info.payload_bytes);
    if (info.entry_complete)
      consumer.on_entry_end(entry);
    break;
  case BlockKind::ZeroBlock:
  case BlockKind::Trailer:
    break;
  }
}

/// Next decoded block of chunk @p index; decode failures are corruption.
std::optional<Block> read_block(BlockCursor &cursor, std::size_t index) {
  try {
    return cursor.next_block();
  } catch (const TruncatedStream &e) {
    throw CorruptChunk(index, e.what());
  } catch (const std::ios_base::failure &e) {
    throw CorruptChunk(index, e.what());
  }
}

BlockInfo consume(EntryTracker &tracker, const Block &block,
                  std::size_t index) {
  try {
    return tracker.consume(block);
  } catch (const MalformedHeader &e) {
    throw CorruptChunk(index, e.what());
  }
}

} // unnamed namespace

StreamWriter::StreamWriter(std::ostream &out) : out_(out) {}

void StreamWriter::on_block(const Block &block, const BlockInfo &info) {
  out_.write(block.data(), static_cast<std::streamsize>(block.size()));
  if (!out_)
    throw std::ios_base::failure(
        "cannot write reconstructed archive at offset " +
        std::to_string(info.stream_offset));
}

void StreamWriter::finish() {
  out_.flush();
  if (!out_)
    throw std::ios_base::failure("cannot flush reconstructed archive");
}

void TeeConsumer::on_block(const Block &block, const BlockInfo &info) {
  for (auto consumer : consumers_)
    consumer->on_block(block, info);
}

void TeeConsumer::on_entry(const EntryInfo &entry) {
  for (auto consumer : consumers_)
    consumer->on_entry(entry);
}

void TeeConsumer::on_payload(const char *data, std::size_t n) {
  for (auto consumer : consumers_)
    consumer->on_payload(data, n);
}

void TeeConsumer::on_entry_end(const EntryInfo &entry) {
  for (auto consumer : consumers_)
    consumer->on_entry_end(entry);
}

void TeeConsumer::finish() {
  for (auto consumer : consumers_)
    consumer->finish();
}

Reassembler::Reassembler(std::optional<CodecKind> codec) : codec_(codec) {}

ReassemblySummary Reassembler::run(const ChunkSource &source,
                                   ReassemblyConsumer &consumer) {
  RunState state;
  EntryTracker tracker(state);
  ReassemblySummary summary;

  for (const auto &chunk : source.chunks()) {
    ChunkReader reader(chunk, codec_);
    BOOST_LOG_TRIVIAL(info) << "Unpacking chunk " << chunk.path.string()
                            << " (" << to_string(reader.codec()) << ")";
    BlockCursor cursor(reader.stream());
    bool first = true;
    while (auto block = read_block(cursor, chunk.index)) {
      if (first) {
        first = false;
        // Chunk 0 is the start of the archive and is never a resumption.
        // Past the end-of-archive marker blocks are kept as they are.
        if (chunk.index > 0 && !state.end_of_archive &&
            resume(*block, state, chunk.index)) {
          ++summary.continuation_records;
          continue;
        }
      }
      dispatch(*block, consume(tracker, *block, chunk.index), state, consumer);
    }
    if (first)
      throw CorruptChunk(chunk.index, "chunk holds no blocks");
    reader.verify();
    ++summary.chunks;
  }

  const auto next = source.chunks().size();
  if (!state.at_entry_boundary())
    throw MissingChunk(next, "sequence ends inside entry '" +
                                 state.current.name + "' with " +
                                 std::to_string(state.bytes_remaining) +
                                 " payload bytes missing");
  if (!state.end_of_archive)
    throw MissingChunk(next, "sequence ends before the end-of-archive marker");

  consumer.finish();
  summary.archive_bytes = state.stream_offset;
  summary.entries = state.entries;
  BOOST_LOG_TRIVIAL(info) << "Reassembled " << summary.archive_bytes
                          << " bytes (" << summary.entries << " entries) from "
                          << summary.chunks << " chunks";
  return summary;
}

/**
 * @brief Check the first block of a chunk against the running state.
 *
 * @return true when the block is a matching continuation record that must
 * be skipped, false when it is ordinary archive data.
 */
bool Reassembler::resume(const Block &first_block, const RunState &state,
                         std::size_t chunk_index) const {
  std::optional<ContinuationRecord> record;
  try {
    record = decode_continuation(first_block);
  } catch (const MalformedHeader &e) {
    throw CorruptChunk(chunk_index, e.what());
  }

  if (!state.mid_payload()) {
    if (record)
      throw CorruptChunk(chunk_index, "unexpected continuation record for '" +
                                          record->name + "'");
    return false;
  }

  const auto &entry = state.current;
  if (!record)
    throw CorruptChunk(chunk_index, "chunk starts inside the payload of '" +
                                        entry.name +
                                        "' without a continuation record");

  const auto expected = continuation_for(entry, state.payload_consumed());
  if (*record != expected)
    throw CorruptChunk(
        chunk_index,
        "continuation record for '" + record->name + "' at offset " +
            std::to_string(record->offset) + " of " +
            std::to_string(record->total_size) + " does not continue '" +
            expected.name + "' at offset " + std::to_string(expected.offset) +
            " of " + std::to_string(expected.total_size));

  BOOST_LOG_TRIVIAL(debug) << "Chunk " << chunk_index << " resumes '"
                           << entry.name << "' at payload offset "
                           << record->offset;
  return true;
}

ReassemblySummary replay_archive(std::istream &archive,
                                 ReassemblyConsumer &consumer) {
  RunState state;
  EntryTracker tracker(state);
  BlockCursor cursor(archive);
  while (auto block = cursor.next_block())
    dispatch(*block, tracker.consume(*block), state, consumer);
  tracker.finish();
  consumer.finish();

  ReassemblySummary summary;
  summary.archive_bytes = state.stream_offset;
  summary.entries = state.entries;
  return summary;
}

} // namespace tar_chunker
