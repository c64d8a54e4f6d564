#pragma once

#include <tar-chunker/block.hxx>
#include <tar-chunker/chunk-source.hxx>
#include <tar-chunker/codec.hxx>
#include <tar-chunker/entry-tracker.hxx>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

namespace tar_chunker {

/**
 * @class ReassemblyConsumer
 * @brief Receives the reconstructed archive while chunks are consumed.
 *
 * on_block() sees every original archive block in order, continuation
 * records already removed. The entry callbacks see resolved entries (pax
 * and GNU long-name records applied, not reported themselves) and their
 * payload bytes without padding.
 */
class ReassemblyConsumer {
public:
  virtual ~ReassemblyConsumer() = default;

  virtual void on_block(const Block &, const BlockInfo &) {}
  virtual void on_entry(const EntryInfo &) {}
  virtual void on_payload(const char *, std::size_t) {}
  virtual void on_entry_end(const EntryInfo &) {}
  /// Called once after the last chunk was accepted.
  virtual void finish() {}
};

/// Writes the byte-faithful archive stream to an std::ostream.
class StreamWriter : public ReassemblyConsumer {
public:
  explicit StreamWriter(std::ostream &out);

  void on_block(const Block &block, const BlockInfo &info) override;
  void finish() override;

private:
  std::ostream &out_;
};

/// Forwards every callback to several consumers in order.
class TeeConsumer : public ReassemblyConsumer {
public:
  void add(ReassemblyConsumer &consumer) { consumers_.push_back(&consumer); }

  void on_block(const Block &block, const BlockInfo &info) override;
  void on_entry(const EntryInfo &entry) override;
  void on_payload(const char *data, std::size_t n) override;
  void on_entry_end(const EntryInfo &entry) override;
  void finish() override;

private:
  std::vector<ReassemblyConsumer *> consumers_;
};

/// Totals of one unpack run.
struct ReassemblySummary {
  std::size_t chunks = 0;
  std::uint64_t archive_bytes = 0;
  std::uint64_t entries = 0;
  std::size_t continuation_records = 0;
};

/**
 * @class Reassembler
 * @brief Consumes a chunk sequence in order and rebuilds the archive.
 *
 * Each chunk is decoded independently. A chunk that resumes an open
 * payload must start with a continuation record matching the running
 * state; the record is checked and dropped.
 */
class Reassembler {
public:
  /// @param codec Codec of the stored chunks; detected per chunk if empty.
  explicit Reassembler(std::optional<CodecKind> codec = std::nullopt);

  /**
   * @throws CorruptChunk when a chunk does not decode, is misaligned or
   * does not continue the previous one.
   * @throws MissingChunk when the sequence stops before the archive ends.
   */
  ReassemblySummary run(const ChunkSource &source,
                        ReassemblyConsumer &consumer);

private:
  bool resume(const Block &first_block, const RunState &state,
              std::size_t chunk_index) const;

  std::optional<CodecKind> codec_;
};

/**
 * @brief Feed a plain, unsplit archive stream to @p consumer.
 * @throws TruncatedStream, MalformedHeader
 */
ReassemblySummary replay_archive(std::istream &archive,
                                 ReassemblyConsumer &consumer);

} // namespace tar_chunker
