#pragma once

#include <tar-chunker/block.hxx>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tar_chunker {

/** @enum BlockKind Role of a block within the archive stream. */
enum class BlockKind {
  Header,          ///< Starts a new entry.
  HeaderExtension, ///< Old GNU sparse map block belonging to the last header.
  Payload,         ///< Data of the current entry, possibly with padding.
  ZeroBlock,       ///< All-zero block at a header position.
  Trailer          ///< Anything after the end-of-archive marker.
};

/**
 * @struct EntryInfo
 * @brief One archive member as described by its (resolved) header.
 *
 * Names, link targets and sizes already include overrides from preceding
 * pax or GNU long-name records.
 */
struct EntryInfo {
  std::string name;
  std::string link_name;
  char typeflag = '0';
  std::uint64_t size = 0; ///< Payload bytes, padding excluded.
  std::uint32_t mode = 0;
  std::uint64_t header_offset = 0;
  bool metadata = false; ///< pax or GNU long-name record for the next entry.
};

/// Classification of one consumed block.
struct BlockInfo {
  BlockKind kind = BlockKind::Header;
  std::uint64_t stream_offset = 0;
  /// Payload blocks: offset of the block's first byte within the payload.
  std::uint64_t payload_offset = 0;
  /// Payload blocks: bytes that belong to the entry; the rest is padding.
  std::size_t payload_bytes = 0;
  /// The block completes the current entry.
  bool entry_complete = false;
};

/// Overrides collected from pax and GNU long-name records.
struct PendingMetadata {
  std::optional<std::string> path;
  std::optional<std::string> link_path;
  std::optional<std::uint64_t> size;
};

/**
 * @struct RunState
 * @brief Running counters of one split or unpack invocation.
 *
 * Owned by the caller and passed by reference to every stage, so separate
 * runs share nothing and may execute concurrently.
 */
struct RunState {
  std::uint64_t stream_offset = 0; ///< Archive bytes consumed so far.
  EntryInfo current;               ///< Most recent entry header.
  Block current_header{};          ///< Raw header block of @ref current.
  std::uint64_t bytes_remaining = 0;
  bool expect_sparse_extension = false;
  std::string metadata_payload;
  PendingMetadata pending;
  std::size_t consecutive_zero_blocks = 0;
  bool end_of_archive = false;
  std::uint64_t entries = 0; ///< Non-metadata entries seen.

  /// Payload bytes of the current entry consumed so far.
  std::uint64_t payload_consumed() const noexcept {
    return current.size - bytes_remaining;
  }
  /// True while the current entry still has payload blocks to come.
  bool mid_payload() const noexcept { return bytes_remaining > 0; }
  /// True at a position where a header, zero block or trailer may follow.
  bool at_entry_boundary() const noexcept {
    return bytes_remaining == 0 && !expect_sparse_extension;
  }
};

/**
 * @class EntryTracker
 * @brief Classifies blocks as headers or payload and tracks the open entry.
 *
 * Header blocks are validated (checksum, size field); a failure raises
 * MalformedHeader because every later offset depends on it. Two consecutive
 * zero blocks mark the end of the archive.
 */
class EntryTracker {
public:
  explicit EntryTracker(RunState &state);

  /// Classify @p block and advance the run state past it.
  BlockInfo consume(const Block &block);

  /**
   * @brief Check that the stream may end here.
   *
   * @throws TruncatedStream when an entry is still open or the
   * end-of-archive marker was never seen.
   */
  void finish() const;

  const RunState &state() const noexcept { return state_; }

private:
  BlockInfo consume_header(const Block &block, std::uint64_t offset);
  BlockInfo consume_extension(const Block &block, std::uint64_t offset);
  BlockInfo consume_payload(const Block &block, std::uint64_t offset);
  void close_entry();
  void apply_pax_records(const std::string &records);

  RunState &state_;
};

} // namespace tar_chunker
