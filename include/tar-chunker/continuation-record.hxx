#pragma once

#include <tar-chunker/block.hxx>
#include <tar-chunker/entry-tracker.hxx>

#include <cstdint>
#include <optional>
#include <string>

namespace tar_chunker {

/**
 * @struct ContinuationRecord
 * @brief Identity and progress of an entry whose payload spans chunks.
 *
 * Stored as a single GNU multi-volume header (typeflag 'M') at the start of
 * the chunk that resumes the payload: size holds the bytes still to come,
 * the GNU offset field the bytes stored in earlier chunks and realsize the
 * entry's full payload length.
 */
struct ContinuationRecord {
  std::string name; ///< Entry name, truncated to the 100-byte name field.
  std::uint64_t offset = 0;
  std::uint64_t remaining = 0;
  std::uint64_t total_size = 0;

  bool operator==(const ContinuationRecord &) const = default;
};

/// Longest name a continuation record can carry.
inline constexpr std::size_t kContinuationNameLength = 100;

/// The record that resumes @p entry's payload at @p payload_offset.
ContinuationRecord continuation_for(const EntryInfo &entry,
                                    std::uint64_t payload_offset);

/**
 * @brief Encode @p record as a header block.
 *
 * Mode, owner and timestamps are copied from @p original_header so the
 * chunk lists sensibly in ordinary tar tools.
 */
Block encode_continuation(const ContinuationRecord &record,
                          const Block &original_header);

/**
 * @brief Decode a continuation record.
 *
 * @return std::nullopt when @p block is not a GNU multi-volume header.
 * @throws MalformedHeader when it is one but its checksum or numeric fields
 * are invalid.
 */
std::optional<ContinuationRecord> decode_continuation(const Block &block);

} // namespace tar_chunker
