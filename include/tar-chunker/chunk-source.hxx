#pragma once

#include <tar-chunker/codec.hxx>

#include <boost/iostreams/filtering_stream.hpp>

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tar_chunker {
namespace detail {
class Sha256Digest;
}

/// One discovered chunk file.
struct ChunkFile {
  std::size_t index = 0;
  std::filesystem::path path;
};

/**
 * @class ChunkSource
 * @brief Discovers a chunk sequence and orders it by numeric suffix.
 *
 * Order comes only from the parsed suffix, never from directory listing
 * order or timestamps. The sequence must be contiguous from index 0.
 */
class ChunkSource {
public:
  /**
   * @brief Collect the `<prefix>.N` files next to @p prefix.
   * @throws MissingChunk when the suffixes are not contiguous from 0.
   */
  static ChunkSource from_prefix(const std::filesystem::path &prefix);

  /**
   * @brief Collect the single chunk sequence stored in @p directory.
   * @throws UsageError when the directory holds more than one sequence.
   * @throws MissingChunk when the suffixes are not contiguous from 0.
   */
  static ChunkSource from_directory(const std::filesystem::path &directory);

  /// from_directory() for directories, from_prefix() otherwise.
  static ChunkSource discover(const std::filesystem::path &location);

  const std::vector<ChunkFile> &chunks() const noexcept { return chunks_; }
  const std::filesystem::path &prefix() const noexcept { return prefix_; }

private:
  ChunkSource(std::filesystem::path prefix, std::vector<ChunkFile> chunks);

  std::filesystem::path prefix_;
  std::vector<ChunkFile> chunks_;
};

/**
 * @class ChunkReader
 * @brief Decoded read access to one stored chunk.
 *
 * The stored-bytes digest sidecar, when present, is checked before any
 * decoding; the raw-bytes digest is checked by verify() after the chunk
 * has been read to its end.
 */
class ChunkReader {
public:
  /**
   * @param codec Codec to decode with; detected from the stored bytes when
   * empty.
   * @throws CorruptChunk when the stored digest does not match.
   */
  ChunkReader(const ChunkFile &chunk, std::optional<CodecKind> codec);
  ~ChunkReader();

  ChunkReader(const ChunkReader &) = delete;
  ChunkReader &operator=(const ChunkReader &) = delete;

  /// Decoded chunk bytes. Decoder failures are thrown from reads.
  std::istream &stream() noexcept { return *in_; }

  CodecKind codec() const noexcept { return codec_; }

  /// @throws CorruptChunk when the raw digest sidecar does not match.
  void verify();

private:
  ChunkFile chunk_;
  CodecKind codec_;
  std::shared_ptr<detail::Sha256Digest> raw_digest_;
  std::unique_ptr<boost::iostreams::filtering_istream> in_;
};

} // namespace tar_chunker
