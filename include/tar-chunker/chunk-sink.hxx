#pragma once

#include <tar-chunker/block.hxx>
#include <tar-chunker/codec.hxx>

#include <boost/iostreams/filtering_stream.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace tar_chunker {
namespace detail {
class Sha256Digest;
}

/// Minimum width of the numeric chunk suffix (`prefix.000`).
inline constexpr std::size_t kChunkSuffixWidth = 3;

/// Name of chunk @p index for @p prefix, e.g. `split.tar.007`.
std::filesystem::path chunk_path(const std::filesystem::path &prefix,
                                 std::size_t index);

/// Sidecar holding the SHA-256 of a chunk's stored (compressed) bytes.
std::filesystem::path stored_digest_path(const std::filesystem::path &chunk);

/// Sidecar holding the SHA-256 of a chunk's raw (uncompressed) bytes.
std::filesystem::path raw_digest_path(const std::filesystem::path &chunk);

/**
 * @class ChunkSink
 * @brief Persists chunks as `<prefix>.NNN` files in emission order.
 *
 * Each chunk is streamed through its own filter chain:
 * raw digest -> codec encoder -> stored digest -> file. Suffixes are
 * assigned strictly in emission order starting at 0.
 */
class ChunkSink {
public:
  ChunkSink(std::filesystem::path prefix, CodecKind codec,
            bool write_digests = false);
  ~ChunkSink();

  ChunkSink(const ChunkSink &) = delete;
  ChunkSink &operator=(const ChunkSink &) = delete;

  /// Append one block to the open chunk, opening the next chunk if needed.
  void write(const Block &block);

  /// Open the next chunk even though no block has been written to it.
  void open_chunk();

  /// Finish the open chunk (flush the codec, write digests). No-op if none.
  void close_chunk();

  /// Close and delete the chunk being written after a failed run.
  void abandon() noexcept;

  /**
   * @brief Delete every chunk this sink wrote, with its digest sidecars.
   *
   * Used when a run fails: the chunks closed before the failure could
   * otherwise pass for a complete sequence.
   */
  void discard() noexcept;

  bool chunk_open() const noexcept { return out_ != nullptr; }
  std::size_t chunks_closed() const noexcept { return next_index_; }
  /// Raw bytes written to the open chunk.
  std::uint64_t chunk_bytes() const noexcept { return chunk_bytes_; }

private:
  std::filesystem::path prefix_;
  std::unique_ptr<ChunkCodec> codec_;
  bool write_digests_;

  std::size_t next_index_ = 0;
  std::filesystem::path current_path_;
  std::uint64_t chunk_bytes_ = 0;
  std::unique_ptr<boost::iostreams::filtering_ostream> out_;
  std::shared_ptr<detail::Sha256Digest> raw_digest_;
  std::shared_ptr<detail::Sha256Digest> stored_digest_;
};

} // namespace tar_chunker
