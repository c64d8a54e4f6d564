#pragma once

#include <boost/iostreams/filtering_stream.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace tar_chunker {

/** @enum CodecKind Compression applied to each stored chunk. */
enum class CodecKind { None, Gzip, Zstd };

/**
 * @class ChunkCodec
 * @brief Compression adapter applied to one chunk at a time.
 *
 * Encoders and decoders are Boost.Iostreams filters pushed onto the chunk's
 * filtering stream, so a chunk is compressed while it is written and never
 * held in memory as a whole. Every chunk is encoded independently and can
 * be decoded without its neighbours.
 */
class ChunkCodec {
public:
  virtual ~ChunkCodec() = default;

  virtual CodecKind kind() const noexcept = 0;

  /// Push the compressor for this codec (nothing for CodecKind::None).
  virtual void push_encoder(boost::iostreams::filtering_ostream &out) const = 0;

  /// Push the decompressor for this codec (nothing for CodecKind::None).
  virtual void push_decoder(boost::iostreams::filtering_istream &in) const = 0;
};

std::unique_ptr<ChunkCodec> make_codec(CodecKind kind);

/**
 * @brief Parse a codec name ("none", "gzip", "zstd").
 * @throws UsageError for any other name.
 */
CodecKind parse_codec(std::string_view name);

std::string_view to_string(CodecKind kind) noexcept;

/**
 * @brief Guess the codec of a stored chunk from its magic number.
 *
 * Raw chunks start with a tar header, which never begins with the gzip or
 * zstd magic bytes in practice.
 */
CodecKind detect_codec(const std::filesystem::path &stored_chunk);

/**
 * @brief Encode a whole chunk held in memory.
 */
std::string encode_bytes(const std::string &chunk, CodecKind kind);

/**
 * @brief Decode a whole stored chunk held in memory.
 * @throws CorruptChunk naming @p chunk_index when the bytes do not decode.
 */
std::string decode_bytes(const std::string &stored, CodecKind kind,
                         std::size_t chunk_index);

} // namespace tar_chunker
