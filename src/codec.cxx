#include <tar-chunker/codec.hxx>
#include <tar-chunker/errors.hxx>

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zstd.hpp>
#include <boost/iostreams/operations.hpp>

#include <array>
#include <cstdint>
#include <ios>

namespace io = boost::iostreams;

namespace tar_chunker {
namespace {

/// zstd level used for chunks; fast enough to keep up with tar on a pipe.
constexpr std::uint32_t kZstdLevel = 3;

class NoneCodec final : public ChunkCodec {
public:
  CodecKind kind() const noexcept override { return CodecKind::None; }
  void push_encoder(io::filtering_ostream &) const override {}
  void push_decoder(io::filtering_istream &) const override {}
};

class GzipCodec final : public ChunkCodec {
public:
  CodecKind kind() const noexcept override { return CodecKind::Gzip; }

  // The gzip header carries no file name and mtime 0, so equal chunks
  // always compress to equal bytes.
  void push_encoder(io::filtering_ostream &out) const override {
    out.push(io::gzip_compressor(io::gzip_params(io::gzip::best_speed)));
  }
  void push_decoder(io::filtering_istream &in) const override {
    in.push(io::gzip_decompressor());
  }
};

/**
 * @brief Pass-through input filter that walks zstd frame and block headers.
 *
 * zstd_decompressor reports end of stream as soon as its source runs dry,
 * even in the middle of a frame. Following the frame layout of the stored
 * bytes makes a cut-off chunk fail instead of decoding short.
 */
class ZstdFrameCheck : public io::multichar_input_filter {
public:
  template <typename Source>
  std::streamsize read(Source &src, char *s, std::streamsize n) {
    const auto got = io::read(src, s, n);
    if (got < 0) {
      if (state_ != State::Magic || got_ != 0)
        throw std::ios_base::failure("zstd frame is truncated");
      return got;
    }
    for (std::streamsize i = 0; i < got; ++i)
      consume(static_cast<unsigned char>(s[i]));
    return got;
  }

private:
  static constexpr std::uint64_t kFrameMagic = 0xFD2FB528;
  static constexpr std::uint64_t kSkippableMagic = 0x184D2A50;

  enum class State {
    Magic,
    Descriptor,
    HeaderFields,
    BlockHeader,
    BlockBody,
    Checksum,
    SkippableSize,
    SkippableBody
  };

  void consume(unsigned char byte) {
    switch (state_) {
    case State::Magic:
    case State::Descriptor:
    case State::BlockHeader:
    case State::SkippableSize:
      field_ |= static_cast<std::uint64_t>(byte) << (8 * got_);
      if (++got_ == need_)
        field_complete();
      break;
    default:
      if (--need_ == 0)
        skip_complete();
      break;
    }
  }

  /// Read a little-endian field of @p bytes bytes.
  void collect(State state, std::uint64_t bytes) {
    state_ = state;
    need_ = bytes;
    got_ = 0;
    field_ = 0;
  }

  /// Pass over @p bytes bytes of content.
  void skip(State state, std::uint64_t bytes) {
    state_ = state;
    need_ = bytes;
    if (need_ == 0)
      skip_complete();
  }

  void field_complete() {
    switch (state_) {
    case State::Magic:
      if (field_ == kFrameMagic)
        collect(State::Descriptor, 1);
      else if ((field_ & ~std::uint64_t{0xF}) == kSkippableMagic)
        collect(State::SkippableSize, 4);
      else
        throw std::ios_base::failure("bad zstd frame magic number");
      break;
    case State::Descriptor: {
      constexpr std::uint64_t kDictionaryIdBytes[] = {0, 1, 2, 4};
      constexpr std::uint64_t kContentSizeBytes[] = {0, 2, 4, 8};
      if (field_ & 0x08)
        throw std::ios_base::failure("zstd frame header has reserved bit set");
      const auto content_size_flag = field_ >> 6;
      const bool single_segment = field_ & 0x20;
      has_checksum_ = field_ & 0x04;

      auto bytes = kDictionaryIdBytes[field_ & 0x03] +
                   kContentSizeBytes[content_size_flag];
      if (single_segment && content_size_flag == 0)
        bytes += 1;
      if (!single_segment)
        bytes += 1; // window descriptor
      skip(State::HeaderFields, bytes);
      break;
    }
    case State::BlockHeader: {
      last_block_ = field_ & 0x01;
      const auto type = (field_ >> 1) & 0x03;
      if (type == 3)
        throw std::ios_base::failure("reserved zstd block type");
      // RLE blocks store a single byte whatever their size says.
      skip(State::BlockBody, type == 1 ? 1 : field_ >> 3);
      break;
    }
    case State::SkippableSize:
      skip(State::SkippableBody, field_);
      break;
    default:
      break;
    }
  }

  void skip_complete() {
    switch (state_) {
    case State::HeaderFields:
      collect(State::BlockHeader, 3);
      break;
    case State::BlockBody:
      if (!last_block_)
        collect(State::BlockHeader, 3);
      else if (has_checksum_)
        skip(State::Checksum, 4);
      else
        collect(State::Magic, 4);
      break;
    default:
      collect(State::Magic, 4);
      break;
    }
  }

  State state_ = State::Magic;
  std::uint64_t need_ = 4;
  std::uint64_t got_ = 0;
  std::uint64_t field_ = 0;
  bool has_checksum_ = false;
  bool last_block_ = false;
};

class ZstdCodec final : public ChunkCodec {
public:
  CodecKind kind() const noexcept override { return CodecKind::Zstd; }
  void push_encoder(io::filtering_ostream &out) const override {
    out.push(io::zstd_compressor(io::zstd_params(kZstdLevel)));
  }
  void push_decoder(io::filtering_istream &in) const override {
    in.push(io::zstd_decompressor());
    in.push(ZstdFrameCheck());
  }
};

} // unnamed namespace

std::unique_ptr<ChunkCodec> make_codec(CodecKind kind) {
  switch (kind) {
  case CodecKind::Gzip:
    return std::make_unique<GzipCodec>();
  case CodecKind::Zstd:
    return std::make_unique<ZstdCodec>();
  case CodecKind::None:
    break;
  }
  return std::make_unique<NoneCodec>();
}

CodecKind parse_codec(std::string_view name) {
  if (name == "none")
    return CodecKind::None;
  if (name == "gzip")
    return CodecKind::Gzip;
  if (name == "zstd")
    return CodecKind::Zstd;
  throw UsageError("unknown compression '" + std::string(name) +
                   "', expected none, gzip or zstd");
}

std::string_view to_string(CodecKind kind) noexcept {
  switch (kind) {
  case CodecKind::Gzip:
    return "gzip";
  case CodecKind::Zstd:
    return "zstd";
  case CodecKind::None:
    break;
  }
  return "none";
}

CodecKind detect_codec(const std::filesystem::path &stored_chunk) {
  io::file_source file(stored_chunk.string(), std::ios::binary);
  if (!file.is_open())
    throw std::ios_base::failure("cannot open " + stored_chunk.string());

  std::array<unsigned char, 4> magic{};
  const auto got =
      io::read(file, reinterpret_cast<char *>(magic.data()), magic.size());

  if (got >= 2 && magic[0] == 0x1f && magic[1] == 0x8b)
    return CodecKind::Gzip;
  if (got == 4 && magic[0] == 0x28 && magic[1] == 0xb5 && magic[2] == 0x2f &&
      magic[3] == 0xfd)
    return CodecKind::Zstd;
  return CodecKind::None;
}

std::string encode_bytes(const std::string &chunk, CodecKind kind) {
  std::string stored;
  {
    io::filtering_ostream out;
    make_codec(kind)->push_encoder(out);
    out.push(io::back_inserter(stored));
    out.exceptions(std::ios::badbit);
    out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    out.pop();
  }
  return stored;
}

std::string decode_bytes(const std::string &stored, CodecKind kind,
                         std::size_t chunk_index) {
  std::string chunk;
  try {
    io::filtering_istream in;
    make_codec(kind)->push_decoder(in);
    in.push(io::array_source(stored.data(), stored.size()));
    io::copy(in, io::back_inserter(chunk));
  } catch (const std::ios_base::failure &e) {
    throw CorruptChunk(chunk_index, e.what());
  }
  return chunk;
}

} // namespace tar_chunker
