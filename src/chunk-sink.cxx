#include <tar-chunker/chunk-sink.hxx>
#include <tar-chunker/detail/sha256-filter.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/log/trivial.hpp>

#include <cstdio>
#include <initializer_list>
#include <ios>
#include <string>
#include <system_error>

namespace io = boost::iostreams;
namespace fs = std::filesystem;

namespace tar_chunker {
namespace {

void write_digest_file(const fs::path &path, const std::string &hex) {
  io::file_sink file(path.string(), std::ios::binary | std::ios::trunc);
  if (!file.is_open())
    throw std::ios_base::failure("cannot create " + path.string());
  const auto written =
      io::copy(io::array_source(hex.data(), hex.size()), file);
  if (written != static_cast<std::streamsize>(hex.size()))
    throw std::ios_base::failure("cannot write " + path.string());
}

} // unnamed namespace

fs::path chunk_path(const fs::path &prefix, std::size_t index) {
  char suffix[32];
  std::snprintf(suffix, sizeof(suffix), ".%0*zu",
                static_cast<int>(kChunkSuffixWidth), index);
  auto path = prefix;
  path += suffix;
  return path;
}

fs::path stored_digest_path(const fs::path &chunk) {
  auto path = chunk;
  path += ".compressed.sha256";
  return path;
}

fs::path raw_digest_path(const fs::path &chunk) {
  auto path = chunk;
  path += ".uncompressed.sha256";
  return path;
}

ChunkSink::ChunkSink(fs::path prefix, CodecKind codec, bool write_digests)
    : prefix_(std::move(prefix)), codec_(make_codec(codec)),
      write_digests_(write_digests) {
  const auto parent = prefix_.parent_path();
  if (!parent.empty())
    fs::create_directories(parent);
}

ChunkSink::~ChunkSink() { abandon(); }

void ChunkSink::open_chunk() {
  current_path_ = chunk_path(prefix_, next_index_);
  chunk_bytes_ = 0;
  raw_digest_ = std::make_shared<detail::Sha256Digest>();
  stored_digest_ = std::make_shared<detail::Sha256Digest>();

  io::file_sink file(current_path_.string(),
                     std::ios::binary | std::ios::trunc);
  if (!file.is_open())
    throw std::ios_base::failure("cannot create " + current_path_.string());

  out_ = std::make_unique<io::filtering_ostream>();
  if (write_digests_)
    out_->push(detail::Sha256OutputFilter(raw_digest_));
  codec_->push_encoder(*out_);
  if (write_digests_)
    out_->push(detail::Sha256OutputFilter(stored_digest_));
  out_->push(file);
  // An incomplete chain reports badbit, so this waits for the device.
  out_->exceptions(std::ios::badbit);

  BOOST_LOG_TRIVIAL(debug) << "Opened chunk " << current_path_.string();
}

void ChunkSink::write(const Block &block) {
  if (!out_)
    open_chunk();
  out_->write(block.data(), static_cast<std::streamsize>(block.size()));
  chunk_bytes_ += block.size();
}

void ChunkSink::close_chunk() {
  if (!out_)
    return;

  // Popping the device closes the whole chain, flushing the encoder.
  out_->pop();
  out_.reset();

  if (write_digests_) {
    write_digest_file(raw_digest_path(current_path_), raw_digest_->hex());
    write_digest_file(stored_digest_path(current_path_), stored_digest_->hex());
  }

  std::error_code ec;
  const auto stored = fs::file_size(current_path_, ec);
  BOOST_LOG_TRIVIAL(info) << "Wrote chunk " << current_path_.string() << " ("
                          << chunk_bytes_ << " bytes, "
                          << (ec ? 0 : stored) << " stored, "
                          << to_string(codec_->kind()) << ")";
  ++next_index_;
}

void ChunkSink::abandon() noexcept {
  if (!out_)
    return;
  try {
    out_.reset();
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(warning) << "Closing abandoned chunk "
                               << current_path_.string() << ": " << e.what();
  }
  std::error_code ec;
  fs::remove(current_path_, ec);
  if (ec)
    BOOST_LOG_TRIVIAL(warning) << "Cannot remove abandoned chunk "
                               << current_path_.string() << ": "
                               << ec.message();
  else
    BOOST_LOG_TRIVIAL(warning) << "Removed incomplete chunk "
                               << current_path_.string();
}

void ChunkSink::discard() noexcept {
  abandon();
  std::size_t removed = 0;
  for (std::size_t i = 0; i < next_index_; ++i) {
    const auto chunk = chunk_path(prefix_, i);
    for (const auto &path :
         {chunk, raw_digest_path(chunk), stored_digest_path(chunk)}) {
      std::error_code ec;
      if (fs::remove(path, ec) && path == chunk)
        ++removed;
      if (ec)
        BOOST_LOG_TRIVIAL(warning) << "Cannot remove " << path.string() << ": "
                                   << ec.message();
    }
  }
  if (removed > 0)
    BOOST_LOG_TRIVIAL(warning) << "Removed " << removed
                               << " chunks written before the failure";
  next_index_ = 0;
}

} // namespace tar_chunker
