#include <tar-chunker/chunk-sink.hxx>
#include <tar-chunker/chunk-source.hxx>
#include <tar-chunker/detail/sha256-filter.hxx>
#include <tar-chunker/errors.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/log/trivial.hpp>

#include <picosha2.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace io = boost::iostreams;
namespace fs = std::filesystem;

namespace tar_chunker {
namespace {

/// Longest suffix accepted as a chunk index.
constexpr std::size_t kMaxSuffixDigits = 18;

/**
 * @brief Split `<base>.<digits>` into its base name and index.
 *
 * Digest sidecars and anything else without an all-digit suffix are not
 * chunks.
 */
std::optional<std::pair<std::string, std::size_t>>
parse_chunk_name(const std::string &file_name) {
  const auto dot = file_name.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == file_name.size())
    return std::nullopt;

  const auto suffix = file_name.substr(dot + 1);
  if (suffix.size() > kMaxSuffixDigits ||
      suffix.find_first_not_of("0123456789") != std::string::npos)
    return std::nullopt;

  return std::make_pair(file_name.substr(0, dot),
                        static_cast<std::size_t>(std::stoull(suffix)));
}

/// Sort by index and reject duplicates and gaps.
std::vector<ChunkFile> order_chunks(std::vector<ChunkFile> chunks,
                                    const fs::path &prefix) {
  if (chunks.empty())
    throw MissingChunk(0, "no chunk files found for " + prefix.string());

  std::sort(chunks.begin(), chunks.end(),
            [](const ChunkFile &a, const ChunkFile &b) {
              return a.index < b.index;
            });

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (i > 0 && chunks[i].index == chunks[i - 1].index)
      throw CorruptChunk(chunks[i].index,
                         "stored twice as " + chunks[i - 1].path.string() +
                             " and " + chunks[i].path.string());
    if (chunks[i].index != i)
      throw MissingChunk(i, "expected " + chunk_path(prefix, i).string() +
                                " before " + chunks[i].path.string());
  }
  return chunks;
}

std::string sha256_of_file(const fs::path &path) {
  io::stream<io::file_source> file(path.string(), std::ios::binary);
  if (!file->is_open())
    throw std::ios_base::failure("cannot open " + path.string());
  std::vector<std::uint8_t> hash(picosha2::k_digest_size);
  picosha2::hash256(std::istreambuf_iterator<char>(file),
                    std::istreambuf_iterator<char>{}, hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

/// Expected digest from a sidecar file, if the sidecar exists.
std::optional<std::string> read_digest_file(const fs::path &path) {
  if (!fs::exists(path))
    return std::nullopt;
  io::stream<io::file_source> file(path.string(), std::ios::binary);
  if (!file->is_open())
    throw std::ios_base::failure("cannot open " + path.string());
  std::string hex;
  file >> hex;
  if (file.bad())
    throw std::ios_base::failure("cannot read " + path.string());
  return hex;
}

} // unnamed namespace

ChunkSource::ChunkSource(fs::path prefix, std::vector<ChunkFile> chunks)
    : prefix_(std::move(prefix)), chunks_(std::move(chunks)) {}

ChunkSource ChunkSource::from_prefix(const fs::path &prefix) {
  auto directory = prefix.parent_path();
  if (directory.empty())
    directory = ".";
  const auto base = prefix.filename().string();

  std::vector<ChunkFile> chunks;
  if (fs::is_directory(directory)) {
    for (const auto &entry : fs::directory_iterator(directory)) {
      if (!entry.is_regular_file())
        continue;
      const auto parsed = parse_chunk_name(entry.path().filename().string());
      if (parsed && parsed->first == base)
        chunks.push_back(ChunkFile{parsed->second, entry.path()});
    }
  }
  return ChunkSource(prefix, order_chunks(std::move(chunks), prefix));
}

ChunkSource ChunkSource::from_directory(const fs::path &directory) {
  std::map<std::string, std::vector<ChunkFile>> sequences;
  for (const auto &entry : fs::directory_iterator(directory)) {
    if (!entry.is_regular_file())
      continue;
    const auto parsed = parse_chunk_name(entry.path().filename().string());
    if (parsed)
      sequences[parsed->first].push_back(ChunkFile{parsed->second, entry.path()});
  }

  if (sequences.empty())
    throw MissingChunk(0, "no chunk files found in " + directory.string());
  if (sequences.size() > 1) {
    std::string names;
    for (const auto &[base, chunks] : sequences)
      names += (names.empty() ? "" : ", ") + base;
    throw UsageError(directory.string() + " holds several chunk sequences (" +
                     names + "); pass one of them as a prefix");
  }

  auto &[base, chunks] = *sequences.begin();
  auto prefix = directory / base;
  return ChunkSource(prefix, order_chunks(std::move(chunks), prefix));
}

ChunkSource ChunkSource::discover(const fs::path &location) {
  if (fs::is_directory(location))
    return from_directory(location);
  return from_prefix(location);
}

ChunkReader::ChunkReader(const ChunkFile &chunk,
                         std::optional<CodecKind> codec)
    : chunk_(chunk), codec_(codec ? *codec : detect_codec(chunk.path)),
      raw_digest_(std::make_shared<detail::Sha256Digest>()) {
  if (const auto expected = read_digest_file(stored_digest_path(chunk_.path))) {
    const auto actual = sha256_of_file(chunk_.path);
    if (actual != *expected)
      throw CorruptChunk(chunk_.index, "stored bytes have SHA-256 " + actual +
                                           ", expected " + *expected);
  }

  io::file_source file(chunk_.path.string(), std::ios::binary);
  if (!file.is_open())
    throw std::ios_base::failure("cannot open " + chunk_.path.string());

  in_ = std::make_unique<io::filtering_istream>();
  in_->push(detail::Sha256InputFilter(raw_digest_));
  make_codec(codec_)->push_decoder(*in_);
  in_->push(file);
  // Rethrow decoder errors from reads instead of only setting badbit. Set
  // once the chain is complete, an empty chain already reports badbit.
  in_->exceptions(std::ios::badbit);
}

ChunkReader::~ChunkReader() = default;

void ChunkReader::verify() {
  const auto expected = read_digest_file(raw_digest_path(chunk_.path));
  if (!expected)
    return;
  const auto actual = raw_digest_->hex();
  if (actual != *expected)
    throw CorruptChunk(chunk_.index, "decoded bytes have SHA-256 " + actual +
                                         ", expected " + *expected);
  BOOST_LOG_TRIVIAL(debug) << "Verified digest of " << chunk_.path.string();
}

} // namespace tar_chunker
