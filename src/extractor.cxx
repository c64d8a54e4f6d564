#include <tar-chunker/detail/tar-header.hxx>
#include <tar-chunker/errors.hxx>
#include <tar-chunker/extractor.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/log/trivial.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace tar_chunker {
namespace fs = std::filesystem;
namespace io = boost::iostreams;
namespace {

/// Entries at least this large are reported at info level.
constexpr std::uint64_t kLargeEntryBytes = 1 << 20;

/// Remove whatever occupies @p path unless it is a directory.
void clear_target(const fs::path &path) {
  std::error_code ec;
  const auto status = fs::symlink_status(path, ec);
  if (ec || !fs::exists(status) || fs::is_directory(status))
    return;
  fs::remove(path, ec);
  if (ec)
    throw ExtractionError(path, "cannot replace existing file: " +
                                    ec.message());
}

} // unnamed namespace

Extractor::Extractor(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec)
    throw ExtractionError(root_, "cannot create destination: " + ec.message());
}

/**
 * @brief Map an archive name onto a path below the root.
 * @throws ExtractionError when the name would escape the root.
 */
fs::path Extractor::resolve(const std::string &name) const {
  fs::path relative;
  for (const auto &part : fs::path(name)) {
    if (part.empty() || part == "." || part == "/" || part.has_root_name() ||
        part.has_root_directory())
      continue;
    if (part == "..")
      throw ExtractionError(name, "entry name escapes the destination");
    relative /= part;
  }
  return relative.empty() ? root_ : root_ / relative;
}

/**
 * @brief Refuse a path that would pass through an existing symbolic link.
 *
 * Symlinks are created with their targets verbatim, so a later entry named
 * through one could land anywhere. The last component is checked only when
 * @p include_last is set; files and links replace it instead of following.
 */
void Extractor::reject_symlinks(const fs::path &path, bool include_last) const {
  const auto relative = path.lexically_relative(root_);
  auto last = relative.end();
  if (!include_last && relative.begin() != last)
    --last;

  auto current = root_;
  for (auto it = relative.begin(); it != last; ++it) {
    current /= *it;
    std::error_code ec;
    const auto status = fs::symlink_status(current, ec);
    if (ec || !fs::exists(status))
      return;
    if (fs::is_symlink(status))
      throw ExtractionError(path, "path goes through symbolic link '" +
                                      current.string() + "'");
  }
}

void Extractor::prepare_parent(const fs::path &path) const {
  if (!path.has_parent_path())
    return;
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec)
    throw ExtractionError(path, "cannot create parent directory: " +
                                    ec.message());
}

void Extractor::open_file(const fs::path &path) {
  prepare_parent(path);
  clear_target(path);
  io::file_sink sink(path.string(), std::ios::binary | std::ios::trunc);
  if (!sink.is_open())
    throw ExtractionError(path, "cannot open for writing");
  file_.open(sink);
  file_path_ = path;
  written_ = 0;
}

void Extractor::on_entry(const EntryInfo &entry) {
  namespace tf = detail::typeflag;

  const auto path = resolve(entry.name);
  reject_symlinks(path, entry.typeflag == tf::kDirectory);
  std::error_code ec;
  switch (entry.typeflag) {
  case tf::kDirectory:
    fs::create_directories(path, ec);
    if (ec)
      throw ExtractionError(path, "cannot create directory: " + ec.message());
    break;
  case tf::kSymlink:
    prepare_parent(path);
    clear_target(path);
    fs::create_symlink(entry.link_name, path, ec);
    if (ec)
      throw ExtractionError(path, "cannot create symlink to '" +
                                      entry.link_name + "': " + ec.message());
    break;
  case tf::kHardLink: {
    const auto target = resolve(entry.link_name);
    reject_symlinks(target, false);
    prepare_parent(path);
    clear_target(path);
    fs::create_hard_link(target, path, ec);
    if (ec)
      throw ExtractionError(path, "cannot link to '" + entry.link_name +
                                      "': " + ec.message());
    break;
  }
  case tf::kCharDevice:
  case tf::kBlockDevice:
  case tf::kFifo:
    BOOST_LOG_TRIVIAL(warning) << "Skipping special file '" << entry.name
                               << "' (type " << entry.typeflag << ")";
    return;
  case tf::kGnuSparse:
    throw ExtractionError(path, "sparse entries are not supported");
  case tf::kGnuMultiVolume:
    BOOST_LOG_TRIVIAL(warning) << "Skipping '" << entry.name
                               << "': continued from an earlier volume";
    return;
  default:
    // Regular and contiguous files; unknown types are treated the same.
    open_file(path);
    break;
  }
  BOOST_LOG_TRIVIAL(debug) << "Extracting '" << entry.name << "'";
}

void Extractor::on_payload(const char *data, std::size_t n) {
  if (!file_.is_open())
    return;
  file_.write(data, static_cast<std::streamsize>(n));
  if (!file_)
    throw ExtractionError(file_path_, "write failed");
  written_ += n;
}

void Extractor::on_entry_end(const EntryInfo &entry) {
  namespace tf = detail::typeflag;

  if (file_.is_open()) {
    file_.close();
    if (!file_)
      throw ExtractionError(file_path_, "cannot close file");
    if (entry.mode != 0) {
      std::error_code ec;
      fs::permissions(file_path_, static_cast<fs::perms>(entry.mode & 07777),
                      ec);
      if (ec)
        BOOST_LOG_TRIVIAL(warning) << "Cannot set mode of '"
                                   << file_path_.string()
                                   << "': " << ec.message();
    }
    if (written_ >= kLargeEntryBytes)
      BOOST_LOG_TRIVIAL(info) << "Extracted '" << entry.name << "' ("
                              << written_ << " bytes)";
    ++extracted_;
    return;
  }

  switch (entry.typeflag) {
  case tf::kDirectory:
  case tf::kSymlink:
  case tf::kHardLink:
    ++extracted_;
    break;
  default:
    break;
  }
}

void Extractor::finish() {
  if (file_.is_open())
    throw ExtractionError(file_path_, "archive ended inside the entry");
}

std::size_t extract_archive(std::istream &archive, const fs::path &root) {
  Extractor extractor(root);
  replay_archive(archive, extractor);
  return extractor.entries_extracted();
}

} // namespace tar_chunker
