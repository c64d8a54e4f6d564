#pragma once

#include <tar-chunker/reassembler.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/stream.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>

namespace tar_chunker {

/**
 * @class Extractor
 * @brief Materializes reassembled entries below a destination directory.
 *
 * Directories, regular files, symbolic links and hard links are created.
 * Device nodes and FIFOs are skipped with a warning. Names are resolved
 * relative to the root: leading "/" and "./" are dropped, and a ".."
 * component is refused, as is any name that passes through a symbolic link
 * already extracted.
 */
class Extractor : public ReassemblyConsumer {
public:
  explicit Extractor(std::filesystem::path root);

  void on_entry(const EntryInfo &entry) override;
  void on_payload(const char *data, std::size_t n) override;
  void on_entry_end(const EntryInfo &entry) override;
  void finish() override;

  std::size_t entries_extracted() const noexcept { return extracted_; }

private:
  std::filesystem::path resolve(const std::string &name) const;
  void reject_symlinks(const std::filesystem::path &path,
                       bool include_last) const;
  void prepare_parent(const std::filesystem::path &path) const;
  void open_file(const std::filesystem::path &path);

  std::filesystem::path root_;
  boost::iostreams::stream<boost::iostreams::file_sink> file_;
  std::filesystem::path file_path_;
  std::uint64_t written_ = 0;
  std::size_t extracted_ = 0;
};

/**
 * @brief Extract a plain archive stream into @p root.
 * @return Number of entries materialized.
 */
std::size_t extract_archive(std::istream &archive,
                            const std::filesystem::path &root);

} // namespace tar_chunker
