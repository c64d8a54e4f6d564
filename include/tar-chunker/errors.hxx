#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace tar_chunker {

/**
 * @brief Root of every failure raised by the chunker.
 *
 * All subclasses describe data-integrity conditions; none of them is
 * transient, so callers report them and stop instead of retrying.
 */
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Input ended inside a block, a payload, or before the end-of-archive marker.
class TruncatedStream : public Error {
public:
  TruncatedStream(std::uint64_t offset, const std::string &detail);

  std::uint64_t offset() const noexcept { return offset_; }

private:
  std::uint64_t offset_;
};

/// A header block failed structural checks; offsets past it are untrusted.
class MalformedHeader : public Error {
public:
  MalformedHeader(std::uint64_t offset, const std::string &reason);

  std::uint64_t offset() const noexcept { return offset_; }

private:
  std::uint64_t offset_;
};

/// A stored chunk does not decode or does not continue the running state.
class CorruptChunk : public Error {
public:
  CorruptChunk(std::size_t index, const std::string &reason);

  std::size_t index() const noexcept { return index_; }

private:
  std::size_t index_;
};

/// The chunk sequence has a gap or lacks its final chunk.
class MissingChunk : public Error {
public:
  MissingChunk(std::size_t index, const std::string &detail);

  std::size_t index() const noexcept { return index_; }

private:
  std::size_t index_;
};

/// An entry could not be materialized under the destination root.
class ExtractionError : public Error {
public:
  ExtractionError(const std::filesystem::path &path, const std::string &reason);

  const std::filesystem::path &path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/// Invalid command line or configuration value.
class UsageError : public Error {
public:
  using Error::Error;
};

} // namespace tar_chunker
