#include <tar-chunker/errors.hxx>

namespace tar_chunker {

TruncatedStream::TruncatedStream(std::uint64_t offset,
                                 const std::string &detail)
    : Error("truncated stream at offset " + std::to_string(offset) + ": " +
            detail),
      offset_(offset) {}

MalformedHeader::MalformedHeader(std::uint64_t offset,
                                 const std::string &reason)
    : Error("malformed header at offset " + std::to_string(offset) + ": " +
            reason),
      offset_(offset) {}

CorruptChunk::CorruptChunk(std::size_t index, const std::string &reason)
    : Error("corrupt chunk " + std::to_string(index) + ": " + reason),
      index_(index) {}

MissingChunk::MissingChunk(std::size_t index, const std::string &detail)
    : Error("missing chunk " + std::to_string(index) + ": " + detail),
      index_(index) {}

ExtractionError::ExtractionError(const std::filesystem::path &path,
                                 const std::string &reason)
    : Error("cannot extract " + path.string() + ": " + reason), path_(path) {}

} // namespace tar_chunker
