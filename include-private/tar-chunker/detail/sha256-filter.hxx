#pragma once

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

#include <picosha2.h>

#include <memory>
#include <string>
#include <utility>

namespace tar_chunker::detail {

/**
 * @brief Running SHA-256 digest shared between a filter and its owner.
 *
 * Boost.Iostreams copies filters when they are pushed onto a chain, so the
 * digest lives behind a shared pointer that the owner keeps to read the
 * result once the chain is closed.
 */
class Sha256Digest {
public:
  void update(const char *data, std::streamsize n) {
    if (n > 0)
      hasher_.process(data, data + n);
  }

  /// Finish hashing and return the lowercase hex digest.
  std::string hex() {
    hasher_.finish();
    return picosha2::get_hash_hex_string(hasher_);
  }

private:
  picosha2::hash256_one_by_one hasher_;
};

/**
 * @brief Pass-through output filter hashing every byte written through it.
 *
 * @code{.cpp}
 * auto digest = std::make_shared<Sha256Digest>();
 * io::filtering_ostream out;
 * out.push(Sha256OutputFilter(digest));
 * out.push(io::file_sink("chunk.000", std::ios::binary));
 * @endcode
 */
class Sha256OutputFilter : public boost::iostreams::multichar_output_filter {
public:
  explicit Sha256OutputFilter(std::shared_ptr<Sha256Digest> digest)
      : digest_(std::move(digest)) {}

  template <typename Sink>
  std::streamsize write(Sink &snk, const char *s, std::streamsize n) {
    const auto written = boost::iostreams::write(snk, s, n);
    digest_->update(s, written);
    return written;
  }

private:
  std::shared_ptr<Sha256Digest> digest_;
};

/// Pass-through input filter hashing every byte read through it.
class Sha256InputFilter : public boost::iostreams::multichar_input_filter {
public:
  explicit Sha256InputFilter(std::shared_ptr<Sha256Digest> digest)
      : digest_(std::move(digest)) {}

  template <typename Source>
  std::streamsize read(Source &src, char *s, std::streamsize n) {
    const auto got = boost::iostreams::read(src, s, n);
    digest_->update(s, got);
    return got;
  }

private:
  std::shared_ptr<Sha256Digest> digest_;
};

} // namespace tar_chunker::detail
