#include <tar-builder.hxx>

#include <tar-chunker/chunk-sink.hxx>
#include <tar-chunker/chunk-source.hxx>
#include <tar-chunker/continuation-record.hxx>
#include <tar-chunker/errors.hxx>
#include <tar-chunker/reassembler.hxx>
#include <tar-chunker/splitter.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace io = boost::iostreams;
namespace fs = std::filesystem;
using namespace tar_chunker;

namespace {

/// The uncompressed archive stored gzip-compressed under tests/assets.
std::string load_asset(const std::string &name) {
  const auto path = fs::path(__FILE__).parent_path() / "assets" / name;
  io::filtering_istream in;
  in.push(io::gzip_decompressor());
  in.push(io::file_source(path.string(), std::ios::binary));
  std::string archive;
  io::copy(in, io::back_inserter(archive));
  return archive;
}

SplitSummary split_to(const std::string &archive, const fs::path &prefix,
                      std::uint64_t chunk_bytes, CodecKind codec,
                      bool digests = false) {
  ChunkSink sink(prefix, codec, digests);
  Splitter splitter(sink, chunk_blocks_for(chunk_bytes));
  std::istringstream in(archive);
  return splitter.split(in);
}

std::string reassemble(const fs::path &location,
                       std::optional<CodecKind> codec = std::nullopt) {
  std::ostringstream out;
  StreamWriter writer(out);
  Reassembler(codec).run(ChunkSource::discover(location), writer);
  return out.str();
}

/// A mixed archive with entries of every kind the splitter cares about.
std::string mixed_archive() {
  return test::TarBuilder{}
      .directory("root/")
      .file("root/small.txt", "small file\n", 0640)
      .file("root/exact.bin", test::pattern(4 * kBlockSize, 3))
      .pax_path("root/" + std::string(140, 'x') + "/long.bin")
      .file("root/placeholder", test::pattern(9 * kBlockSize + 17, 4))
      .gnu_long_name("root/" + std::string(130, 'y') + ".txt")
      .file("root/short", test::pattern(700, 5))
      .symlink("root/link", "small.txt")
      .hard_link("root/hard", "root/small.txt")
      .file("root/empty", "")
      .finish(16);
}

} // namespace

struct RoundTripCase {
  std::string name;
  std::string hash;
  std::vector<std::uint64_t> chunk_sizes;
};

class AssetRoundTripTest : public ::testing::TestWithParam<RoundTripCase> {};

/**
 * @brief Splitting and reassembling a real tar archive gives it back byte
 * for byte, for every chunk size and codec.
 */
TEST_P(AssetRoundTripTest, ReassemblesIdenticalStream) {
  const auto &[asset, expected_hash, chunk_sizes] = GetParam();
  const auto archive = load_asset(asset);
  ASSERT_EQ(test::sha256_hex(archive), expected_hash);

  for (const auto codec : {CodecKind::None, CodecKind::Gzip, CodecKind::Zstd}) {
    for (const auto size : chunk_sizes) {
      SCOPED_TRACE(std::string(to_string(codec)) + " " + std::to_string(size));
      const auto dir = test::make_temp_dir("round-trip");
      const auto summary = split_to(archive, dir / "part", size, codec);
      EXPECT_GE(summary.chunks, 1u);
      for (std::size_t i = 0; i < summary.chunks; ++i) {
        const auto stored = test::read_file(chunk_path(dir / "part", i));
        EXPECT_LE(decode_bytes(stored, codec, i).size(), size);
      }

      const auto rebuilt = reassemble(dir);
      EXPECT_EQ(test::sha256_hex(rebuilt), expected_hash);
      fs::remove_all(dir);
    }
  }
}

INSTANTIATE_TEST_SUITE_P(
    RoundTripTests, AssetRoundTripTest,
    ::testing::Values(
        RoundTripCase{.name = "gnu-tree.tar.gz",
                      .hash = "b0694aadf5cf2abe47c31c1ecdf600153b16fbfd1b41c0c"
                              "a81656430cde77344",
                      .chunk_sizes = {1024, 1536, 5 * 1024, 64 * 1024,
                                      1024 * 1024}},
        RoundTripCase{.name = "pax-tree.tar.gz",
                      .hash = "f2cffa728b9201af665d28c76e3db90c0bbddad09fe4a31"
                              "1b2167fe3b5d6b240",
                      .chunk_sizes = {1024, 3 * 1024, 20 * 1024, 1024 * 1024}}));

TEST(RoundTrip, MixedArchiveAcrossAllSmallChunkSizes) {
  const auto archive = mixed_archive();
  for (std::uint64_t blocks = kMinChunkBlocks; blocks <= 24; ++blocks) {
    SCOPED_TRACE(blocks);
    const auto dir = test::make_temp_dir("round-trip-mixed");
    split_to(archive, dir / "m", blocks * kBlockSize, CodecKind::None);
    EXPECT_EQ(reassemble(dir / "m", CodecKind::None), archive);
    fs::remove_all(dir);
  }
}

TEST(RoundTrip, SplittingIsIdempotent) {
  const auto archive = mixed_archive();
  const auto dir = test::make_temp_dir("idempotent");
  const auto first = split_to(archive, dir / "a", 3 * 1024, CodecKind::Zstd);
  const auto second = split_to(archive, dir / "b", 3 * 1024, CodecKind::Zstd);
  ASSERT_EQ(first.chunks, second.chunks);
  for (std::size_t i = 0; i < first.chunks; ++i)
    EXPECT_EQ(test::read_file(chunk_path(dir / "a", i)),
              test::read_file(chunk_path(dir / "b", i)));
}

TEST(RoundTrip, DigestSidecarsAreVerifiedOnUnpack) {
  const auto archive = mixed_archive();
  const auto dir = test::make_temp_dir("digests");
  const auto summary =
      split_to(archive, dir / "d", 4 * 1024, CodecKind::Gzip, true);
  ASSERT_GT(summary.chunks, 2u);
  EXPECT_EQ(reassemble(dir), archive);

  test::write_file(raw_digest_path(chunk_path(dir / "d", 2)),
                   std::string(64, '0'));
  try {
    reassemble(dir);
    FAIL() << "expected CorruptChunk";
  } catch (const CorruptChunk &e) {
    EXPECT_EQ(e.index(), 2u);
  }
}

TEST(Reassembler, MissingFinalChunkIsDetected) {
  // Chunks: H P P P | C P P P | C P P P | C P P P | Z Z
  const auto archive = test::TarBuilder{}
                           .file("big", test::pattern(12 * kBlockSize))
                           .finish();
  const auto dir = test::make_temp_dir("missing-last");
  const auto prefix = dir / "p";
  const auto summary = split_to(archive, prefix, 4 * kBlockSize, CodecKind::None);
  ASSERT_EQ(summary.chunks, 5u);

  fs::remove(chunk_path(prefix, 4));
  try {
    reassemble(prefix);
    FAIL() << "expected MissingChunk";
  } catch (const MissingChunk &e) {
    EXPECT_EQ(e.index(), 4u);
  }

  fs::remove(chunk_path(prefix, 3));
  try {
    reassemble(prefix);
    FAIL() << "expected MissingChunk";
  } catch (const MissingChunk &e) {
    EXPECT_EQ(e.index(), 3u);
  }
}

TEST(Reassembler, ChunkMissingInTheMiddleIsDetected) {
  const auto archive = mixed_archive();
  const auto dir = test::make_temp_dir("missing-middle");
  split_to(archive, dir / "p", 2 * 1024, CodecKind::None);
  fs::remove(chunk_path(dir / "p", 1));

  try {
    reassemble(dir / "p");
    FAIL() << "expected MissingChunk";
  } catch (const MissingChunk &e) {
    EXPECT_EQ(e.index(), 1u);
  }
}

TEST(Reassembler, ReorderedChunksAreCorrupt) {
  const auto archive = test::TarBuilder{}
                           .file("big", test::pattern(12 * kBlockSize))
                           .finish();
  const auto dir = test::make_temp_dir("reordered");
  const auto prefix = dir / "p";
  const auto summary = split_to(archive, prefix, 4 * kBlockSize, CodecKind::None);
  ASSERT_GE(summary.chunks, 4u);

  // Both chunks resume "big", at different offsets.
  const auto one = test::read_file(chunk_path(prefix, 1));
  const auto two = test::read_file(chunk_path(prefix, 2));
  test::write_file(chunk_path(prefix, 1), two);
  test::write_file(chunk_path(prefix, 2), one);

  try {
    reassemble(prefix);
    FAIL() << "expected CorruptChunk";
  } catch (const CorruptChunk &e) {
    EXPECT_EQ(e.index(), 1u);
  }
}

TEST(Reassembler, ChunkWithoutExpectedContinuationIsCorrupt) {
  const auto archive = test::TarBuilder{}
                           .file("big", test::pattern(12 * kBlockSize))
                           .finish();
  const auto dir = test::make_temp_dir("no-record");
  const auto prefix = dir / "p";
  split_to(archive, prefix, 4 * kBlockSize, CodecKind::None);

  const auto chunk = test::read_file(chunk_path(prefix, 1));
  test::write_file(chunk_path(prefix, 1), chunk.substr(kBlockSize));

  try {
    reassemble(prefix);
    FAIL() << "expected CorruptChunk";
  } catch (const CorruptChunk &e) {
    EXPECT_EQ(e.index(), 1u);
  }
}

TEST(Reassembler, MisalignedChunkIsCorrupt) {
  const auto archive = mixed_archive();
  const auto dir = test::make_temp_dir("misaligned");
  const auto prefix = dir / "p";
  split_to(archive, prefix, 4 * kBlockSize, CodecKind::None);

  auto chunk = test::read_file(chunk_path(prefix, 1));
  chunk += "extra";
  test::write_file(chunk_path(prefix, 1), chunk);

  try {
    reassemble(prefix);
    FAIL() << "expected CorruptChunk";
  } catch (const CorruptChunk &e) {
    EXPECT_EQ(e.index(), 1u);
  }
}

TEST(Reassembler, DamagedCompressedChunkIsCorrupt) {
  const auto archive = mixed_archive();
  const auto dir = test::make_temp_dir("damaged-gzip");
  const auto prefix = dir / "p";
  split_to(archive, prefix, 8 * kBlockSize, CodecKind::Gzip);

  auto stored = test::read_file(chunk_path(prefix, 2));
  stored[2] = 0x07;
  test::write_file(chunk_path(prefix, 2), stored);

  try {
    reassemble(prefix, CodecKind::Gzip);
    FAIL() << "expected CorruptChunk";
  } catch (const CorruptChunk &e) {
    EXPECT_EQ(e.index(), 2u);
  }
}

TEST(Reassembler, TrailerShapedLikeContinuationIsKept) {
  // Chunks: H P | Z Z | M, where M follows the end-of-archive marker.
  auto archive = test::TarBuilder{}.file("a", "x").finish();
  EntryInfo entry;
  entry.name = "a";
  entry.size = 4096;
  const auto trailer = encode_continuation(continuation_for(entry, 512),
                                           test::make_header("a", '0', 4096));
  archive.append(trailer.data(), trailer.size());

  const auto dir = test::make_temp_dir("trailer-record");
  const auto summary =
      split_to(archive, dir / "t", 2 * kBlockSize, CodecKind::None);
  ASSERT_EQ(summary.chunks, 3u);
  EXPECT_EQ(test::read_file(chunk_path(dir / "t", 2)),
            std::string(trailer.data(), trailer.size()));
  EXPECT_EQ(reassemble(dir / "t"), archive);
}
