#include <tar-builder.hxx>

#include <tar-chunker/chunk-sink.hxx>
#include <tar-chunker/chunk-source.hxx>
#include <tar-chunker/detail/tar-header.hxx>
#include <tar-chunker/errors.hxx>
#include <tar-chunker/extractor.hxx>
#include <tar-chunker/reassembler.hxx>
#include <tar-chunker/splitter.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include <string>

namespace io = boost::iostreams;
namespace fs = std::filesystem;
using namespace tar_chunker;

namespace {

std::string load_asset(const std::string &name) {
  const auto path = fs::path(__FILE__).parent_path() / "assets" / name;
  io::filtering_istream in;
  in.push(io::gzip_decompressor());
  in.push(io::file_source(path.string(), std::ios::binary));
  std::string archive;
  io::copy(in, io::back_inserter(archive));
  return archive;
}

/**
 * @brief Describe a directory tree as path -> (type, content digest, mode).
 *
 * Symlinks are not followed; hard links show up as regular files.
 */
std::map<std::string, std::string> snapshot(const fs::path &root) {
  std::map<std::string, std::string> tree;
  for (const auto &entry : fs::recursive_directory_iterator(root)) {
    const auto relative = fs::relative(entry.path(), root).generic_string();
    if (entry.is_symlink()) {
      tree[relative] = "link:" + fs::read_symlink(entry.path()).string();
    } else if (entry.is_directory()) {
      tree[relative] = "dir";
    } else {
      const auto mode = static_cast<unsigned>(entry.status().permissions() &
                                              fs::perms::mask);
      tree[relative] = "file:" + std::to_string(mode) + ":" +
                       test::sha256_hex(test::read_file(entry.path()));
    }
  }
  return tree;
}

void unpack_chunks(const fs::path &location, const fs::path &destination) {
  Extractor extractor(destination);
  Reassembler().run(ChunkSource::discover(location), extractor);
}

void split(const std::string &archive, const fs::path &prefix,
           std::uint64_t chunk_blocks, CodecKind codec) {
  ChunkSink sink(prefix, codec);
  Splitter splitter(sink, chunk_blocks);
  std::istringstream in(archive);
  splitter.split(in);
}

} // namespace

class ExtractionEquivalenceTest
    : public ::testing::TestWithParam<std::uint64_t> {};

/**
 * @brief Unpacking the chunks materializes the same tree as extracting the
 * original archive directly.
 */
TEST_P(ExtractionEquivalenceTest, MatchesDirectExtraction) {
  for (const auto asset : {"gnu-tree.tar.gz", "pax-tree.tar.gz"}) {
    SCOPED_TRACE(asset);
    const auto archive = load_asset(asset);
    const auto dir = test::make_temp_dir("equivalence");

    std::istringstream plain(archive);
    const auto direct = extract_archive(plain, dir / "direct");
    EXPECT_GT(direct, 0u);

    split(archive, dir / "chunks" / "tree.tar", GetParam(), CodecKind::Zstd);
    unpack_chunks(dir / "chunks", dir / "unpacked");

    const auto expected = snapshot(dir / "direct");
    EXPECT_EQ(snapshot(dir / "unpacked"), expected);
    EXPECT_EQ(expected.at("tree/readme-link"), "link:docs/readme.txt");
    EXPECT_EQ(expected.at("tree/docs/readme.txt"),
              expected.at("tree/docs/readme-hard.txt"));
    fs::remove_all(dir);
  }
}

INSTANTIATE_TEST_SUITE_P(ChunkSizes, ExtractionEquivalenceTest,
                         ::testing::Values(2, 3, 7, 40, 4096));

TEST(Extractor, MaterializesEveryEntryKind) {
  const std::string long_dir = "root/" + std::string(140, 'x');
  const auto archive = test::TarBuilder{}
                           .directory("root/")
                           .file("root/small.txt", "small file\n", 0640)
                           .pax_path(long_dir + "/long.bin")
                           .file("root/placeholder", test::pattern(3000))
                           .gnu_long_name("root/" + std::string(130, 'y'))
                           .file("root/short", "gnu")
                           .symlink("root/link", "small.txt")
                           .hard_link("root/hard", "root/small.txt")
                           .file("root/empty", "")
                           .finish();
  const auto dir = test::make_temp_dir("extract-kinds");
  std::istringstream in(archive);
  EXPECT_EQ(extract_archive(in, dir), 7u);

  EXPECT_TRUE(fs::is_directory(dir / "root"));
  EXPECT_EQ(test::read_file(dir / "root/small.txt"), "small file\n");
  EXPECT_EQ(fs::status(dir / "root/small.txt").permissions() & fs::perms::mask,
            static_cast<fs::perms>(0640));
  EXPECT_EQ(test::read_file(dir / long_dir / "long.bin"), test::pattern(3000));
  EXPECT_FALSE(fs::exists(dir / "root/placeholder"));
  EXPECT_EQ(test::read_file(dir / "root" / std::string(130, 'y')), "gnu");
  EXPECT_EQ(fs::read_symlink(dir / "root/link"), "small.txt");
  EXPECT_EQ(test::read_file(dir / "root/hard"), "small file\n");
  EXPECT_EQ(fs::hard_link_count(dir / "root/small.txt"), 2u);
  EXPECT_EQ(fs::file_size(dir / "root/empty"), 0u);
}

TEST(Extractor, LeadingSlashAndDotAreStripped) {
  const auto archive = test::TarBuilder{}
                           .file("/abs/file", "a")
                           .file("./rel/file", "b")
                           .finish();
  const auto dir = test::make_temp_dir("extract-strip");
  std::istringstream in(archive);
  extract_archive(in, dir);
  EXPECT_EQ(test::read_file(dir / "abs/file"), "a");
  EXPECT_EQ(test::read_file(dir / "rel/file"), "b");
}

TEST(Extractor, ParentComponentIsRejected) {
  const auto archive =
      test::TarBuilder{}.file("safe/../../escape", "x").finish();
  const auto dir = test::make_temp_dir("extract-escape");
  std::istringstream in(archive);
  EXPECT_THROW(extract_archive(in, dir / "root"), ExtractionError);
  EXPECT_FALSE(fs::exists(dir / "escape"));
}

TEST(Extractor, HardLinkOutsideRootIsRejected) {
  const auto archive =
      test::TarBuilder{}.hard_link("link", "../../etc/passwd").finish();
  const auto dir = test::make_temp_dir("extract-link-escape");
  std::istringstream in(archive);
  EXPECT_THROW(extract_archive(in, dir), ExtractionError);
}

TEST(Extractor, SymlinkCannotRedirectLaterEntries) {
  const auto dir = test::make_temp_dir("extract-symlink-escape");
  const auto outside = dir / "outside";
  fs::create_directories(outside);

  for (const auto &target : {outside.string(), std::string("../outside")}) {
    SCOPED_TRACE(target);
    for (const auto &later : {std::string("evil/owned.txt"),
                              std::string("evil/sub/owned.txt")}) {
      const auto archive = test::TarBuilder{}
                               .symlink("evil", target)
                               .file(later, "owned")
                               .finish();
      std::istringstream in(archive);
      EXPECT_THROW(extract_archive(in, dir / "root"), ExtractionError);
      EXPECT_TRUE(fs::is_empty(outside));
    }

    const auto archive = test::TarBuilder{}
                             .symlink("evil", target)
                             .directory("evil/")
                             .finish();
    std::istringstream in(archive);
    EXPECT_THROW(extract_archive(in, dir / "root"), ExtractionError);

    const auto linked = test::TarBuilder{}
                            .symlink("evil", target)
                            .file("victim", "v")
                            .hard_link("copy", "evil/passwd")
                            .finish();
    std::istringstream linked_in(linked);
    EXPECT_THROW(extract_archive(linked_in, dir / "root"), ExtractionError);
    fs::remove_all(dir / "root");
  }
  EXPECT_TRUE(fs::is_empty(outside));
}

TEST(Extractor, SpecialFilesAreSkipped) {
  const auto archive = test::TarBuilder{}
                           .special("fifo", detail::typeflag::kFifo)
                           .special("tty", detail::typeflag::kCharDevice)
                           .file("regular", "r")
                           .finish();
  const auto dir = test::make_temp_dir("extract-special");
  std::istringstream in(archive);
  EXPECT_EQ(extract_archive(in, dir), 1u);
  EXPECT_FALSE(fs::exists(dir / "fifo"));
  EXPECT_FALSE(fs::exists(dir / "tty"));
  EXPECT_TRUE(fs::exists(dir / "regular"));
}

TEST(Extractor, SparseEntriesAreRejected) {
  const auto archive =
      test::TarBuilder{}
          .block(test::make_header("sparse", detail::typeflag::kGnuSparse, 0))
          .finish();
  const auto dir = test::make_temp_dir("extract-sparse");
  std::istringstream in(archive);
  EXPECT_THROW(extract_archive(in, dir), ExtractionError);
}

TEST(Extractor, ExtractingTwiceReplacesFiles) {
  const auto archive = test::TarBuilder{}
                           .file("a", "first")
                           .symlink("l", "a")
                           .hard_link("h", "a")
                           .finish();
  const auto dir = test::make_temp_dir("extract-twice");
  for (int i = 0; i < 2; ++i) {
    std::istringstream in(archive);
    EXPECT_EQ(extract_archive(in, dir), 3u);
  }
  EXPECT_EQ(test::read_file(dir / "h"), "first");
  EXPECT_EQ(fs::read_symlink(dir / "l"), "a");
}

TEST(Extractor, StreamAndTreeFromOneUnpack) {
  const auto archive = test::TarBuilder{}
                           .file("big", test::pattern(10 * kBlockSize + 1))
                           .file("small", "s")
                           .finish(6);
  const auto dir = test::make_temp_dir("extract-tee");
  split(archive, dir / "chunks" / "p", 3, CodecKind::Gzip);

  std::ostringstream stream;
  StreamWriter writer(stream);
  Extractor extractor(dir / "out");
  TeeConsumer both;
  both.add(writer);
  both.add(extractor);
  const auto summary =
      Reassembler().run(ChunkSource::discover(dir / "chunks" / "p"), both);

  EXPECT_EQ(stream.str(), archive);
  EXPECT_EQ(summary.entries, 2u);
  EXPECT_EQ(summary.archive_bytes, archive.size());
  EXPECT_GT(summary.continuation_records, 0u);
  EXPECT_EQ(test::read_file(dir / "out/big"), test::pattern(10 * kBlockSize + 1));
  EXPECT_EQ(test::read_file(dir / "out/small"), "s");
}
