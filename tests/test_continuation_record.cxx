#include <tar-builder.hxx>

#include <tar-chunker/continuation-record.hxx>
#include <tar-chunker/detail/tar-fields.hxx>
#include <tar-chunker/detail/tar-header.hxx>
#include <tar-chunker/errors.hxx>

#include <gtest/gtest.h>
#include <string>

using namespace tar_chunker;

namespace {

EntryInfo entry_named(const std::string &name, std::uint64_t size) {
  EntryInfo entry;
  entry.name = name;
  entry.size = size;
  return entry;
}

} // namespace

TEST(ContinuationRecord, DescribesProgressThroughPayload) {
  const auto record = continuation_for(entry_named("data.bin", 10240), 2048);
  EXPECT_EQ(record.name, "data.bin");
  EXPECT_EQ(record.offset, 2048u);
  EXPECT_EQ(record.remaining, 8192u);
  EXPECT_EQ(record.total_size, 10240u);
}

TEST(ContinuationRecord, EncodedBlockDecodesToSameRecord) {
  const auto original = test::make_header("data.bin", '0', 10240, "", 0600);
  const auto record = continuation_for(entry_named("data.bin", 10240), 2048);
  const auto block = encode_continuation(record, original);

  EXPECT_TRUE(detail::verify_checksum(block.data()));
  auto gnu = reinterpret_cast<const detail::GnuTarHeader *>(block.data());
  EXPECT_EQ(gnu->typeflag[0], 'M');
  EXPECT_EQ(detail::parse_numeric_field(gnu->mode, sizeof(gnu->mode)), 0600u);

  const auto decoded = decode_continuation(block);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(*decoded, record);
}

TEST(ContinuationRecord, LongNamesAreTruncatedToTheNameField) {
  const std::string name(150, 'z');
  const auto record = continuation_for(entry_named(name, 4096), 512);
  EXPECT_EQ(record.name.size(), kContinuationNameLength);

  const auto block =
      encode_continuation(record, test::make_header("x", '0', 4096));
  const auto decoded = decode_continuation(block);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded->name, record.name);
}

TEST(ContinuationRecord, SizesBeyondOctalUseBase256) {
  const std::uint64_t total = std::uint64_t(1) << 36; // 64 GiB
  const auto record = continuation_for(entry_named("huge", total), 512);
  const auto block =
      encode_continuation(record, test::make_header("huge", '0', 0));
  const auto decoded = decode_continuation(block);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded->total_size, total);
  EXPECT_EQ(decoded->remaining, total - 512);
}

TEST(ContinuationRecord, OrdinaryHeaderIsNotARecord) {
  EXPECT_FALSE(decode_continuation(test::make_header("a", '0', 10)));
  EXPECT_FALSE(decode_continuation(Block{}));
}

TEST(ContinuationRecord, DamagedRecordIsMalformed) {
  const auto record = continuation_for(entry_named("a", 4096), 1024);
  auto block = encode_continuation(record, test::make_header("a", '0', 4096));
  block[0] = 'b';
  EXPECT_THROW(decode_continuation(block), MalformedHeader);
}

TEST(ContinuationRecord, InconsistentSizesAreMalformed) {
  const auto record = continuation_for(entry_named("a", 4096), 1024);
  auto block = encode_continuation(record, test::make_header("a", '0', 4096));
  auto gnu = reinterpret_cast<detail::GnuTarHeader *>(block.data());
  detail::format_numeric_field(gnu->realsize, sizeof(gnu->realsize), 9999);
  detail::write_checksum(block.data());
  EXPECT_THROW(decode_continuation(block), MalformedHeader);
}
