#include <tar-header-block/block.hxx>
#include <tar-header-block/detail/octal.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <ios>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace io = boost::iostreams;
namespace fs = std::filesystem;
using namespace tar_header_block;

/**
 * @brief Read the first header block of a gzip-compressed archive.
 *
 * @param file_path Path of the .tar.gz file.
 * @return Block The first 512 bytes of the decompressed stream.
 */
static Block read_first_block(const fs::path &file_path) {
  io::filtering_istream in;
  in.push(io::gzip_decompressor());
  in.push(io::file_source(file_path.string(), std::ios::binary));

  std::array<char, block_size> bytes{};
  in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  EXPECT_EQ(in.gcount(), static_cast<std::streamsize>(bytes.size()));
  return Block(bytes);
}

static fs::path asset_path(const std::string &name) {
  return fs::path(__FILE__).parent_path() / "assets" / name;
}

/**
 * @brief Parse an octal field read through a view.
 */
static std::optional<std::uint64_t> octal(std::span<const char> field) {
  return detail::parse_octal(std::string_view(field.data(), field.size()));
}

/**
 * @brief Parameters for a single archive test case.
 *
 * - name: archive under tests/assets, written by GNU tar
 * - detected: format the first header block must classify as
 * - written: single format that reproduces the block through set_format
 */
struct TarAssetTestCase {
  std::string name;
  Format detected;
  Format written;
};

/**
 * @brief Parameterized fixture over archives in each on-disk format.
 */
class TarAssetTest : public ::testing::TestWithParam<TarAssetTestCase> {};

TEST_P(TarAssetTest, DetectsFormatOfFirstHeader) {
  const auto &[name, detected, written] = GetParam();

  const auto file_path = asset_path(name);
  ASSERT_TRUE(fs::exists(file_path));
  const auto block = read_first_block(file_path);
  EXPECT_EQ(block.get_format(), detected)
      << "Expected " << detected << " but got " << block.get_format();
}

TEST_P(TarAssetTest, RewritingTheFormatKeepsTheBlock) {
  const auto &[name, detected, written] = GetParam();

  const auto file_path = asset_path(name);
  ASSERT_TRUE(fs::exists(file_path));
  const auto original = read_first_block(file_path);
  auto rewritten = original;
  rewritten.set_format(written);
  EXPECT_EQ(rewritten, original);
}

// -----------------------------
// Test Case Definitions
// -----------------------------

INSTANTIATE_TEST_SUITE_P(
    TarAssetTests, TarAssetTest,
    ::testing::Values(
        TarAssetTestCase{
            .name = "v7.tar.gz", .detected = format_v7, .written = format_v7},
        TarAssetTestCase{.name = "ustar.tar.gz",
                         .detected = format_ustar | format_pax,
                         .written = format_ustar},
        // The first block of a PAX archive is the extended header itself.
        TarAssetTestCase{.name = "posix.tar.gz",
                         .detected = format_ustar | format_pax,
                         .written = format_pax},
        TarAssetTestCase{.name = "gnu.tar.gz",
                         .detected = format_gnu,
                         .written = format_gnu},
        TarAssetTestCase{.name = "gnu-sparse.tar.gz",
                         .detected = format_gnu,
                         .written = format_gnu}));

TEST(TarAssetSparseTest, ReadsInlineSparseMap) {
  const auto block = read_first_block(asset_path("gnu-sparse.tar.gz"));
  ASSERT_EQ(block.get_format(), format_gnu);
  EXPECT_EQ(block.v7().type_flag()[0], 'S');

  struct Extent {
    std::uint64_t offset;
    std::uint64_t length;
  };
  constexpr std::array<Extent, 4> expected{{
      {0, 4096},
      {65536, 4096},
      {262144, 100},
      {262244, 0},
  }};

  const auto sparse = block.gnu().sparse();
  ASSERT_EQ(sparse.max_entries(), expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(octal(sparse.entry(i).offset()), expected[i].offset) << i;
    EXPECT_EQ(octal(sparse.entry(i).length()), expected[i].length) << i;
  }
  EXPECT_EQ(sparse.is_extended()[0], '\0');
  EXPECT_EQ(octal(block.gnu().real_size()), 262244u);
}

TEST(TarAssetPaddingTest, NextRecordFollowsThePadding) {
  io::filtering_istream in;
  in.push(io::gzip_decompressor());
  in.push(io::file_source(asset_path("gnu.tar.gz").string(), std::ios::binary));

  std::array<char, block_size> bytes{};
  ASSERT_TRUE(in.read(bytes.data(), static_cast<std::streamsize>(bytes.size())));
  const Block header(bytes);
  ASSERT_EQ(header.get_format(), format_gnu);

  const auto size = octal(header.v7().size());
  ASSERT_TRUE(size);
  EXPECT_EQ(*size, std::string_view("hello, tar\n").size());

  const auto padding = block_padding(static_cast<std::int64_t>(*size));
  EXPECT_EQ(padding, 501);
  ASSERT_TRUE(in.ignore(static_cast<std::streamsize>(*size) + padding));

  // A single member is followed by the end-of-archive zero blocks.
  ASSERT_TRUE(in.read(bytes.data(), static_cast<std::streamsize>(bytes.size())));
  const Block next(bytes);
  EXPECT_TRUE(next.is_zero());
  EXPECT_EQ(next.get_format(), format_unknown);
}
