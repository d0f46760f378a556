/**
 * @file block.hxx
 * @brief The 512-byte tar header record and the operations on it.
 */

#pragma once

#include <tar-header-block/constants.hxx>
#include <tar-header-block/format.hxx>
#include <tar-header-block/header-views.hxx>
#include <tar-header-block/sparse.hxx>

#include <array>
#include <cstdint>
#include <span>

namespace tar_header_block {
/**
 * @struct Checksum
 * @brief Both sums a header checksum may have been computed with.
 *
 * POSIX specifies the sum of the unsigned byte values, but the historical
 * Sun tar summed signed bytes. Archives written either way are in the wild, so
 * a stored checksum is valid when it equals either value.
 */
struct Checksum {
  std::int64_t unsigned_sum = 0; /**< @brief Bytes taken as 0..255. */
  std::int64_t signed_sum = 0;   /**< @brief Bytes taken as -128..127. */

  friend bool operator==(const Checksum &, const Checksum &) = default;
};

/**
 * @class Block
 * @brief Owner of one 512-byte tar header record.
 *
 * The block stores bytes only. Field access goes through the format views
 * returned by v7(), ustar(), star(), gnu() and sparse(); those borrow the
 * block's storage and must not outlive it. A const Block hands out read-only
 * views.
 *
 * The block is not synchronized; concurrent writers must be serialized by the
 * caller.
 */
class Block {
public:
  /** @brief Construct an all-zero block. */
  Block() noexcept = default;

  /**
   * @brief Construct a block holding a copy of @p bytes.
   *
   * @param bytes Exactly one record read from a tar stream.
   */
  explicit Block(std::span<const char, block_size> bytes) noexcept;

  /** @brief Raw bytes of the block. */
  std::span<char, block_size> data() noexcept { return bytes_; }
  /** @brief Raw bytes of the block. */
  std::span<const char, block_size> data() const noexcept { return bytes_; }

  HeaderV7 v7() noexcept { return HeaderV7(bytes_); }
  ConstHeaderV7 v7() const noexcept { return ConstHeaderV7(bytes_); }

  HeaderUstar ustar() noexcept { return HeaderUstar(bytes_); }
  ConstHeaderUstar ustar() const noexcept { return ConstHeaderUstar(bytes_); }

  HeaderStar star() noexcept { return HeaderStar(bytes_); }
  ConstHeaderStar star() const noexcept { return ConstHeaderStar(bytes_); }

  HeaderGnu gnu() noexcept { return HeaderGnu(bytes_); }
  ConstHeaderGnu gnu() const noexcept { return ConstHeaderGnu(bytes_); }

  /**
   * @brief The whole block as a sparse map.
   *
   * This is the layout of a GNU sparse continuation block: 21 entries and the
   * extension flag at byte 504.
   */
  SparseArray sparse() noexcept { return SparseArray(bytes_); }
  /** @copydoc sparse() */
  ConstSparseArray sparse() const noexcept { return ConstSparseArray(bytes_); }

  /**
   * @brief Classify the block.
   *
   * The block must first carry a valid checksum: the checksum field has to
   * parse as octal and match either of the sums from compute_checksum().
   * Otherwise the block is not a header (corrupt data, or the zero block that
   * ends an archive) and format_unknown is returned.
   *
   * A valid header is then told apart by its magic, version and trailer:
   *  - USTAR magic and STAR trailer: format_star,
   *  - USTAR magic: format_ustar | format_pax, since the two are identical at
   *    this level,
   *  - GNU magic and GNU version: format_gnu,
   *  - anything else: format_v7.
   *
   * @return Format Candidate formats, or format_unknown.
   */
  Format get_format() const;

  /**
   * @brief Stamp the block as @p format and refresh its checksum.
   *
   * Writes the magic, version and trailer bytes of @p format (nothing for V7,
   * which predates them), then stores the unsigned checksum as six octal
   * digits followed by a NUL and a space.
   *
   * @param format Exactly one of the format constants.
   * @throws std::invalid_argument when @p format is unknown or names more
   * than one format.
   */
  void set_format(Format format);

  /**
   * @brief Sum the block with the checksum field read as eight spaces.
   *
   * @return Checksum The unsigned and the signed byte sums.
   */
  Checksum compute_checksum() const noexcept;

  /** @brief Clear the block to all zeros. */
  void reset() noexcept;

  /** @brief Check for the all-zero block that marks the end of an archive. */
  bool is_zero() const noexcept;

  friend bool operator==(const Block &, const Block &) = default;

private:
  std::array<char, block_size> bytes_{};
};

/** @brief A shared all-zero block. */
const Block &zero_block() noexcept;

/**
 * @brief Number of bytes needed to pad @p offset to the next block edge.
 *
 * @param offset Non-negative stream offset.
 * @return std::int64_t Value in [0, 511]; 0 when @p offset is block aligned.
 */
constexpr std::int64_t block_padding(std::int64_t offset) noexcept {
  return -offset & static_cast<std::int64_t>(block_size - 1);
}
} // namespace tar_header_block
