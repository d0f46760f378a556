/**
 * @file format.hxx
 * @brief Identifier for the competing tar header conventions.
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

namespace tar_header_block {
/**
 * @class Format
 * @brief Set of tar formats a header block may follow.
 *
 * The original tar format was introduced in Unix V7. USTAR (POSIX.1-1988),
 * PAX (POSIX.1-2001), GNU and Schily's STAR all extend it over the same
 * 512-byte block. Each concrete format owns one bit of the mask.
 *
 * A Format may legitimately carry more than one bit: USTAR and PAX headers are
 * byte-identical, so a block classified in isolation is "USTAR or PAX". The
 * empty mask means the format is unknown.
 *
 * The set operations narrow or widen the candidates in place:
 *  - may_be() adds candidates,
 *  - may_only_be() keeps only the candidates also present in @p other,
 *  - must_not_be() removes candidates.
 */
class Format {
public:
  using mask_type = std::uint8_t;

  /** @brief Construct the unknown (empty) format. */
  constexpr Format() noexcept = default;

  /**
   * @brief Construct a format from a raw bit mask.
   *
   * @param mask Bits of the candidate formats.
   */
  constexpr explicit Format(mask_type mask) noexcept : mask_(mask) {}

  /** @brief Raw bit mask of the candidate formats. */
  constexpr mask_type mask() const noexcept { return mask_; }

  /**
   * @brief Check whether the two sets share at least one candidate.
   *
   * @param other Format to test against.
   * @return true if any bit is set in both masks.
   */
  constexpr bool has(Format other) const noexcept {
    return (mask_ & other.mask_) != 0;
  }

  /** @brief Add the candidates of @p other. */
  constexpr void may_be(Format other) noexcept { mask_ |= other.mask_; }

  /** @brief Keep only candidates that are also in @p other. */
  constexpr void may_only_be(Format other) noexcept { mask_ &= other.mask_; }

  /** @brief Rule out the candidates of @p other. */
  constexpr void must_not_be(Format other) noexcept {
    mask_ &= static_cast<mask_type>(~other.mask_);
  }

  /**
   * @brief Check whether exactly one format is selected.
   *
   * Only such a format can be written into a block.
   */
  constexpr bool is_single() const noexcept {
    return mask_ != 0 && (mask_ & (mask_ - 1)) == 0;
  }

  /**
   * @brief Human-readable rendering.
   *
   * @return std::string "GNU" for a single format, "(USTAR | PAX)" for
   * several, "<unknown>" when no known format is set.
   */
  std::string to_string() const;

  friend constexpr bool operator==(Format, Format) noexcept = default;

  /** @brief Union of two candidate sets. */
  friend constexpr Format operator|(Format lhs, Format rhs) noexcept {
    lhs.may_be(rhs);
    return lhs;
  }

private:
  mask_type mask_ = 0;
};

/** @brief Format of a block that is not a valid header. */
inline constexpr Format format_unknown{};

/** @brief Unix V7 tar, prior to any standardization. */
inline constexpr Format format_v7{0x01};

/** @brief POSIX.1-1988 USTAR. */
inline constexpr Format format_ustar{0x02};

/**
 * @brief POSIX.1-2001 PAX.
 *
 * A USTAR header preceded by an extended header record; identical to USTAR at
 * the block level.
 */
inline constexpr Format format_pax{0x04};

/** @brief GNU tar, incompatible with USTAR. */
inline constexpr Format format_gnu{0x08};

/** @brief Schily's STAR, incompatible with USTAR. */
inline constexpr Format format_star{0x10};

/** @brief Stream the to_string() rendering of @p format. */
std::ostream &operator<<(std::ostream &os, Format format);
} // namespace tar_header_block
