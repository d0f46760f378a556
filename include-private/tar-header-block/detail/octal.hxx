#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace tar_header_block::detail {
/**
 * @brief Parse an ASCII octal number from a header field.
 *
 * Unused fields are filled with NULs and numbers may be padded with spaces or
 * NULs on either side, so both are trimmed first; an all-padding field reads
 * as zero. The remaining text is cut at its first NUL and must then consist of
 * octal digits only.
 *
 * @param field Bytes of the field.
 * @return std::optional<std::uint64_t> The value, or std::nullopt when the
 * field holds anything but octal digits or overflows.
 */
std::optional<std::uint64_t> parse_octal(std::string_view field) noexcept;

/**
 * @brief Store @p sum in the 8-byte checksum field.
 *
 * The checksum is the one numeric field terminated by a NUL and then a space:
 * six zero-padded octal digits, NUL, space. Every possible sum of a 512-byte
 * block (at most 0377 * 512) fits in six digits.
 *
 * @param field The checksum field.
 * @param sum Unsigned byte sum of the block.
 */
void format_checksum(std::span<char, 8> field, std::uint64_t sum);
} // namespace tar_header_block::detail
