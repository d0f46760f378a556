#pragma once

#include <cstddef>
#include <string_view>

namespace tar_header_block {
/** @brief Size of every record in a tar stream, headers included. */
inline constexpr std::size_t block_size = 512;

/** @brief Capacity of the name field in the USTAR format. */
inline constexpr std::size_t name_size = 100;

/** @brief Capacity of the prefix field in the USTAR format. */
inline constexpr std::size_t prefix_size = 155;

/**
 * @brief Literal byte strings used to fingerprint each format.
 *
 * USTAR and PAX share the same magic and version. GNU uses a magic that is
 * one space short of a NUL and a version of space-NUL. STAR reuses the USTAR
 * magic and adds a trailer at the very end of the block.
 */
inline constexpr std::string_view magic_gnu{"ustar ", 6};
inline constexpr std::string_view version_gnu{" \0", 2};
inline constexpr std::string_view magic_ustar{"ustar\0", 6};
inline constexpr std::string_view version_ustar{"00", 2};
inline constexpr std::string_view trailer_star{"tar\0", 4};
} // namespace tar_header_block
