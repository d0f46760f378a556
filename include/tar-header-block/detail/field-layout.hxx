#pragma once

#include <tar-header-block/constants.hxx>

#include <cstddef>
#include <span>

namespace tar_header_block::detail {
/**
 * @struct Field
 * @brief Contiguous byte range of a header block.
 *
 * Offsets and lengths are fixed by the on-disk formats and never change at
 * runtime, so every field is a compile-time constant and can be used as a
 * template argument.
 */
struct Field {
  std::size_t offset; /**< @brief First byte of the field. */
  std::size_t length; /**< @brief Number of bytes in the field. */

  /** @brief One past the last byte of the field. */
  constexpr std::size_t end() const noexcept { return offset + length; }
};

// Fields of the original V7 header, present in every format.
inline constexpr Field v7_name{0, 100};
inline constexpr Field v7_mode{100, 8};
inline constexpr Field v7_uid{108, 8};
inline constexpr Field v7_gid{116, 8};
inline constexpr Field v7_size{124, 12};
inline constexpr Field v7_mod_time{136, 12};
inline constexpr Field v7_checksum{148, 8};
inline constexpr Field v7_type_flag{156, 1};
inline constexpr Field v7_link_name{157, 100};

// Fields shared by USTAR, PAX, GNU and STAR.
inline constexpr Field ustar_magic{257, 6};
inline constexpr Field ustar_version{263, 2};
inline constexpr Field ustar_user_name{265, 32};
inline constexpr Field ustar_group_name{297, 32};
inline constexpr Field ustar_dev_major{329, 8};
inline constexpr Field ustar_dev_minor{337, 8};

inline constexpr Field ustar_prefix{345, prefix_size};

inline constexpr Field star_prefix{345, 131};
inline constexpr Field star_access_time{476, 12};
inline constexpr Field star_change_time{488, 12};
inline constexpr Field star_trailer{508, 4};

inline constexpr Field gnu_access_time{345, 12};
inline constexpr Field gnu_change_time{357, 12};
inline constexpr Field gnu_sparse{386, 4 * 24 + 1};
inline constexpr Field gnu_real_size{483, 12};

// Layout of one (offset, length) pair of a sparse map.
inline constexpr std::size_t sparse_entry_size = 24;
inline constexpr Field sparse_offset{0, 12};
inline constexpr Field sparse_length{12, 12};

static_assert(v7_name.length == name_size);
static_assert(v7_link_name.end() == ustar_magic.offset);
static_assert(ustar_prefix.end() + 12 == block_size);
static_assert(star_trailer.end() == block_size);
static_assert(gnu_sparse.end() == gnu_real_size.offset);
static_assert(gnu_real_size.end() <= block_size);
static_assert(sparse_length.end() == sparse_entry_size);

/**
 * @brief Window onto one field of a block-sized span.
 *
 * @tparam F Field to address.
 * @tparam Char `char` for a writable window, `const char` for a read-only one.
 * @tparam Extent Extent of the span being addressed.
 * @param bytes Span the field lies within.
 * @return std::span<Char, F.length> Alias of the field's bytes; no copy.
 */
template <Field F, typename Char, std::size_t Extent>
constexpr std::span<Char, F.length>
slice(std::span<Char, Extent> bytes) noexcept {
  static_assert(F.end() <= Extent, "field lies outside the span");
  return bytes.template subspan<F.offset, F.length>();
}
} // namespace tar_header_block::detail
