#pragma once

#include <tar-header-block/constants.hxx>
#include <tar-header-block/detail/field-layout.hxx>
#include <tar-header-block/sparse.hxx>

#include <span>

namespace tar_header_block {
/**
 * @class BasicHeaderV7
 * @brief Overlay of the V7 header fields onto a 512-byte block.
 *
 * A view never copies: every accessor returns a span aliasing the block it
 * was created from, so writes through one view are visible through the block
 * and every other view over it. A view must not outlive that block.
 *
 * @tparam Char `char` for a writable view, `const char` for a read-only one.
 */
template <typename Char> class BasicHeaderV7 {
public:
  using block_span = std::span<Char, block_size>;

  explicit BasicHeaderV7(block_span block) noexcept : block_(block) {}

  /** @brief The whole underlying block. */
  block_span bytes() const noexcept { return block_; }

  auto name() const noexcept { return detail::slice<detail::v7_name>(block_); }
  auto mode() const noexcept { return detail::slice<detail::v7_mode>(block_); }
  auto uid() const noexcept { return detail::slice<detail::v7_uid>(block_); }
  auto gid() const noexcept { return detail::slice<detail::v7_gid>(block_); }
  auto size() const noexcept { return detail::slice<detail::v7_size>(block_); }
  auto mod_time() const noexcept {
    return detail::slice<detail::v7_mod_time>(block_);
  }
  auto checksum() const noexcept {
    return detail::slice<detail::v7_checksum>(block_);
  }
  auto type_flag() const noexcept {
    return detail::slice<detail::v7_type_flag>(block_);
  }
  auto link_name() const noexcept {
    return detail::slice<detail::v7_link_name>(block_);
  }

private:
  block_span block_;
};

/**
 * @class BasicHeaderUstarBase
 * @brief Fields every post-V7 format places right after the link name.
 *
 * USTAR, PAX, GNU and STAR agree on these ranges; they diverge after the
 * device numbers.
 */
template <typename Char>
class BasicHeaderUstarBase : public BasicHeaderV7<Char> {
public:
  using BasicHeaderV7<Char>::BasicHeaderV7;

  auto magic() const noexcept {
    return detail::slice<detail::ustar_magic>(this->bytes());
  }
  auto version() const noexcept {
    return detail::slice<detail::ustar_version>(this->bytes());
  }
  auto user_name() const noexcept {
    return detail::slice<detail::ustar_user_name>(this->bytes());
  }
  auto group_name() const noexcept {
    return detail::slice<detail::ustar_group_name>(this->bytes());
  }
  auto dev_major() const noexcept {
    return detail::slice<detail::ustar_dev_major>(this->bytes());
  }
  auto dev_minor() const noexcept {
    return detail::slice<detail::ustar_dev_minor>(this->bytes());
  }
};

/** @brief USTAR (and PAX) header: adds the 155-byte name prefix. */
template <typename Char>
class BasicHeaderUstar : public BasicHeaderUstarBase<Char> {
public:
  using BasicHeaderUstarBase<Char>::BasicHeaderUstarBase;

  auto prefix() const noexcept {
    return detail::slice<detail::ustar_prefix>(this->bytes());
  }
};

/**
 * @brief STAR header.
 *
 * Shortens the prefix to 131 bytes to make room for the access and change
 * times, and ends the block with the "tar\0" trailer.
 */
template <typename Char>
class BasicHeaderStar : public BasicHeaderUstarBase<Char> {
public:
  using BasicHeaderUstarBase<Char>::BasicHeaderUstarBase;

  auto prefix() const noexcept {
    return detail::slice<detail::star_prefix>(this->bytes());
  }
  auto access_time() const noexcept {
    return detail::slice<detail::star_access_time>(this->bytes());
  }
  auto change_time() const noexcept {
    return detail::slice<detail::star_change_time>(this->bytes());
  }
  auto trailer() const noexcept {
    return detail::slice<detail::star_trailer>(this->bytes());
  }
};

/**
 * @brief GNU header.
 *
 * Has no prefix; stores access and change times, an inline sparse map of
 * four entries plus its extension flag, and the real size of a sparse file.
 */
template <typename Char>
class BasicHeaderGnu : public BasicHeaderUstarBase<Char> {
public:
  using BasicHeaderUstarBase<Char>::BasicHeaderUstarBase;

  auto access_time() const noexcept {
    return detail::slice<detail::gnu_access_time>(this->bytes());
  }
  auto change_time() const noexcept {
    return detail::slice<detail::gnu_change_time>(this->bytes());
  }
  BasicSparseArray<Char> sparse() const noexcept {
    return BasicSparseArray<Char>(
        detail::slice<detail::gnu_sparse>(this->bytes()));
  }
  auto real_size() const noexcept {
    return detail::slice<detail::gnu_real_size>(this->bytes());
  }
};

using HeaderV7 = BasicHeaderV7<char>;
using HeaderUstar = BasicHeaderUstar<char>;
using HeaderStar = BasicHeaderStar<char>;
using HeaderGnu = BasicHeaderGnu<char>;

using ConstHeaderV7 = BasicHeaderV7<const char>;
using ConstHeaderUstar = BasicHeaderUstar<const char>;
using ConstHeaderStar = BasicHeaderStar<const char>;
using ConstHeaderGnu = BasicHeaderGnu<const char>;
} // namespace tar_header_block
