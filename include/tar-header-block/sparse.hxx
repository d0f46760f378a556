#pragma once

#include <tar-header-block/detail/field-layout.hxx>

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>

namespace tar_header_block {
/**
 * @class BasicSparseElem
 * @brief One (offset, length) pair of a GNU sparse map.
 *
 * Both values are 12-byte ASCII octal fields describing one extent of file
 * data that is actually stored in the archive.
 */
template <typename Char> class BasicSparseElem {
public:
  using entry_span = std::span<Char, detail::sparse_entry_size>;

  explicit BasicSparseElem(entry_span bytes) noexcept : bytes_(bytes) {}

  auto offset() const noexcept {
    return detail::slice<detail::sparse_offset>(bytes_);
  }
  auto length() const noexcept {
    return detail::slice<detail::sparse_length>(bytes_);
  }

private:
  entry_span bytes_;
};

/**
 * @class BasicSparseArray
 * @brief Packed sparse entries followed by a one-byte extension flag.
 *
 * The capacity is the number of whole 24-byte entries that fit in the range;
 * the byte right after the last entry flags that the map continues in the
 * next block. Within a GNU header the range holds 4 entries; a GNU sparse
 * continuation block holds 21.
 *
 * Following the continuation chain is up to the caller; this type only
 * locates the flag.
 */
template <typename Char> class BasicSparseArray {
public:
  explicit BasicSparseArray(std::span<Char> bytes) noexcept : bytes_(bytes) {}

  /** @brief Number of entries the range can hold. */
  std::size_t max_entries() const noexcept {
    return bytes_.size() / detail::sparse_entry_size;
  }

  /**
   * @brief Address entry @p i of the map.
   *
   * @param i Zero-based entry index.
   * @return BasicSparseElem<Char> Alias of the entry's 24 bytes.
   * @throws std::out_of_range when @p i is not below max_entries().
   */
  BasicSparseElem<Char> entry(std::size_t i) const {
    if (i >= max_entries())
      throw std::out_of_range("sparse entry " + std::to_string(i) +
                              " is beyond the capacity of " +
                              std::to_string(max_entries()));
    return BasicSparseElem<Char>(
        bytes_.subspan(i * detail::sparse_entry_size)
            .template first<detail::sparse_entry_size>());
  }

  /**
   * @brief The extension flag byte following the last entry.
   *
   * @throws std::out_of_range when the range ends on an entry boundary and
   * has no room for the flag.
   */
  std::span<Char, 1> is_extended() const {
    auto const flag = max_entries() * detail::sparse_entry_size;
    if (flag >= bytes_.size())
      throw std::out_of_range("sparse map of " +
                              std::to_string(bytes_.size()) +
                              " bytes has no extension flag");
    return bytes_.subspan(flag).template first<1>();
  }

  /** @brief The whole range, entries and flag. */
  std::span<Char> bytes() const noexcept { return bytes_; }

private:
  std::span<Char> bytes_;
};

using SparseElem = BasicSparseElem<char>;
using SparseArray = BasicSparseArray<char>;
using ConstSparseElem = BasicSparseElem<const char>;
using ConstSparseArray = BasicSparseArray<const char>;
} // namespace tar_header_block
