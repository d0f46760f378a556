#include <tar-header-block/block.hxx>
#include <tar-header-block/detail/octal.hxx>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tar_header_block {
namespace {

/**
 * @brief View a header field as text for comparison with a magic literal.
 */
template <std::size_t N>
std::string_view as_text(std::span<const char, N> field) noexcept {
  return {field.data(), field.size()};
}

/**
 * @brief Copy a magic literal into a field of the same length.
 */
template <std::size_t N>
void write_literal(std::span<char, N> field, std::string_view literal) {
  std::copy_n(literal.begin(), std::min(N, literal.size()), field.begin());
}

/**
 * @brief Check a parsed checksum against one of the computed sums.
 *
 * The signed sum can be negative, which no octal field can express.
 */
bool matches(std::uint64_t stored, std::int64_t sum) noexcept {
  return sum >= 0 && stored == static_cast<std::uint64_t>(sum);
}

} // unnamed namespace

Block::Block(std::span<const char, block_size> bytes) noexcept {
  std::copy(bytes.begin(), bytes.end(), bytes_.begin());
}

Format Block::get_format() const {
  auto const stored = detail::parse_octal(as_text(v7().checksum()));
  auto const [unsigned_sum, signed_sum] = compute_checksum();
  if (!stored) {
    spdlog::debug("tar header: checksum field is not octal");
    return format_unknown;
  }
  if (!matches(*stored, unsigned_sum) && !matches(*stored, signed_sum)) {
    spdlog::debug("tar header: stored checksum {:o} matches neither {:o} "
                  "(unsigned) nor {:o} (signed)",
                  *stored, unsigned_sum, signed_sum);
    return format_unknown;
  }

  auto const magic = as_text(ustar().magic());
  auto const version = as_text(gnu().version());
  auto const trailer = as_text(star().trailer());

  Format format;
  if (magic == magic_ustar && trailer == trailer_star)
    format = format_star;
  else if (magic == magic_ustar)
    format = format_ustar | format_pax;
  else if (magic == magic_gnu && version == version_gnu)
    format = format_gnu;
  else
    format = format_v7;

  spdlog::trace("tar header: detected {}", format.to_string());
  return format;
}

void Block::set_format(Format format) {
  if (!format.is_single())
    throw std::invalid_argument("tar header: cannot write format " +
                                format.to_string() +
                                ", exactly one format is required");

  if (format == format_v7) {
    // V7 predates the magic fields.
  } else if (format == format_gnu) {
    write_literal(gnu().magic(), magic_gnu);
    write_literal(gnu().version(), version_gnu);
  } else if (format == format_star) {
    write_literal(star().magic(), magic_ustar);
    write_literal(star().version(), version_ustar);
    write_literal(star().trailer(), trailer_star);
  } else if (format == format_ustar || format == format_pax) {
    write_literal(ustar().magic(), magic_ustar);
    write_literal(ustar().version(), version_ustar);
  } else {
    throw std::invalid_argument("tar header: unsupported format bit " +
                                std::to_string(format.mask()));
  }

  auto const sum = compute_checksum().unsigned_sum;
  detail::format_checksum(v7().checksum(), static_cast<std::uint64_t>(sum));
}

Checksum Block::compute_checksum() const noexcept {
  Checksum checksum;
  for (std::size_t i = 0; i < bytes_.size(); ++i) {
    auto c = static_cast<unsigned char>(bytes_[i]);
    if (i >= detail::v7_checksum.offset && i < detail::v7_checksum.end())
      c = ' ';
    checksum.unsigned_sum += c;
    checksum.signed_sum += static_cast<std::int8_t>(c);
  }
  return checksum;
}

void Block::reset() noexcept { bytes_.fill('\0'); }

bool Block::is_zero() const noexcept {
  return std::all_of(bytes_.begin(), bytes_.end(),
                     [](char c) { return c == '\0'; });
}

const Block &zero_block() noexcept {
  static const Block block;
  return block;
}
} // namespace tar_header_block
