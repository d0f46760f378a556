#include <tar-header-block/detail/octal.hxx>

#include <fmt/format.h>

#include <charconv>
#include <system_error>

namespace tar_header_block::detail {
namespace {

/**
 * @brief Check for the bytes a numeric field may be padded with.
 */
constexpr bool is_padding(char c) noexcept { return c == ' ' || c == '\0'; }

} // unnamed namespace

std::optional<std::uint64_t> parse_octal(std::string_view field) noexcept {
  while (!field.empty() && is_padding(field.front()))
    field.remove_prefix(1);
  while (!field.empty() && is_padding(field.back()))
    field.remove_suffix(1);
  if (field.empty())
    return 0;

  field = field.substr(0, field.find('\0'));

  std::uint64_t value = 0;
  auto const end = field.data() + field.size();
  auto const [ptr, ec] = std::from_chars(field.data(), end, value, 8);
  if (ec != std::errc{} || ptr != end)
    return std::nullopt;
  return value;
}

void format_checksum(std::span<char, 8> field, std::uint64_t sum) {
  fmt::format_to_n(field.data(), 6, "{:06o}", sum);
  field[6] = '\0';
  field[7] = ' ';
}
} // namespace tar_header_block::detail
