#include <tar-header-block/format.hxx>

#include <boost/algorithm/string/join.hpp>

#include <array>
#include <ostream>
#include <string_view>
#include <vector>

namespace tar_header_block {
namespace {

struct FormatName {
  Format format;
  std::string_view name;
};

constexpr std::array<FormatName, 5> format_names{{
    {format_v7, "V7"},
    {format_ustar, "USTAR"},
    {format_pax, "PAX"},
    {format_gnu, "GNU"},
    {format_star, "STAR"},
}};

} // unnamed namespace

std::string Format::to_string() const {
  std::vector<std::string> names;
  for (const auto &[format, name] : format_names)
    if (has(format))
      names.emplace_back(name);

  switch (names.size()) {
  case 0:
    return "<unknown>";
  case 1:
    return names.front();
  default:
    return "(" + boost::algorithm::join(names, " | ") + ")";
  }
}

std::ostream &operator<<(std::ostream &os, Format format) {
  return os << format.to_string();
}
} // namespace tar_header_block
