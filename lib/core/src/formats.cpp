#include <core/formats.hpp>

#include <algorithm>
#include <core/errors.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <vector>

namespace uuid4::core {

auto format_of(int length) -> const format &
{
  const auto found =
    std::ranges::find_if(format_table, [length](const format &entry) { return entry.length == length; });
  if (found == format_table.end()) {
    throw invalid_format(fmt::format("Invalid format {} (should be one of {})", length, supported_formats()));
  }
  return *found;
}

auto grouping_of(const format &layout) -> std::string
{
  if (layout.canonical) { return "8-4-4-4-12"; }
  if (layout.hyphens == 0) { return "none"; }

  std::vector<int> groups(static_cast<std::size_t>(layout.hyphens), layout.group);
  groups.push_back(layout.digits - (layout.group * layout.hyphens));
  return fmt::format("{}", fmt::join(groups, "-"));
}

}// namespace uuid4::core
