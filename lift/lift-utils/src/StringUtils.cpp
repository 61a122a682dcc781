// Ticket: 0005_definition_import

#include "lift-utils/src/StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace lift_utils
{

std::string trim(std::string_view text)
{
  auto isSpace = [](char c)
  { return std::isspace(static_cast<unsigned char>(c)) != 0; };

  auto first = std::find_if_not(text.begin(), text.end(), isSpace);
  auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
  if (first >= last)
  {
    return {};
  }
  return std::string{first, last};
}

std::string toLower(std::string_view text)
{
  std::string out{text};
  std::transform(out.begin(),
                 out.end(),
                 out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string normalizedName(std::string_view name)
{
  return toLower(trim(name));
}

}  // namespace lift_utils
