/*
MIT License

Copyright (c) 2023-2024 Jason Turner

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef SKY_EXPR_PRINTER_HPP
#define SKY_EXPR_PRINTER_HPP

#include <concepts>
#include <cstddef>
#include <ranges>
#include <string>
#include <string_view>

// Abbreviated, single-line rendering of sequences for diagnostics.
//
// Error messages and `to_string()` forms must stay readable even when a literal has thousands of
// elements, so every diagnostic call site shares one pair of thresholds: a maximum element count
// and a maximum rendered length. Anything beyond either threshold collapses into "...".

namespace sky_expr {

struct PrintLimits
{
  std::size_t max_elements{ 4 };
  std::size_t max_length{ 32 };

  [[nodiscard]] constexpr bool operator==(const PrintLimits &) const noexcept = default;
};

inline constexpr PrintLimits suggested_print_limits{};

inline constexpr std::string_view ellipsis{ "..." };

// Writes `before`, the rendered items separated by ", ", then `after`.
//
// An item is only written if, counting the separator, the item, `after` and (when more items
// follow) room for a trailing ", ...", the output stays within `limits.max_length`, and fewer
// than `limits.max_elements` items have been written. The first item that does not qualify
// ends the listing with `ellipsis`. `singleton_terminator` is written after a lone item of a
// complete listing, which is how one-element tuples keep their comma.
//
// `render` is only called for items that are considered, so long tails are never rendered.
template<std::ranges::forward_range Range, typename Render>
[[nodiscard]] constexpr std::string print_abbreviated_list(const Range &items,
  Render render,
  std::string_view before,
  std::string_view after,
  std::string_view singleton_terminator,
  const PrintLimits limits)
{
  constexpr std::string_view separator{ ", " };

  std::string result{ before };
  std::size_t printed = 0;
  bool truncated = false;

  for (auto item = std::ranges::begin(items); item != std::ranges::end(items);) {
    const std::string rendered{ render(*item) };
    const bool last = ++item == std::ranges::end(items);

    std::size_t needed = result.size() + (printed == 0 ? 0 : separator.size()) + rendered.size() + after.size();
    if (last && printed == 0) { needed += singleton_terminator.size(); }
    if (!last) { needed += separator.size() + ellipsis.size(); }

    if (printed == limits.max_elements || needed > limits.max_length) {
      truncated = true;
      break;
    }

    if (printed != 0) { result += separator; }
    result += rendered;
    ++printed;
  }

  if (truncated) {
    if (printed != 0) { result += separator; }
    result += ellipsis;
  } else if (printed == 1) {
    result += singleton_terminator;
  }

  result += after;
  return result;
}

template<std::ranges::forward_range Range, typename Render>
[[nodiscard]] constexpr std::string
  print_abbreviated_list(const Range &items, Render render, bool is_tuple, const PrintLimits limits)
{
  return print_abbreviated_list(items, render, is_tuple ? "(" : "[", is_tuple ? ")" : "]", is_tuple ? "," : "", limits);
}

template<std::ranges::forward_range Range>
  requires std::convertible_to<std::ranges::range_reference_t<const Range>, std::string_view>
[[nodiscard]] constexpr std::string
  print_abbreviated_list(const Range &items, bool is_tuple, const PrintLimits limits = suggested_print_limits)
{
  return print_abbreviated_list(
    items, [](std::string_view item) { return std::string{ item }; }, is_tuple, limits);
}

}// namespace sky_expr

#endif
