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

#ifndef SKY_EXPR_UTILITY_HPP
#define SKY_EXPR_UTILITY_HPP

#include "sky_expr.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace sky_expr {
template<typename> inline constexpr bool is_interpreter_v = false;

template<std::unsigned_integral SizeType, std::signed_integral IntegralType, std::floating_point FloatType>
inline constexpr bool is_interpreter_v<sky_expr::interpreter<SizeType, IntegralType, FloatType>> = true;

template<typename T>
concept Interpreter = is_interpreter_v<T>;


template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::Value &input);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::Atom &input);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const std::monostate &);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const bool input);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::int_type input);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::float_type input);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::string_type &string);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::List &list);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::Tuple &tuple);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::FunctionPtr &);
template<Interpreter Eval>
std::string to_string(const Eval &,
  bool annotate,
  const typename Eval::Value &input,
  std::vector<typename Eval::size_type> &open_lists);


template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const std::monostate &)
{
  if (annotate) { return "[none] None"; }
  return "None";
}

template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const bool input)
{
  std::string result;
  if (annotate) { result = "[bool] "; }
  if (input) {
    return result + "True";
  } else {
    return result + "False";
  }
}

template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::int_type input)
{
  std::string result;
  if (annotate) { result = "[int] "; }
  return result + std::format("{}", input);
}

template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::float_type input)
{
  std::string result;
  if (annotate) { result = "[float] "; }
  return result + Eval::format_float(input);
}

template<Interpreter Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::string_type &string)
{
  if (annotate) {
    return std::format("[string] {{{}, {}}} {}", string.start, string.size, Eval::quote(engine.view(string)));
  } else {
    return Eval::quote(engine.view(string));
  }
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::List &list)
{
  std::vector<typename Eval::size_type> open_lists;
  return to_string(engine, annotate, typename Eval::Value{ list }, open_lists);
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::Tuple &tuple)
{
  std::vector<typename Eval::size_type> open_lists;
  return to_string(engine, annotate, typename Eval::Value{ tuple }, open_lists);
}

// `open_lists` are the lists being printed further up, a list that contains itself prints as [...]
template<Interpreter Eval>
std::string to_string(const Eval &engine,
  bool annotate,
  const typename Eval::Value &input,
  std::vector<typename Eval::size_type> &open_lists)
{
  const auto items = [&](auto values) {
    std::string result;
    std::string_view separator;
    for (const auto &item : values) {
      result += separator;
      result += to_string(engine, false, item, open_lists);
      separator = ", ";
    }
    return result;
  };

  if (const auto *list = Eval::template get_if<typename Eval::List>(&input); list != nullptr) {
    std::string result;
    if (annotate) { result += std::format("[list] {{{}}} ", list->index); }
    if (std::ranges::find(open_lists, list->index) != open_lists.end()) { return result + "[...]"; }

    open_lists.push_back(list->index);
    result += "[" + items(engine.view(*list)) + "]";
    open_lists.pop_back();
    return result;
  }

  if (const auto *tuple = Eval::template get_if<typename Eval::Tuple>(&input); tuple != nullptr) {
    std::string result;
    if (annotate) { result += std::format("[tuple] {{{}, {}}} ", tuple->items.start, tuple->items.size); }
    result += "(" + items(engine.view(*tuple));
    if (tuple->items.size == 1) { result += ","; }
    return result + ")";
  }

  return to_string(engine, annotate, input);
}

template<Interpreter Eval> std::string to_string(const Eval &, bool, const typename Eval::FunctionPtr &func)
{
  return std::format("<function {}>", reinterpret_cast<const void *>(func.ptr));
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::Atom &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input);
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::Value &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input.value);
}

template<Interpreter Eval>
std::string to_short_string(const Eval &engine,
  const typename Eval::Value &input,
  const PrintLimits limits,
  std::vector<typename Eval::size_type> &open_lists)
{
  const auto abbreviate = [&](auto items, bool is_tuple) {
    return print_abbreviated_list(
      items, [&](const auto &item) { return to_short_string(engine, item, limits, open_lists); }, is_tuple, limits);
  };

  if (const auto *list = Eval::template get_if<typename Eval::List>(&input); list != nullptr) {
    if (std::ranges::find(open_lists, list->index) != open_lists.end()) { return "[...]"; }

    open_lists.push_back(list->index);
    auto result = abbreviate(engine.view(*list), false);
    open_lists.pop_back();
    return result;
  }
  if (const auto *tuple = Eval::template get_if<typename Eval::Tuple>(&input); tuple != nullptr) {
    return abbreviate(engine.view(*tuple), true);
  }
  return to_string(engine, false, input);
}

// Same as `to_string`, but lists and tuples are abbreviated like any other diagnostic.
template<Interpreter Eval>
std::string to_short_string(const Eval &engine, const typename Eval::Value &input, const PrintLimits limits)
{
  std::vector<typename Eval::size_type> open_lists;
  return to_short_string(engine, input, limits, open_lists);
}
}// namespace sky_expr

#endif
