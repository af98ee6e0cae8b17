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

#ifndef SKY_EXPR_HPP
#define SKY_EXPR_HPP

#include <sky_expr/printer.hpp>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <sstream>
#include <stop_token>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// Goals
// * expression evaluation core for a small, dynamically typed, Python-like embedded language
// * one closed expression tree, every pass is a std::visit away
// * errors are values: everything that can fail returns std::expected, the library never throws
// * values are small and trivially copyable, storage lives in the interpreter that made them
// * lists alias, tuples don't need to
// * a host can stop an evaluation at any expression boundary
// * C++23 as a minimum

/// Notes
// * there is no parser here, trees are built with the factories on each node type
// * `[a, b]` evaluates to a list: a handle into the interpreter's list storage. Every copy of the
//   handle sees the same elements, and appends through any of them are seen by all of them
// * `(a, b)` evaluates to a tuple: an immutable range of the interpreter's tuple storage
// * nothing is ever released before the interpreter is destroyed

namespace sky_expr {

inline constexpr int sky_expr_version_major{ 0 };
inline constexpr int sky_expr_version_minor{ 1 };
inline constexpr int sky_expr_version_patch{ 0 };
inline constexpr int sky_expr_version_tweak{};

template<typename... Callable> struct overloaded : Callable...
{
  using Callable::operator()...;
};

// Numeric literal recognition for hosts that build trees from text, like the CLI driver.
// Integers are `[+-]digits`; floats additionally accept a fraction and a decimal exponent
// (`1.`, `.5`, `-2.5e-3`).
// Integers that do not fit in T are rejected, floats with more digits than T holds are rounded.
template<typename T> [[nodiscard]] constexpr std::optional<T> parse_number(std::string_view input) noexcept
{
  enum struct State : std::uint8_t {
    Start,
    Sign,
    Integer,
    Fraction,
    ExponentStart,
    ExponentSign,
    Exponent,
  };

  using mantissa_type = std::conditional_t<std::is_floating_point_v<T>, T, double>;

  // far beyond any finite double, small enough that the power loop below stays short
  constexpr long long max_exponent = 10000;
  // digits past this add nothing a double can represent
  constexpr auto max_mantissa = static_cast<mantissa_type>(1e30);

  State state = State::Start;
  bool negative = false;
  bool negative_exponent = false;
  bool saw_digit = false;
  bool integer_overflow = false;
  unsigned long long integer = 0ULL;
  mantissa_type mantissa{ 0 };
  long long fraction_digits = 0LL;
  long long dropped_digits = 0LL;
  long long exponent = 0LL;

  constexpr auto digit = [](char ch) -> std::optional<unsigned> {
    if (ch >= '0' && ch <= '9') { return static_cast<unsigned>(ch - '0'); }
    return std::nullopt;
  };

  for (const auto ch : input) {
    const auto value = digit(ch);
    switch (state) {
    case State::Start:
      if (ch == '-' || ch == '+') {
        negative = ch == '-';
        state = State::Sign;
        break;
      }
      [[fallthrough]];
    case State::Sign:
    case State::Integer:
      if (value) {
        if (integer > (std::numeric_limits<unsigned long long>::max() - *value) / 10) {
          integer_overflow = true;
        } else {
          integer = integer * 10 + *value;
        }
        if (mantissa < max_mantissa) {
          mantissa = mantissa * 10 + static_cast<mantissa_type>(*value);
        } else {
          ++dropped_digits;
        }
        saw_digit = true;
        state = State::Integer;
      } else if (ch == '.') {
        state = State::Fraction;
      } else if ((ch == 'e' || ch == 'E') && saw_digit) {
        state = State::ExponentStart;
      } else {
        return std::nullopt;
      }
      break;
    case State::Fraction:
      if (value) {
        if (mantissa < max_mantissa) {
          mantissa = mantissa * 10 + static_cast<mantissa_type>(*value);
          ++fraction_digits;
        }
        saw_digit = true;
      } else if ((ch == 'e' || ch == 'E') && saw_digit) {
        state = State::ExponentStart;
      } else {
        return std::nullopt;
      }
      break;
    case State::ExponentStart:
      if (ch == '-' || ch == '+') {
        negative_exponent = ch == '-';
        state = State::ExponentSign;
        break;
      }
      [[fallthrough]];
    case State::ExponentSign:
    case State::Exponent:
      if (!value) { return std::nullopt; }
      if (exponent < max_exponent) { exponent = exponent * 10 + *value; }
      state = State::Exponent;
      break;
    }
  }

  if constexpr (std::is_integral_v<T>) {
    if (state != State::Integer || integer_overflow) { return std::nullopt; }

    constexpr auto max = static_cast<unsigned long long>(std::numeric_limits<T>::max());
    if (!negative) {
      if (integer > max) { return std::nullopt; }
      return static_cast<T>(integer);
    }
    if (integer == 0) { return T{ 0 }; }
    if constexpr (std::is_unsigned_v<T>) {
      return std::nullopt;
    } else {
      // |min| is max + 1
      if (integer - 1 > max) { return std::nullopt; }
      return static_cast<T>(-static_cast<T>(integer - 1) - T{ 1 });
    }
  } else {
    if (!saw_digit || state == State::ExponentStart || state == State::ExponentSign) { return std::nullopt; }

    if (mantissa == T{ 0 }) { return negative ? -T{ 0 } : T{ 0 }; }

    constexpr auto pow_10 = [](long long power) {
      auto result = T{ 1 };
      for (; power > 0; --power) {
        result *= T{ 10 };
        if (result == std::numeric_limits<T>::infinity()) { break; }
      }
      return result;
    };

    const auto power = (negative_exponent ? -exponent : exponent) + dropped_digits - fraction_digits;
    const auto magnitude = power >= 0 ? mantissa * pow_10(power) : mantissa / pow_10(-power);
    return negative ? -magnitude : magnitude;
  }
}

template<std::unsigned_integral SizeType> struct IndexedString
{
  using size_type = SizeType;
  size_type start{ 0 };
  size_type size{ 0 };
  [[nodiscard]] constexpr bool operator==(const IndexedString &) const noexcept = default;
  [[nodiscard]] constexpr bool empty() const noexcept { return size == 0; }
};

template<std::unsigned_integral SizeType> struct IndexedList
{
  using size_type = SizeType;
  size_type start{ 0 };
  size_type size{ 0 };
  [[nodiscard]] constexpr bool operator==(const IndexedList &) const noexcept = default;
  [[nodiscard]] constexpr bool empty() const noexcept { return size == 0; }
  [[nodiscard]] constexpr size_type operator[](size_type index) const noexcept { return start + index; }
  [[nodiscard]] constexpr auto sublist(const size_type from, const size_type distance) const noexcept
  {
    return IndexedList{ static_cast<size_type>(start + from), distance };
  }
};

// Append-only storage addressed by (start, size) keys. Keys stay valid as the arena grows,
// spans and views returned by `view` do not.
template<std::unsigned_integral SizeType,
  typename Contained,
  typename KeyType,
  typename SpanType = std::span<const Contained>>
struct Arena
{
  using size_type = SizeType;
  using span_type = SpanType;

  std::vector<Contained> data;

  [[nodiscard]] constexpr Contained &operator[](size_type index) noexcept { return data[index]; }
  [[nodiscard]] constexpr const Contained &operator[](size_type index) const noexcept { return data[index]; }
  [[nodiscard]] constexpr size_type size() const noexcept { return static_cast<size_type>(data.size()); }
  [[nodiscard]] constexpr auto begin() const noexcept { return data.begin(); }
  [[nodiscard]] constexpr auto begin() noexcept { return data.begin(); }
  [[nodiscard]] constexpr auto end() const noexcept { return data.end(); }
  [[nodiscard]] constexpr auto end() noexcept { return data.end(); }

  [[nodiscard]] constexpr SpanType view(KeyType range) const noexcept
  {
    return SpanType{ data.data() + range.start, range.size };
  }
  [[nodiscard]] constexpr auto operator[](KeyType range) const noexcept { return view(range); }

  constexpr void reserve(size_type new_capacity) { data.reserve(new_capacity); }
  constexpr void resize(size_type new_size) { data.resize(new_size); }
  constexpr void push_back(Contained obj) { data.push_back(std::move(obj)); }

  constexpr size_type insert(Contained obj)
  {
    data.push_back(std::move(obj));
    return static_cast<size_type>(data.size() - 1);
  }

  constexpr KeyType insert(SpanType values)
  {
    const auto start = size();
    const auto *first = std::to_address(values.begin());
    if (std::less_equal<>{}(data.data(), first) && std::less<>{}(first, data.data() + data.size())) {
      // inserting a range of ourselves, which growing would invalidate
      const std::vector<Contained> copy(values.begin(), values.end());
      data.insert(data.end(), copy.begin(), copy.end());
    } else {
      data.insert(data.end(), values.begin(), values.end());
    }
    return KeyType{ start, static_cast<size_type>(values.size()) };
  }

  constexpr KeyType insert_or_find(SpanType values)
  {
    if (const auto found = std::search(data.begin(), data.end(), values.begin(), values.end()); found != data.end()) {
      return KeyType{ static_cast<size_type>(std::distance(data.begin(), found)), static_cast<size_type>(values.size()) };
    }
    return insert(values);
  }
};

struct Location
{
  std::string file;
  std::size_t line{ 0 };
  std::size_t column{ 0 };

  [[nodiscard]] bool operator==(const Location &) const = default;

  [[nodiscard]] std::string to_string() const
  {
    return std::format("{}:{}:{}", file.empty() ? std::string_view{ "<unknown>" } : std::string_view{ file }, line, column);
  }
};

struct Error
{
  enum struct Type : std::uint8_t { evaluation, validation, cancelled, mutation };

  Type type{ Type::evaluation };
  std::optional<Location> location;
  std::string message;

  [[nodiscard]] bool operator==(const Error &) const = default;

  [[nodiscard]] std::string to_string() const
  {
    if (location) { return std::format("{}: {}", location->to_string(), message); }
    return message;
  }
};


template<std::unsigned_integral SizeType = std::uint32_t,
  std::signed_integral IntegralType = long long,
  std::floating_point FloatType = double>
struct interpreter
{
  using size_type = SizeType;
  using int_type = IntegralType;
  using float_type = FloatType;
  using string_type = IndexedString<size_type>;
  using string_view_type = std::string_view;
  using list_type = IndexedList<size_type>;

  struct Value;
  struct Expression;

  using function_ptr = std::expected<Value, Error> (*)(interpreter &, std::span<const Value>);
  using Atom = std::variant<std::monostate, bool, int_type, float_type, string_type>;

  // mutable, shared by every copy of the handle
  struct List
  {
    size_type index{ 0 };
    [[nodiscard]] constexpr bool operator==(const List &) const noexcept = default;
  };

  // immutable
  struct Tuple
  {
    list_type items;
    [[nodiscard]] constexpr bool operator==(const Tuple &) const noexcept = default;
  };

  struct FunctionPtr
  {
    function_ptr ptr{ nullptr };
    [[nodiscard]] constexpr bool operator==(const FunctionPtr &) const noexcept = default;
  };

  template<typename T>
  inline static constexpr bool is_value_type_v = std::is_same_v<T, List> || std::is_same_v<T, Tuple>
                                                 || std::is_same_v<T, FunctionPtr> || std::is_same_v<T, Atom>;

  // `==` is identity: two lists are equal only if they are the same list. Use `equal` to compare contents.
  struct Value
  {
    std::variant<Atom, List, Tuple, FunctionPtr> value;

    [[nodiscard]] constexpr bool operator==(const Value &) const noexcept = default;
  };

  static_assert(std::is_trivially_copyable_v<Value> && std::is_trivially_destructible_v<Value>,
    "sky_expr values must stay trivial, storage belongs to the interpreter");

  template<typename Result> [[nodiscard]] static constexpr const Result *get_if(const Value *value) noexcept
  {
    if (value == nullptr) { return nullptr; }

    if constexpr (is_value_type_v<Result>) {
      return std::get_if<Result>(&value->value);
    } else {
      if (const auto *atom = std::get_if<Atom>(&value->value)) {
        return std::get_if<Result>(atom);
      } else {
        return nullptr;
      }
    }
  }

  template<typename ScratchTo> struct Scratch
  {
    constexpr explicit Scratch(ScratchTo &t_data) noexcept : data(&t_data) {}
    Scratch(const Scratch &) = delete;
    Scratch(Scratch &&) = delete;
    Scratch &operator=(const Scratch &) = delete;
    Scratch &operator=(Scratch &&) = delete;
    constexpr ~Scratch() { data->resize(initial_size); }

    [[nodiscard]] constexpr auto begin() const noexcept { return std::next(data->begin(), initial_size); }
    [[nodiscard]] constexpr auto end() const noexcept { return std::next(data->begin(), current_size); }
    [[nodiscard]] constexpr size_type size() const noexcept { return current_size - initial_size; }
    [[nodiscard]] constexpr auto view() const noexcept { return data->view({ initial_size, size() }); }

    constexpr void push_back(auto obj)
    {
      assert(data->size() == current_size);
      data->push_back(obj);
      current_size = data->size();
    }

  private:
    ScratchTo *data;
    size_type initial_size = data->size();
    size_type current_size = data->size();
  };

  //
  // static checks
  //
  struct ValidationEnvironment
  {
    std::vector<std::string> declared;
    // names resolved so far, in the order they were met, for hosts that track what a tree reads
    std::vector<std::string> referenced;

    ValidationEnvironment() = default;

    // every global binding of `engine` counts as declared
    explicit ValidationEnvironment(const interpreter &engine)
    {
      for (const auto &[name, value] : engine.global_scope) { declare(engine.strings.view(name)); }
    }

    void declare(string_view_type name)
    {
      if (!is_defined(name)) { declared.emplace_back(name); }
    }

    [[nodiscard]] bool is_defined(string_view_type name) const noexcept
    {
      return std::find(declared.begin(), declared.end(), name) != declared.end();
    }

    [[nodiscard]] bool resolve(string_view_type name)
    {
      referenced.emplace_back(name);
      return is_defined(name);
    }
  };

  static constexpr string_view_type null_expression{ "<null>" };

  //
  // expression tree
  //
  struct Literal
  {
    std::variant<std::monostate, bool, int_type, float_type, std::string> value;

    template<typename Constant> [[nodiscard]] static Expression make(Constant constant)
    {
      if constexpr (std::is_same_v<Constant, bool> || std::is_same_v<Constant, std::monostate>) {
        return Expression{ Literal{ constant } };
      } else if constexpr (std::is_integral_v<Constant>) {
        return Expression{ Literal{ static_cast<int_type>(constant) } };
      } else if constexpr (std::is_floating_point_v<Constant>) {
        return Expression{ Literal{ static_cast<float_type>(constant) } };
      } else {
        return Expression{ Literal{ std::string{ constant } } };
      }
    }

    [[nodiscard]] std::expected<Value, Error> evaluate(interpreter &engine, const std::optional<Location> &) const
    {
      return std::visit([&](const auto &constant) { return engine.make_value(constant); }, value);
    }

    [[nodiscard]] std::expected<void, Error> validate(ValidationEnvironment &, const std::optional<Location> &) const
    {
      return {};
    }

    std::ostream &pretty_print(std::ostream &out) const { return out << to_string(); }

    [[nodiscard]] std::string to_string(const PrintLimits = suggested_print_limits) const
    {
      return std::visit(overloaded{ [](std::monostate) { return std::string{ "None" }; },
                          [](bool constant) { return std::string{ constant ? "True" : "False" }; },
                          [](int_type constant) { return std::format("{}", constant); },
                          [](float_type constant) { return format_float(constant); },
                          [](const std::string &constant) { return quote(constant); } },
        value);
    }
  };

  struct Identifier
  {
    std::string name;

    [[nodiscard]] static Expression make(string_view_type name) { return Expression{ Identifier{ std::string{ name } } }; }

    [[nodiscard]] std::expected<Value, Error> evaluate(interpreter &engine, const std::optional<Location> &location) const
    {
      auto result = engine.lookup(name);
      if (!result) { result.error().location = location; }
      return result;
    }

    [[nodiscard]] std::expected<void, Error> validate(ValidationEnvironment &environment,
      const std::optional<Location> &location) const
    {
      if (!environment.resolve(name)) {
        return std::unexpected(
          make_error(std::format("name '{}' is not defined", name), location, Error::Type::validation));
      }
      return {};
    }

    std::ostream &pretty_print(std::ostream &out) const { return out << name; }

    [[nodiscard]] std::string to_string(const PrintLimits = suggested_print_limits) const { return name; }
  };

  // callee(arguments...), where the callee evaluates to a host function
  struct Call
  {
    std::unique_ptr<Expression> callee;
    std::vector<std::unique_ptr<Expression>> arguments;

    [[nodiscard]] static Expression make(Expression callee, std::vector<std::unique_ptr<Expression>> arguments = {})
    {
      return Expression{ Call{ std::make_unique<Expression>(std::move(callee)), std::move(arguments) } };
    }

    [[nodiscard]] std::expected<Value, Error> evaluate(interpreter &engine, const std::optional<Location> &location) const
    {
      if (callee == nullptr) {
        return std::unexpected(make_error(std::format("null expression in {}", to_string(engine.print_limits)), location));
      }

      const auto function = callee->evaluate(engine);
      if (!function) { return std::unexpected(function.error()); }

      const auto *func = get_if<FunctionPtr>(&*function);
      if (func == nullptr) {
        return std::unexpected(make_error(std::format("'{}' object is not callable", type_name(*function)), location));
      }

      std::vector<Value> evaluated;
      evaluated.reserve(arguments.size());
      for (const auto &argument : arguments) {
        if (argument == nullptr) {
          return std::unexpected(
            make_error(std::format("null expression in {}", to_string(engine.print_limits)), location));
        }
        auto result = argument->evaluate(engine);
        if (!result) { return std::unexpected(std::move(result.error())); }
        evaluated.push_back(*result);
      }

      auto result = (func->ptr)(engine, evaluated);
      // host functions don't know where they were called from
      if (!result && result.error().type != Error::Type::cancelled && !result.error().location) {
        result.error().location = location;
      }
      return result;
    }

    [[nodiscard]] std::expected<void, Error> validate(ValidationEnvironment &environment,
      const std::optional<Location> &location) const
    {
      if (callee == nullptr) {
        return std::unexpected(make_error(std::format("null expression in {}", to_string()), location, Error::Type::validation));
      }
      if (auto result = callee->validate(environment); !result) { return result; }

      for (const auto &argument : arguments) {
        if (argument == nullptr) {
          return std::unexpected(make_error(std::format("null expression in {}", to_string()), location, Error::Type::validation));
        }
        if (auto result = argument->validate(environment); !result) { return result; }
      }
      return {};
    }

    std::ostream &pretty_print(std::ostream &out) const
    {
      print_child(out, callee) << '(';
      string_view_type separator;
      for (const auto &argument : arguments) {
        if (!out) { return out; }
        print_child(out << separator, argument);
        separator = ", ";
      }
      return out << ')';
    }

    [[nodiscard]] std::string to_string(const PrintLimits limits = suggested_print_limits) const
    {
      return render_child(callee, limits)
             + print_abbreviated_list(
               arguments, [&](const auto &argument) { return render_child(argument, limits); }, "(", ")", "", limits);
    }
  };

  // List and tuple displays: `[a, b, c]` and `(a, b, c)`.
  struct SequenceLiteral
  {
    enum struct Kind : std::uint8_t { list, tuple };

    SequenceLiteral(Kind kind, std::vector<std::unique_ptr<Expression>> elements) noexcept
      : m_kind{ kind }, m_elements{ std::move(elements) }
    {}

    [[nodiscard]] static Expression make_list(std::vector<std::unique_ptr<Expression>> elements)
    {
      return Expression{ SequenceLiteral{ Kind::list, std::move(elements) } };
    }

    [[nodiscard]] static Expression make_tuple(std::vector<std::unique_ptr<Expression>> elements)
    {
      return Expression{ SequenceLiteral{ Kind::tuple, std::move(elements) } };
    }

    // for literals that are synthesized rather than parsed, the caller sets the location
    [[nodiscard]] static Expression empty_list() { return make_list({}); }

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }
    [[nodiscard]] const std::vector<std::unique_ptr<Expression>> &elements() const noexcept { return m_elements; }
    [[nodiscard]] bool is_tuple() const noexcept { return m_kind == Kind::tuple; }

    // Elements are evaluated strictly left to right. The first failure, cancellation included,
    // is returned as is and nothing is built.
    [[nodiscard]] std::expected<Value, Error> evaluate(interpreter &engine, const std::optional<Location> &location) const
    {
      engine.object_scratch.reserve(static_cast<size_type>(engine.object_scratch.size() + m_elements.size()));
      Scratch result{ engine.object_scratch };

      for (const auto &element : m_elements) {
        if (element == nullptr) {
          return std::unexpected(
            make_error(std::format("null expression in {}", to_string(engine.print_limits)), location));
        }

        const auto value = element->evaluate(engine);
        if (!value) { return std::unexpected(value.error()); }
        result.push_back(*value);
      }

      if (is_tuple()) { return Value{ Tuple{ engine.tuple_items.insert(result.view()) } }; }
      return Value{ engine.make_list(result.view()) };
    }

    [[nodiscard]] std::expected<void, Error> validate(ValidationEnvironment &environment,
      const std::optional<Location> &location) const
    {
      for (const auto &element : m_elements) {
        if (element == nullptr) {
          return std::unexpected(
            make_error(std::format("null expression in {}", to_string()), location, Error::Type::validation));
        }
        if (auto result = element->validate(environment); !result) { return result; }
      }
      return {};
    }

    std::ostream &pretty_print(std::ostream &out) const
    {
      out << (is_tuple() ? '(' : '[');
      string_view_type separator;
      for (const auto &element : m_elements) {
        if (!out) { return out; }
        print_child(out << separator, element);
        separator = ", ";
      }
      // (x) is just x in parentheses
      if (is_tuple() && m_elements.size() == 1) { out << ','; }
      return out << (is_tuple() ? ')' : ']');
    }

    [[nodiscard]] std::string to_string(const PrintLimits limits = suggested_print_limits) const
    {
      return print_abbreviated_list(
        m_elements, [&](const auto &element) { return render_child(element, limits); }, is_tuple(), limits);
    }

  private:
    Kind m_kind;
    std::vector<std::unique_ptr<Expression>> m_elements;
  };

  struct Expression
  {
    std::variant<Literal, Identifier, Call, SequenceLiteral> value;
    std::optional<Location> location;

    Expression &set_location(Location new_location) &
    {
      location = std::move(new_location);
      return *this;
    }

    Expression &&set_location(Location new_location) &&
    {
      location = std::move(new_location);
      return std::move(*this);
    }

    template<typename Node> [[nodiscard]] const Node *get_if() const noexcept { return std::get_if<Node>(&value); }

    // Cancellation is checked here, so it is seen before every subexpression is evaluated.
    [[nodiscard]] std::expected<Value, Error> evaluate(interpreter &engine) const
    {
      if (auto cancelled = engine.check_cancellation(location); !cancelled) { return std::unexpected(cancelled.error()); }
      return std::visit([&](const auto &node) { return node.evaluate(engine, location); }, value);
    }

    [[nodiscard]] std::expected<void, Error> validate(ValidationEnvironment &environment) const
    {
      return std::visit([&](const auto &node) { return node.validate(environment, location); }, value);
    }

    std::ostream &pretty_print(std::ostream &out) const
    {
      return std::visit([&](const auto &node) -> std::ostream & { return node.pretty_print(out); }, value);
    }

    [[nodiscard]] std::string pretty_print() const
    {
      std::ostringstream out;
      pretty_print(out);
      return std::move(out).str();
    }

    [[nodiscard]] std::string to_string(const PrintLimits limits = suggested_print_limits) const
    {
      return std::visit([&](const auto &node) { return node.to_string(limits); }, value);
    }

    template<typename Visitor> decltype(auto) accept(Visitor &&visitor) const
    {
      return std::visit(std::forward<Visitor>(visitor), value);
    }
  };

  template<typename... Node> [[nodiscard]] static std::vector<std::unique_ptr<Expression>> make_expressions(Node &&...nodes)
  {
    std::vector<std::unique_ptr<Expression>> result;
    result.reserve(sizeof...(nodes));
    (result.push_back(std::make_unique<Expression>(std::forward<Node>(nodes))), ...);
    return result;
  }

  // pre-order, skips null slots
  template<typename Callable> static void walk(const Expression &expression, Callable &&callable)
  {
    callable(expression);
    expression.accept(overloaded{ [&](const SequenceLiteral &sequence) {
                                   for (const auto &element : sequence.elements()) {
                                     if (element != nullptr) { walk(*element, callable); }
                                   }
                                 },
      [&](const Call &call) {
        if (call.callee != nullptr) { walk(*call.callee, callable); }
        for (const auto &argument : call.arguments) {
          if (argument != nullptr) { walk(*argument, callable); }
        }
      },
      [](const auto &) {} });
  }

  static std::ostream &print_child(std::ostream &out, const std::unique_ptr<Expression> &child)
  {
    if (child == nullptr) { return out << null_expression; }
    return child->pretty_print(out);
  }

  [[nodiscard]] static std::string render_child(const std::unique_ptr<Expression> &child, const PrintLimits limits)
  {
    if (child == nullptr) { return std::string{ null_expression }; }
    return child->to_string(limits);
  }

  //
  // storage
  //
  using LexicalScope = std::vector<std::pair<string_type, Value>>;

  LexicalScope global_scope{};
  Arena<size_type, char, string_type, string_view_type> strings{};
  Arena<size_type, Value, list_type> tuple_items{};
  std::vector<std::vector<Value>> lists{};
  Arena<size_type, Value, list_type> object_scratch{};

  PrintLimits print_limits{ suggested_print_limits };

  // set by the host, checked before every expression is evaluated
  std::stop_token stop_token{};
  std::optional<std::chrono::steady_clock::time_point> deadline{};

  bool frozen = false;

  interpreter()
  {
    add("len", Value{ FunctionPtr{ len } });
    add("type", Value{ FunctionPtr{ type_of } });
  }

  explicit interpreter(std::stop_token token) : interpreter() { stop_token = std::move(token); }

  void set_timeout(std::chrono::steady_clock::duration timeout) { deadline = std::chrono::steady_clock::now() + timeout; }

  [[nodiscard]] bool cancellation_requested() const noexcept
  {
    return stop_token.stop_requested() || (deadline.has_value() && std::chrono::steady_clock::now() >= *deadline);
  }

  [[nodiscard]] std::expected<void, Error> check_cancellation(const std::optional<Location> &location) const
  {
    if (stop_token.stop_requested()) {
      return std::unexpected(make_error("evaluation cancelled", location, Error::Type::cancelled));
    }
    if (deadline.has_value() && std::chrono::steady_clock::now() >= *deadline) {
      return std::unexpected(make_error("evaluation deadline exceeded", location, Error::Type::cancelled));
    }
    return {};
  }

  [[nodiscard]] static Error
    make_error(std::string message, std::optional<Location> location = std::nullopt, Error::Type error_type = Error::Type::evaluation)
  {
    return Error{ error_type, std::move(location), std::move(message) };
  }

  //
  // values
  //
  template<typename Type> [[nodiscard]] Value make_value(const Type &input)
  {
    if constexpr (std::is_same_v<Type, Value>) {
      return input;
    } else if constexpr (is_value_type_v<Type>) {
      return Value{ input };
    } else if constexpr (std::is_same_v<Type, bool> || std::is_same_v<Type, std::monostate>) {
      return Value{ Atom{ input } };
    } else if constexpr (std::is_integral_v<Type>) {
      return Value{ Atom{ static_cast<int_type>(input) } };
    } else if constexpr (std::is_floating_point_v<Type>) {
      return Value{ Atom{ static_cast<float_type>(input) } };
    } else {
      static_assert(std::is_convertible_v<const Type &, string_view_type>, "unsupported value type");
      return Value{ Atom{ strings.insert_or_find(string_view_type{ input }) } };
    }
  }

  [[nodiscard]] List make_list(std::span<const Value> values)
  {
    lists.emplace_back(values.begin(), values.end());
    return List{ static_cast<size_type>(lists.size() - 1) };
  }

  [[nodiscard]] Tuple make_tuple(std::span<const Value> values) { return Tuple{ tuple_items.insert(values) }; }

  [[nodiscard]] std::span<const Value> view(List list) const noexcept { return lists[list.index]; }
  [[nodiscard]] std::span<const Value> view(Tuple tuple) const noexcept { return tuple_items[tuple.items]; }
  [[nodiscard]] string_view_type view(string_type string) const noexcept { return strings.view(string); }

  [[nodiscard]] size_type size(List list) const noexcept { return static_cast<size_type>(lists[list.index].size()); }
  [[nodiscard]] size_type size(Tuple tuple) const noexcept { return tuple.items.size; }

  // Lists become read only once their interpreter is frozen, tuples always are.
  void freeze() noexcept { frozen = true; }
  [[nodiscard]] bool is_frozen() const noexcept { return frozen; }

  [[nodiscard]] std::expected<void, Error> append(List list, Value value)
  {
    if (frozen) { return std::unexpected(frozen_error()); }
    lists[list.index].push_back(value);
    return {};
  }

  [[nodiscard]] std::expected<void, Error> extend(List list, std::span<const Value> values)
  {
    if (frozen) { return std::unexpected(frozen_error()); }
    // `values` may be a view of this very list
    const std::vector<Value> copy(values.begin(), values.end());
    lists[list.index].insert(lists[list.index].end(), copy.begin(), copy.end());
    return {};
  }

  [[nodiscard]] std::expected<void, Error> set(List list, size_type index, Value value)
  {
    if (frozen) { return std::unexpected(frozen_error()); }
    auto &items = lists[list.index];
    if (index >= items.size()) {
      return std::unexpected(make_error(
        std::format("index out of range (index is {}, but sequence has {} elements)", index, items.size()),
        std::nullopt,
        Error::Type::mutation));
    }
    items[index] = value;
    return {};
  }

  // content comparison, lists and tuples never compare equal to each other
  [[nodiscard]] bool equal(const Value &lhs, const Value &rhs) const
  {
    std::vector<std::pair<size_type, size_type>> comparing;
    return equal(lhs, rhs, comparing);
  }

  template<typename Type> [[nodiscard]] std::expected<Type, Error> to(const Value &value) const
  {
    if constexpr (std::is_same_v<Type, Value>) {
      return value;
    } else if constexpr (std::is_same_v<Type, string_view_type>) {
      if (const auto *string = get_if<string_type>(&value); string != nullptr) { return strings.view(*string); }
    } else {
      if (const auto *result = get_if<Type>(&value); result != nullptr) { return *result; }
    }
    return std::unexpected(make_error(std::format("expected {}, got {}", type_name<Type>(), type_name(value))));
  }

  template<typename Type> [[nodiscard]] static constexpr string_view_type type_name() noexcept
  {
    if constexpr (std::is_same_v<Type, std::monostate>) {
      return "NoneType";
    } else if constexpr (std::is_same_v<Type, bool>) {
      return "bool";
    } else if constexpr (std::is_same_v<Type, int_type>) {
      return "int";
    } else if constexpr (std::is_same_v<Type, float_type>) {
      return "float";
    } else if constexpr (std::is_same_v<Type, string_type> || std::is_same_v<Type, string_view_type>) {
      return "string";
    } else if constexpr (std::is_same_v<Type, List>) {
      return "list";
    } else if constexpr (std::is_same_v<Type, Tuple>) {
      return "tuple";
    } else if constexpr (std::is_same_v<Type, FunctionPtr>) {
      return "function";
    } else {
      return "value";
    }
  }

  [[nodiscard]] static constexpr string_view_type type_name(const Value &value) noexcept
  {
    return std::visit(overloaded{ [](const Atom &atom) {
                                   return std::visit(
                                     []<typename Type>(const Type &) { return type_name<Type>(); }, atom);
                                 },
                        []<typename Type>(const Type &) { return type_name<Type>(); } },
      value.value);
  }

  [[nodiscard]] static std::string format_float(const float_type value)
  {
    auto result = std::format("{}", value);
    if (result.find_first_not_of("-0123456789") == std::string::npos) { result += ".0"; }
    return result;
  }

  [[nodiscard]] static std::string quote(string_view_type input)
  {
    std::string result{ '"' };
    for (const auto ch : input) {
      switch (ch) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        result += ch;
      }
    }
    result += '"';
    return result;
  }

  //
  // bindings
  //
  auto add(string_view_type name, Value value) { return global_scope.emplace_back(strings.insert_or_find(name), value); }

  template<auto Func> auto add(string_view_type name) { return add(name, Value{ FunctionPtr{ make_evaluator<Func>() } }); }

  [[nodiscard]] std::expected<Value, Error> lookup(string_view_type name) const
  {
    for (const auto &[key, value] : global_scope | std::views::reverse) {
      if (strings.view(key) == name) { return value; }
    }
    return std::unexpected(make_error(std::format("name '{}' is not defined", name)));
  }

  // Wraps a plain C++ function so scripts can call it. Arguments must match the parameter types
  // exactly, there are no implicit conversions.
  template<auto Func, typename Ret, typename... Param> [[nodiscard]] static function_ptr make_evaluator()
  {
    return function_ptr{ [](interpreter &engine, std::span<const Value> params) -> std::expected<Value, Error> {
      if (params.size() != sizeof...(Param)) {
        return std::unexpected(
          make_error(std::format("expected {} arguments, got {}", sizeof...(Param), params.size())));
      }

      auto impl = [&]<std::size_t... Idx>(std::index_sequence<Idx...>) -> std::expected<Value, Error> {
        std::tuple converted{ engine.template to<std::remove_cvref_t<Param>>(params[Idx])... };

        std::optional<Error> error;

        // first argument that didn't convert
        const bool converted_all = ([&] {
          if (std::get<Idx>(converted).has_value()) {
            return true;
          } else {
            error = std::get<Idx>(converted).error();
            return false;
          }
        }() && ...);

        if (!converted_all) { return std::unexpected(std::move(*error)); }

        if constexpr (std::is_same_v<void, Ret>) {
          std::invoke(Func, *std::get<Idx>(converted)...);
          return Value{ Atom{ std::monostate{} } };
        } else {
          return engine.make_value(std::invoke(Func, *std::get<Idx>(converted)...));
        }
      };

      return impl(std::index_sequence_for<Param...>{});
    } };
  }

  template<auto Func, typename Ret, typename... Param>
  [[nodiscard]] static function_ptr make_evaluator(Ret (*)(Param...))
  {
    return make_evaluator<Func, Ret, Param...>();
  }

  template<auto Func> [[nodiscard]] static function_ptr make_evaluator() { return make_evaluator<Func>(Func); }

  //
  // built-ins
  //
  [[nodiscard]] static std::expected<Value, Error> len(interpreter &engine, std::span<const Value> params)
  {
    if (params.size() != 1) {
      return std::unexpected(make_error(std::format("len() takes exactly one argument ({} given)", params.size())));
    }

    const auto &param = params.front();
    if (const auto *list = get_if<List>(&param); list != nullptr) { return engine.make_value(engine.size(*list)); }
    if (const auto *tuple = get_if<Tuple>(&param); tuple != nullptr) { return engine.make_value(engine.size(*tuple)); }
    if (const auto *string = get_if<string_type>(&param); string != nullptr) { return engine.make_value(string->size); }

    return std::unexpected(make_error(std::format("object of type '{}' has no len()", type_name(param))));
  }

  [[nodiscard]] static std::expected<Value, Error> type_of(interpreter &engine, std::span<const Value> params)
  {
    if (params.size() != 1) {
      return std::unexpected(make_error(std::format("type() takes exactly one argument ({} given)", params.size())));
    }
    return engine.make_value(type_name(params.front()));
  }

private:
  // `comparing` holds the list pairs on the current path. Lists can contain themselves, and a pair
  // met again is assumed equal, the rest of its elements decide.
  [[nodiscard]] bool equal(const Value &lhs, const Value &rhs, std::vector<std::pair<size_type, size_type>> &comparing) const
  {
    const auto equal_items = [&](std::span<const Value> left, std::span<const Value> right) {
      return std::ranges::equal(left, right, [&](const Value &l, const Value &r) { return equal(l, r, comparing); });
    };

    if (const auto *left = get_if<List>(&lhs), *right = get_if<List>(&rhs); left != nullptr && right != nullptr) {
      if (*left == *right) { return true; }

      const std::pair pair{ left->index, right->index };
      if (std::ranges::find(comparing, pair) != comparing.end()) { return true; }

      comparing.push_back(pair);
      const bool result = equal_items(view(*left), view(*right));
      comparing.pop_back();
      return result;
    }
    if (const auto *left = get_if<Tuple>(&lhs), *right = get_if<Tuple>(&rhs); left != nullptr && right != nullptr) {
      return equal_items(view(*left), view(*right));
    }
    if (const auto *left = get_if<string_type>(&lhs), *right = get_if<string_type>(&rhs);
        left != nullptr && right != nullptr) {
      return view(*left) == view(*right);
    }
    return lhs == rhs;
  }

  [[nodiscard]] static Error frozen_error()
  {
    return make_error("trying to mutate a frozen list", std::nullopt, Error::Type::mutation);
  }
};


}// namespace sky_expr

#endif
