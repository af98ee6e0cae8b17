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

#include <CLI/CLI.hpp>
#include <format>
#include <spdlog/spdlog.h>

#include <sky_expr/sky_expr.hpp>
#include <sky_expr/utility.hpp>

#include <internal_use_only/config.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using sky_expr_type = sky_expr::interpreter<>;
using Expression = sky_expr_type::Expression;

namespace {

// Each --element is one literal or a name: 1, -2.5, True, False, None, "text", len
Expression make_element(const std::string &source, std::size_t index)
{
  auto expression = [&]() {
    if (source == "True" || source == "False") { return sky_expr_type::Literal::make(source == "True"); }
    if (source == "None") { return sky_expr_type::Literal::make(std::monostate{}); }
    if (source.size() >= 2 && source.front() == '"' && source.back() == '"') {
      return sky_expr_type::Literal::make(std::string_view{ source }.substr(1, source.size() - 2));
    }
    if (const auto value = sky_expr::parse_number<sky_expr_type::int_type>(source)) {
      return sky_expr_type::Literal::make(*value);
    }
    if (const auto value = sky_expr::parse_number<sky_expr_type::float_type>(source)) {
      return sky_expr_type::Literal::make(*value);
    }
    return sky_expr_type::Identifier::make(source);
  }();

  return std::move(expression).set_location(sky_expr::Location{ "<command line>", 1, index + 1 });
}

}// namespace

int main(int argc, const char **argv)
{
  try {
    CLI::App app{ std::format("{} version {}", sky_expr::cmake::project_name, sky_expr::cmake::project_version) };

    bool show_version = false;
    bool tuple = false;
    bool freeze = false;
    bool verbose = false;
    std::vector<std::string> elements;
    std::optional<long long> timeout_ms;
    sky_expr::PrintLimits limits = sky_expr::suggested_print_limits;

    app.add_flag("--version", show_version, "Show version information");
    app.add_flag("--tuple", tuple, "Build a tuple literal instead of a list literal");
    app.add_option("-e,--element", elements, "Element of the literal: number, True, False, None, \"string\" or name");
    app.add_option("--max-elements", limits.max_elements, "Elements shown in diagnostics")->capture_default_str();
    app.add_option("--max-length", limits.max_length, "Characters shown in diagnostics")->capture_default_str();
    app.add_option("--timeout-ms", timeout_ms, "Cancel evaluation after this many milliseconds")->check(CLI::NonNegativeNumber);
    app.add_flag("--freeze", freeze, "Freeze the interpreter after evaluation and show that the result is read only");
    app.add_flag("-v,--verbose", verbose, "Log every node of the literal");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
      std::puts(std::format("{}", sky_expr::cmake::project_version).c_str());
      return EXIT_SUCCESS;
    }

    if (verbose) { spdlog::set_level(spdlog::level::debug); }

    std::vector<std::unique_ptr<Expression>> children;
    for (std::size_t index = 0; index < elements.size(); ++index) {
      children.push_back(std::make_unique<Expression>(make_element(elements[index], index)));
    }

    const auto literal = (tuple ? sky_expr_type::SequenceLiteral::make_tuple(std::move(children))
                                : sky_expr_type::SequenceLiteral::make_list(std::move(children)))
                           .set_location(sky_expr::Location{ "<command line>", 1, 0 });

    sky_expr_type::walk(literal, [](const Expression &node) {
      node.accept(sky_expr::overloaded{
        [](const sky_expr_type::SequenceLiteral &sequence) {
          spdlog::debug("{} literal with {} elements", sequence.is_tuple() ? "tuple" : "list", sequence.elements().size());
        },
        [&](const auto &) { spdlog::debug("element {}", node.to_string()); } });
    });

    std::cout << std::format("pretty:     {}\n", literal.pretty_print());
    std::cout << std::format("diagnostic: {}\n", literal.to_string(limits));

    sky_expr_type evaluator;
    evaluator.print_limits = limits;
    if (timeout_ms) { evaluator.set_timeout(std::chrono::milliseconds{ *timeout_ms }); }

    sky_expr_type::ValidationEnvironment validation{ evaluator };
    if (const auto valid = literal.validate(validation); !valid) {
      spdlog::error("validation failed: {}", valid.error().to_string());
      return EXIT_FAILURE;
    }

    const auto result = literal.evaluate(evaluator);
    if (!result) {
      spdlog::error("evaluation failed: {}", result.error().to_string());
      return EXIT_FAILURE;
    }

    std::cout << std::format("value:      {}\n", sky_expr::to_string(evaluator, false, *result));
    std::cout << std::format("annotated:  {}\n", sky_expr::to_string(evaluator, true, *result));

    if (freeze) {
      evaluator.freeze();
      if (const auto *list = sky_expr_type::get_if<sky_expr_type::List>(&*result); list != nullptr) {
        if (const auto appended = evaluator.append(*list, *result); !appended) {
          std::cout << std::format("append:     {}\n", appended.error().to_string());
        }
      } else {
        std::cout << "append:     tuples are immutable\n";
      }
    }
  } catch (const std::exception &e) {
    spdlog::error("Unhandled exception in main: {}", e.what());
    return EXIT_FAILURE;
  }
}
