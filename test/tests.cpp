#include <catch2/catch_test_macros.hpp>

#include <sky_expr/sky_expr.hpp>
#include <sky_expr/utility.hpp>

#include <array>
#include <chrono>
#include <sstream>
#include <stop_token>
#include <string>
#include <vector>

using sky_expr_type = sky_expr::interpreter<>;
using Expression = sky_expr_type::Expression;
using Literal = sky_expr_type::Literal;
using Identifier = sky_expr_type::Identifier;
using Call = sky_expr_type::Call;
using SequenceLiteral = sky_expr_type::SequenceLiteral;
using int_type = sky_expr_type::int_type;

namespace {

std::vector<int_type> evaluation_log;
std::stop_source test_stop_source;

int_type record(int_type index)
{
  evaluation_log.push_back(index);
  return index;
}

void request_stop() { test_stop_source.request_stop(); }

template<typename... Node> auto items(Node &&...nodes)
{
  return sky_expr_type::make_expressions(std::forward<Node>(nodes)...);
}

Expression record_call(int_type index)
{
  return Call::make(Identifier::make("record"), items(Literal::make(index)));
}

std::vector<int_type> ints(std::span<const sky_expr_type::Value> values)
{
  std::vector<int_type> result;
  for (const auto &value : values) {
    const auto *integer = sky_expr_type::get_if<int_type>(&value);
    REQUIRE(integer != nullptr);
    result.push_back(*integer);
  }
  return result;
}

sky_expr_type make_evaluator()
{
  sky_expr_type evaluator;
  evaluator.add<record>("record");
  evaluator.add<request_stop>("request_stop");
  evaluation_log.clear();
  return evaluator;
}

}// namespace

TEST_CASE("list literal evaluates to a list", "[evaluation]")
{
  auto evaluator = make_evaluator();
  const auto literal = SequenceLiteral::make_list(items(Literal::make(1), Literal::make(2), Literal::make(3)));

  const auto result = literal.evaluate(evaluator);
  REQUIRE(result.has_value());

  const auto *list = sky_expr_type::get_if<sky_expr_type::List>(&*result);
  REQUIRE(list != nullptr);
  CHECK(ints(evaluator.view(*list)) == std::vector<int_type>{ 1, 2, 3 });
}

TEST_CASE("tuple literal evaluates to a tuple", "[evaluation]")
{
  auto evaluator = make_evaluator();
  const auto literal = SequenceLiteral::make_tuple(items(Literal::make(1), Literal::make(2), Literal::make(3)));

  const auto result = literal.evaluate(evaluator);
  REQUIRE(result.has_value());

  const auto *tuple = sky_expr_type::get_if<sky_expr_type::Tuple>(&*result);
  REQUIRE(tuple != nullptr);
  CHECK(ints(evaluator.view(*tuple)) == std::vector<int_type>{ 1, 2, 3 });
  CHECK(sky_expr_type::get_if<sky_expr_type::List>(&*result) == nullptr);
}

TEST_CASE("every evaluation builds a new value", "[evaluation]")
{
  auto evaluator = make_evaluator();

  SECTION("list")
  {
    const auto literal = SequenceLiteral::make_list(items(Literal::make(1), Literal::make("two")));
    const auto first = literal.evaluate(evaluator);
    const auto second = literal.evaluate(evaluator);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    CHECK(*first != *second);
    CHECK(evaluator.equal(*first, *second));
  }

  SECTION("tuple")
  {
    const auto literal = SequenceLiteral::make_tuple(items(Literal::make(1), Literal::make("two")));
    const auto first = literal.evaluate(evaluator);
    const auto second = literal.evaluate(evaluator);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    CHECK(*first != *second);
    CHECK(evaluator.equal(*first, *second));
  }
}

TEST_CASE("lists and tuples with the same elements are not equal", "[evaluation]")
{
  auto evaluator = make_evaluator();
  const auto list = SequenceLiteral::make_list(items(Literal::make(1))).evaluate(evaluator);
  const auto tuple = SequenceLiteral::make_tuple(items(Literal::make(1))).evaluate(evaluator);
  REQUIRE(list.has_value());
  REQUIRE(tuple.has_value());
  CHECK_FALSE(evaluator.equal(*list, *tuple));
}

TEST_CASE("elements are evaluated left to right", "[evaluation]")
{
  auto evaluator = make_evaluator();

  SECTION("list")
  {
    const auto literal = SequenceLiteral::make_list(items(record_call(0), record_call(1), record_call(2)));
    REQUIRE(literal.evaluate(evaluator).has_value());
    CHECK(evaluation_log == std::vector<int_type>{ 0, 1, 2 });
  }

  SECTION("tuple")
  {
    const auto literal = SequenceLiteral::make_tuple(items(record_call(0), record_call(1), record_call(2)));
    REQUIRE(literal.evaluate(evaluator).has_value());
    CHECK(evaluation_log == std::vector<int_type>{ 0, 1, 2 });
  }

  SECTION("nested")
  {
    const auto literal = SequenceLiteral::make_list(
      items(record_call(0), SequenceLiteral::make_tuple(items(record_call(1), record_call(2))), record_call(3)));
    REQUIRE(literal.evaluate(evaluator).has_value());
    CHECK(evaluation_log == std::vector<int_type>{ 0, 1, 2, 3 });
  }
}

TEST_CASE("null element is reported at the literal", "[evaluation]")
{
  auto evaluator = make_evaluator();
  const sky_expr::Location location{ "BUILD", 3, 7 };

  auto elements = items(record_call(1));
  elements.push_back(nullptr);
  elements.push_back(std::make_unique<Expression>(record_call(3)));
  const auto literal = SequenceLiteral::make_list(std::move(elements)).set_location(location);

  const auto result = literal.evaluate(evaluator);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().type == sky_expr::Error::Type::evaluation);
  CHECK(result.error().location == location);
  CHECK(result.error().message == "null expression in [record(1), <null>, record(3)]");
  CHECK(result.error().to_string() == "BUILD:3:7: null expression in [record(1), <null>, record(3)]");

  // the elements before the hole were evaluated, the ones after were not
  CHECK(evaluation_log == std::vector<int_type>{ 1 });
}

TEST_CASE("element errors are returned unchanged", "[evaluation]")
{
  auto evaluator = make_evaluator();
  const sky_expr::Location location{ "BUILD", 1, 5 };

  const auto literal = SequenceLiteral::make_tuple(
    items(record_call(0), Identifier::make("missing").set_location(location), record_call(2)))
                         .set_location(sky_expr::Location{ "BUILD", 1, 1 });

  const auto result = literal.evaluate(evaluator);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().message == "name 'missing' is not defined");
  CHECK(result.error().location == location);
  CHECK(evaluation_log == std::vector<int_type>{ 0 });
}

TEST_CASE("host function errors are attributed to the call", "[evaluation]")
{
  auto evaluator = make_evaluator();
  const sky_expr::Location location{ "BUILD", 2, 4 };

  const auto literal =
    SequenceLiteral::make_list(items(Call::make(Identifier::make("record"), items(Literal::make("zero"))).set_location(location)));

  const auto result = literal.evaluate(evaluator);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().message == "expected int, got string");
  CHECK(result.error().location == location);
}

TEST_CASE("only host functions can be called", "[evaluation]")
{
  auto evaluator = make_evaluator();
  evaluator.add("one", evaluator.make_value(1));

  const auto result = Call::make(Identifier::make("one")).evaluate(evaluator);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().message == "'int' object is not callable");
}

TEST_CASE("cancellation stops evaluation before the next element", "[cancellation]")
{
  auto evaluator = make_evaluator();
  test_stop_source = std::stop_source{};
  evaluator.stop_token = test_stop_source.get_token();

  const auto literal = SequenceLiteral::make_list(
    items(SequenceLiteral::make_tuple(
            items(record_call(0), Call::make(Identifier::make("request_stop")), record_call(2))),
      record_call(3)));

  const auto result = literal.evaluate(evaluator);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().type == sky_expr::Error::Type::cancelled);
  CHECK(result.error().message == "evaluation cancelled");
  CHECK(evaluation_log == std::vector<int_type>{ 0 });
  CHECK(evaluator.lists.empty());
  CHECK(evaluator.tuple_items.size() == 0);
}

TEST_CASE("an expired deadline cancels evaluation", "[cancellation]")
{
  auto evaluator = make_evaluator();
  evaluator.set_timeout(std::chrono::milliseconds{ 0 });

  const auto result = SequenceLiteral::make_list(items(record_call(0))).evaluate(evaluator);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().type == sky_expr::Error::Type::cancelled);
  CHECK(result.error().message == "evaluation deadline exceeded");
  CHECK(evaluation_log.empty());
}

TEST_CASE("validation visits every element", "[validation]")
{
  auto evaluator = make_evaluator();
  sky_expr_type::ValidationEnvironment environment{ evaluator };
  environment.declare("x");

  SECTION("all names declared")
  {
    const auto literal = SequenceLiteral::make_list(items(Identifier::make("x"), record_call(1), Literal::make(2)));
    CHECK(literal.validate(environment).has_value());
  }

  SECTION("first failure wins")
  {
    const sky_expr::Location location{ "BUILD", 4, 2 };
    const auto literal = SequenceLiteral::make_tuple(items(Identifier::make("x"),
      Identifier::make("y").set_location(location),
      Identifier::make("z").set_location(sky_expr::Location{ "BUILD", 4, 5 })));

    const auto result = literal.validate(environment);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().type == sky_expr::Error::Type::validation);
    CHECK(result.error().message == "name 'y' is not defined");
    CHECK(result.error().location == location);

    // z comes after the failure and is never looked at
    CHECK(environment.referenced == std::vector<std::string>{ "x", "y" });
  }

  SECTION("siblings of a nested failure are skipped")
  {
    const auto literal = SequenceLiteral::make_list(items(record_call(0),
      SequenceLiteral::make_tuple(items(Identifier::make("missing"), Identifier::make("x"))),
      record_call(2)));

    const auto result = literal.validate(environment);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message == "name 'missing' is not defined");
    CHECK(environment.referenced == std::vector<std::string>{ "record", "missing" });
  }

  SECTION("nested failure")
  {
    const auto literal = SequenceLiteral::make_list(
      items(SequenceLiteral::make_tuple(items(Call::make(Identifier::make("undeclared"))))));

    const auto result = literal.validate(environment);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message == "name 'undeclared' is not defined");
  }

  SECTION("validation does not evaluate")
  {
    const auto literal = SequenceLiteral::make_list(items(record_call(0), record_call(1)));
    CHECK(literal.validate(environment).has_value());
    CHECK(evaluation_log.empty());
  }
}

TEST_CASE("pretty printing", "[printing]")
{
  const auto one_two_three = [] { return items(Literal::make(1), Literal::make(2), Literal::make(3)); };

  CHECK(SequenceLiteral::make_list(one_two_three()).pretty_print() == "[1, 2, 3]");
  CHECK(SequenceLiteral::make_tuple(one_two_three()).pretty_print() == "(1, 2, 3)");
  CHECK(SequenceLiteral::make_tuple(items(Literal::make(5))).pretty_print() == "(5,)");
  CHECK(SequenceLiteral::make_list(items(Literal::make(5))).pretty_print() == "[5]");
  CHECK(SequenceLiteral::make_list({}).pretty_print() == "[]");
  CHECK(SequenceLiteral::make_tuple({}).pretty_print() == "()");
  CHECK(SequenceLiteral::empty_list().pretty_print() == "[]");

  CHECK(SequenceLiteral::make_list(items(SequenceLiteral::make_tuple(items(Literal::make(1))),
                                     Literal::make("a \"quoted\" word"),
                                     Literal::make(std::monostate{}),
                                     Literal::make(true),
                                     Literal::make(2.5),
                                     Literal::make(3.0),
                                     Call::make(Identifier::make("len"), items(Identifier::make("x")))))
          .pretty_print()
        == R"([(1,), "a \"quoted\" word", None, True, 2.5, 3.0, len(x)])");
}

TEST_CASE("pretty printing stops on a failed stream", "[printing]")
{
  const auto literal = SequenceLiteral::make_list(items(Literal::make(1), Literal::make(2)));

  std::ostringstream out;
  out.setstate(std::ios::badbit);
  literal.pretty_print(out);
  CHECK(out.str().empty());
  CHECK(out.bad());
}

TEST_CASE("diagnostic form is abbreviated", "[printing]")
{
  SECTION("short literals are complete")
  {
    CHECK(SequenceLiteral::make_tuple(items(Literal::make(5))).to_string() == "(5,)");
    CHECK(SequenceLiteral::make_list(items(Literal::make(5))).to_string() == "[5]");
    CHECK(SequenceLiteral::make_tuple({}).to_string() == "()");
  }

  SECTION("too many elements")
  {
    std::vector<std::unique_ptr<Expression>> elements;
    for (int value = 0; value < 10; ++value) { elements.push_back(std::make_unique<Expression>(Literal::make(value))); }
    const auto literal = SequenceLiteral::make_list(std::move(elements));

    const auto text = literal.to_string();
    CHECK(text == "[0, 1, 2, 3, ...]");
    CHECK(text.size() <= sky_expr::suggested_print_limits.max_length);

    CHECK(literal.to_string({ 2, 100 }) == "[0, 1, ...]");
  }

  SECTION("too long")
  {
    const std::string word(20, 'a');
    const auto literal = SequenceLiteral::make_tuple(items(Literal::make(word), Literal::make(word), Literal::make(word)));

    const auto text = literal.to_string();
    CHECK(text == "(\"" + word + "\", ...)");
    CHECK(text.size() <= sky_expr::suggested_print_limits.max_length);
  }

  SECTION("interpreter limits are used for error messages")
  {
    auto evaluator = make_evaluator();
    evaluator.print_limits = { 1, 80 };

    auto elements = items(Literal::make(1), Literal::make(2));
    elements.push_back(nullptr);
    const auto result = SequenceLiteral::make_list(std::move(elements)).evaluate(evaluator);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message == "null expression in [1, ...]");
  }
}

TEST_CASE("sequence literal queries", "[syntax]")
{
  const auto tuple = SequenceLiteral::make_tuple(items(Literal::make(1), Literal::make(2)));
  const auto *node = tuple.get_if<SequenceLiteral>();
  REQUIRE(node != nullptr);
  CHECK(node->kind() == SequenceLiteral::Kind::tuple);
  CHECK(node->is_tuple());
  CHECK(node->elements().size() == 2);
  CHECK(node->elements()[1]->pretty_print() == "2");

  const auto list = SequenceLiteral::make_list(items(Literal::make(1)));
  CHECK(list.get_if<SequenceLiteral>()->kind() == SequenceLiteral::Kind::list);
  CHECK_FALSE(list.get_if<SequenceLiteral>()->is_tuple());
  CHECK(list.get_if<Literal>() == nullptr);
}

TEST_CASE("synthesized empty list takes a location later", "[syntax]")
{
  auto evaluator = make_evaluator();
  const sky_expr::Location location{ "generated", 10, 1 };

  const auto literal = SequenceLiteral::empty_list().set_location(location);
  CHECK(literal.location == location);
  CHECK(literal.get_if<SequenceLiteral>()->elements().empty());

  const auto result = literal.evaluate(evaluator);
  REQUIRE(result.has_value());
  const auto *list = sky_expr_type::get_if<sky_expr_type::List>(&*result);
  REQUIRE(list != nullptr);
  CHECK(evaluator.size(*list) == 0);
}

TEST_CASE("visitors see the node kind", "[syntax]")
{
  const auto literal = SequenceLiteral::make_list(
    items(Literal::make(1), SequenceLiteral::make_tuple(items(Literal::make(2), Identifier::make("x")))));

  const auto kind = literal.accept(sky_expr::overloaded{ [](const SequenceLiteral &) { return std::string{ "sequence" }; },
    [](const auto &) { return std::string{ "other" }; } });
  CHECK(kind == "sequence");

  std::vector<std::string> visited;
  sky_expr_type::walk(literal, [&](const Expression &node) { visited.push_back(node.to_string()); });
  CHECK(visited == std::vector<std::string>{ "[1, (2, x)]", "1", "(2, x)", "2", "x" });

  int sequences = 0;
  sky_expr_type::walk(literal, [&](const Expression &node) {
    if (node.get_if<SequenceLiteral>() != nullptr) { ++sequences; }
  });
  CHECK(sequences == 2);
}

TEST_CASE("lists are shared by every reference", "[values]")
{
  auto evaluator = make_evaluator();
  const auto result = SequenceLiteral::make_list(items(Literal::make(1), Literal::make(2))).evaluate(evaluator);
  REQUIRE(result.has_value());

  const auto list = *sky_expr_type::get_if<sky_expr_type::List>(&*result);
  const auto alias = list;

  REQUIRE(evaluator.append(alias, evaluator.make_value(3)).has_value());
  CHECK(ints(evaluator.view(list)) == std::vector<int_type>{ 1, 2, 3 });

  REQUIRE(evaluator.set(list, 0, evaluator.make_value(10)).has_value());
  CHECK(ints(evaluator.view(alias)) == std::vector<int_type>{ 10, 2, 3 });

  REQUIRE(evaluator.extend(list, evaluator.view(alias)).has_value());
  CHECK(ints(evaluator.view(alias)) == std::vector<int_type>{ 10, 2, 3, 10, 2, 3 });

  const auto out_of_range = evaluator.set(list, 6, evaluator.make_value(0));
  REQUIRE_FALSE(out_of_range.has_value());
  CHECK(out_of_range.error().type == sky_expr::Error::Type::mutation);
}

TEST_CASE("lists inside tuples stay mutable", "[values]")
{
  auto evaluator = make_evaluator();
  const auto result =
    SequenceLiteral::make_tuple(items(SequenceLiteral::make_list(items(Literal::make(1))))).evaluate(evaluator);
  REQUIRE(result.has_value());

  const auto tuple = *sky_expr_type::get_if<sky_expr_type::Tuple>(&*result);
  const auto inner = *sky_expr_type::get_if<sky_expr_type::List>(&evaluator.view(tuple)[0]);
  REQUIRE(evaluator.append(inner, evaluator.make_value(2)).has_value());

  CHECK(sky_expr::to_string(evaluator, false, *result) == "([1, 2],)");
}

TEST_CASE("frozen interpreters reject mutation", "[values]")
{
  auto evaluator = make_evaluator();
  const auto result = SequenceLiteral::make_list(items(Literal::make(1))).evaluate(evaluator);
  REQUIRE(result.has_value());
  const auto list = *sky_expr_type::get_if<sky_expr_type::List>(&*result);

  evaluator.freeze();
  CHECK(evaluator.is_frozen());

  const auto appended = evaluator.append(list, evaluator.make_value(2));
  REQUIRE_FALSE(appended.has_value());
  CHECK(appended.error().type == sky_expr::Error::Type::mutation);
  CHECK(appended.error().message == "trying to mutate a frozen list");
  CHECK(evaluator.size(list) == 1);

  // literals still evaluate, their lists are simply read only
  CHECK(SequenceLiteral::make_list({}).evaluate(evaluator).has_value());
}

TEST_CASE("lists that contain themselves", "[values]")
{
  auto evaluator = make_evaluator();
  const auto make_self_containing = [&](int_type first) {
    const auto result = SequenceLiteral::make_list(items(Literal::make(first))).evaluate(evaluator);
    REQUIRE(result.has_value());
    REQUIRE(evaluator.append(*sky_expr_type::get_if<sky_expr_type::List>(&*result), *result).has_value());
    return *result;
  };

  const auto ones = make_self_containing(1);

  SECTION("printing stops at the repeated list")
  {
    CHECK(sky_expr::to_string(evaluator, false, ones) == "[1, [...]]");
    CHECK(sky_expr::to_string(evaluator, true, ones) == "[list] {0} [1, [...]]");
    CHECK(sky_expr::to_short_string(evaluator, ones, sky_expr::suggested_print_limits) == "[1, [...]]");
  }

  SECTION("through a tuple")
  {
    const auto outer = SequenceLiteral::make_list({}).evaluate(evaluator);
    REQUIRE(outer.has_value());
    const auto list = *sky_expr_type::get_if<sky_expr_type::List>(&*outer);

    const std::array contents{ *outer };
    const auto tuple = evaluator.make_tuple(contents);
    REQUIRE(evaluator.append(list, sky_expr_type::Value{ tuple }).has_value());

    CHECK(sky_expr::to_string(evaluator, false, *outer) == "[([...],)]");
    CHECK(sky_expr::to_short_string(evaluator, *outer, sky_expr::suggested_print_limits) == "[([...],)]");
  }

  SECTION("comparison terminates")
  {
    const auto other_ones = make_self_containing(1);
    const auto twos = make_self_containing(2);

    CHECK(ones != other_ones);
    CHECK(evaluator.equal(ones, ones));
    CHECK(evaluator.equal(ones, other_ones));
    CHECK_FALSE(evaluator.equal(ones, twos));
  }

  CHECK(evaluator.size(*sky_expr_type::get_if<sky_expr_type::List>(&ones)) == 2);
}

TEST_CASE("empty tuples built back to back share their range", "[values]")
{
  auto evaluator = make_evaluator();
  const auto literal = SequenceLiteral::make_tuple({});

  const auto first = literal.evaluate(evaluator);
  const auto second = literal.evaluate(evaluator);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());

  CHECK(*first == *second);
  CHECK(evaluator.equal(*first, *second));
  CHECK(evaluator.size(*sky_expr_type::get_if<sky_expr_type::Tuple>(&*first)) == 0);
}

TEST_CASE("global bindings", "[values]")
{
  auto evaluator = make_evaluator();
  evaluator.add("x", evaluator.make_value(41));
  evaluator.add("x", evaluator.make_value(42));

  const auto result = SequenceLiteral::make_list(items(Identifier::make("x"))).evaluate(evaluator);
  REQUIRE(result.has_value());
  CHECK(sky_expr::to_string(evaluator, false, *result) == "[42]");
}

TEST_CASE("built-in functions", "[builtins]")
{
  auto evaluator = make_evaluator();

  const auto size = Call::make(Identifier::make("len"),
    items(SequenceLiteral::make_tuple(items(Literal::make(1), Literal::make(2), Literal::make(3)))))
                      .evaluate(evaluator);
  REQUIRE(size.has_value());
  CHECK(evaluator.to<int_type>(*size) == 3);

  const auto name =
    Call::make(Identifier::make("type"), items(SequenceLiteral::make_list({}))).evaluate(evaluator);
  REQUIRE(name.has_value());
  CHECK(evaluator.to<std::string_view>(*name) == "list");

  const auto no_len = Call::make(Identifier::make("len"), items(Literal::make(1))).evaluate(evaluator);
  REQUIRE_FALSE(no_len.has_value());
  CHECK(no_len.error().message == "object of type 'int' has no len()");
}

TEST_CASE("value printing", "[printing]")
{
  auto evaluator = make_evaluator();
  const auto result = SequenceLiteral::make_list(items(Literal::make(1),
                                                   SequenceLiteral::make_tuple(items(Literal::make("a"))),
                                                   Literal::make(std::monostate{}),
                                                   Literal::make(false),
                                                   Literal::make(0.5)))
                        .evaluate(evaluator);
  REQUIRE(result.has_value());

  CHECK(sky_expr::to_string(evaluator, false, *result) == R"([1, ("a",), None, False, 0.5])");
  CHECK(sky_expr::to_string(evaluator, true, *result).starts_with("[list] {0} ["));
  CHECK(sky_expr::to_short_string(evaluator, *result, { 2, 80 }) == R"([1, ("a",), ...])");
}
