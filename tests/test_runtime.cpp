#include "blatte/runtime.hpp"
#include "blatte/blatte.hpp"
#include "blatte/parser.hpp"
#include "blatte/value.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

// Evaluate a parsed tree made only of literal text: words and strings are
// their own values and a group is a list
blt::value
_evaluate_literals(blt::value x)
{
  if (blt::isws(x))
    return blt::ws(blt::ws_text(x), _evaluate_literals(blt::ws_obj(x)));
  if (blt::ispair(x) and blt::car(x) == "group")
  {
    blt::value result = blt::nil;
    for (const blt::value item : blt::range(blt::cdr(x)))
      result = blt::cons(_evaluate_literals(item), result);
    return blt::reverse(result);
  }
  return x;
}

blt::value
_parse_all(std::string_view text)
{
  blt::value result = blt::nil;
  for (const blt::value expr : blt::range(blt::default_parser().read_all(text)))
    result = blt::cons(_evaluate_literals(expr), result);
  return blt::reverse(result);
}


TEST(WhitespaceWrapperTest, WsofOfWrapper)
{
  for (const char *w : {"", " ", "\n\t  "})
  {
    EXPECT_EQ(blt::wsof(blt::wrapws(w, blt::str("x"))), w);
    EXPECT_EQ(blt::wsof(blt::wrapws(w, blt::list(blt::str("x")))), w);
  }
  // Not wrapped
  EXPECT_EQ(blt::wsof(blt::str("x")), "");
  EXPECT_EQ(blt::wsof(blt::nil), "");
}

TEST(WhitespaceWrapperTest, Unwrap)
{
  const blt::value x = blt::str("x");
  EXPECT_TRUE(blt::is(blt::unwrapws(blt::wrapws(" ", x)), x));
  EXPECT_TRUE(blt::is(blt::unwrapws(blt::wrapws(" ", blt::wrapws("\n", x))), x));
  EXPECT_TRUE(blt::is(blt::unwrapws(x), x));

  // Only the outermost wrapper is reported
  EXPECT_EQ(blt::wsof(blt::wrapws("a", blt::wrapws("b", x))), "a");
}


TEST(TruthTest, FalseValues)
{
  EXPECT_FALSE(blt::is_true(blt::num(0)));
  EXPECT_FALSE(blt::is_true(blt::str("")));
  EXPECT_FALSE(blt::is_true(blt::nil));
  EXPECT_FALSE(blt::is_true(blt::str("0")));
  // Wrappers are looked through
  EXPECT_FALSE(blt::is_true(blt::wrapws(" ", blt::str(""))));
  EXPECT_FALSE(blt::is_true(blt::wrapws(" ", blt::wrapws("\n", blt::nil))));
}

TEST(TruthTest, TrueValues)
{
  // A non-empty list is true whatever its elements are
  EXPECT_TRUE(blt::is_true(blt::list(blt::num(0))));
  EXPECT_TRUE(blt::is_true(blt::list(blt::nil)));
  EXPECT_TRUE(blt::is_true(blt::str("0.0")));
  EXPECT_TRUE(blt::is_true(blt::str(" ")));
  EXPECT_TRUE(blt::is_true(blt::str("x")));
  EXPECT_TRUE(blt::is_true(blt::num(0.5)));
  EXPECT_TRUE(blt::is_true(blt::wrapws(" ", blt::str("x"))));
}


TEST(QuoteTest, EmptyString)
{
  EXPECT_EQ(blt::quote(""), "\\\"\\\"");
  EXPECT_EQ(blt::quote("").size(), 4);
}

TEST(QuoteTest, WithWhitespace)
{
  EXPECT_EQ(blt::quote("a b"), "\\\"a b\\\"");
  // Backslashes are doubled, braces stay
  EXPECT_EQ(blt::quote("a\\b {c}\n"), "\\\"a\\\\b {c}\n\\\"");
}

TEST(QuoteTest, WithoutWhitespace)
{
  EXPECT_EQ(blt::quote("a{b}"), "a\\{b\\}");
  EXPECT_EQ(blt::quote("a\\b"), "a\\\\b");
  EXPECT_EQ(blt::quote("plain"), "plain");
}

// Quoted text reads back as the same single word or string
TEST(QuoteTest, ReadsBack)
{
  for (const char *text : {"", "a b", "a{b}", "c:\\dir", "x \\ y", "}{"})
  {
    const std::string quoted = blt::quote(text);
    size_t pos = 0;
    const std::optional<blt::value> expr =
        blt::default_parser().read(quoted, pos);
    ASSERT_TRUE(expr.has_value()) << quoted;
    EXPECT_EQ(pos, quoted.size()) << quoted;
    const blt::value x = blt::unwrapws(*expr);
    ASSERT_TRUE(blt::isstr(x)) << quoted;
    EXPECT_EQ(blt::str_view(x), text);
  }
}


TEST(FlattenTest, OwnWhitespace)
{
  const blt::value x = blt::list(blt::wrapws("", blt::str("a")),
                                 blt::wrapws(" ", blt::str("b")),
                                 blt::wrapws("\n", blt::list(blt::str("c"),
                                                             blt::str("d"))));
  EXPECT_EQ(blt::flatten(x), "a b\ncd");
  EXPECT_EQ(blt::flatten(blt::nil), "");
  EXPECT_EQ(blt::flatten(blt::num(42)), "42");
}

// An explicit whitespace applies to the first scalar only
TEST(FlattenTest, OverrideAppliesOnce)
{
  const blt::value x = blt::list(blt::wrapws("1", blt::str("a")),
                                 blt::wrapws("2", blt::str("b")),
                                 blt::wrapws("3", blt::str("c")));
  EXPECT_EQ(blt::flatten(x), "1a2b3c");
  EXPECT_EQ(blt::flatten(x, "_"), "_a2b3c");

  // Outer wrappers take precedence over inner ones
  EXPECT_EQ(blt::flatten(blt::wrapws("out", x)), "outa2b3c");
}

TEST(FlattenTest, OverrideSkipsEmptyLists)
{
  const blt::value x = blt::list(blt::nil, blt::wrapws("2", blt::str("b")));
  EXPECT_EQ(blt::flatten(x, "_"), "_b");
}

// Document made of literal text flattens to itself
TEST(FlattenTest, RoundTrip)
{
  for (const char *document :
       {"Hello", "  Hello, world!", "one  two\tthree\nfour",
        "\n\nleading newlines", "x  y\n z"})
  {
    const blt::value exprs = _parse_all(document);
    EXPECT_EQ(blt::flatten(exprs), document);
  }
}

TEST(FlattenTest, ForgetWhitespace)
{
  const blt::value exprs = _parse_all("A \\/B");
  EXPECT_EQ(blt::flatten(exprs), "AB");

  EXPECT_EQ(blt::flatten(_parse_all("a \\; comment\n \\/b")), "ab");
  EXPECT_EQ(blt::flatten(_parse_all("a\n\\/  b")), "a  b");
}


TEST(TraverseTest, EmptyList)
{
  bool called = false;
  const blt::traverse_result r = blt::traverse(
      blt::nil, [&](std::optional<std::string_view>, blt::value x) {
        called = true;
        return blt::traverse_result {x, true};
      });
  EXPECT_FALSE(called);
  EXPECT_FALSE(r.consumed);
  EXPECT_TRUE(blt::isnil(r.result));
}

// The override is handed on until some scalar consumes it
TEST(TraverseTest, UnconsumedWhitespacePropagates)
{
  const blt::value x = blt::list(blt::wrapws("1", blt::str("skip")),
                                 blt::wrapws("2", blt::str("take")),
                                 blt::wrapws("3", blt::str("after")));

  std::vector<std::string> seen;
  const blt::traverse_result r = blt::traverse(
      x,
      [&](std::optional<std::string_view> ws, blt::value scalar) {
        seen.push_back(std::string {ws.value_or("<none>")} + ":" +
                       std::string {blt::str_view(scalar)});
        return blt::traverse_result {scalar, blt::str_view(scalar) != "skip"};
      },
      "_");

  ASSERT_EQ(seen.size(), 3);
  EXPECT_EQ(seen[0], "_:skip");
  EXPECT_EQ(seen[1], "_:take");
  EXPECT_EQ(seen[2], "3:after");

  // The first consuming result is kept
  EXPECT_TRUE(r.consumed);
  EXPECT_TRUE(blt::equal(r.result, blt::str("take")));
}

// A consumed payload that would count as false is not mistaken for
// an unconsumed one
TEST(TraverseTest, FalsyPayload)
{
  const blt::value x = blt::list(blt::wrapws("1", blt::str("0")),
                                 blt::wrapws("2", blt::str("b")));
  std::vector<std::string> wss;
  blt::traverse(
      x,
      [&](std::optional<std::string_view> ws, blt::value scalar) {
        wss.emplace_back(ws.value_or("<none>"));
        return blt::traverse_result {scalar, true};
      },
      "_");
  ASSERT_EQ(wss.size(), 2);
  EXPECT_EQ(wss[0], "_");
  EXPECT_EQ(wss[1], "2");
}

// Callables are leaves
TEST(TraverseTest, CallablesAreLeaves)
{
  const blt::value f = blt::fn([](blt::value, blt::value) { return blt::nil; });
  size_t count = 0;
  blt::traverse(blt::list(f, blt::str("x")),
                [&](std::optional<std::string_view>, blt::value x) {
                  count += 1;
                  return blt::traverse_result {x, true};
                });
  EXPECT_EQ(count, 2);
  EXPECT_EQ(blt::flatten(blt::list(f, blt::wrapws(" ", blt::str("x")))), " x");
}


// Native callables receive named arguments followed by positional ones
TEST(CallTest, CallingConvention)
{
  const blt::value f = blt::fn(
      [](blt::value named, blt::value positional) {
        blt::value n = blt::nil;
        if (not blt::assoc(blt::sym("n"), named, n))
          n = blt::str("none");
        return blt::cons(n, positional);
      },
      "f");

  const blt::value result =
      blt::call(blt::wrapws(" ", f), blt::list(blt::cons("n", blt::str("17"))),
                blt::list(blt::str("a"), blt::str("b")));
  EXPECT_TRUE(blt::equal(result,
                         blt::list(blt::str("17"), blt::str("a"), blt::str("b"))));

  EXPECT_THROW(blt::call(blt::str("f"), blt::nil, blt::nil),
               std::invalid_argument);
}

} // anonymous namespace
