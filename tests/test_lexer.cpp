#include "blatte/lexer.hpp"
#include "blatte/exceptions.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

using type = enum blt::token::type;

std::vector<type>
_types(std::string_view text)
{
  std::vector<type> types;
  for (const blt::token &tok : blt::lexer::tokenize(text))
    types.push_back(tok.type);
  return types;
}


TEST(LexerTest, WordsAndWhitespace)
{
  const auto tokens = blt::lexer::tokenize("Hello,  world!\n");
  ASSERT_EQ(tokens.size(), 4);
  EXPECT_EQ(tokens[0].type, type::WORD);
  EXPECT_EQ(tokens[0].text, "Hello,");
  EXPECT_EQ(tokens[1].type, type::WHITESPACE);
  EXPECT_EQ(tokens[1].text, "  ");
  EXPECT_EQ(tokens[2].text, "world!");
  EXPECT_EQ(tokens[3].text, "\n");

  // Offsets
  EXPECT_EQ(tokens[2].start, 8);
  EXPECT_EQ(tokens[2].end, 14);
}

// Backslash before a metacharacter makes it a part of the word
TEST(LexerTest, EscapedMetacharacters)
{
  const auto tokens = blt::lexer::tokenize("a\\{b\\}c\\\\d");
  ASSERT_EQ(tokens.size(), 1);
  EXPECT_EQ(tokens[0].type, type::WORD);
  EXPECT_EQ(tokens[0].text, "a{b}c\\d");
}

TEST(LexerTest, Braces)
{
  EXPECT_EQ(_types("{a}"),
            (std::vector<type> {type::LBRACE, type::WORD, type::RBRACE}));
  EXPECT_EQ(_types("{ {}}"),
            (std::vector<type> {type::LBRACE, type::WHITESPACE, type::LBRACE,
                                type::RBRACE, type::RBRACE}));
}

TEST(LexerTest, Variables)
{
  const auto tokens = blt::lexer::tokenize("\\foo \\x_1\\y");
  ASSERT_EQ(tokens.size(), 4);
  EXPECT_EQ(tokens[0].type, type::VARIABLE);
  EXPECT_EQ(tokens[0].text, "foo");
  EXPECT_EQ(tokens[2].type, type::VARIABLE);
  EXPECT_EQ(tokens[2].text, "x_1");
  EXPECT_EQ(tokens[3].text, "y");
}

// Keyword spellings with trailing '!' or '*'
TEST(LexerTest, KeywordSpellings)
{
  const auto tokens = blt::lexer::tokenize("\\set! \\let*");
  ASSERT_EQ(tokens.size(), 3);
  EXPECT_EQ(tokens[0].text, "set!");
  EXPECT_EQ(tokens[2].text, "let*");
}

TEST(LexerTest, ParametersAndNamedArguments)
{
  const auto tokens = blt::lexer::tokenize("\\=n \\&rest \\n2=17");
  ASSERT_EQ(tokens.size(), 6);
  EXPECT_EQ(tokens[0].type, type::NAMED_PARAM);
  EXPECT_EQ(tokens[0].text, "n");
  EXPECT_EQ(tokens[2].type, type::REST_PARAM);
  EXPECT_EQ(tokens[2].text, "rest");
  EXPECT_EQ(tokens[4].type, type::NAMED_ARG);
  EXPECT_EQ(tokens[4].text, "n2");
  EXPECT_EQ(tokens[5].type, type::WORD);
  EXPECT_EQ(tokens[5].text, "17");
}

TEST(LexerTest, Strings)
{
  const auto tokens = blt::lexer::tokenize("\\\"some \"quoted\" {text}\\\"");
  ASSERT_EQ(tokens.size(), 1);
  EXPECT_EQ(tokens[0].type, type::STRING);
  EXPECT_EQ(tokens[0].text, "some \"quoted\" {text}");

  // Only the backslash is escaped
  const auto tokens2 = blt::lexer::tokenize("\\\"a\\\\b\\nc\\\"");
  ASSERT_EQ(tokens2.size(), 1);
  EXPECT_EQ(tokens2[0].text, "a\\b\\nc");

  const auto tokens3 = blt::lexer::tokenize("\\\"\\\"");
  ASSERT_EQ(tokens3.size(), 1);
  EXPECT_EQ(tokens3[0].type, type::STRING);
  EXPECT_EQ(tokens3[0].text, "");
}

TEST(LexerTest, CommentsAndForget)
{
  const auto tokens = blt::lexer::tokenize("a \\; note {}\nb\\/c");
  ASSERT_EQ(tokens.size(), 6);
  EXPECT_EQ(tokens[2].type, type::COMMENT);
  // The comment takes the newline with it
  EXPECT_EQ(tokens[2].text, "\\; note {}\n");
  EXPECT_EQ(tokens[3].type, type::WORD);
  EXPECT_EQ(tokens[4].type, type::FORGET);
  EXPECT_EQ(tokens[5].text, "c");

  // Comment at the end of input
  EXPECT_EQ(_types("x\\;"), (std::vector<type> {type::WORD, type::COMMENT}));
}

TEST(LexerTest, NextFromPosition)
{
  blt::lexer lex {"skip \\x", 5};
  const blt::token tok = lex.next();
  EXPECT_EQ(tok.type, type::VARIABLE);
  EXPECT_EQ(tok.start, 5);
  EXPECT_EQ(lex.next().type, type::END);
  EXPECT_EQ(lex.next().type, type::END);
  EXPECT_EQ(lex.position(), 7);
}

TEST(LexerTest, Errors)
{
  EXPECT_THROW((void)blt::lexer::tokenize("abc \\"), blt::lex_error);
  EXPECT_THROW((void)blt::lexer::tokenize("\\\"unterminated"), blt::lex_error);
  EXPECT_THROW((void)blt::lexer::tokenize("\\\"almost\\"), blt::lex_error);
  EXPECT_THROW((void)blt::lexer::tokenize("\\1abc"), blt::parse_error);
  EXPECT_THROW((void)blt::lexer::tokenize("\\=1"), blt::parse_error);
  EXPECT_THROW((void)blt::lexer::tokenize("\\& x"), blt::parse_error);
}

TEST(LexerTest, ErrorLocation)
{
  try
  {
    (void)blt::lexer::tokenize("ok \\\"open");
    FAIL() << "expected lex_error";
  }
  catch (const blt::lex_error &exn)
  {
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(exn.location()->start, 3);
    EXPECT_EQ(exn.location()->end, 9);
  }
}

} // anonymous namespace
