#include "blatte/reader.hpp"
#include "blatte/parser.hpp"
#include "blatte/exceptions.hpp"
#include "blatte/value.hpp"

#include <gtest/gtest.h>
#include <string>


// Test basic functionality of reader
TEST(ReaderTest, BasicFunctionality) {
  blt::parser parser;
  blt::reader reader(parser);

  reader << "{\\f a}";

  blt::value result = blt::nil;
  ASSERT_TRUE(reader >> result);
  ASSERT_TRUE(blt::isws(result));
  const blt::value group = blt::ws_obj(result);
  ASSERT_TRUE(blt::issym(blt::car(group), "group"));
  EXPECT_EQ(blt::length(group), 3);

  // No more values should be available
  ASSERT_FALSE(reader >> result);
  EXPECT_FALSE(reader.pending());
}

// Test handling multiple expressions
TEST(ReaderTest, MultipleExpressions) {
  blt::parser parser;
  blt::reader reader(parser);

  reader << "one {two} three";

  blt::value result = blt::nil;
  ASSERT_TRUE(reader >> result);
  EXPECT_TRUE(blt::isstr(blt::ws_obj(result), "one"));
  ASSERT_TRUE(reader >> result);
  EXPECT_TRUE(blt::ispair(blt::ws_obj(result)));
  ASSERT_TRUE(reader >> result);
  EXPECT_TRUE(blt::isstr(blt::ws_obj(result), "three"));
  ASSERT_FALSE(reader >> result);
}

// Test handling partial inputs
TEST(ReaderTest, PartialInputs) {
  blt::parser parser;
  blt::reader reader(parser);

  reader << "{\\f a";

  // No complete expression should be available yet
  blt::value result = blt::nil;
  ASSERT_FALSE(reader >> result);
  EXPECT_TRUE(reader.pending());

  reader << " b}";

  ASSERT_TRUE(reader >> result);
  const blt::value group = blt::ws_obj(result);
  ASSERT_TRUE(blt::issym(blt::car(group), "group"));
  EXPECT_EQ(blt::length(group), 4);

  ASSERT_FALSE(reader >> result);
  EXPECT_FALSE(reader.pending());
}

// Nested groups spread over several lines
TEST(ReaderTest, MultiLineInput) {
  blt::parser parser;
  blt::reader reader(parser);
  blt::value result = blt::nil;

  reader << "{\\define {\\f \\x}\n";
  ASSERT_FALSE(reader >> result);
  reader << "  {\\if \\x\n";
  ASSERT_FALSE(reader >> result);
  reader << "    yes no}}\n";
  ASSERT_TRUE(reader >> result);
  EXPECT_TRUE(blt::issym(blt::car(blt::ws_obj(result)), "define"));
  ASSERT_FALSE(reader >> result);
}

// A string cut by the end of a fragment waits for the rest
TEST(ReaderTest, SplitString) {
  blt::parser parser;
  blt::reader reader(parser);
  blt::value result = blt::nil;

  reader << "\\\"first ";
  ASSERT_FALSE(reader >> result);
  reader << "second\\\"";
  ASSERT_TRUE(reader >> result);
  EXPECT_TRUE(blt::isstr(blt::ws_obj(result), "first second"));
}

// Whitespace after the last expression is carried over to the next one
TEST(ReaderTest, WhitespaceCarriedOver) {
  blt::parser parser;
  blt::reader reader(parser);
  blt::value result = blt::nil;

  reader << "a ";
  ASSERT_TRUE(reader >> result);
  EXPECT_EQ(blt::ws_text(result), "");
  ASSERT_FALSE(reader >> result);

  reader << " b";
  ASSERT_TRUE(reader >> result);
  EXPECT_EQ(blt::ws_text(result), "  ");
  EXPECT_TRUE(blt::isstr(blt::ws_obj(result), "b"));
}

TEST(ReaderTest, CommentsAreNotPending) {
  blt::parser parser;
  blt::reader reader(parser);
  blt::value result = blt::nil;

  reader << "  \\; just a comment\n";
  ASSERT_FALSE(reader >> result);
  EXPECT_FALSE(reader.pending());
}

// Errors that more input cannot fix discard the pending text
TEST(ReaderTest, ErrorResetsBuffer) {
  blt::parser parser;
  blt::reader reader(parser);
  blt::value result = blt::nil;

  reader << "{\\f a";
  EXPECT_THROW(reader << " b}}", blt::parse_error);
  EXPECT_FALSE(reader.pending());

  // Reader is usable after the error
  reader << "{\\g}";
  ASSERT_TRUE(reader >> result);
  EXPECT_TRUE(blt::issym(blt::car(blt::ws_obj(result)), "group"));
}

TEST(ReaderTest, MalformedFormIsNotIncomplete) {
  blt::parser parser;
  blt::reader reader(parser);

  EXPECT_THROW(reader << "{\\set! a b}", blt::parse_error);
  EXPECT_FALSE(reader.pending());
  EXPECT_THROW(reader << "a}", blt::parse_error);
  EXPECT_FALSE(reader.pending());
}

TEST(ReaderTest, Reset) {
  blt::parser parser;
  blt::reader reader(parser);
  blt::value result = blt::nil;

  reader << "done {open";
  EXPECT_TRUE(reader.pending());
  reader.reset();
  EXPECT_FALSE(reader.pending());
  ASSERT_FALSE(reader >> result);
}
