#include "blatte/blatte.hpp"
#include "blatte/perl_emitter.hpp"
#include "blatte/exceptions.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::string
_emit(std::string_view text)
{
  const std::optional<std::string> code = blt::parse(text);
  if (not code.has_value())
    return "<nothing>";
  return *code;
}


TEST(PerlEmitterTest, Atoms)
{
  EXPECT_EQ(_emit("hello"), "\"hello\"");
  EXPECT_EQ(_emit(" \\x"), "&Blatte::wrapws(\" \", $x)");
  EXPECT_EQ(_emit("\\\"a b\\\""), "\"a b\"");
  EXPECT_EQ(_emit("{}"), "[]");
  EXPECT_EQ(_emit("  \\; nothing\n"), "<nothing>");
}

TEST(PerlEmitterTest, StringLiteral)
{
  using blt::perl_emitter;
  EXPECT_EQ(perl_emitter::string_literal(""), "\"\"");
  EXPECT_EQ(perl_emitter::string_literal("a$b@c"), "\"a\\$b\\@c\"");
  EXPECT_EQ(perl_emitter::string_literal("\"\\"), "\"\\\"\\\\\"");
  EXPECT_EQ(perl_emitter::string_literal("\n\t\r"), "\"\\n\\t\\r\"");
  EXPECT_EQ(perl_emitter::string_literal("\x01"), "\"\\x{01}\"");
  EXPECT_EQ(perl_emitter::string_literal("{x}"), "\"{x}\"");
}

TEST(PerlEmitterTest, DefineAndSet)
{
  EXPECT_EQ(_emit("{\\define \\x y}"),
            "do { use vars qw($x); $x = &Blatte::wrapws(\" \", \"y\") }");
  EXPECT_EQ(_emit("{\\set! \\x 1}"), "($x = &Blatte::wrapws(\" \", \"1\"))");
}

TEST(PerlEmitterTest, If)
{
  EXPECT_EQ(_emit("{\\if \\t a}"),
            "(&Blatte::true(&Blatte::wrapws(\" \", $t)) ? "
            "&Blatte::wrapws(\" \", \"a\") : [])");
  EXPECT_EQ(_emit("{\\if \\t a b}"),
            "(&Blatte::true(&Blatte::wrapws(\" \", $t)) ? "
            "&Blatte::wrapws(\" \", \"a\") : &Blatte::wrapws(\" \", \"b\"))");
  // Several else-expressions are evaluated in sequence
  EXPECT_EQ(_emit("{\\if \\t a b c}"),
            "(&Blatte::true(&Blatte::wrapws(\" \", $t)) ? "
            "&Blatte::wrapws(\" \", \"a\") : do { &Blatte::wrapws(\" \", \"b\"); "
            "&Blatte::wrapws(\" \", \"c\") })");
}

TEST(PerlEmitterTest, AndOr)
{
  EXPECT_EQ(_emit("{\\and a}"), "&Blatte::wrapws(\" \", \"a\")");
  EXPECT_EQ(_emit("{\\and a b}"),
            "do { my $_v = &Blatte::wrapws(\" \", \"a\"); &Blatte::true($_v) ? "
            "&Blatte::wrapws(\" \", \"b\") : $_v }");
  EXPECT_EQ(_emit("{\\or a b}"),
            "do { my $_v = &Blatte::wrapws(\" \", \"a\"); &Blatte::true($_v) ? "
            "$_v : &Blatte::wrapws(\" \", \"b\") }");
}

TEST(PerlEmitterTest, Cond)
{
  EXPECT_EQ(_emit("{\\cond}"), "[]");
  EXPECT_EQ(_emit("{\\cond {\\a b}}"),
            "(&Blatte::true($a) ? do { &Blatte::wrapws(\" \", \"b\") } : [])");
  // Clause without a body yields its test
  EXPECT_EQ(_emit("{\\cond {\\a}}"),
            "do { my $_v = $a; &Blatte::true($_v) ? $_v : [] }");
}

TEST(PerlEmitterTest, While)
{
  EXPECT_EQ(_emit("{\\while \\x a}"),
            "do { while (&Blatte::true(&Blatte::wrapws(\" \", $x))) "
            "{ &Blatte::wrapws(\" \", \"a\"); } [] }");
}

TEST(PerlEmitterTest, Lambda)
{
  EXPECT_EQ(_emit("{\\lambda {} x}"),
            "sub { die \"too few arguments\\n\" if @_ < 1; "
            "my($_named) = splice(@_, 0, 1); "
            "die \"too many arguments\\n\" if @_; "
            "&Blatte::wrapws(\" \", \"x\") }");
  EXPECT_EQ(_emit("{\\lambda {\\a \\=n \\&r} \\a}"),
            "sub { die \"too few arguments\\n\" if @_ < 2; "
            "my($_named, $a) = splice(@_, 0, 2); "
            "my $n = $_named->{n}; "
            "my $r = [@_]; "
            "&Blatte::wrapws(\" \", $a) }");
  // Empty body
  EXPECT_EQ(_emit("{\\lambda {\\&r}}"),
            "sub { die \"too few arguments\\n\" if @_ < 1; "
            "my($_named) = splice(@_, 0, 1); my $r = [@_]; [] }");
}

TEST(PerlEmitterTest, Let)
{
  EXPECT_EQ(_emit("{\\let {{\\x 1} {\\y 2}} \\x}"),
            "do { my($x, $y) = (&Blatte::wrapws(\" \", \"1\"), "
            "&Blatte::wrapws(\" \", \"2\")); &Blatte::wrapws(\" \", $x) }");
  EXPECT_EQ(_emit("{\\let* {{\\x 1} {\\y \\x}} \\y}"),
            "do { my $x = &Blatte::wrapws(\" \", \"1\"); "
            "my $y = &Blatte::wrapws(\" \", $x); &Blatte::wrapws(\" \", $y) }");
  EXPECT_EQ(_emit("{\\letrec {{\\x 1}} \\x}"),
            "do { my($x); ($x) = (&Blatte::wrapws(\" \", \"1\")); "
            "&Blatte::wrapws(\" \", $x) }");
  EXPECT_EQ(_emit("{\\let {} a}"), "do { &Blatte::wrapws(\" \", \"a\") }");
  EXPECT_EQ(_emit("{\\let* {}}"), "do { [] }");
}

TEST(PerlEmitterTest, CallOrList)
{
  EXPECT_EQ(_emit("{\\f a b}"),
            "do { my @_e = ($f, &Blatte::wrapws(\" \", \"a\"), "
            "&Blatte::wrapws(\" \", \"b\")); "
            "ref(&Blatte::unwrapws($_e[0])) eq 'CODE' ? "
            "&{&Blatte::unwrapws($_e[0])}({}, @_e[1, 2]) : [@_e] }");
  EXPECT_EQ(_emit("{\\f}"),
            "do { my @_e = ($f); ref(&Blatte::unwrapws($_e[0])) eq 'CODE' ? "
            "&{&Blatte::unwrapws($_e[0])}({}) : [@_e] }");
  // Named arguments are passed in the hash and left out of a list
  EXPECT_EQ(_emit("{\\f a \\n=b}"),
            "do { my @_e = ($f, &Blatte::wrapws(\" \", \"a\"), \"b\"); "
            "ref(&Blatte::unwrapws($_e[0])) eq 'CODE' ? "
            "&{&Blatte::unwrapws($_e[0])}({n => $_e[2]}, $_e[1]) : [@_e[0, 1]] }");
}

TEST(PerlEmitterTest, CustomPackage)
{
  const blt::perl_emitter emitter {"Site::Runtime"};
  const blt::value expr = blt::ws(" ", blt::list("if", blt::sym("x"), blt::str("y")));
  EXPECT_EQ(emitter.emit(expr),
            "&Site::Runtime::wrapws(\" \", (&Site::Runtime::true($x) ? \"y\" : []))");
}

// Emitter with assignments routed through a run-time hook
class assigning_emitter: public blt::perl_emitter {
  public:
  assigning_emitter()
  {
    prepend_rule({blt::list("set!"), blt::list("set!", "var", "expr")},
                 [this](const auto &ms) {
      return blt::str(std::format("&{}::assign(\\{}, {})", package(),
                                  emit(ms.at("var")), emit(ms.at("expr"))));
    });
  }
};

TEST(PerlEmitterTest, PrependedRuleOverridesTemplate)
{
  const assigning_emitter emitter;
  EXPECT_EQ(emitter.emit(blt::list("set!", blt::sym("x"), blt::str("1"))),
            "&Blatte::assign(\\$x, \"1\")");
  // Nested forms go through the overriding rule as well
  EXPECT_EQ(emitter.emit(blt::list("if", blt::sym("t"),
                                   blt::list("set!", blt::sym("x"), blt::sym("y")))),
            "(&Blatte::true($t) ? &Blatte::assign(\\$x, $y) : [])");

  // Default emitter is not affected
  EXPECT_EQ(blt::default_emitter().emit(
                blt::list("set!", blt::sym("x"), blt::str("1"))),
            "($x = \"1\")");
}

TEST(PerlEmitterTest, BadTrees)
{
  const blt::perl_emitter &emitter = blt::default_emitter();
  EXPECT_THROW((void)emitter.emit(blt::list("bogus", blt::str("x"))),
               blt::codegen_error);
  EXPECT_THROW((void)emitter.emit(blt::fn([](blt::value, blt::value) {
                 return blt::nil;
               })),
               blt::codegen_error);
  EXPECT_THROW(
      (void)emitter.emit(blt::list("lambda", blt::list(blt::list("weird", blt::sym("x"))))),
      blt::codegen_error);
  EXPECT_THROW((void)emitter.emit(blt::list("and")), blt::codegen_error);
  EXPECT_THROW((void)emitter.emit(blt::list("group",
                                            blt::list("named-arg", blt::sym("n"),
                                                      blt::str("v")))),
               blt::codegen_error);
}

TEST(PerlEmitterTest, ParseFront)
{
  std::string buffer = "a {b} rest";
  EXPECT_EQ(blt::parse_front(buffer), "\"a\"");
  EXPECT_EQ(buffer, " {b} rest");

  // Buffer is left as is on failure
  std::string bad = "{\\set! a b} x";
  EXPECT_THROW(blt::parse_front(bad), blt::parse_error);
  EXPECT_EQ(bad, "{\\set! a b} x");

  std::string empty = " \\; only a comment";
  EXPECT_FALSE(blt::parse_front(empty).has_value());
  EXPECT_EQ(empty, " \\; only a comment");
}

TEST(PerlEmitterTest, TranslateDocument)
{
  const std::string text = "{\\define \\x hi}\n\\x\n";
  EXPECT_EQ(blt::translate(text),
            "do { use vars qw($x); $x = &Blatte::wrapws(\" \", \"hi\") };\n"
            "&Blatte::wrapws(\"\\n\", $x);\n"
            "\"\\n\";\n");

  blt::translation_options options;
  options.standalone = true;
  EXPECT_EQ(blt::translate(text, options),
            "use Blatte;\nuse Blatte::Builtins;\n\n"
            "do { use vars qw($x); $x = &Blatte::wrapws(\" \", \"hi\") };\n"
            "print &Blatte::flatten(&Blatte::wrapws(\"\\n\", $x));\n"
            "print \"\\n\";\n");

  options.package = "Site";
  options.standalone = false;
  EXPECT_EQ(blt::translate("\\x", options), "$x;\n");
  EXPECT_EQ(blt::translate(" \\x", options), "&Site::wrapws(\" \", $x);\n");

  EXPECT_EQ(blt::translate(""), "");
}

TEST(PerlEmitterTest, TranslateErrorLocation)
{
  blt::translation_options options;
  options.source_name = "page.blt";
  try
  {
    (void)blt::translate("ok\n{\\if x}", options);
    FAIL() << "expected parse_error";
  }
  catch (const blt::parse_error &exn)
  {
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(exn.location()->source, "page.blt");
    EXPECT_EQ(exn.location()->start, 3);
  }
}


// Minimal runtime package for running the generated code
const char *const stub_runtime = R"perl(
package Blatte;

sub wrapws { bless { ws => $_[0], obj => $_[1] }, 'Blatte::Ws' }

sub unwrapws
{
  my $x = shift;
  $x = $x->{obj} while ref($x) eq 'Blatte::Ws';
  return $x;
}

sub true
{
  my $x = unwrapws(shift);
  return 0 unless defined $x;
  return scalar(@$x) if ref($x) eq 'ARRAY';
  return 1 if ref($x);
  return ($x ne '' and $x ne '0') ? 1 : 0;
}

sub flatten
{
  my ($x, $ws) = @_;
  if (ref($x) eq 'Blatte::Ws')
  { return flatten($x->{obj}, defined($ws) ? $ws : $x->{ws}) }
  if (ref($x) eq 'ARRAY')
  {
    my $result = '';
    for my $e (@$x) { $result .= flatten($e, $ws); undef $ws; }
    return $result;
  }
  return '' if ref($x) eq 'CODE';
  return (defined($ws) ? $ws : '') . (defined($x) ? $x : '');
}

1;
)perl";

std::string
_slurp(const std::filesystem::path &path)
{
  std::ifstream in {path};
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

std::string
_run_perl(std::string_view document)
{
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path() /
      ("blatte_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
       "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
  fs::create_directories(dir / "Blatte");

  std::ofstream {dir / "Blatte.pm"} << stub_runtime;
  std::ofstream {dir / "Blatte" / "Builtins.pm"} << "package Blatte::Builtins;\n1;\n";

  blt::translation_options options;
  options.standalone = true;
  std::ofstream {dir / "program.pl"} << blt::translate(document, options);

  const std::string command =
      std::format("perl -I'{}' '{}' > '{}'", dir.string(),
                  (dir / "program.pl").string(), (dir / "output.txt").string());
  const int status = std::system(command.c_str());
  std::string output = _slurp(dir / "output.txt");
  fs::remove_all(dir);
  if (status != 0)
    throw std::runtime_error {std::format("perl failed with status {}", status)};
  return output;
}

class PerlRunTest: public testing::Test {
  protected:
  void
  SetUp() override
  {
    if (std::system("perl -e 1 > /dev/null 2>&1") != 0)
      GTEST_SKIP() << "perl is not available";
  }
};

TEST_F(PerlRunTest, PlainText)
{
  EXPECT_EQ(_run_perl("Hello,\n  world!\n"), "Hello,\n  world!\n");
  EXPECT_EQ(_run_perl("a \\/b \\; comment\nc"), "ab c");
}

TEST_F(PerlRunTest, ArgumentBinding)
{
  const std::string document =
      "{\\define {\\fn \\=n1 \\=n2 \\a \\b \\&r}\n"
      "  {\\if \\n1 wrong {\\n2 \\a \\b \\r}}}\n"
      "{\\fn \\n2=17 This is an example.}\n";
  EXPECT_EQ(_run_perl(document), "\n17 This is an example.\n");
}

TEST_F(PerlRunTest, LocalBindings)
{
  EXPECT_EQ(_run_perl("{\\let {{\\x one} {\\y two}} \\y \\x}"), " one");
  EXPECT_EQ(_run_perl("{\\let* {{\\x one} {\\y \\x}} {\\y}}"), " one");
  EXPECT_EQ(_run_perl("{\\and a {}}|{\\or {} b}"), "| b");
}

TEST_F(PerlRunTest, Conditionals)
{
  EXPECT_EQ(_run_perl("{\\define \\t 0}{\\if \\t yes no}"), " no");
  EXPECT_EQ(_run_perl("{\\define \\t x}{\\cond {\\t first} {second}}"), " first");
  EXPECT_EQ(_run_perl("{\\cond {{}} {\\\"\\\"} {fallback}}"), "fallback");
}

TEST_F(PerlRunTest, ArityErrors)
{
  EXPECT_THROW(_run_perl("{\\define {\\f \\a} \\a}{\\f}"), std::runtime_error);
  EXPECT_THROW(_run_perl("{\\define {\\f \\a} \\a}{\\f x y}"), std::runtime_error);
}

} // anonymous namespace
