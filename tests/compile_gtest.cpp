#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "tinyc/compiler.hpp"

using namespace tinyc;

TEST(Compile, CanonicalScenarios){
    EXPECT_EQ(compile("(add 2 2)"), "add(2, 2);");
    EXPECT_EQ(compile("(subtract 4 2)"), "subtract(4, 2);");
    EXPECT_EQ(compile("(add 2 (subtract 4 2))"), "add(2, subtract(4, 2));");
    EXPECT_EQ(compile("(concat \"foo\" \"bar\")"), "concat(\"foo\", \"bar\");");
    EXPECT_EQ(compile("(add 2 2)\n(subtract 4 2)"), "add(2, 2);\nsubtract(4, 2);");
}

TEST(Compile, EmptyProgram){
    EXPECT_EQ(compile(""), "");
    EXPECT_EQ(compile(" \n\t "), "");
}

TEST(Compile, Deterministic){
    const char* src = "(a (b 1 \"x\") (c (d 2)))\n(e)";
    const std::string first = compile(src);
    for(int i=0;i<5;++i) EXPECT_EQ(compile(src), first);
}

TEST(Compile, WhitespaceInsensitive){
    const std::string tight = compile("(add 2 (subtract 4 2))(concat \"a b\" 1)");
    EXPECT_EQ(compile("  ( add\t2\n(subtract   4 2 ) )\r\n\n( concat \"a b\"   1 )  "), tight);
    EXPECT_EQ(tight, "add(2, subtract(4, 2));\nconcat(\"a b\", 1);");
}

TEST(Compile, ArgumentOrderPreserved){
    EXPECT_EQ(compile("(f 1 2 3 4 5)"), "f(1, 2, 3, 4, 5);");
    EXPECT_EQ(compile("(f \"z\" (g 9 8) 7 (h))"), "f(\"z\", g(9, 8), 7, h());");
}

TEST(Compile, StagesComposeWithoutThrowing){
    const std::vector<std::string> accepted{
        "", "(f)", "1", "\"s\"", "(a 1) 2 \"three\"", "(a (b (c (d (e 1)))))", "(x \"\" \"()\")"};
    for(auto& src : accepted){
        auto tokens = scan(src);
        auto tree = parse(tokens);
        EXPECT_NO_THROW((void)generate(transform(tree))) << src;
    }
    EXPECT_EQ(compile("1 \"s\""), "1\n\"s\"");
}

TEST(Compile, ErrorTypes){
    EXPECT_THROW((void)compile("@"), lex_error);
    EXPECT_THROW((void)compile("(f \"open"), lex_error);
    EXPECT_THROW((void)compile("(1)"), parse_error);
    EXPECT_THROW((void)compile("(f"), parse_error);
    EXPECT_THROW((void)compile(")"), parse_error);
    try { (void)scan("@"); FAIL() << "expected lex_error"; }
    catch(const lex_error& e){ ASSERT_TRUE(e.character.has_value()); EXPECT_EQ(*e.character, '@'); EXPECT_NE(std::string(e.what()).find('@'), std::string::npos); }
}

// (a (a ... (a 1) ...)) with the given number of calls
static std::string nested_calls(size_t depth){
    std::string s;
    for(size_t i=0;i<depth;++i) s += "(a ";
    return s + "1" + std::string(depth, ')');
}

static const std::string& too_deep(){
    static const std::string src = nested_calls(max_nesting_depth + 1);
    return src;
}

TEST(Compile, DeepestAcceptedNesting){
    std::string expected;
    for(size_t i=0;i<max_nesting_depth;++i) expected += "a(";
    expected += "1" + std::string(max_nesting_depth, ')') + ";";
    EXPECT_EQ(compile(nested_calls(max_nesting_depth)), expected);
}

TEST(Compile, ExcessiveNestingIsAnError){
    EXPECT_THROW((void)compile(nested_calls(50000)), parse_error);
}

struct ErrorCase { const char* src; const char* code; };

class TryCompileErrors : public ::testing::TestWithParam<ErrorCase> {};

TEST_P(TryCompileErrors, ReportsCode){
    const auto& c = GetParam();
    compile_result r;
    ASSERT_NO_THROW(r = try_compile(c.src));
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.output.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, c.code);
    EXPECT_FALSE(r.errors[0].message.empty());
}

INSTANTIATE_TEST_SUITE_P(Taxonomy, TryCompileErrors, ::testing::Values(
    ErrorCase{"(add 2 %)", "E0100"},
    ErrorCase{"(say \"unterminated", "E0101"},
    ErrorCase{"(42 1)", "E0200"},
    ErrorCase{"(f) )", "E0201"},
    ErrorCase{"(f (g 1)", "E0202"},
    ErrorCase{too_deep().c_str(), "E0203"}));

TEST(TryCompile, Success){
    auto r = try_compile("(add 2 2)");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, "add(2, 2);");
    EXPECT_TRUE(r.errors.empty());
}
