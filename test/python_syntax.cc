#include <gtest/gtest.h>
#include <sandtool/python_syntax.hh>

using sandtool::python::parse;
using sandtool::python::SyntaxError;
using sandtool::python::Token;
using sandtool::python::tokenize;

namespace {

std::vector<Token::Kind> kinds(std::string_view source) {
    std::vector<Token::Kind> res;
    for (const auto& tok : tokenize(source)) {
        res.emplace_back(tok.kind);
    }
    return res;
}

size_t syntax_error_line(std::string_view source) {
    try {
        parse(source);
    } catch (const SyntaxError& e) {
        return e.line();
    }
    return 0;
}

} // namespace

// NOLINTNEXTLINE
TEST(python_tokenize, simple_statement) {
    using K = Token::Kind;
    auto tokens = tokenize("x = 42 ** 2\n");
    ASSERT_EQ(
        kinds("x = 42 ** 2\n"),
        (std::vector{K::Name, K::Operator, K::Number, K::Operator, K::Number, K::Newline,
            K::EndMarker}));
    EXPECT_EQ(tokens[3].text, "**");
    EXPECT_EQ(tokens[2].line, 1U);
    EXPECT_EQ(tokens[2].column, 5U);
}

// NOLINTNEXTLINE
TEST(python_tokenize, indentation) {
    using K = Token::Kind;
    ASSERT_EQ(
        kinds("if x:\n    y\nz\n"),
        (std::vector{K::Name, K::Name, K::Operator, K::Newline, K::Indent, K::Name, K::Newline,
            K::Dedent, K::Name, K::Newline, K::EndMarker}));
}

// NOLINTNEXTLINE
TEST(python_tokenize, blank_lines_and_comments_are_skipped) {
    using K = Token::Kind;
    ASSERT_EQ(
        kinds("# comment\n\nx  # trailing\n\n"),
        (std::vector{K::Name, K::Newline, K::EndMarker}));
}

// NOLINTNEXTLINE
TEST(python_tokenize, brackets_join_lines) {
    using K = Token::Kind;
    ASSERT_EQ(
        kinds("f(1,\n  2)\n"),
        (std::vector{K::Name, K::Operator, K::Number, K::Operator, K::Number, K::Operator,
            K::Newline, K::EndMarker}));
}

// NOLINTNEXTLINE
TEST(python_tokenize, strings) {
    auto tokens = tokenize("s = f'{x}' + \"\"\"a\nb\"\"\" + rb'\\x00'\n");
    ASSERT_EQ(tokens[2].kind, Token::Kind::String);
    EXPECT_TRUE(tokens[2].is_fstring());
    EXPECT_EQ(tokens[4].kind, Token::Kind::String);
    EXPECT_EQ(tokens[4].text, "\"\"\"a\nb\"\"\"");
    EXPECT_FALSE(tokens[4].is_fstring());
    EXPECT_EQ(tokens[6].kind, Token::Kind::String);
}

// NOLINTNEXTLINE
TEST(python_tokenize, errors) {
    EXPECT_THROW(tokenize("x = (1, 2\n"), SyntaxError);
    EXPECT_THROW(tokenize("x = 1)\n"), SyntaxError);
    EXPECT_THROW(tokenize("x = [1, 2)\n"), SyntaxError);
    EXPECT_THROW(tokenize("s = 'abc\n"), SyntaxError);
    EXPECT_THROW(tokenize("s = '''abc\n"), SyntaxError);
    EXPECT_THROW(tokenize("x = 1 $ 2\n"), SyntaxError);
    EXPECT_THROW(tokenize("if x:\n        a\n    b\n"), SyntaxError);
}

// NOLINTNEXTLINE
TEST(python_parse, nested_blocks) {
    auto module = parse("for i in range(3):\n    if i:\n        print(i)\n    x = i\nprint(x)\n");
    ASSERT_EQ(module.body.size(), 2U);
    const auto& loop = module.body[0];
    EXPECT_TRUE(loop.tokens[0].is_name("for"));
    ASSERT_EQ(loop.body.size(), 2U);
    EXPECT_TRUE(loop.body[0].tokens[0].is_name("if"));
    ASSERT_EQ(loop.body[0].body.size(), 1U);
    EXPECT_EQ(loop.body[0].body[0].line(), 3U);
    EXPECT_EQ(module.body[1].line(), 5U);
}

// NOLINTNEXTLINE
TEST(python_parse, one_line_compound_statement) {
    auto module = parse("if True: print(1)\nwhile False: pass\n");
    ASSERT_EQ(module.body.size(), 2U);
    EXPECT_TRUE(module.body[0].body.empty());
}

// NOLINTNEXTLINE
TEST(python_parse, match_statement) {
    EXPECT_NO_THROW(parse("match x:\n    case 1:\n        pass\n"));
}

// NOLINTNEXTLINE
TEST(python_parse, syntax_errors) {
    EXPECT_EQ(syntax_error_line("x = 1\n    y = 2\n"), 2U);
    EXPECT_EQ(syntax_error_line("if x:\ny = 2\n"), 2U);
    EXPECT_EQ(syntax_error_line("x = 1\nwhile x\n    pass\n"), 2U);
    EXPECT_EQ(syntax_error_line("print(1):\n    pass\n"), 1U);
    EXPECT_NE(syntax_error_line("for i in range(3):\n"), 0U);
    EXPECT_EQ(syntax_error_line("x = 1\n"), 0U);
}
