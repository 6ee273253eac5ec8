#include <gtest/gtest.h>
#include <sandtool/config_file.hh>

using std::string;
using std::vector;

namespace {

ConfigFile load(std::string_view contents) {
    ConfigFile cf;
    cf.add_vars({"a", "b", "arr", "flag"});
    cf.load_config_from_string(contents);
    return cf;
}

} // namespace

// NOLINTNEXTLINE
TEST(config_file, colon_and_equals) {
    auto cf = load("a: 42\nb = hello world  \n");
    ASSERT_TRUE(cf["a"].is_set());
    EXPECT_EQ(cf["a"].as<int>(), 42);
    EXPECT_EQ(cf["b"].as_string(), "hello world");
    EXPECT_FALSE(cf["arr"].is_set());
}

// NOLINTNEXTLINE
TEST(config_file, comments_and_blank_lines) {
    auto cf = load("# comment\n\n  a: 1 # trailing\n");
    EXPECT_EQ(cf["a"].as<uint64_t>(), uint64_t{1});
}

// NOLINTNEXTLINE
TEST(config_file, quoted_values) {
    auto cf = load(R"(a: 'no \n escapes'
b: "tab\there \"quoted\" 'single'")");
    EXPECT_EQ(cf["a"].as_string(), R"(no \n escapes)");
    EXPECT_EQ(cf["b"].as_string(), "tab\there \"quoted\" 'single'");
}

// NOLINTNEXTLINE
TEST(config_file, arrays_spanning_lines) {
    auto cf = load("arr: [\n  one,\n  'two', # comment\n  \"three\"\n]\n");
    ASSERT_TRUE(cf["arr"].is_array());
    EXPECT_EQ(cf["arr"].as_array(), (vector<string>{"one", "two", "three"}));
}

// NOLINTNEXTLINE
TEST(config_file, empty_array) {
    auto cf = load("arr: []");
    ASSERT_TRUE(cf["arr"].is_set());
    ASSERT_TRUE(cf["arr"].is_array());
    EXPECT_TRUE(cf["arr"].as_array().empty());
}

// NOLINTNEXTLINE
TEST(config_file, later_occurrence_overrides) {
    auto cf = load("a: 1\na: 2\n");
    EXPECT_EQ(cf["a"].as<int>(), 2);
}

// NOLINTNEXTLINE
TEST(config_file, unregistered_variables_are_ignored) {
    auto cf = load("unknown: 7\na: 3\n");
    EXPECT_FALSE(cf["unknown"].is_set());
    EXPECT_EQ(cf.get_vars().count("unknown"), 0U);
    EXPECT_EQ(cf["a"].as<int>(), 3);
}

// NOLINTNEXTLINE
TEST(config_file, as_bool) {
    auto cf = load("a: Yes\nb: off\nflag: maybe\n");
    EXPECT_EQ(cf["a"].as_bool(), true);
    EXPECT_EQ(cf["b"].as_bool(), false);
    EXPECT_EQ(cf["flag"].as_bool(), std::nullopt);
}

// NOLINTNEXTLINE
TEST(config_file, as_number) {
    auto cf = load("a: 2.5\nb: 12abc\n");
    EXPECT_EQ(cf["a"].as<double>(), 2.5);
    EXPECT_EQ(cf["a"].as<int>(), std::nullopt);
    EXPECT_EQ(cf["b"].as<int>(), std::nullopt);
}

// NOLINTNEXTLINE
TEST(config_file, reset_vars) {
    auto cf = load("a: 1");
    cf.reset_vars();
    EXPECT_FALSE(cf["a"].is_set());
    cf.load_config_from_string("a: 5");
    EXPECT_EQ(cf["a"].as<int>(), 5);
}

// NOLINTNEXTLINE
TEST(config_file, parse_errors_carry_position) {
    try {
        load("a: 1\nb: \"unterminated\n");
        FAIL() << "expected ParseError";
    } catch (const ConfigFile::ParseError& e) {
        EXPECT_EQ(e.line(), 2U);
    }
    EXPECT_THROW(load("a 1"), ConfigFile::ParseError);
    EXPECT_THROW(load("arr: [1, 2"), ConfigFile::ParseError);
}

// NOLINTNEXTLINE
TEST(config_file, missing_file) {
    ConfigFile cf;
    EXPECT_THROW(cf.load_config_from_file("/nonexistent/sandtool.conf"), std::runtime_error);
}
