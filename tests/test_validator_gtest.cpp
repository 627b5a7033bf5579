// ==============================================================================
// test_validator_gtest.cpp - Тесты валидации аргументов (GoogleTest)
// ==============================================================================

#include "fulcrum/validator.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace fulcrum::validator::test {

namespace {

schema::ArgumentSchema make_schema() {
    schema::ArgumentSchema s("start");
    s.add({"fresh", schema::ValueType::Boolean, 0u, false});
    s.add({"verbose", schema::ValueType::Boolean, 1u, false});
    s.add({"memory", schema::ValueType::Integer, std::nullopt, false});
    s.add({"ratio", schema::ValueType::Float, std::nullopt, false});
    s.add({"motd", schema::ValueType::Text, std::nullopt, false});
    return s;
}

}  // namespace

// ==============================================================================
// Классификация
// ==============================================================================

TEST(ValidatorTest, Classify_Numbers) {
    EXPECT_EQ(classify("7"), TokenClass::Integer);
    EXPECT_EQ(classify("-12"), TokenClass::Integer);
    EXPECT_EQ(classify("1.5"), TokenClass::Float);
    EXPECT_EQ(classify("-.5"), TokenClass::Float);
    EXPECT_EQ(classify("3."), TokenClass::Float);
    EXPECT_EQ(classify("1.2.3"), TokenClass::Malformed);
    EXPECT_EQ(classify("-"), TokenClass::Malformed);
}

TEST(ValidatorTest, Classify_WordsAndFlags) {
    EXPECT_EQ(classify("Hello"), TokenClass::Word);
    EXPECT_EQ(classify("-memory"), TokenClass::ShortFlag);
    EXPECT_EQ(classify("--fresh"), TokenClass::LongFlag);
    EXPECT_EQ(classify("--dry-run"), TokenClass::LongFlag);
    EXPECT_EQ(classify("---x"), TokenClass::Malformed);
    EXPECT_EQ(classify("--Fresh"), TokenClass::Malformed);
    EXPECT_EQ(classify("--a--b"), TokenClass::Malformed);
    EXPECT_EQ(classify("--a-"), TokenClass::Malformed);
    EXPECT_EQ(classify("abc123"), TokenClass::Malformed);
}

TEST(ValidatorTest, CharLength_CountsCodePoints) {
    EXPECT_EQ(char_length("abc"), 3u);
    EXPECT_EQ(char_length("\xC3\xA9t\xC3\xA9"), 3u);  // "été"
}

// ==============================================================================
// Успешный разбор
// ==============================================================================

TEST(ValidatorTest, Validate_Empty_Ok) {
    auto result = validate(make_schema(), {});
    ASSERT_TRUE(result);
    EXPECT_EQ(result.command.options, 0u);
    EXPECT_TRUE(result.command.flags.empty());
}

TEST(ValidatorTest, Validate_LongFlags_SetBits) {
    auto result = validate(make_schema(), {"--fresh", "--verbose"});
    ASSERT_TRUE(result) << result.error.message;
    EXPECT_EQ(result.command.options, 0b11u);
    EXPECT_TRUE(result.command.has_option(0));
    EXPECT_TRUE(result.command.has_option(1));
    EXPECT_FALSE(result.command.has_option(32));
    EXPECT_TRUE(result.command.has_flag("fresh"));
}

TEST(ValidatorTest, Validate_UnknownLongFlag_Ignored) {
    auto result = validate(make_schema(), {"--loud"});
    ASSERT_TRUE(result);
    EXPECT_EQ(result.command.options, 0u);
    EXPECT_FALSE(result.command.has_flag("loud"));
}

TEST(ValidatorTest, Validate_ShortFlagBindsValue) {
    auto result = validate(make_schema(), {"-memory", "4", "-motd", "Hello"});
    ASSERT_TRUE(result) << result.error.message;
    EXPECT_EQ(std::get<std::int64_t>(result.command.flags.at("memory")), 4);
    EXPECT_EQ(std::get<std::string>(result.command.flags.at("motd")), "Hello");
    EXPECT_TRUE(result.command.positionals.empty());
}

TEST(ValidatorTest, Validate_IntegerWidensToFloat) {
    auto result = validate(make_schema(), {"-ratio", "2"});
    ASSERT_TRUE(result);
    EXPECT_DOUBLE_EQ(std::get<double>(result.command.flags.at("ratio")), 2.0);
}

TEST(ValidatorTest, Validate_NegativeIntegerAfterShortFlag_IsValue) {
    auto result = validate(make_schema(), {"-memory", "-3"});
    ASSERT_TRUE(result);
    EXPECT_EQ(std::get<std::int64_t>(result.command.flags.at("memory")), -3);
}

TEST(ValidatorTest, Validate_Positionals) {
    auto result = validate(make_schema(), {"alpha", "2", "--fresh", "1.5"});
    ASSERT_TRUE(result);
    ASSERT_EQ(result.command.positionals.size(), 3u);
    EXPECT_EQ(std::get<std::string>(result.command.positionals[0]), "alpha");
    EXPECT_EQ(std::get<std::int64_t>(result.command.positionals[1]), 2);
    EXPECT_DOUBLE_EQ(std::get<double>(result.command.positionals[2]), 1.5);
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST(ValidatorTest, Validate_TokenLength_Boundary) {
    std::string max_token(MAX_TOKEN_LENGTH, 'a');
    EXPECT_TRUE(validate(make_schema(), {max_token}));

    std::string long_token(MAX_TOKEN_LENGTH + 1, 'a');
    auto result = validate(make_schema(), {"ok", long_token});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::TokenTooLarge);
    ASSERT_EQ(result.error.tokens.size(), 1u);
    EXPECT_EQ(result.error.tokens[0].index, 1u);
    EXPECT_EQ(result.error.tokens[0].offset, 3u);
}

TEST(ValidatorTest, Validate_LengthCheckedBeforeAscii) {
    std::string long_token(MAX_TOKEN_LENGTH + 1, 'a');
    auto result = validate(make_schema(), {"\xC3\xA9", long_token});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::TokenTooLarge);
}

TEST(ValidatorTest, Validate_NonAscii) {
    auto result = validate(make_schema(), {"-motd", "caf\xC3\xA9"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::NonAsciiToken);
    EXPECT_EQ(result.error.tokens[0].offset, 6u);
    EXPECT_EQ(result.error.tokens[0].length, 4u);
}

TEST(ValidatorTest, Validate_Malformed) {
    auto result = validate(make_schema(), {"--fresh", "a_b"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::MalformedToken);
    EXPECT_EQ(result.error.tokens[0].index, 1u);
}

TEST(ValidatorTest, Validate_IntegerOverflow_Malformed) {
    auto result = validate(make_schema(), {"-memory", "99999999999999999999"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::MalformedToken);
}

TEST(ValidatorTest, Validate_UnknownShortFlag_CitesFlagAndValue) {
    auto result = validate(make_schema(), {"-size", "3"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::UnknownFlag);
    ASSERT_EQ(result.error.tokens.size(), 2u);
    EXPECT_EQ(result.error.tokens[0].token, "-size");
    EXPECT_EQ(result.error.tokens[1].token, "3");
}

TEST(ValidatorTest, Validate_TypeMismatch) {
    auto result = validate(make_schema(), {"-memory", "big"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::FlagTypeMismatch);
    EXPECT_NE(result.error.message.find("expects integer"), std::string::npos);
}

TEST(ValidatorTest, Validate_FloatForInteger_Mismatch) {
    auto result = validate(make_schema(), {"-memory", "1.5"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::FlagTypeMismatch);
}

TEST(ValidatorTest, Validate_BooleanNeverTakesValue) {
    auto result = validate(make_schema(), {"-fresh", "yes"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::FlagTypeMismatch);
}

TEST(ValidatorTest, Validate_ShortFlagFollowedByFlag_MissingValue) {
    auto result = validate(make_schema(), {"-memory", "--fresh"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::MissingFlagValue);
    EXPECT_EQ(result.error.tokens[0].token, "-memory");
}

TEST(ValidatorTest, Validate_DanglingShortFlag_MissingValue) {
    auto result = validate(make_schema(), {"--fresh", "-memory"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::MissingFlagValue);
    EXPECT_EQ(result.error.tokens[0].index, 1u);
}

// ==============================================================================
// Диагностика
// ==============================================================================

TEST(ValidatorTest, Render_UnderlinesCitedTokens) {
    std::vector<std::string> tokens{"-memory", "big"};
    auto result = validate(make_schema(), tokens);
    ASSERT_FALSE(result);

    std::string rendered = result.error.render(join_tokens(tokens));
    EXPECT_EQ(rendered.substr(0, rendered.find('\n', 12) + 1), "-memory big\n^^^^^^^ ^^^\n");
    EXPECT_NE(rendered.find(result.error.message), std::string::npos);
}

TEST(ValidatorTest, SplitTokens_CollapsesWhitespace) {
    auto tokens = split_tokens("  start\t--fresh   -memory 4 ");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0], "start");
    EXPECT_EQ(tokens[3], "4");
    EXPECT_EQ(join_tokens(tokens), "start --fresh -memory 4");
}

TEST(ValidatorTest, ValueToString) {
    EXPECT_EQ(value_to_string(Value{std::int64_t{42}}), "42");
    EXPECT_EQ(value_to_string(Value{1.5}), "1.5");
    EXPECT_EQ(value_to_string(Value{2.0}), "2.0");
    EXPECT_EQ(value_to_string(Value{true}), "true");
    EXPECT_EQ(value_to_string(Value{std::string("hi")}), "hi");
}

}  // namespace fulcrum::validator::test
