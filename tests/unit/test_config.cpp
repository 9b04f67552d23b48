#include <gtest/gtest.h>
#include "stencil/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace stencil;

namespace {

Value json(std::string_view text) {
    auto parsed = config::parse_json(text);
    EXPECT_TRUE(parsed.has_value()) << text;
    return parsed ? *parsed : Value();
}

} // namespace

// ============================================================================
// JSON Reading
// ============================================================================

TEST(ConfigTest, ParseJsonRejectsMalformedText) {
    auto parsed = config::parse_json("{\"messages\": [");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, ParseJsonKeepsKeyOrder) {
    auto parsed = config::parse_json(R"({"zeta": 1, "alpha": 2})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->begin().key(), "zeta");
}

TEST(ConfigTest, ReadMissingFile) {
    auto document = config::read_json_file("/nonexistent/stencil/options.json");
    ASSERT_FALSE(document.has_value());
    EXPECT_EQ(document.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(document.error().context, "/nonexistent/stencil/options.json");
}

TEST(ConfigTest, ReadFile) {
    auto path = (std::filesystem::temp_directory_path() / "stencil_test_options.json").string();
    {
        std::ofstream out(path);
        out << R"({"missing_variable_policy": "lenient"})";
    }

    auto document = config::read_json_file(path);
    std::remove(path.c_str());

    ASSERT_TRUE(document.has_value());
    auto options = config::load_render_options(*document);
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->missing_variable_policy, MissingVariablePolicy::Lenient);
}

// ============================================================================
// Render Options
// ============================================================================

TEST(ConfigTest, RenderOptionsDefaults) {
    auto options = config::load_render_options(Value::object());
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(*options, RenderOptions{});
}

TEST(ConfigTest, RenderOptionsAllKeys) {
    auto options = config::load_render_options(
        json(R"({"missing_variable_policy": "lenient", "escape_output": true})"));
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->missing_variable_policy, MissingVariablePolicy::Lenient);
    EXPECT_TRUE(options->escape_output);
}

TEST(ConfigTest, RenderOptionsRejectBadValues) {
    for (const char* text : {R"({"missing_variable_policy": "loose"})",
                             R"({"missing_variable_policy": 1})",
                             R"({"escape_output": "yes"})",
                             R"([])"}) {
        auto options = config::load_render_options(json(text));
        ASSERT_FALSE(options.has_value()) << text;
        EXPECT_EQ(options.error().code, ErrorCode::InvalidConfig) << text;
    }
}

TEST(ConfigTest, RenderOptionsSerializeAndLoadBack) {
    RenderOptions original = RenderOptions::lenient();
    original.escape_output = true;

    Value j = original;
    EXPECT_EQ(j["missing_variable_policy"].get<std::string>(), "lenient");

    auto loaded = config::load_render_options(j);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, original);
}

// ============================================================================
// Chat Templates
// ============================================================================

TEST(ConfigTest, LoadChatTemplate) {
    auto loaded = config::load_chat_template(json(R"({"messages": [
        {"role": "system", "template": "You are {persona}."},
        {"placeholder": "history", "optional": true, "n_messages": 20},
        {"role": "human", "template": "{{question}}"}
    ]})"));
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 3u);

    const auto& placeholder = std::get<chat::MessagesPlaceholder>(loaded->entries()[1]);
    EXPECT_EQ(placeholder, chat::MessagesPlaceholder("history", true, 20));
    EXPECT_EQ(std::get<chat::RoleTemplate>(loaded->entries()[2]).role, Role::User);

    auto messages = loaded->format_messages({{"persona", "terse"}, {"question", "Why?"}});
    ASSERT_TRUE(messages.has_value());
    ASSERT_EQ(messages->size(), 2u);
    EXPECT_EQ((*messages)[1], Message::user("Why?"));
}

TEST(ConfigTest, ChatTemplateNeedsMessagesList) {
    for (const char* text : {R"({})", R"({"messages": {}})", R"("text")"}) {
        auto loaded = config::load_chat_template(json(text));
        ASSERT_FALSE(loaded.has_value()) << text;
        ASSERT_EQ(loaded.error().size(), 1u);
        EXPECT_EQ(loaded.error()[0].code, ErrorCode::InvalidConfig);
    }
}

TEST(ConfigTest, ChatTemplateReportsEveryBadEntry) {
    auto loaded = config::load_chat_template(json(R"({"messages": [
        5,
        {"role": "robot", "template": "x"},
        {"role": "user"},
        {"role": "user", "template": "{}"},
        {"placeholder": ""},
        {"placeholder": "h", "n_messages": -1},
        {"role": "ai", "template": "fine"}
    ]})"));
    ASSERT_FALSE(loaded.has_value());

    const auto& errors = loaded.error();
    ASSERT_EQ(errors.size(), 6u);
    EXPECT_EQ(errors[0].context, "messages[0]");
    EXPECT_EQ(errors[1].code, ErrorCode::InvalidRole);
    EXPECT_EQ(errors[1].context, "messages[1]");
    EXPECT_EQ(errors[2].code, ErrorCode::InvalidConfig);
    EXPECT_EQ(errors[3].code, ErrorCode::EmptyPlaceholder);
    EXPECT_EQ(errors[3].context, "messages[3]");
    EXPECT_EQ(errors[4].context, "messages[4]");
    EXPECT_EQ(errors[5].context, "messages[5]");
}

// ============================================================================
// Few-Shot Templates
// ============================================================================

TEST(ConfigTest, LoadFewShotTemplate) {
    auto few_shot = config::load_few_shot_template(json(R"({
        "prefix": "P {x}",
        "examples": ["e1", "e2"],
        "suffix": "S",
        "example_separator": "|"
    })"));
    ASSERT_TRUE(few_shot.has_value());
    EXPECT_EQ(few_shot->examples().size(), 2u);

    auto text = few_shot->format({{"x", 1}});
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "P 1|e1|e2|S");
}

TEST(ConfigTest, FewShotEmptyDocument) {
    auto few_shot = config::load_few_shot_template(Value::object());
    ASSERT_TRUE(few_shot.has_value());
    EXPECT_EQ(few_shot->example_separator(), "\n\n");
}

TEST(ConfigTest, FewShotReportsTypeErrors) {
    auto few_shot = config::load_few_shot_template(json(R"({"prefix": 5, "examples": "nope"})"));
    ASSERT_FALSE(few_shot.has_value());
    ASSERT_EQ(few_shot.error().size(), 2u);
    EXPECT_EQ(few_shot.error()[0].context, "prefix");
    EXPECT_EQ(few_shot.error()[1].context, "examples");

    few_shot = config::load_few_shot_template(json(R"({"examples": ["ok", 3]})"));
    ASSERT_FALSE(few_shot.has_value());
    ASSERT_EQ(few_shot.error().size(), 1u);
    EXPECT_EQ(few_shot.error()[0].context, "examples[1]");
}

TEST(ConfigTest, FewShotReportsParseErrors) {
    auto few_shot = config::load_few_shot_template(json(R"({"suffix": "{x} {{y}}"})"));
    ASSERT_FALSE(few_shot.has_value());
    ASSERT_EQ(few_shot.error().size(), 1u);
    EXPECT_EQ(few_shot.error()[0].code, ErrorCode::MixedFormat);
    EXPECT_EQ(few_shot.error()[0].context, "suffix");
}

TEST(ConfigTest, FewShotIgnoresMessages) {
    auto few_shot = config::load_few_shot_template(json(R"({
        "examples": ["e1"],
        "messages": [{"role": "human", "template": "{input}"}]
    })"));
    ASSERT_TRUE(few_shot.has_value());
    EXPECT_EQ(few_shot->examples().size(), 1u);
}

// ============================================================================
// Few-Shot Chat Templates
// ============================================================================

TEST(ConfigTest, LoadFewShotChatTemplate) {
    auto few_shot = config::load_few_shot_chat_template(json(R"({
        "prefix": "### Examples:",
        "examples": ["{input}: What is 2 + 2?\n{output}: 4", "{input}: What is 2 + 3?\n{output}: 5"],
        "example_separator": "\n---\n",
        "messages": [
            {"role": "human", "template": "{input}"},
            {"role": "ai", "template": "{output}"}
        ]
    })"));
    ASSERT_TRUE(few_shot.has_value());
    EXPECT_EQ(few_shot->example_prompt().size(), 2u);
    EXPECT_EQ(few_shot->examples().examples().size(), 2u);

    auto text = few_shot->format_examples();
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text,
              "### Examples:\n---\n"
              "user: What is 2 + 2?\nassistant: 4\n---\n"
              "user: What is 2 + 3?\nassistant: 5");
}

TEST(ConfigTest, FewShotChatNeedsMessagesList) {
    auto few_shot = config::load_few_shot_chat_template(json(R"({"examples": ["e1"]})"));
    ASSERT_FALSE(few_shot.has_value());
    ASSERT_EQ(few_shot.error().size(), 1u);
    EXPECT_EQ(few_shot.error()[0].code, ErrorCode::InvalidConfig);
    EXPECT_EQ(few_shot.error()[0].context, "messages");

    few_shot = config::load_few_shot_chat_template(json("[]"));
    ASSERT_FALSE(few_shot.has_value());
    ASSERT_EQ(few_shot.error().size(), 1u);
    EXPECT_EQ(few_shot.error()[0].code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, FewShotChatReportsErrorsOfBothParts) {
    auto few_shot = config::load_few_shot_chat_template(json(R"({
        "prefix": 5,
        "messages": [{"role": "robot", "template": "{x}"}, {"role": "ai", "template": "{x} {{y}}"}]
    })"));
    ASSERT_FALSE(few_shot.has_value());
    const auto& errors = few_shot.error();
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].code, ErrorCode::InvalidConfig);
    EXPECT_EQ(errors[0].context, "prefix");
    EXPECT_EQ(errors[1].code, ErrorCode::InvalidRole);
    EXPECT_EQ(errors[1].context, "messages[0]");
    EXPECT_EQ(errors[2].code, ErrorCode::MixedFormat);
    EXPECT_EQ(errors[2].context, "messages[1]");
}
