#include <gtest/gtest.h>
#include "stencil/chat/few_shot_chat_template.hpp"

using namespace stencil;
using namespace stencil::chat;

class FewShotChatTemplateTest : public ::testing::Test {
protected:
    static ChatTemplate example_prompt(const std::string& first, const std::string& second) {
        auto prompt = ChatTemplate::from_messages({
            {Role::User, first},
            {Role::Assistant, second},
        });
        if (!prompt) {
            ADD_FAILURE() << "example prompt failed to parse";
            return ChatTemplate{};
        }
        return std::move(*prompt);
    }

    static FewShotTemplate arithmetic(bool framed) {
        auto builder = FewShotTemplate::builder();
        if (framed) {
            builder.prefix("### Examples:").suffix("---");
        }
        builder.add_example("{input}: What is 2 + 2?\n{output}: 4")
               .add_example("{input}: What is 2 + 3?\n{output}: 5")
               .add_example("{input}: What is 3 + 3?\n{output}: 6");
        auto built = builder.build();
        if (!built) {
            ADD_FAILURE() << "examples failed to parse";
            return *FewShotTemplate::builder().build();
        }
        return std::move(*built);
    }
};

TEST_F(FewShotChatTemplateTest, FormatExamplesWritesRoleNames) {
    FewShotChatTemplate few_shot(arithmetic(true), example_prompt("{input}", "{output}"));

    auto text = few_shot.format_examples();
    ASSERT_TRUE(text.has_value()) << text.error().to_string();
    EXPECT_EQ(*text,
              "### Examples:\n\n"
              "user: What is 2 + 2?\nassistant: 4\n\n"
              "user: What is 2 + 3?\nassistant: 5\n\n"
              "user: What is 3 + 3?\nassistant: 6\n\n"
              "---");
}

TEST_F(FewShotChatTemplateTest, BindingsFollowTheExamplePrompt) {
    auto examples = FewShotTemplate::builder()
        .add_example("{question}: What is 5 + 5?\n{answer}: 10")
        .add_example("{question}: What is 6 + 6?\n{answer}: 12")
        .build();
    ASSERT_TRUE(examples.has_value());

    FewShotChatTemplate few_shot(*examples, example_prompt("{question}", "{answer}"));
    auto text = few_shot.format_examples();
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "user: What is 5 + 5?\nassistant: 10\n\nuser: What is 6 + 6?\nassistant: 12");
}

TEST_F(FewShotChatTemplateTest, NoExamplesFormatsEmpty) {
    auto examples = FewShotTemplate::builder().build();
    ASSERT_TRUE(examples.has_value());

    FewShotChatTemplate few_shot(*examples, example_prompt("{input}", "{output}"));
    auto text = few_shot.format_examples();
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "");
}

TEST_F(FewShotChatTemplateTest, UnboundExampleVariableIsMissing) {
    FewShotChatTemplate few_shot(arithmetic(false), example_prompt("{question}", "{answer}"));

    auto text = few_shot.format_examples();
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, ErrorCode::MissingVariable);
    EXPECT_EQ(text.error().name, "input");
    EXPECT_EQ(text.error().context, "example[0]");
}

TEST_F(FewShotChatTemplateTest, RoleBindings) {
    ChatTemplate prompt;
    auto system = PromptTemplate::from_template("You are {name}, helping {user}.");
    auto fixed = PromptTemplate::from_template("I'm doing well, thank you.");
    ASSERT_TRUE(system.has_value() && fixed.has_value());
    prompt.add_message(Role::System, *system)
          .add_placeholder(MessagesPlaceholder("history"))
          .add_message(Role::Assistant, *fixed);

    auto examples = FewShotTemplate::builder().build();
    ASSERT_TRUE(examples.has_value());
    FewShotChatTemplate few_shot(*examples, prompt);

    EXPECT_EQ(few_shot.role_bindings(), (Context{{"name", "system"}}));
}

TEST_F(FewShotChatTemplateTest, LaterRoleWinsSharedVariable) {
    auto examples = FewShotTemplate::builder().add_example("{speaker}: hi").build();
    ASSERT_TRUE(examples.has_value());

    FewShotChatTemplate few_shot(*examples, example_prompt("{speaker}", "{speaker} again"));
    EXPECT_EQ(few_shot.role_bindings(), (Context{{"speaker", "assistant"}}));

    auto text = few_shot.format_examples();
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "assistant: hi");
}

TEST_F(FewShotChatTemplateTest, ContextOverridesBindings) {
    auto examples = FewShotTemplate::builder()
        .add_example("{input}: {question}\n{output}: 4")
        .build();
    ASSERT_TRUE(examples.has_value());

    FewShotChatTemplate few_shot(*examples, example_prompt("{input}", "{output}"));
    EXPECT_EQ(few_shot.input_variables(), (std::vector<std::string>{"input", "question", "output"}));

    auto text = few_shot.format({{"input", "Q"}, {"question", "2 + 2?"}});
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "Q: 2 + 2?\nassistant: 4");
}

TEST_F(FewShotChatTemplateTest, NonMapContextIsRejected) {
    FewShotChatTemplate few_shot(arithmetic(false), example_prompt("{input}", "{output}"));

    auto text = few_shot.format(Value::array({1, 2}));
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, ErrorCode::InvalidContext);
}
