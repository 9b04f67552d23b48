#pragma once

#include "chat_template.hpp"
#include "few_shot_template.hpp"
#include <string>
#include <vector>

namespace stencil {
namespace chat {

/**
 * @brief Few-shot examples written against the roles of a chat template
 *
 * Examples name speakers through variables ("{input}: What is 2 + 2?"). The
 * example prompt binds each of those variables to a role: the first variable
 * of every role template maps to that template's role name. Formatting the
 * examples with those bindings yields a transcript such as
 * "user: What is 2 + 2?\nassistant: 4".
 *
 * @code
 * auto examples = stencil::chat::FewShotTemplate::builder()
 *     .add_example("{input}: What is 2 + 2?\n{output}: 4")
 *     .build();
 * auto prompt = stencil::chat::ChatTemplate::from_messages({
 *     {stencil::Role::User, "{input}"},
 *     {stencil::Role::Assistant, "{output}"},
 * });
 * stencil::chat::FewShotChatTemplate few_shot(*examples, *prompt);
 * auto text = few_shot.format_examples();
 * @endcode
 *
 * @threadsafety Formatting is const and safe to call concurrently.
 */
class FewShotChatTemplate {
public:
    FewShotChatTemplate(FewShotTemplate examples, ChatTemplate example_prompt);

    const FewShotTemplate& examples() const { return examples_; }
    const ChatTemplate& example_prompt() const { return example_prompt_; }

    /**
     * @brief Variable to role name map taken from the example prompt
     *
     * Placeholders and role templates without variables contribute nothing.
     * When two templates share a first variable, the later role wins.
     */
    Context role_bindings() const;

    /** @brief Variables of the examples, unique, in order. */
    std::vector<std::string> input_variables() const { return examples_.input_variables(); }

    /**
     * @brief Render the examples with role bindings under the context
     *
     * @param context JSON object (or null); overrides bindings key by key
     * @return Expected<std::string> Joined text, or the first render error
     *         with context naming the part
     */
    Expected<std::string> format(const Context& context, const RenderOptions& options = RenderOptions{}) const;

    /** @brief Render the examples with the role bindings alone. */
    Expected<std::string> format_examples(const RenderOptions& options = RenderOptions{}) const;

private:
    FewShotTemplate examples_;
    ChatTemplate example_prompt_;
};

} // namespace chat
} // namespace stencil
