#pragma once

#include "chat/chat_template.hpp"
#include "chat/few_shot_chat_template.hpp"
#include "chat/few_shot_template.hpp"
#include "types.hpp"
#include <string>
#include <string_view>

namespace stencil {

/**
 * @brief Serialize render options
 *
 * {"missing_variable_policy": "strict" | "lenient", "escape_output": bool}
 */
void to_json(Value& j, const RenderOptions& options);

namespace config {

/**
 * @brief Parse JSON text
 *
 * @return Expected<Value> Document, or InvalidConfig with the parser's message
 */
Expected<Value> parse_json(std::string_view text);

/**
 * @brief Read and parse a JSON file
 *
 * @return Expected<Value> Document, or InvalidConfig with the path as context
 */
Expected<Value> read_json_file(const std::string& path);

/**
 * @brief Load render options from a JSON object
 *
 * Both keys are optional and default to RenderOptions{}. Unknown policies and
 * mistyped values are InvalidConfig.
 */
Expected<RenderOptions> load_render_options(const Value& j);

/**
 * @brief Load a chat template
 *
 * Document shape:
 * @code
 * {"messages": [
 *     {"role": "system", "template": "You are {persona}."},
 *     {"placeholder": "history", "optional": true, "n_messages": 20},
 *     {"role": "human", "template": "{question}"}
 * ]}
 * @endcode
 *
 * @return The template, or every structural and parse error found, each with
 *         context "messages[i]"
 */
tl::expected<chat::ChatTemplate, ErrorSet> load_chat_template(const Value& j);

/**
 * @brief Load a few-shot template
 *
 * Document shape:
 * @code
 * {"prefix": "...", "examples": ["...", "..."], "suffix": "...", "example_separator": "\n\n"}
 * @endcode
 * Every key is optional. A "messages" list is read by
 * load_few_shot_chat_template() and ignored here.
 */
tl::expected<chat::FewShotTemplate, ErrorSet> load_few_shot_template(const Value& j);

/**
 * @brief Load few-shot examples together with their example chat prompt
 *
 * The few-shot document plus a required "messages" list, whose entries take
 * the same shape as in load_chat_template():
 * @code
 * {"prefix": "### Examples:",
 *  "examples": ["{input}: What is 2 + 2?\n{output}: 4"],
 *  "messages": [{"role": "human", "template": "{input}"}, {"role": "ai", "template": "{output}"}]}
 * @endcode
 *
 * @return The template, or the errors of both parts together
 */
tl::expected<chat::FewShotChatTemplate, ErrorSet> load_few_shot_chat_template(const Value& j);

} // namespace config
} // namespace stencil
