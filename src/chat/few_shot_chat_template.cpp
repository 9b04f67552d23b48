#include "stencil/chat/few_shot_chat_template.hpp"

#include <utility>
#include <variant>

namespace stencil {
namespace chat {

FewShotChatTemplate::FewShotChatTemplate(FewShotTemplate examples, ChatTemplate example_prompt)
    : examples_(std::move(examples))
    , example_prompt_(std::move(example_prompt))
{}

Context FewShotChatTemplate::role_bindings() const {
    Context bindings = Context::object();
    for (const auto& entry : example_prompt_.entries()) {
        auto* role_template = std::get_if<RoleTemplate>(&entry);
        if (role_template == nullptr) continue;

        auto names = role_template->prompt.input_variables();
        if (!names.empty()) {
            bindings[names.front()] = role_to_string(role_template->role);
        }
    }
    return bindings;
}

Expected<std::string> FewShotChatTemplate::format(const Context& context, const RenderOptions& options) const {
    if (!context.is_null() && !context.is_object()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidContext,
            std::string("render context must be a map, got ") + context.type_name()
        });
    }

    Context merged = role_bindings();
    if (context.is_object()) {
        for (const auto& item : context.items()) {
            merged[item.key()] = item.value();
        }
    }
    return examples_.format(merged, options);
}

Expected<std::string> FewShotChatTemplate::format_examples(const RenderOptions& options) const {
    return examples_.format(role_bindings(), options);
}

} // namespace chat
} // namespace stencil
