#include "stencil/chat/chat_template.hpp"
#include "stencil/log.hpp"

#include <algorithm>

namespace stencil {
namespace chat {

namespace {

std::string entry_label(std::size_t index) {
    return "message[" + std::to_string(index) + "]";
}

Error malformed_entry(const std::string& variable, std::size_t index, const std::string& reason) {
    Error err{ErrorCode::TypeCoercion,
              "'" + variable + "' entry " + std::to_string(index) + " " + reason};
    err.name = variable;
    return err;
}

} // namespace

// ============================================================================
// MessagesPlaceholder
// ============================================================================

Expected<std::vector<Message>> MessagesPlaceholder::format_messages(const Context& context,
                                                                    const RenderOptions& options) const {
    std::vector<Message> messages;

    const Value* value = nullptr;
    if (context.is_object()) {
        auto it = context.find(variable_name);
        if (it != context.end()) value = &*it;
    }

    if (value == nullptr) {
        if (optional || options.missing_variable_policy == MissingVariablePolicy::Lenient) {
            return messages;
        }
        Error err{ErrorCode::MissingVariable, "messages variable '" + variable_name + "' is not in the context"};
        err.name = variable_name;
        return tl::unexpected(std::move(err));
    }

    if (!value->is_array()) {
        Error err{ErrorCode::TypeCoercion,
                  "messages variable '" + variable_name + "' must be a list, got " + value->type_name()};
        err.name = variable_name;
        return tl::unexpected(std::move(err));
    }

    auto count = std::min(n_messages, value->size());
    messages.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& entry = (*value)[i];
        if (!entry.is_object()) {
            return tl::unexpected(malformed_entry(variable_name, i, "is not a map"));
        }

        auto role_it = entry.find("role");
        auto content_it = entry.find("content");
        if (role_it == entry.end() || !role_it->is_string()) {
            return tl::unexpected(malformed_entry(variable_name, i, "has no string 'role'"));
        }
        if (content_it == entry.end() || !content_it->is_string()) {
            return tl::unexpected(malformed_entry(variable_name, i, "has no string 'content'"));
        }

        auto role = role_from_string(role_it->get<std::string>());
        if (!role) {
            return tl::unexpected(malformed_entry(variable_name, i, "has " + role.error().message));
        }

        Message message{*role, content_it->get<std::string>(), std::nullopt};
        auto id_it = entry.find("tool_call_id");
        if (id_it != entry.end() && id_it->is_string()) {
            message.tool_call_id = id_it->get<std::string>();
        }
        messages.push_back(std::move(message));
    }

    return messages;
}

// ============================================================================
// ChatTemplate
// ============================================================================

tl::expected<ChatTemplate, ErrorSet> ChatTemplate::from_messages(
    const std::vector<std::pair<Role, std::string>>& messages) {
    ChatTemplate chat;
    ErrorSet errors;

    for (std::size_t i = 0; i < messages.size(); ++i) {
        auto prompt = PromptTemplate::from_template(messages[i].second);
        if (!prompt) {
            for (auto& err : prompt.error()) {
                err.context = entry_label(i);
                errors.push_back(std::move(err));
            }
            continue;
        }
        chat.add_message(messages[i].first, std::move(*prompt));
    }

    if (!errors.empty()) {
        log::logger()->debug("Chat template rejected: {} error(s) across {} message(s)", errors.size(),
                             messages.size());
        return tl::unexpected(std::move(errors));
    }
    return chat;
}

ChatTemplate& ChatTemplate::add_message(Role role, PromptTemplate prompt) {
    entries_.emplace_back(RoleTemplate{role, std::move(prompt)});
    return *this;
}

ChatTemplate& ChatTemplate::add_placeholder(MessagesPlaceholder placeholder) {
    entries_.emplace_back(std::move(placeholder));
    return *this;
}

ChatTemplate ChatTemplate::operator+(const ChatTemplate& other) const {
    ChatTemplate combined = *this;
    combined.entries_.insert(combined.entries_.end(), other.entries_.begin(), other.entries_.end());
    return combined;
}

std::vector<std::string> ChatTemplate::input_variables() const {
    std::vector<std::string> names;
    auto add = [&names](const std::string& name) {
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    };

    for (const auto& entry : entries_) {
        if (auto* role_template = std::get_if<RoleTemplate>(&entry)) {
            for (const auto& name : role_template->prompt.input_variables()) add(name);
        } else {
            add(std::get<MessagesPlaceholder>(entry).variable_name);
        }
    }
    return names;
}

Expected<std::vector<Message>> ChatTemplate::format_messages(const Context& context,
                                                             const RenderOptions& options) const {
    std::vector<Message> messages;

    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (auto* role_template = std::get_if<RoleTemplate>(&entries_[i])) {
            auto content = role_template->prompt.format(context, options);
            if (!content) {
                auto err = content.error();
                err.context = entry_label(i);
                return tl::unexpected(std::move(err));
            }
            messages.push_back(Message{role_template->role, std::move(*content), std::nullopt});
            continue;
        }

        auto expanded = std::get<MessagesPlaceholder>(entries_[i]).format_messages(context, options);
        if (!expanded) {
            auto err = expanded.error();
            err.context = entry_label(i);
            return tl::unexpected(std::move(err));
        }
        for (auto& message : *expanded) {
            messages.push_back(std::move(message));
        }
    }

    return messages;
}

Expected<std::string> ChatTemplate::format(const Context& context, const RenderOptions& options) const {
    auto messages = format_messages(context, options);
    if (!messages) {
        return tl::unexpected(messages.error());
    }

    std::string out;
    for (std::size_t i = 0; i < messages->size(); ++i) {
        if (i > 0) out += "\n";
        out += (*messages)[i].content;
    }
    return out;
}

} // namespace chat
} // namespace stencil
