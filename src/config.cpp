#include "stencil/config.hpp"
#include "stencil/log.hpp"

#include <fstream>
#include <sstream>

namespace stencil {

void to_json(Value& j, const RenderOptions& options) {
    j = Value{
        {"missing_variable_policy", policy_to_string(options.missing_variable_policy)},
        {"escape_output", options.escape_output}
    };
}

namespace config {

namespace {

Error invalid(std::string message, std::string context) {
    return Error{ErrorCode::InvalidConfig, std::move(message), std::move(context)};
}

// Reads an optional string member; false (after recording an error) when mistyped
bool optional_string(const Value& j, const char* key, std::optional<std::string>& out,
                     const std::string& context, ErrorSet& errors) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) {
        errors.push_back(invalid(std::string("'") + key + "' must be a string", context));
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// Role templates and placeholders of a "messages" list; problems go to errors
chat::ChatTemplate load_messages(const Value& messages, ErrorSet& errors) {
    chat::ChatTemplate result;
    for (std::size_t i = 0; i < messages.size(); ++i) {
        const auto& entry = messages[i];
        auto context = "messages[" + std::to_string(i) + "]";

        if (!entry.is_object()) {
            errors.push_back(invalid("Message entry must be an object", context));
            continue;
        }

        if (auto placeholder = entry.find("placeholder"); placeholder != entry.end()) {
            if (!placeholder->is_string() || placeholder->get<std::string>().empty()) {
                errors.push_back(invalid("'placeholder' must be a non-empty string", context));
                continue;
            }
            bool optional = false;
            std::size_t n_messages = chat::MessagesPlaceholder::kDefaultLimit;
            if (auto it = entry.find("optional"); it != entry.end()) {
                if (!it->is_boolean()) {
                    errors.push_back(invalid("'optional' must be a boolean", context));
                    continue;
                }
                optional = it->get<bool>();
            }
            if (auto it = entry.find("n_messages"); it != entry.end()) {
                if (!it->is_number_unsigned()) {
                    errors.push_back(invalid("'n_messages' must be a non-negative integer", context));
                    continue;
                }
                n_messages = it->get<std::size_t>();
            }
            result.add_placeholder(chat::MessagesPlaceholder(placeholder->get<std::string>(), optional, n_messages));
            continue;
        }

        auto role_it = entry.find("role");
        auto template_it = entry.find("template");
        if (role_it == entry.end() || !role_it->is_string()) {
            errors.push_back(invalid("Message entry needs a string 'role' or a 'placeholder'", context));
            continue;
        }
        if (template_it == entry.end() || !template_it->is_string()) {
            errors.push_back(invalid("Message entry needs a string 'template'", context));
            continue;
        }

        auto role = role_from_string(role_it->get<std::string>());
        if (!role) {
            auto err = role.error();
            err.context = context;
            errors.push_back(std::move(err));
            continue;
        }

        auto prompt = PromptTemplate::from_template(template_it->get<std::string>());
        if (!prompt) {
            for (auto& err : prompt.error()) {
                err.context = context;
                errors.push_back(std::move(err));
            }
            continue;
        }
        result.add_message(*role, std::move(*prompt));
    }
    return result;
}

} // namespace

Expected<Value> parse_json(std::string_view text) {
    try {
        return Value::parse(text.begin(), text.end());
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, std::string("JSON parse error: ") + e.what()});
    }
}

Expected<Value> read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return tl::unexpected(invalid("Cannot open configuration file", path));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto document = parse_json(buffer.str());
    if (!document) {
        auto err = document.error();
        err.context = path;
        return tl::unexpected(std::move(err));
    }
    log::logger()->debug("Loaded configuration from {}", path);
    return document;
}

Expected<RenderOptions> load_render_options(const Value& j) {
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Render options must be a JSON object"});
    }

    RenderOptions options;

    if (auto it = j.find("missing_variable_policy"); it != j.end()) {
        if (!it->is_string()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "'missing_variable_policy' must be a string"});
        }
        auto policy = it->get<std::string>();
        if (policy == "strict") {
            options.missing_variable_policy = MissingVariablePolicy::Strict;
        } else if (policy == "lenient") {
            options.missing_variable_policy = MissingVariablePolicy::Lenient;
        } else {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown missing variable policy: " + policy});
        }
    }

    if (auto it = j.find("escape_output"); it != j.end()) {
        if (!it->is_boolean()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "'escape_output' must be a boolean"});
        }
        options.escape_output = it->get<bool>();
    }

    if (auto valid = options.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return options;
}

tl::expected<chat::ChatTemplate, ErrorSet> load_chat_template(const Value& j) {
    auto messages_it = j.is_object() ? j.find("messages") : j.end();
    if (!j.is_object() || messages_it == j.end() || !messages_it->is_array()) {
        return tl::unexpected(ErrorSet{
            Error{ErrorCode::InvalidConfig, "Chat template must be an object with a 'messages' list"}
        });
    }

    ErrorSet errors;
    auto result = load_messages(*messages_it, errors);
    if (!errors.empty()) {
        log::logger()->debug("Chat template configuration rejected with {} error(s)", errors.size());
        return tl::unexpected(std::move(errors));
    }
    return result;
}

tl::expected<chat::FewShotTemplate, ErrorSet> load_few_shot_template(const Value& j) {
    if (!j.is_object()) {
        return tl::unexpected(ErrorSet{Error{ErrorCode::InvalidConfig, "Few-shot template must be a JSON object"}});
    }

    ErrorSet errors;
    auto builder = chat::FewShotTemplate::builder();

    std::optional<std::string> prefix;
    std::optional<std::string> suffix;
    std::optional<std::string> separator;
    if (optional_string(j, "prefix", prefix, "prefix", errors) && prefix) builder.prefix(*prefix);
    if (optional_string(j, "suffix", suffix, "suffix", errors) && suffix) builder.suffix(*suffix);
    if (optional_string(j, "example_separator", separator, "example_separator", errors) && separator) {
        builder.example_separator(*separator);
    }

    if (auto it = j.find("examples"); it != j.end()) {
        if (!it->is_array()) {
            errors.push_back(invalid("'examples' must be a list of strings", "examples"));
        } else {
            for (std::size_t i = 0; i < it->size(); ++i) {
                const auto& example = (*it)[i];
                if (!example.is_string()) {
                    errors.push_back(invalid("Example must be a string", "examples[" + std::to_string(i) + "]"));
                    continue;
                }
                builder.add_example(example.get<std::string>());
            }
        }
    }

    auto built = builder.build();
    if (!built) {
        for (auto& err : built.error()) errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        return tl::unexpected(std::move(errors));
    }
    return std::move(*built);
}

tl::expected<chat::FewShotChatTemplate, ErrorSet> load_few_shot_chat_template(const Value& j) {
    auto few_shot = load_few_shot_template(j);
    if (!j.is_object()) {
        return tl::unexpected(std::move(few_shot.error()));
    }

    ErrorSet errors;
    if (!few_shot) {
        errors = std::move(few_shot.error());
    }

    chat::ChatTemplate example_prompt;
    auto messages_it = j.find("messages");
    if (messages_it == j.end() || !messages_it->is_array()) {
        errors.push_back(invalid("Few-shot chat template needs a 'messages' list", "messages"));
    } else {
        example_prompt = load_messages(*messages_it, errors);
    }

    if (!errors.empty()) {
        log::logger()->debug("Few-shot chat template configuration rejected with {} error(s)", errors.size());
        return tl::unexpected(std::move(errors));
    }
    return chat::FewShotChatTemplate(std::move(*few_shot), std::move(example_prompt));
}

} // namespace config
} // namespace stencil
