#pragma once

#include "../engine/renderer.hpp"
#include "../prompt_template.hpp"
#include "../types.hpp"
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace stencil {
namespace chat {

/**
 * @brief Model-specific chat wire format
 */
enum class ChatFormat {
    Llama3,  ///< Llama 3 header/eot tokens
    ChatML,  ///< <|im_start|> / <|im_end|> blocks
    Custom   ///< Per-message template rendered by this engine
};

[[nodiscard]] inline const char* chat_format_to_string(ChatFormat format) {
    switch (format) {
        case ChatFormat::Llama3: return "llama3";
        case ChatFormat::ChatML: return "chatml";
        case ChatFormat::Custom: return "custom";
    }
    return "unknown";
}

/**
 * @brief Renders a message list into a model-specific prompt
 *
 * Supports:
 * - Llama3: <|begin_of_text|><|start_header_id|>role<|end_header_id|>\n\ncontent<|eot_id|>
 * - ChatML: <|im_start|>role\ncontent<|im_end|>\n
 * - Custom: a template rendered once per message with context
 *   {"role": ..., "content": ...}; either placeholder style works
 *   ("{role}: {content}\n" or "{{role}}: {{content}}\n")
 *
 * Llama3 and ChatML append an open assistant header when the last message is
 * not from the assistant, so the model continues as the assistant.
 */
class ChatFormatter {
public:
    /**
     * @brief Construct a formatter
     *
     * @param format Wire format
     * @param custom_template Per-message template, required for ChatFormat::Custom
     * @return Expected<ChatFormatter> Formatter, or InvalidTemplate when the
     *         custom template is absent or does not parse
     */
    static Expected<ChatFormatter> create(ChatFormat format,
                                          const std::optional<std::string>& custom_template = std::nullopt) {
        if (format != ChatFormat::Custom) {
            return ChatFormatter(format, std::nullopt);
        }
        if (!custom_template.has_value()) {
            return tl::unexpected(Error{ErrorCode::InvalidTemplate, "Custom template not provided"});
        }

        auto prompt = PromptTemplate::from_template(*custom_template);
        if (!prompt) {
            const auto& first = prompt.error().front();
            return tl::unexpected(Error{
                ErrorCode::InvalidTemplate,
                "Custom template does not parse: " + first.to_string(),
                std::to_string(prompt.error().size()) + " error(s)"
            });
        }
        return ChatFormatter(format, std::move(*prompt));
    }

    /**
     * @brief Render messages into a prompt
     *
     * @param messages Messages to render
     * @return Expected<std::string> Formatted prompt or error
     */
    Expected<std::string> render(const std::vector<Message>& messages) const {
        if (messages.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidTemplate, "Cannot render empty message list"});
        }

        switch (format_) {
            case ChatFormat::Llama3:
                return render_llama3(messages);
            case ChatFormat::ChatML:
                return render_chatml(messages);
            case ChatFormat::Custom:
                return render_custom(messages);
        }
        return tl::unexpected(Error{ErrorCode::Unknown, "Unknown chat format"});
    }

    ChatFormat get_format() const {
        return format_;
    }

private:
    ChatFormat format_;
    std::optional<PromptTemplate> custom_;

    ChatFormatter(ChatFormat format, std::optional<PromptTemplate> custom)
        : format_(format)
        , custom_(std::move(custom))
    {}

    // Llama3 format implementation
    std::string render_llama3(const std::vector<Message>& messages) const {
        std::ostringstream out;
        out << "<|begin_of_text|>";

        for (const auto& msg : messages) {
            out << "<|start_header_id|>" << role_to_string(msg.role) << "<|end_header_id|>\n\n"
                << msg.content << "<|eot_id|>";
        }

        // Open an assistant turn for the response
        if (messages.back().role != Role::Assistant) {
            out << "<|start_header_id|>assistant<|end_header_id|>\n\n";
        }

        return out.str();
    }

    // ChatML format implementation
    std::string render_chatml(const std::vector<Message>& messages) const {
        std::ostringstream out;

        for (const auto& msg : messages) {
            out << "<|im_start|>" << role_to_string(msg.role) << "\n"
                << msg.content << "<|im_end|>\n";
        }

        if (messages.back().role != Role::Assistant) {
            out << "<|im_start|>assistant\n";
        }

        return out.str();
    }

    Expected<std::string> render_custom(const std::vector<Message>& messages) const {
        std::ostringstream out;

        for (std::size_t i = 0; i < messages.size(); ++i) {
            Context context{
                {"role", role_to_string(messages[i].role)},
                {"content", messages[i].content}
            };
            auto text = custom_->format(context);
            if (!text) {
                auto err = text.error();
                err.context = "message[" + std::to_string(i) + "]";
                return tl::unexpected(std::move(err));
            }
            out << *text;
        }

        return out.str();
    }
};

} // namespace chat
} // namespace stencil
