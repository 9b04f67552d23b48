#pragma once

#include "error.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil {

// ============================================================================
// Context Values
// ============================================================================

/**
 * @brief Runtime value bound to a template variable
 *
 * JSON value model: string, number, bool, null, ordered list, ordered-key map.
 * Contexts built from LLM API payloads map onto it without conversion.
 */
using Value = nlohmann::ordered_json;

/// Mapping from variable name to Value; must be a JSON object (or null for empty).
using Context = nlohmann::ordered_json;

// ============================================================================
// Template Style
// ============================================================================

/**
 * @brief Placeholder syntax of a template, decided once at parse time
 */
enum class Style {
    FmtString,  ///< Inline single-brace placeholders: {name}, {name:>8}
    Mustache,   ///< Double-brace tags and sections: {{name}}, {{#items}}...{{/items}}
    Literal     ///< No placeholders; renders to itself
};

[[nodiscard]] inline const char* style_to_string(Style style) {
    switch (style) {
        case Style::FmtString: return "FmtString";
        case Style::Mustache: return "Mustache";
        case Style::Literal: return "Literal";
    }
    return "unknown";
}

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Message role in conversation flow
 */
enum class Role {
    System,     ///< System instructions that guide model behavior
    User,       ///< Input from the end user
    Assistant,  ///< Model-generated response
    Tool        ///< Result from tool execution
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/**
 * @brief Parse a role name
 *
 * Accepts the canonical names plus the "human" and "ai" aliases used by
 * LangChain-style prompt files.
 */
inline Expected<Role> role_from_string(std::string_view name) {
    if (name == "system") return Role::System;
    if (name == "user" || name == "human") return Role::User;
    if (name == "assistant" || name == "ai") return Role::Assistant;
    if (name == "tool") return Role::Tool;
    return tl::unexpected(Error{ErrorCode::InvalidRole, "Unknown role: " + std::string(name)});
}

/**
 * @brief Single rendered chat message
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role;                                 ///< Message role (system/user/assistant/tool)
    std::string content;                       ///< Text content of the message
    std::optional<std::string> tool_call_id;   ///< Tool correlation ID (tool responses only)

    // Factory methods
    static Message system(std::string content) {
        return Message{Role::System, std::move(content), std::nullopt};
    }

    static Message user(std::string content) {
        return Message{Role::User, std::move(content), std::nullopt};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content), std::nullopt};
    }

    static Message tool(std::string content, std::string tool_call_id) {
        return Message{Role::Tool, std::move(content), std::move(tool_call_id)};
    }

    // Equality for testing
    bool operator==(const Message& other) const {
        return role == other.role &&
               content == other.content &&
               tool_call_id == other.tool_call_id;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Render Options
// ============================================================================

/**
 * @brief What the renderer does when a variable is absent from the context
 */
enum class MissingVariablePolicy {
    Strict,   ///< Fail with ErrorCode::MissingVariable
    Lenient   ///< Substitute an empty string and record the miss
};

[[nodiscard]] inline const char* policy_to_string(MissingVariablePolicy policy) {
    switch (policy) {
        case MissingVariablePolicy::Strict: return "strict";
        case MissingVariablePolicy::Lenient: return "lenient";
    }
    return "unknown";
}

/**
 * @brief Per-render configuration
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct RenderOptions {
    MissingVariablePolicy missing_variable_policy = MissingVariablePolicy::Strict;  ///< Missing-variable handling
    bool escape_output = false;  ///< HTML-escape substituted values (unescaped Mustache tags bypass)

    static RenderOptions strict() {
        return RenderOptions{};
    }

    static RenderOptions lenient() {
        RenderOptions options;
        options.missing_variable_policy = MissingVariablePolicy::Lenient;
        return options;
    }

    // Validation
    Expected<void> validate() const {
        if (missing_variable_policy != MissingVariablePolicy::Strict &&
            missing_variable_policy != MissingVariablePolicy::Lenient) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown missing variable policy"});
        }
        return {};
    }

    // Equality for testing
    bool operator==(const RenderOptions& other) const {
        return missing_variable_policy == other.missing_variable_policy &&
               escape_output == other.escape_output;
    }

    bool operator!=(const RenderOptions& other) const {
        return !(*this == other);
    }
};

} // namespace stencil
