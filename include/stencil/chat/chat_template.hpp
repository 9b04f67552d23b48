#pragma once

#include "../prompt_template.hpp"
#include "../types.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace stencil {
namespace chat {

/**
 * @brief Slot in a chat template filled with messages from the context
 *
 * At format time the named context value must be a list of
 * `{"role": ..., "content": ...}` objects (an optional "tool_call_id" string
 * is carried over). Only the first n_messages entries are used.
 */
struct MessagesPlaceholder {
    static constexpr std::size_t kDefaultLimit = 100;

    std::string variable_name;
    bool optional = false;                 ///< Missing variable yields no messages instead of an error
    std::size_t n_messages = kDefaultLimit;

    explicit MessagesPlaceholder(std::string variable_name, bool optional = false,
                                 std::size_t n_messages = kDefaultLimit)
        : variable_name(std::move(variable_name))
        , optional(optional)
        , n_messages(n_messages == 0 ? kDefaultLimit : n_messages)
    {}

    /**
     * @brief Expand the placeholder against a context
     *
     * @param context JSON object (or null)
     * @param options Lenient policy treats a missing variable like an optional one
     * @return Expected<std::vector<Message>> Messages or MissingVariable/TypeCoercion
     */
    Expected<std::vector<Message>> format_messages(const Context& context,
                                                   const RenderOptions& options = RenderOptions{}) const;

    bool operator==(const MessagesPlaceholder& other) const {
        return variable_name == other.variable_name &&
               optional == other.optional &&
               n_messages == other.n_messages;
    }

    bool operator!=(const MessagesPlaceholder& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Template for one message of a fixed role
 */
struct RoleTemplate {
    Role role;
    PromptTemplate prompt;

    bool operator==(const RoleTemplate& other) const {
        return role == other.role && prompt == other.prompt;
    }

    bool operator!=(const RoleTemplate& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Ordered sequence of role templates and message placeholders
 *
 * Formatting produces one Message per role template and the expanded
 * messages of each placeholder, in entry order.
 *
 * @code
 * auto chat = stencil::chat::ChatTemplate::from_messages({
 *     {stencil::Role::System, "You are {persona}."},
 *     {stencil::Role::User, "{question}"},
 * });
 * auto messages = chat->format_messages({{"persona", "terse"}, {"question", "Why?"}});
 * @endcode
 *
 * @threadsafety Formatting is const and safe to call concurrently.
 */
class ChatTemplate {
public:
    using Entry = std::variant<RoleTemplate, MessagesPlaceholder>;

    ChatTemplate() = default;

    /**
     * @brief Parse one template per (role, source) pair
     *
     * Every source is parsed; errors from all entries are returned together,
     * each with context "message[i]".
     */
    static tl::expected<ChatTemplate, ErrorSet> from_messages(
        const std::vector<std::pair<Role, std::string>>& messages);

    ChatTemplate& add_message(Role role, PromptTemplate prompt);
    ChatTemplate& add_placeholder(MessagesPlaceholder placeholder);

    /** @brief Concatenate entries of two templates. */
    ChatTemplate operator+(const ChatTemplate& other) const;

    const std::vector<Entry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief Template variables and placeholder names
     *
     * Unique, in order of first occurrence across entries.
     */
    std::vector<std::string> input_variables() const;

    /**
     * @brief Render every entry into messages
     *
     * Fails on the first error; the error's context names the entry
     * ("message[i]").
     */
    Expected<std::vector<Message>> format_messages(const Context& context,
                                                   const RenderOptions& options = RenderOptions{}) const;

    /** @brief format_messages() with contents joined by newlines. */
    Expected<std::string> format(const Context& context, const RenderOptions& options = RenderOptions{}) const;

    bool operator==(const ChatTemplate& other) const {
        return entries_ == other.entries_;
    }

    bool operator!=(const ChatTemplate& other) const {
        return !(*this == other);
    }

private:
    std::vector<Entry> entries_;
};

} // namespace chat
} // namespace stencil
