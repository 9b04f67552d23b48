#pragma once

#include "../prompt_template.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stencil {
namespace chat {

/**
 * @brief Prefix, worked examples and suffix rendered as one prompt
 *
 * Every part is a PromptTemplate rendered against the same context. Parts
 * that render to an empty string are skipped; the rest are joined with
 * example_separator.
 *
 * @code
 * auto few_shot = stencil::chat::FewShotTemplate::builder()
 *     .prefix("Translate to French.")
 *     .add_example("cat -> chat")
 *     .add_example("dog -> chien")
 *     .suffix("{word} ->")
 *     .build();
 * @endcode
 */
class FewShotTemplate {
public:
    static constexpr const char* kDefaultExampleSeparator = "\n\n";

    class Builder;

    /** @brief Start building; parse errors are collected and reported by build(). */
    static Builder builder();

    const std::optional<PromptTemplate>& prefix() const { return prefix_; }
    const std::optional<PromptTemplate>& suffix() const { return suffix_; }
    const std::vector<PromptTemplate>& examples() const { return examples_; }
    const std::string& example_separator() const { return example_separator_; }

    /** @brief Variables of prefix, examples and suffix, unique, in order. */
    std::vector<std::string> input_variables() const;

    /**
     * @brief Render prefix, examples and suffix
     *
     * @return Expected<std::string> Joined text, or the first render error
     *         with context naming the part ("prefix", "example[i]", "suffix")
     */
    Expected<std::string> format(const Context& context = Context(),
                                 const RenderOptions& options = RenderOptions{}) const;

private:
    std::optional<PromptTemplate> prefix_;
    std::optional<PromptTemplate> suffix_;
    std::vector<PromptTemplate> examples_;
    std::string example_separator_ = kDefaultExampleSeparator;
};

/**
 * @brief Fluent builder for FewShotTemplate
 *
 * Setters taking source text parse it immediately; failures are held until
 * build() so a chain never needs intermediate checks.
 */
class FewShotTemplate::Builder {
public:
    Builder& prefix(std::string_view source);
    Builder& prefix(PromptTemplate prompt);
    Builder& suffix(std::string_view source);
    Builder& suffix(PromptTemplate prompt);
    Builder& add_example(std::string_view source);
    Builder& add_example(PromptTemplate prompt);
    Builder& example_separator(std::string separator);

    /**
     * @brief Finish building
     *
     * @return The template, or every parse error collected by the setters,
     *         each with context naming its part
     */
    tl::expected<FewShotTemplate, ErrorSet> build();

private:
    FewShotTemplate result_;
    ErrorSet errors_;
    std::size_t example_count_ = 0;  ///< Examples added, including rejected ones

    std::optional<PromptTemplate> parse_part(std::string_view source, const std::string& label);
};

} // namespace chat
} // namespace stencil
