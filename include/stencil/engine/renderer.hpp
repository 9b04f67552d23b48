#pragma once

#include "../template.hpp"
#include "../types.hpp"
#include <string>
#include <vector>

namespace stencil {

/**
 * @brief Rendered text plus diagnostics from a lenient render
 */
struct RenderResult {
    std::string text;
    std::vector<std::string> missing_variables;  ///< Names substituted with "" under the lenient policy, in render order

    bool operator==(const RenderResult& other) const {
        return text == other.text && missing_variables == other.missing_variables;
    }

    bool operator!=(const RenderResult& other) const {
        return !(*this == other);
    }
};

namespace engine {

/**
 * @brief Walks a Template's nodes against a Context
 *
 * One Renderer serves one render call. It holds the scope stack for
 * Mustache sections and the output buffer; the template and context are
 * only read.
 *
 * Name resolution:
 * - The first segment of a name is looked up on the scope stack, innermost
 *   map first; the remaining segments descend through maps from there
 * - "." is the innermost scope value
 *
 * Sections are entered through an explicit work stack rather than
 * recursion, so nesting depth is bounded only by memory. Rendering stops at
 * the first error.
 */
class Renderer {
public:
    Renderer(const Template& tmpl, const RenderOptions& options)
        : template_(tmpl)
        , options_(options)
    {}

    /**
     * @brief Render against a context
     *
     * @param context JSON object, or null for an empty context
     * @return Expected<RenderResult> Output or the first error encountered
     */
    Expected<RenderResult> run(const Context& context);

private:
    const Template& template_;
    const RenderOptions& options_;
    std::vector<const Value*> scopes_;
    std::vector<const Value*> map_scopes_;  ///< The subset of scopes_ that are maps
    RenderResult result_;

    // A node list being walked, with the section iteration that owns it
    struct Frame;

    Expected<void> render_tree();
    Expected<void> render_placeholder(const PlaceholderNode& node, std::size_t offset);
    Expected<void> render_variable(const VariableNode& node, std::size_t offset);

    // Pushes the body frame when the section renders at all
    void enter_section(const SectionNode& node, std::vector<Frame>& frames);

    void push_scope(const Value* scope);
    void pop_scope();

    // nullptr when the name cannot be resolved
    const Value* lookup(const std::string& name) const;

    // Handles a missing name per policy; appends nothing on success
    Expected<void> missing(const std::string& name, std::size_t offset);

    Error positioned(ErrorCode code, std::string message, std::size_t offset, std::string name) const;
    void emit(const std::string& text, bool escape);
};

/**
 * @brief HTML-escape text
 *
 * Replaces & < > " ' with their entity references.
 */
std::string html_escape(std::string_view text);

/**
 * @brief Render a template into a string
 *
 * @code
 * auto tmpl = stencil::parse("Hello, {name}!");
 * auto text = stencil::render(*tmpl, {{"name", "World"}});
 * // *text == "Hello, World!"
 * @endcode
 */
Expected<std::string> render(const Template& tmpl, const Context& context,
                             const RenderOptions& options = RenderOptions{});

/**
 * @brief Render a template and report which variables were missing
 *
 * Under the strict policy missing_variables is always empty.
 */
Expected<RenderResult> render_detailed(const Template& tmpl, const Context& context,
                                       const RenderOptions& options = RenderOptions{});

} // namespace engine

using engine::render;
using engine::render_detailed;

} // namespace stencil
