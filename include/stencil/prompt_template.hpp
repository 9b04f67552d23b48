#pragma once

#include "engine/renderer.hpp"
#include "template.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace stencil {

/**
 * @brief Parsed template with pre-bound ("partial") variables
 *
 * Partials are merged under the runtime context at format time, so a
 * runtime value always wins over a partial of the same name. The parsed
 * Template is shared, so copies are cheap and may be formatted concurrently.
 *
 * @code
 * auto prompt = stencil::PromptTemplate::from_template("Hello, {name}. You are {mood}.");
 * prompt->partial("name", "Alice");
 * auto text = prompt->format({{"mood", "calm"}});
 * @endcode
 */
class PromptTemplate {
public:
    explicit PromptTemplate(Template tmpl)
        : template_(std::make_shared<const Template>(std::move(tmpl)))
        , partials_(Context::object())
    {}

    /**
     * @brief Parse source into a prompt template
     *
     * @return The template, or every parse error in the source
     */
    static tl::expected<PromptTemplate, ErrorSet> from_template(std::string_view source) {
        auto parsed = parse(source);
        if (!parsed) {
            return tl::unexpected(std::move(parsed.error()));
        }
        return PromptTemplate(std::move(*parsed));
    }

    /**
     * @brief Pre-bind a variable
     *
     * @return PromptTemplate& This template, for chaining
     */
    PromptTemplate& partial(const std::string& name, Value value) {
        partials_[name] = std::move(value);
        return *this;
    }

    PromptTemplate& clear_partials() {
        partials_ = Context::object();
        return *this;
    }

    const Context& partial_variables() const { return partials_; }

    /** @brief Names the template references, in order of first occurrence. */
    std::vector<std::string> input_variables() const { return template_->variables(); }

    const Template& get_template() const { return *template_; }

    /**
     * @brief Render with partials merged under the runtime context
     *
     * @param context JSON object (or null); overrides partials key by key
     * @param options Render options
     * @return Expected<std::string> Rendered text or error
     */
    Expected<std::string> format(const Context& context = Context(), const RenderOptions& options = RenderOptions{}) const {
        auto merged = merge(context);
        if (!merged) {
            return tl::unexpected(merged.error());
        }
        return render(*template_, *merged, options);
    }

    /**
     * @brief Like format(), also reporting variables missing under the lenient policy
     */
    Expected<RenderResult> format_detailed(const Context& context = Context(),
                                           const RenderOptions& options = RenderOptions{}) const {
        auto merged = merge(context);
        if (!merged) {
            return tl::unexpected(merged.error());
        }
        return render_detailed(*template_, *merged, options);
    }

    bool operator==(const PromptTemplate& other) const {
        return *template_ == *other.template_ && partials_ == other.partials_;
    }

    bool operator!=(const PromptTemplate& other) const {
        return !(*this == other);
    }

private:
    std::shared_ptr<const Template> template_;
    Context partials_;

    Expected<Context> merge(const Context& context) const {
        if (!context.is_null() && !context.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidContext,
                std::string("render context must be a map, got ") + context.type_name()
            });
        }
        if (partials_.empty()) {
            return context;
        }

        Context merged = partials_;
        if (context.is_object()) {
            for (const auto& item : context.items()) {
                merged[item.key()] = item.value();
            }
        }
        return merged;
    }
};

} // namespace stencil
