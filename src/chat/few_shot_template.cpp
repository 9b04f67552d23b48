#include "stencil/chat/few_shot_template.hpp"

#include <algorithm>

namespace stencil {
namespace chat {

FewShotTemplate::Builder FewShotTemplate::builder() {
    return Builder{};
}

std::vector<std::string> FewShotTemplate::input_variables() const {
    std::vector<std::string> names;
    auto add_all = [&names](const PromptTemplate& prompt) {
        for (const auto& name : prompt.input_variables()) {
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        }
    };

    if (prefix_) add_all(*prefix_);
    for (const auto& example : examples_) add_all(example);
    if (suffix_) add_all(*suffix_);
    return names;
}

Expected<std::string> FewShotTemplate::format(const Context& context, const RenderOptions& options) const {
    std::vector<std::string> parts;

    auto render_part = [&](const PromptTemplate& prompt, const std::string& label) -> Expected<void> {
        auto text = prompt.format(context, options);
        if (!text) {
            auto err = text.error();
            err.context = label;
            return tl::unexpected(std::move(err));
        }
        if (!text->empty()) {
            parts.push_back(std::move(*text));
        }
        return {};
    };

    if (prefix_) {
        if (auto rendered = render_part(*prefix_, "prefix"); !rendered) {
            return tl::unexpected(rendered.error());
        }
    }
    for (std::size_t i = 0; i < examples_.size(); ++i) {
        if (auto rendered = render_part(examples_[i], "example[" + std::to_string(i) + "]"); !rendered) {
            return tl::unexpected(rendered.error());
        }
    }
    if (suffix_) {
        if (auto rendered = render_part(*suffix_, "suffix"); !rendered) {
            return tl::unexpected(rendered.error());
        }
    }

    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += example_separator_;
        out += parts[i];
    }
    return out;
}

// ============================================================================
// Builder
// ============================================================================

std::optional<PromptTemplate> FewShotTemplate::Builder::parse_part(std::string_view source,
                                                                   const std::string& label) {
    auto prompt = PromptTemplate::from_template(source);
    if (!prompt) {
        for (auto& err : prompt.error()) {
            err.context = label;
            errors_.push_back(std::move(err));
        }
        return std::nullopt;
    }
    return std::move(*prompt);
}

FewShotTemplate::Builder& FewShotTemplate::Builder::prefix(std::string_view source) {
    result_.prefix_ = parse_part(source, "prefix");
    return *this;
}

FewShotTemplate::Builder& FewShotTemplate::Builder::prefix(PromptTemplate prompt) {
    result_.prefix_ = std::move(prompt);
    return *this;
}

FewShotTemplate::Builder& FewShotTemplate::Builder::suffix(std::string_view source) {
    result_.suffix_ = parse_part(source, "suffix");
    return *this;
}

FewShotTemplate::Builder& FewShotTemplate::Builder::suffix(PromptTemplate prompt) {
    result_.suffix_ = std::move(prompt);
    return *this;
}

FewShotTemplate::Builder& FewShotTemplate::Builder::add_example(std::string_view source) {
    auto label = "example[" + std::to_string(example_count_++) + "]";
    if (auto prompt = parse_part(source, label)) {
        result_.examples_.push_back(std::move(*prompt));
    }
    return *this;
}

FewShotTemplate::Builder& FewShotTemplate::Builder::add_example(PromptTemplate prompt) {
    ++example_count_;
    result_.examples_.push_back(std::move(prompt));
    return *this;
}

FewShotTemplate::Builder& FewShotTemplate::Builder::example_separator(std::string separator) {
    result_.example_separator_ = std::move(separator);
    return *this;
}

tl::expected<FewShotTemplate, ErrorSet> FewShotTemplate::Builder::build() {
    if (!errors_.empty()) {
        return tl::unexpected(std::move(errors_));
    }
    return std::move(result_);
}

} // namespace chat
} // namespace stencil
