#include "stencil/node.hpp"

#include <utility>

namespace stencil {

// ============================================================================
// SectionNode
// ============================================================================

SectionNode::SectionNode(const SectionNode& other)
    : name(other.name)
    , inverted(other.inverted)
    , open_tag(other.open_tag)
    , close_tag(other.close_tag)
{
    // Each pending pair is a body to copy into an already allocated shell
    std::vector<std::pair<const NodeList*, NodeList*>> pending{{&other.body, &body}};
    while (!pending.empty()) {
        auto [from, to] = pending.back();
        pending.pop_back();

        // Reserved up front so the addresses taken below stay valid
        to->reserve(from->size());
        for (const auto& node : *from) {
            auto* section = node.get_if<SectionNode>();
            if (section == nullptr) {
                to->push_back(node);
                continue;
            }
            SectionNode shell;
            shell.name = section->name;
            shell.inverted = section->inverted;
            shell.open_tag = section->open_tag;
            shell.close_tag = section->close_tag;
            to->push_back(Node{std::move(shell), node.offset});
            pending.emplace_back(&section->body, &std::get<SectionNode>(to->back().value).body);
        }
    }
}

SectionNode::SectionNode(SectionNode&& other) noexcept = default;

SectionNode& SectionNode::operator=(const SectionNode& other) {
    if (this != &other) {
        SectionNode copy(other);
        *this = std::move(copy);
    }
    return *this;
}

SectionNode& SectionNode::operator=(SectionNode&& other) noexcept = default;

SectionNode::~SectionNode() {
    // Hoist grandchildren before each child dies so no destructor recurses
    NodeList pending = std::move(body);
    while (!pending.empty()) {
        Node node = std::move(pending.back());
        pending.pop_back();
        if (auto* section = std::get_if<SectionNode>(&node.value)) {
            for (auto& child : section->body) {
                pending.push_back(std::move(child));
            }
            section->body.clear();
        }
    }
}

bool SectionNode::operator==(const SectionNode& other) const {
    std::vector<std::pair<const SectionNode*, const SectionNode*>> pending{{this, &other}};
    while (!pending.empty()) {
        auto [lhs, rhs] = pending.back();
        pending.pop_back();

        if (lhs->name != rhs->name || lhs->inverted != rhs->inverted ||
            lhs->open_tag != rhs->open_tag || lhs->close_tag != rhs->close_tag ||
            lhs->body.size() != rhs->body.size()) {
            return false;
        }
        for (std::size_t i = 0; i < lhs->body.size(); ++i) {
            const auto& a = lhs->body[i];
            const auto& b = rhs->body[i];
            if (a.offset != b.offset || a.value.index() != b.value.index()) {
                return false;
            }
            if (auto* section = a.get_if<SectionNode>()) {
                pending.emplace_back(section, b.get_if<SectionNode>());
            } else if (!(a.value == b.value)) {
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// Source Reassembly
// ============================================================================

void append_source(const NodeList& nodes, std::string& out) {
    struct Level {
        const NodeList* nodes;
        std::size_t next;
        const SectionNode* section;  ///< Owner whose close tag follows the body
    };

    std::vector<Level> stack{{&nodes, 0, nullptr}};
    while (!stack.empty()) {
        auto& level = stack.back();
        if (level.next == level.nodes->size()) {
            if (level.section != nullptr) {
                out += level.section->close_tag;
            }
            stack.pop_back();
            continue;
        }

        const auto& node = (*level.nodes)[level.next++];
        if (auto* literal = node.get_if<LiteralNode>()) {
            out += literal->raw;
        } else if (auto* placeholder = node.get_if<PlaceholderNode>()) {
            out += placeholder->tag;
        } else if (auto* variable = node.get_if<VariableNode>()) {
            out += variable->tag;
        } else if (auto* section = node.get_if<SectionNode>()) {
            out += section->open_tag;
            stack.push_back(Level{&section->body, 0, section});
        }
    }
}

} // namespace stencil
