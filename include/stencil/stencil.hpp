#pragma once

/**
 * @file stencil.hpp
 * @brief Main convenience header for the Stencil prompt template engine
 *
 * Include this single header to get access to all public Stencil APIs.
 *
 * Stencil is a C++17 library that parses, validates and renders prompt
 * templates written in one of two placeholder styles: inline FmtString
 * placeholders ("{name}", "{score:>6.2f}") or Mustache tags and sections
 * ("{{name}}", "{{#items}}...{{/items}}"). The style is detected once at
 * parse time; a template mixing both styles is rejected.
 *
 * Quick Start:
 * @code
 * #include <stencil/stencil.hpp>
 *
 * int main() {
 *     auto tmpl = stencil::parse("Hello, {name}!");
 *     if (!tmpl) {
 *         for (const auto& err : tmpl.error()) {
 *             std::cerr << err.to_string() << std::endl;
 *         }
 *         return 1;
 *     }
 *
 *     auto text = stencil::render(*tmpl, {{"name", "World"}});
 *     if (text) {
 *         std::cout << *text << std::endl;  // Hello, World!
 *     } else {
 *         std::cerr << "Error: " << text.error().to_string() << std::endl;
 *     }
 *
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - stencil::parse / stencil::Template: immutable parsed templates
 * - stencil::render: substitute a JSON context into a template
 * - stencil::PromptTemplate: template with pre-bound variables
 * - stencil::chat::ChatTemplate: role-tagged message templates
 * - stencil::chat::FewShotTemplate: prefix, examples and suffix
 * - stencil::chat::FewShotChatTemplate: examples bound to chat roles
 * - stencil::chat::ChatFormatter: Llama3, ChatML and custom wire formats
 * - stencil::Error: structured, positioned errors
 *
 * Thread Safety:
 * - Parsing and rendering are pure; a Template may be rendered from any
 *   number of threads at once
 * - The library logger is thread-safe
 */

// Core types
#include "error.hpp"
#include "types.hpp"
#include "log.hpp"

// Parsing and rendering
#include "template.hpp"
#include "engine/style_detector.hpp"
#include "engine/renderer.hpp"

// Prompt helpers
#include "prompt_template.hpp"
#include "chat/chat_template.hpp"
#include "chat/few_shot_template.hpp"
#include "chat/few_shot_chat_template.hpp"
#include "chat/chat_format.hpp"

// Configuration loading
#include "config.hpp"

/**
 * @namespace stencil
 * @brief Main namespace for the Stencil library
 *
 * Internal implementation details are in nested namespaces:
 * - stencil::engine - Style detection, parsers, scanner and renderer
 * - stencil::chat - Chat and few-shot prompt builders
 * - stencil::config - JSON configuration loaders
 * - stencil::log - Library logger
 */
