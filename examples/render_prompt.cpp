/**
 * Stencil Render Prompt
 *
 * CLI that parses a template file and renders it against a JSON context.
 *
 * Usage:
 *   ./render_prompt <template_file> [options]
 *
 * Options:
 *   --context <json>         Context as inline JSON (default: {})
 *   --context-file <path>    Context read from a JSON file
 *   --options-file <path>    Render options read from a JSON file
 *   --lenient                Substitute "" for missing variables
 *   --escape                 HTML-escape substituted values
 *   --check                  Only parse; report the detected style
 *   --verbose                Debug logging to stderr
 *   --help                   Show this help message
 */

#include "stencil/stencil.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

struct CLIArgs {
    std::string template_path;
    std::string context_json = "{}";
    std::string context_file;
    std::string options_file;
    bool lenient = false;
    bool escape = false;
    bool check = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Stencil Render Prompt\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " <template_file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --context <json>         Context as inline JSON (default: {})\n";
    std::cout << "  --context-file <path>    Context read from a JSON file\n";
    std::cout << "  --options-file <path>    Render options read from a JSON file\n";
    std::cout << "  --lenient                Substitute \"\" for missing variables\n";
    std::cout << "  --escape                 HTML-escape substituted values\n";
    std::cout << "  --check                  Only parse; report the detected style\n";
    std::cout << "  --verbose                Debug logging to stderr\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " greeting.txt --context '{\"name\": \"World\"}'\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    if (argc < 2) {
        args.help = true;
        return args;
    }

    if (std::string(argv[1]) == "--help") {
        args.help = true;
        return args;
    }

    args.template_path = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--context" && i + 1 < argc) {
            args.context_json = argv[++i];
        }
        else if (arg == "--context-file" && i + 1 < argc) {
            args.context_file = argv[++i];
        }
        else if (arg == "--options-file" && i + 1 < argc) {
            args.options_file = argv[++i];
        }
        else if (arg == "--lenient") {
            args.lenient = true;
        }
        else if (arg == "--escape") {
            args.escape = true;
        }
        else if (arg == "--check") {
            args.check = true;
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }

    return args;
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

void print_error(const stencil::Error& err) {
    std::cerr << err.location.line << ":" << err.location.column << ": [" << err.kind() << "] "
              << err.message;
    if (err.context) {
        std::cerr << " (" << *err.context << ")";
    }
    std::cerr << "\n";
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return args.template_path.empty() ? 1 : 0;
    }

    if (args.verbose) {
        stencil::log::set_level(spdlog::level::debug);
    }

    std::string source;
    if (!read_file(args.template_path, source)) {
        std::cerr << "Cannot read template file: " << args.template_path << "\n";
        return 1;
    }

    auto tmpl = stencil::parse(source);
    if (!tmpl) {
        for (const auto& err : tmpl.error()) {
            print_error(err);
        }
        return 1;
    }

    if (args.check) {
        std::cout << "style: " << stencil::style_to_string(tmpl->style()) << "\n";
        std::cout << "variables:";
        for (const auto& name : tmpl->variables()) {
            std::cout << " " << name;
        }
        std::cout << "\n";
        return 0;
    }

    stencil::RenderOptions options;
    if (!args.options_file.empty()) {
        auto document = stencil::config::read_json_file(args.options_file);
        if (!document) {
            std::cerr << "Error: " << document.error().to_string() << "\n";
            return 1;
        }
        auto loaded = stencil::config::load_render_options(*document);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().to_string() << "\n";
            return 1;
        }
        options = *loaded;
    }
    if (args.lenient) {
        options.missing_variable_policy = stencil::MissingVariablePolicy::Lenient;
    }
    if (args.escape) {
        options.escape_output = true;
    }

    auto context = args.context_file.empty()
        ? stencil::config::parse_json(args.context_json)
        : stencil::config::read_json_file(args.context_file);
    if (!context) {
        std::cerr << "Error: " << context.error().to_string() << "\n";
        return 1;
    }

    auto result = stencil::render_detailed(*tmpl, *context, options);
    if (!result) {
        print_error(result.error());
        return 1;
    }

    std::cout << result->text;
    for (const auto& name : result->missing_variables) {
        std::cerr << "warning: '" << name << "' was missing from the context\n";
    }
    return 0;
}
