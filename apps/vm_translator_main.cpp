// ==============================================================================
// vm_translator - command line front end
// ==============================================================================
// Usage: vm_translator <input.vm> [output.asm] [--bootstrap] [--no-comments]
//                      [--stack-base N]
//
// Exit codes: 0 success, 1 translation error, 2 usage error.
// ==============================================================================

#include "vm_translator.hpp"
#include <cctype>
#include <iostream>
#include <string>
#include <vector>

using namespace vmt;

namespace {

struct Options {
    std::string input_path;
    std::string output_path;
    TranslatorConfig config;
};

void print_usage(std::ostream& out) {
    out << "Usage: vm_translator <input.vm> [output.asm] [--bootstrap] "
           "[--no-comments] [--stack-base N]\n"
        << "  --bootstrap      initialize SP and call Sys.init before the program\n"
        << "  --no-comments    omit the echo comment before each command\n"
        << "  --stack-base N   initial stack pointer (default 256)\n";
}

Address parse_stack_base(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        throw UsageError("--stack-base expects a number, got '" + text + "'");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw UsageError("--stack-base expects a number, got '" + text + "'");
        }
    }
    unsigned long value = std::stoul(text);
    if (value > 0x7FFF) {
        throw UsageError("--stack-base must be at most 32767, got " + text);
    }
    return static_cast<Address>(value);
}

Options parse_arguments(const std::vector<std::string>& args) {
    Options options;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--bootstrap") {
            options.config.bootstrap = true;
        } else if (arg == "--no-comments") {
            options.config.emit_comments = false;
        } else if (arg == "--stack-base") {
            if (i + 1 >= args.size()) {
                throw UsageError("--stack-base requires a value");
            }
            options.config.stack_base = parse_stack_base(args[++i]);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option '" + arg + "'");
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        throw UsageError("Missing input file");
    }
    if (positional.size() > 2) {
        throw UsageError("Too many arguments");
    }

    options.input_path = positional[0];
    options.output_path = positional.size() == 2
        ? positional[1]
        : default_output_path(options.input_path);
    return options;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    for (const std::string& arg : args) {
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return 0;
        }
    }

    Options options;
    try {
        options = parse_arguments(args);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        print_usage(std::cerr);
        return 2;
    }

    try {
        TranslationStats stats = translate_file(
            options.input_path, options.output_path, options.config);

        std::cout << options.input_path << " -> " << options.output_path
                  << ": " << stats.commands_translated << " commands, "
                  << stats.instructions_emitted << " instructions\n";
    } catch (const TranslatorError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
