// ==============================================================================
// VM Translator Implementation
// ==============================================================================

#include "vm_translator.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace vmt {

const char* translator_state_to_string(TranslatorState state) {
    switch (state) {
        case TranslatorState::IDLE:    return "idle";
        case TranslatorState::RUNNING: return "running";
        case TranslatorState::CLOSED:  return "closed";
        case TranslatorState::FAILED:  return "failed";
        default:                       return "unknown";
    }
}

// ==============================================================================
// Construction
// ==============================================================================

VMTranslator::VMTranslator(VMParser parser, const TranslatorConfig& config)
    : parser_(std::move(parser))
    , writer_(config)
{
    stats_.instructions_emitted = writer_.instruction_count();
}

// ==============================================================================
// Translation
// ==============================================================================

void VMTranslator::run() {
    if (state_ == TranslatorState::CLOSED || state_ == TranslatorState::FAILED) {
        throw UsageError(std::string("run() called on a ") +
                         translator_state_to_string(state_) + " translator");
    }

    state_ = TranslatorState::RUNNING;

    try {
        while (parser_.has_more_lines()) {
            parser_.advance();

            const VMCommand& command = parser_.command();
            try {
                writer_.write(command);
            } catch (TranslatorError& e) {
                e.locate(parser_.source_name(), get_source_line(command));
                throw;
            }

            record(command);
        }
    } catch (...) {
        state_ = TranslatorState::FAILED;
        throw;
    }

    stats_.instructions_emitted = writer_.instruction_count();
}

void VMTranslator::record(const VMCommand& command) {
    stats_.commands_translated++;

    switch (get_command_type(command)) {
        case CommandType::ARITHMETIC: {
            const auto& op = std::get<ArithmeticCommand>(command).operation;
            if (op == "eq" || op == "gt" || op == "lt") {
                stats_.comparison_count++;
            } else {
                stats_.arithmetic_count++;
            }
            break;
        }
        case CommandType::PUSH:     stats_.push_count++;     break;
        case CommandType::POP:      stats_.pop_count++;      break;
        case CommandType::LABEL:
        case CommandType::GOTO:
        case CommandType::IF_GOTO:  stats_.flow_count++;     break;
        case CommandType::FUNCTION: stats_.function_count++; break;
        case CommandType::CALL:     stats_.call_count++;     break;
        case CommandType::RETURN:   stats_.return_count++;   break;
    }
}

// ==============================================================================
// Output
// ==============================================================================

void VMTranslator::close(std::ostream& out) {
    if (state_ == TranslatorState::CLOSED) {
        return;
    }
    if (state_ == TranslatorState::FAILED) {
        throw UsageError("close() called after a failed run; no output is written");
    }

    writer_.close();
    stats_.instructions_emitted = writer_.instruction_count();

    try {
        writer_.write_to(out);
    } catch (...) {
        state_ = TranslatorState::FAILED;
        throw;
    }

    state_ = TranslatorState::CLOSED;
}

void VMTranslator::close_to_file(const std::string& output_path) {
    if (state_ == TranslatorState::CLOSED) {
        return;
    }
    if (state_ == TranslatorState::FAILED) {
        throw UsageError("close_to_file() called after a failed run; no output is written");
    }

    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw FileError(output_path, "Could not open file for writing");
    }

    try {
        close(file);
    } catch (TranslatorError& e) {
        e.locate(output_path, 0);
        throw;
    }
}

// ==============================================================================
// Convenience Functions
// ==============================================================================

TranslationStats translate_file(const std::string& input_path,
                                const std::string& output_path,
                                const TranslatorConfig& config) {
    VMTranslator translator(VMParser::from_file(input_path), config);
    translator.run();
    translator.close_to_file(output_path);
    return translator.get_stats();
}

std::string translate_string(const std::string& source, const TranslatorConfig& config) {
    VMTranslator translator(VMParser::from_string(source), config);
    translator.run();

    std::ostringstream out;
    translator.close(out);
    return out.str();
}

std::string default_output_path(const std::string& input_path) {
    namespace fs = std::filesystem;
    return fs::path(input_path).replace_extension(".asm").string();
}

}  // namespace vmt
