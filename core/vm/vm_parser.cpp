// ==============================================================================
// VM Parser Implementation
// ==============================================================================

#include "vm_parser.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace vmt {

// ==============================================================================
// Classification
// ==============================================================================

std::optional<CommandType> try_classify(const std::string& first_token) {
    if (arithmetic_op_from_string(first_token).has_value()) {
        return CommandType::ARITHMETIC;
    }

    if (first_token == "push")     return CommandType::PUSH;
    if (first_token == "pop")      return CommandType::POP;

    if (first_token == "label")    return CommandType::LABEL;
    if (!first_token.empty() && first_token[0] == '(') {
        return CommandType::LABEL;
    }

    if (first_token == "goto")     return CommandType::GOTO;
    if (first_token == "if-goto")  return CommandType::IF_GOTO;
    if (first_token == "function") return CommandType::FUNCTION;
    if (first_token == "return")   return CommandType::RETURN;
    if (first_token == "call")     return CommandType::CALL;

    return std::nullopt;
}

CommandType classify(const std::string& first_token) {
    auto type = try_classify(first_token);
    if (!type.has_value()) {
        throw MalformedInstructionError("Unknown command: '" + first_token + "'");
    }
    return *type;
}

// ==============================================================================
// Construction
// ==============================================================================

VMParser::VMParser(std::istream& input, const std::string& source_name)
    : source_name_(source_name)
{
    std::string line;
    LineNumber line_number = 0;

    while (std::getline(input, line)) {
        line_number++;

        std::string cleaned = clean_line(line);
        if (!cleaned.empty()) {
            lines_.push_back(RawLine{cleaned, line_number});
        }
    }

    if (input.bad()) {
        throw FileError(source_name_, build_error_message(
            "Read failed after line ", line_number));
    }
}

VMParser VMParser::from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw FileError(file_path, "Could not open file for reading");
    }

    return VMParser(file, get_file_basename(file_path));
}

VMParser VMParser::from_string(const std::string& source, const std::string& source_name) {
    std::istringstream stream(source);
    return VMParser(stream, source_name);
}

// ==============================================================================
// Iteration
// ==============================================================================

void VMParser::advance() {
    if (!has_more_lines()) {
        throw ExhaustedInputError(source_name_,
            build_error_message("advance() called with no instructions left (",
                                lines_.size(), " consumed)"));
    }

    const RawLine& raw = lines_[next_];
    error_line_ = raw.line;

    // Parse before committing so a bad line leaves the old command current
    ParsedCommand parsed = parse_instruction(raw);
    current_ = std::move(parsed);
    next_++;
}

// ==============================================================================
// Current Command
// ==============================================================================

const VMParser::ParsedCommand& VMParser::require_current(const char* accessor) const {
    if (!current_.has_value()) {
        throw UsageError(std::string(accessor) +
                         "() called before the first advance()");
    }
    return *current_;
}

CommandType VMParser::command_type() const {
    return require_current("command_type").type;
}

const std::string& VMParser::arg1() const {
    const ParsedCommand& cmd = require_current("arg1");
    if (cmd.type == CommandType::RETURN) {
        throw UsageError("arg1() is not defined for return");
    }
    return cmd.arg1;
}

uint16_t VMParser::arg2() const {
    const ParsedCommand& cmd = require_current("arg2");
    if (!cmd.arg2.has_value()) {
        throw UsageError(std::string("arg2() is not defined for ") +
                         command_type_to_string(cmd.type));
    }
    return *cmd.arg2;
}

bool VMParser::has_arg2() const {
    return require_current("has_arg2").arg2.has_value();
}

const VMCommand& VMParser::command() const {
    return require_current("command").command;
}

LineNumber VMParser::current_line() const {
    return require_current("current_line").source_line;
}

const std::string& VMParser::current_text() const {
    return require_current("current_text").text;
}

// ==============================================================================
// Instruction Parsing
// ==============================================================================

VMParser::ParsedCommand VMParser::parse_instruction(const RawLine& raw) {
    std::vector<std::string> tokens = tokenize(raw.text);
    if (tokens.empty()) {
        throw InternalError(build_error_message(
            "Blank line ", raw.line, " of ", source_name_, " reached the instruction parser"));
    }
    const std::string& keyword = tokens[0];

    auto type = try_classify(keyword);
    if (!type.has_value()) {
        unknown_command(keyword);
    }

    ParsedCommand parsed;
    parsed.type = *type;
    parsed.source_line = raw.line;
    parsed.text = raw.text;

    switch (parsed.type) {
        case CommandType::ARITHMETIC: {
            expect_tokens(tokens, 1, "arithmetic commands take no arguments");
            parsed.arg1 = keyword;
            parsed.command = ArithmeticCommand{keyword, raw.line};
            break;
        }

        case CommandType::PUSH:
        case CommandType::POP: {
            expect_tokens(tokens, 3, parsed.type == CommandType::PUSH
                ? "push requires 2 arguments: push segment index"
                : "pop requires 2 arguments: pop segment index");
            parsed.arg1 = tokens[1];
            parsed.arg2 = parse_index(tokens[2]);
            if (parsed.type == CommandType::PUSH) {
                parsed.command = PushCommand{tokens[1], *parsed.arg2, raw.line};
            } else {
                parsed.command = PopCommand{tokens[1], *parsed.arg2, raw.line};
            }
            break;
        }

        case CommandType::LABEL: {
            if (keyword == "label") {
                expect_tokens(tokens, 2, "label requires 1 argument: label labelName");
                parsed.arg1 = tokens[1];
            } else {
                // Bracketed form: (LABEL_NAME)
                expect_tokens(tokens, 1, "bracketed label takes no arguments: (labelName)");
                if (keyword.size() < 3 || keyword.back() != ')') {
                    error("Malformed label declaration: '" + keyword +
                          "'. Expected (labelName)");
                }
                parsed.arg1 = keyword.substr(1, keyword.size() - 2);
            }
            parsed.command = LabelCommand{parsed.arg1, raw.line};
            break;
        }

        case CommandType::GOTO: {
            expect_tokens(tokens, 2, "goto requires 1 argument: goto labelName");
            parsed.arg1 = tokens[1];
            parsed.command = GotoCommand{tokens[1], raw.line};
            break;
        }

        case CommandType::IF_GOTO: {
            expect_tokens(tokens, 2, "if-goto requires 1 argument: if-goto labelName");
            parsed.arg1 = tokens[1];
            parsed.command = IfGotoCommand{tokens[1], raw.line};
            break;
        }

        case CommandType::FUNCTION: {
            expect_tokens(tokens, 3, "function requires 2 arguments: function functionName nVars");
            parsed.arg1 = tokens[1];
            parsed.arg2 = parse_index(tokens[2]);
            parsed.command = FunctionCommand{tokens[1], *parsed.arg2, raw.line};
            break;
        }

        case CommandType::CALL: {
            expect_tokens(tokens, 3, "call requires 2 arguments: call functionName nArgs");
            parsed.arg1 = tokens[1];
            parsed.arg2 = parse_index(tokens[2]);
            parsed.command = CallCommand{tokens[1], *parsed.arg2, raw.line};
            break;
        }

        case CommandType::RETURN: {
            expect_tokens(tokens, 1, "return takes no arguments");
            parsed.command = ReturnCommand{raw.line};
            break;
        }
    }

    return parsed;
}

void VMParser::expect_tokens(const std::vector<std::string>& tokens, size_t expected,
                             const char* usage) {
    if (tokens.size() < expected) {
        throw InsufficientTokensError(source_name_, error_line_,
            build_error_message("'", tokens[0], "' has ", tokens.size() - 1,
                                " argument(s); ", usage));
    }
    if (tokens.size() > expected) {
        error(build_error_message("Unexpected token '", tokens[expected],
                                  "' after '", tokens[0], "'; ", usage));
    }
}

uint16_t VMParser::parse_index(const std::string& index_str) {
    for (char c : index_str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            error("Index must be a non-negative integer, got '" + index_str + "'");
        }
    }

    // At most 5 digits fit; anything longer is out of range anyway
    if (index_str.size() > 5) {
        error("Index out of range (max 32767), got " + index_str);
    }

    unsigned long value = std::stoul(index_str);
    if (value > 32767) {
        error("Index out of range (max 32767), got " + index_str);
    }
    return static_cast<uint16_t>(value);
}

void VMParser::unknown_command(const std::string& keyword) {
    // Check for common typos
    if (keyword == "pussh" || keyword == "psh") {
        error_with_suggestion("Unknown command", keyword, "push");
    }
    if (keyword == "popp" || keyword == "po") {
        error_with_suggestion("Unknown command", keyword, "pop");
    }
    if (keyword == "ad" || keyword == "addd") {
        error_with_suggestion("Unknown command", keyword, "add");
    }
    if (keyword == "substract" || keyword == "subtract") {
        error_with_suggestion("Unknown command", keyword, "sub");
    }
    if (keyword == "ifgoto" || keyword == "if_goto") {
        error_with_suggestion("Unknown command", keyword, "if-goto");
    }
    if (keyword == "func") {
        error_with_suggestion("Unknown command", keyword, "function");
    }
    if (keyword == "ret") {
        error_with_suggestion("Unknown command", keyword, "return");
    }

    error("Unknown command: '" + keyword + "'");
}

void VMParser::error(const std::string& message) {
    throw MalformedInstructionError(source_name_, error_line_, message);
}

void VMParser::error_with_suggestion(const std::string& message,
                                     const std::string& wrong,
                                     const std::string& correct) {
    throw MalformedInstructionError(source_name_, error_line_,
                                    message + ": " + format_suggestion(wrong, correct));
}

// ==============================================================================
// Utility Functions
// ==============================================================================

// Same set operator>> skips in tokenize()
static constexpr const char* WHITESPACE = " \t\r\n\f\v";

std::string clean_line(const std::string& line) {
    std::string result = line;

    // Remove comment (everything after //)
    size_t comment_pos = result.find("//");
    if (comment_pos != std::string::npos) {
        result = result.substr(0, comment_pos);
    }

    size_t start = result.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";  // Line is all whitespace
    }

    size_t end = result.find_last_not_of(WHITESPACE);

    return result.substr(start, end - start + 1);
}

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;

    while (stream >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

std::string get_file_basename(const std::string& file_path) {
    namespace fs = std::filesystem;
    return fs::path(file_path).stem().string();
}

}  // namespace vmt
