// ==============================================================================
// VM Parser
// ==============================================================================
// Reads a .vm instruction stream and hands it out one classified command at
// a time. The parser handles:
// - Loading the whole input up front
// - Removing comments, whitespace and blank lines
// - Classifying each instruction by its first token
// - Extracting arguments and reporting errors with file:line context
//
// The parser never generates code and the code writer never reads input;
// the translator drives one from the other.
// ==============================================================================

#ifndef VMTRANSLATOR_VM_PARSER_HPP
#define VMTRANSLATOR_VM_PARSER_HPP

#include "vm_command.hpp"
#include "error.hpp"
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace vmt {

// ==============================================================================
// Classification
// ==============================================================================

/**
 * @brief Classify an instruction by its first token
 *
 * - add, sub, neg, eq, gt, lt, and, or, not -> ARITHMETIC
 * - push -> PUSH, pop -> POP
 * - "label", or any token starting with '(' -> LABEL
 * - goto -> GOTO, if-goto -> IF_GOTO
 * - function -> FUNCTION, return -> RETURN, call -> CALL
 *
 * @return The command type, or nullopt if the token is not a VM command
 */
std::optional<CommandType> try_classify(const std::string& first_token);

/**
 * @brief Classify an instruction by its first token
 *
 * @throws MalformedInstructionError if the token is not a VM command
 */
CommandType classify(const std::string& first_token);

// ==============================================================================
// VM Parser Class
// ==============================================================================

/**
 * @brief Streams classified commands out of VM source
 *
 * Usage:
 *   VMParser parser = VMParser::from_file("StackTest.vm");
 *   while (parser.has_more_lines()) {
 *       parser.advance();
 *       if (parser.command_type() == CommandType::PUSH) {
 *           use(parser.arg1(), parser.arg2());
 *       }
 *   }
 *
 * The accessors describe the command made current by the last successful
 * advance(). Calling them before the first advance() throws UsageError.
 */
class VMParser {
public:
    /**
     * @brief Read all of `input` and keep its non-empty instructions
     *
     * @param input Stream positioned at the start of the VM source
     * @param source_name Name to use in error messages
     * @throws FileError if the stream fails while reading
     */
    explicit VMParser(std::istream& input, const std::string& source_name = "<stream>");

    /**
     * @brief Open and load a .vm file
     *
     * @throws FileError if the file cannot be opened or read
     */
    static VMParser from_file(const std::string& file_path);

    /**
     * @brief Load VM source held in memory
     */
    static VMParser from_string(const std::string& source,
                                const std::string& source_name = "<string>");

    // =========================================================================
    // Iteration
    // =========================================================================

    /**
     * @brief True while an unconsumed instruction remains
     */
    bool has_more_lines() const { return next_ < lines_.size(); }

    /**
     * @brief Move to the next instruction and classify it
     *
     * If classification fails, the previously parsed command stays current.
     *
     * @throws ExhaustedInputError if no instructions remain
     * @throws MalformedInstructionError if the instruction is not recognized
     * @throws InsufficientTokensError if arguments are missing
     */
    void advance();

    // =========================================================================
    // Current Command
    // =========================================================================

    CommandType command_type() const;

    /**
     * @brief First argument
     *
     * The operator for arithmetic commands, the segment for push/pop,
     * the label or function name otherwise.
     *
     * @throws UsageError for return, which has no arguments
     */
    const std::string& arg1() const;

    /**
     * @brief Integer argument of push, pop, function and call
     *
     * @throws UsageError if the current command has no integer argument
     */
    uint16_t arg2() const;

    bool has_arg2() const;

    /**
     * @brief The current instruction as a VMCommand variant
     */
    const VMCommand& command() const;

    /**
     * @brief Line number of the current instruction in the input
     */
    LineNumber current_line() const;

    /**
     * @brief The current instruction after comment stripping and trimming
     */
    const std::string& current_text() const;

    // =========================================================================
    // Input Information
    // =========================================================================

    const std::string& source_name() const { return source_name_; }

    /**
     * @brief Number of retained instructions in the input
     */
    size_t instruction_count() const { return lines_.size(); }

private:
    // A retained source line and where it came from
    struct RawLine {
        std::string text;
        LineNumber line;
    };

    struct ParsedCommand {
        CommandType type;
        std::string arg1;
        std::optional<uint16_t> arg2;
        VMCommand command;
        LineNumber source_line;
        std::string text;
    };

    std::vector<RawLine> lines_;
    size_t next_ = 0;
    std::optional<ParsedCommand> current_;
    std::string source_name_;

    // Line being parsed, for error messages
    LineNumber error_line_ = 0;

    // =========================================================================
    // Parsing Helpers
    // =========================================================================

    ParsedCommand parse_instruction(const RawLine& raw);

    /**
     * @brief Check the token count for a command class
     *
     * @throws InsufficientTokensError if there are fewer than `expected`
     * @throws MalformedInstructionError if there are more
     */
    void expect_tokens(const std::vector<std::string>& tokens, size_t expected,
                       const char* usage);

    /**
     * @brief Parse a non-negative decimal index (0-32767)
     *
     * @throws MalformedInstructionError if the token is not a valid index
     */
    uint16_t parse_index(const std::string& index_str);

    /**
     * @brief Report an unrecognized first token, with a spelling hint if
     * it looks like a typo
     */
    [[noreturn]] void unknown_command(const std::string& keyword);

    const ParsedCommand& require_current(const char* accessor) const;

    [[noreturn]] void error(const std::string& message);

    [[noreturn]] void error_with_suggestion(const std::string& message,
                                             const std::string& wrong,
                                             const std::string& correct);
};

// ==============================================================================
// Utility Functions
// ==============================================================================

/**
 * @brief Remove a trailing // comment and trim whitespace
 *
 * @return The cleaned line (empty if blank or comment-only)
 */
std::string clean_line(const std::string& line);

/**
 * @brief Split a cleaned line into whitespace-separated tokens
 */
std::vector<std::string> tokenize(const std::string& line);

/**
 * @brief Get the base name of a file (without directory and extension)
 *
 * Example: "/path/to/Math.vm" -> "Math"
 */
std::string get_file_basename(const std::string& file_path);

}  // namespace vmt

#endif  // VMTRANSLATOR_VM_PARSER_HPP
