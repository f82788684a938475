// ==============================================================================
// Error Handling
// ==============================================================================
// Error types and exception classes for the translator.
// Every error is terminal: the run stops at the first failing instruction
// and no partial output is produced.
// ==============================================================================

#ifndef VMTRANSLATOR_COMMON_ERROR_HPP
#define VMTRANSLATOR_COMMON_ERROR_HPP

#include <exception>
#include <string>
#include <sstream>
#include "types.hpp"

namespace vmt {

// ==============================================================================
// Error Categories
// ==============================================================================

/**
 * @brief Different categories of errors that can occur
 *
 * Translation errors:
 * - MALFORMED_INSTRUCTION: first token not recognized, bad index, stray tokens
 * - INSUFFICIENT_TOKENS: a command is missing arguments
 * - UNKNOWN_SEGMENT: push/pop names a segment that does not exist
 * - INVALID_OPERATOR: arithmetic dispatch got something outside the 9 operators
 * - INVALID_ARGUMENT: a well-formed command that cannot be translated
 *   (pop constant, index outside the segment)
 * - EXHAUSTED_INPUT: advance() with no instructions left
 * - FILE_ERROR: couldn't read or write a file
 * - USAGE_ERROR: an API was called in the wrong state
 *
 * Verification harness errors:
 * - PARSE_ERROR: the assembler couldn't understand its input
 * - RUNTIME_ERROR: the emulated CPU faulted
 *
 * - INTERNAL_ERROR: bug in the translator itself (shouldn't happen!)
 */
enum class ErrorCategory {
    MALFORMED_INSTRUCTION,
    INSUFFICIENT_TOKENS,
    UNKNOWN_SEGMENT,
    INVALID_OPERATOR,
    INVALID_ARGUMENT,
    EXHAUSTED_INPUT,
    FILE_ERROR,
    USAGE_ERROR,
    PARSE_ERROR,
    RUNTIME_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Convert ErrorCategory to string for display
 */
inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::MALFORMED_INSTRUCTION: return "Malformed Instruction";
        case ErrorCategory::INSUFFICIENT_TOKENS:   return "Insufficient Tokens";
        case ErrorCategory::UNKNOWN_SEGMENT:       return "Unknown Segment";
        case ErrorCategory::INVALID_OPERATOR:      return "Invalid Operator";
        case ErrorCategory::INVALID_ARGUMENT:      return "Invalid Argument";
        case ErrorCategory::EXHAUSTED_INPUT:       return "Exhausted Input";
        case ErrorCategory::FILE_ERROR:            return "File Error";
        case ErrorCategory::USAGE_ERROR:           return "Usage Error";
        case ErrorCategory::PARSE_ERROR:           return "Parse Error";
        case ErrorCategory::RUNTIME_ERROR:         return "Runtime Error";
        case ErrorCategory::INTERNAL_ERROR:        return "Internal Error";
        default:                                   return "Unknown Error";
    }
}

// ==============================================================================
// Base Exception Class
// ==============================================================================

/**
 * @brief Base exception class for all translator errors
 *
 * Carries the error category, the source location (file and line number)
 * and a descriptive message.
 *
 * Example usage:
 *   throw TranslatorError(ErrorCategory::MALFORMED_INSTRUCTION, "Main.vm", 42,
 *                         "Unknown command: 'psh' (did you mean 'push'?)");
 *
 * This will produce:
 *   Malformed Instruction in Main.vm:42 - Unknown command: 'psh' (did you mean 'push'?)
 */
class TranslatorError : public std::exception {
public:
    /**
     * @brief Construct an error with full context
     *
     * @param category What kind of error
     * @param file Which file the error is in
     * @param line Which line number (0 if unknown)
     * @param message Description of what went wrong
     */
    TranslatorError(ErrorCategory category,
                    const std::string& file,
                    LineNumber line,
                    const std::string& message)
        : category_(category)
        , file_(file)
        , line_(line)
        , message_(message)
    {
        format_message();
    }

    /**
     * @brief Construct a simple error without file context
     */
    TranslatorError(ErrorCategory category, const std::string& message)
        : TranslatorError(category, "", 0, message)
    {}

    const char* what() const noexcept override {
        return full_message_.c_str();
    }

    ErrorCategory category() const { return category_; }

    const std::string& file() const { return file_; }

    /**
     * @brief Get the line number where the error occurred (0 if unknown)
     */
    LineNumber line() const { return line_; }

    /**
     * @brief Get just the error message (without category/file/line)
     */
    const std::string& message() const { return message_; }

    /**
     * @brief Attach a source location to an error raised without one
     *
     * Components that never see the input (the code writer) throw without
     * file context; the caller that knows the location fills it in before
     * rethrowing. An existing location is kept.
     */
    void locate(const std::string& file, LineNumber line) {
        if (!file_.empty()) {
            return;
        }
        file_ = file;
        line_ = line;
        format_message();
    }

private:
    void format_message() {
        std::ostringstream oss;
        oss << error_category_to_string(category_);

        if (!file_.empty()) {
            oss << " in " << file_;
            if (line_ > 0) {
                oss << ":" << line_;
            }
        }

        oss << " - " << message_;
        full_message_ = oss.str();
    }

    ErrorCategory category_;
    std::string file_;
    LineNumber line_;
    std::string message_;
    std::string full_message_;  // Cached formatted message
};

// ==============================================================================
// Specific Exception Types
// ==============================================================================
// Convenience classes, more readable than
// TranslatorError(ErrorCategory::UNKNOWN_SEGMENT, ...)
// ==============================================================================

/**
 * @brief The first token of an instruction is not a VM command, or its
 * arguments are not shaped like the command expects
 */
class MalformedInstructionError : public TranslatorError {
public:
    MalformedInstructionError(const std::string& file, LineNumber line, const std::string& message)
        : TranslatorError(ErrorCategory::MALFORMED_INSTRUCTION, file, line, message)
    {}

    MalformedInstructionError(const std::string& message)
        : TranslatorError(ErrorCategory::MALFORMED_INSTRUCTION, message)
    {}
};

/**
 * @brief A command has fewer tokens than its class requires
 *
 * Example: "push constant" (missing index)
 */
class InsufficientTokensError : public TranslatorError {
public:
    InsufficientTokensError(const std::string& file, LineNumber line, const std::string& message)
        : TranslatorError(ErrorCategory::INSUFFICIENT_TOKENS, file, line, message)
    {}

    InsufficientTokensError(const std::string& message)
        : TranslatorError(ErrorCategory::INSUFFICIENT_TOKENS, message)
    {}
};

/**
 * @brief push/pop segment name is not in the segment table
 */
class UnknownSegmentError : public TranslatorError {
public:
    UnknownSegmentError(const std::string& message)
        : TranslatorError(ErrorCategory::UNKNOWN_SEGMENT, message)
    {}
};

/**
 * @brief Arithmetic dispatch received a token outside the 9-operator set
 */
class InvalidOperatorError : public TranslatorError {
public:
    InvalidOperatorError(const std::string& message)
        : TranslatorError(ErrorCategory::INVALID_OPERATOR, message)
    {}
};

/**
 * @brief A well-formed command whose arguments cannot be translated
 *
 * Examples:
 * - pop constant 3
 * - temp 9 (temp only has 0-7)
 */
class InvalidArgumentError : public TranslatorError {
public:
    InvalidArgumentError(const std::string& message)
        : TranslatorError(ErrorCategory::INVALID_ARGUMENT, message)
    {}
};

/**
 * @brief advance() was called with zero retained instructions remaining
 */
class ExhaustedInputError : public TranslatorError {
public:
    ExhaustedInputError(const std::string& file, const std::string& message)
        : TranslatorError(ErrorCategory::EXHAUSTED_INPUT, file, 0, message)
    {}
};

/**
 * @brief File error - couldn't read or write a file
 */
class FileError : public TranslatorError {
public:
    FileError(const std::string& file, const std::string& message)
        : TranslatorError(ErrorCategory::FILE_ERROR, file, 0, message)
    {}

    FileError(const std::string& message)
        : TranslatorError(ErrorCategory::FILE_ERROR, message)
    {}
};

/**
 * @brief An API was used out of order
 *
 * Examples:
 * - arg1() before the first advance()
 * - write_arithmetic() after close()
 */
class UsageError : public TranslatorError {
public:
    UsageError(const std::string& message)
        : TranslatorError(ErrorCategory::USAGE_ERROR, message)
    {}
};

/**
 * @brief Parse error in Hack assembly (verification harness)
 */
class ParseError : public TranslatorError {
public:
    ParseError(const std::string& file, LineNumber line, const std::string& message)
        : TranslatorError(ErrorCategory::PARSE_ERROR, file, line, message)
    {}

    ParseError(const std::string& message)
        : TranslatorError(ErrorCategory::PARSE_ERROR, message)
    {}
};

/**
 * @brief Runtime error in the emulated CPU (verification harness)
 *
 * Examples:
 * - RAM access out of bounds
 * - Program too large for ROM
 */
class RuntimeError : public TranslatorError {
public:
    RuntimeError(const std::string& message)
        : TranslatorError(ErrorCategory::RUNTIME_ERROR, message)
    {}
};

/**
 * @brief Internal error - bug in the translator itself
 *
 * These should never happen in a correct implementation.
 */
class InternalError : public TranslatorError {
public:
    InternalError(const std::string& message)
        : TranslatorError(ErrorCategory::INTERNAL_ERROR, message)
    {}
};

// ==============================================================================
// Error Reporting Helpers
// ==============================================================================

/**
 * @brief Concatenate any streamable arguments into one message
 *
 * Example:
 *   build_error_message("temp index ", 9, " out of range (0-7)")
 */
template<typename... Args>
std::string build_error_message(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

/**
 * @brief Format a suggestion for a typo
 *
 * Example:
 *   format_suggestion("psh", "push")
 * Returns:
 *   "'psh' (did you mean 'push'?)"
 */
inline std::string format_suggestion(const std::string& wrong, const std::string& correct) {
    return "'" + wrong + "' (did you mean '" + correct + "'?)";
}

}  // namespace vmt

#endif  // VMTRANSLATOR_COMMON_ERROR_HPP
