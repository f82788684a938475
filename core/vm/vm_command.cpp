// ==============================================================================
// VM Command Implementation
// ==============================================================================

#include "vm_command.hpp"
#include <cctype>
#include <type_traits>

namespace vmt {

LineNumber get_source_line(const VMCommand& cmd) {
    return std::visit([](const auto& c) -> LineNumber {
        return c.source_line;
    }, cmd);
}

CommandType get_command_type(const VMCommand& cmd) {
    return std::visit([](const auto& c) -> CommandType {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, ArithmeticCommand>) {
            return CommandType::ARITHMETIC;
        } else if constexpr (std::is_same_v<T, PushCommand>) {
            return CommandType::PUSH;
        } else if constexpr (std::is_same_v<T, PopCommand>) {
            return CommandType::POP;
        } else if constexpr (std::is_same_v<T, LabelCommand>) {
            return CommandType::LABEL;
        } else if constexpr (std::is_same_v<T, GotoCommand>) {
            return CommandType::GOTO;
        } else if constexpr (std::is_same_v<T, IfGotoCommand>) {
            return CommandType::IF_GOTO;
        } else if constexpr (std::is_same_v<T, FunctionCommand>) {
            return CommandType::FUNCTION;
        } else if constexpr (std::is_same_v<T, CallCommand>) {
            return CommandType::CALL;
        } else {
            static_assert(std::is_same_v<T, ReturnCommand>, "unhandled VMCommand alternative");
            return CommandType::RETURN;
        }
    }, cmd);
}

std::string command_to_string(const VMCommand& cmd) {
    return std::visit([](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, ArithmeticCommand>) {
            return c.operation;
        } else if constexpr (std::is_same_v<T, PushCommand>) {
            return "push " + c.segment + " " + std::to_string(c.index);
        } else if constexpr (std::is_same_v<T, PopCommand>) {
            return "pop " + c.segment + " " + std::to_string(c.index);
        } else if constexpr (std::is_same_v<T, LabelCommand>) {
            return "label " + c.label_name;
        } else if constexpr (std::is_same_v<T, GotoCommand>) {
            return "goto " + c.label_name;
        } else if constexpr (std::is_same_v<T, IfGotoCommand>) {
            return "if-goto " + c.label_name;
        } else if constexpr (std::is_same_v<T, FunctionCommand>) {
            return "function " + c.function_name + " " +
                   std::to_string(c.num_locals);
        } else if constexpr (std::is_same_v<T, CallCommand>) {
            return "call " + c.function_name + " " +
                   std::to_string(c.num_args);
        } else {
            static_assert(std::is_same_v<T, ReturnCommand>, "unhandled VMCommand alternative");
            return "return";
        }
    }, cmd);
}

bool is_valid_identifier(const std::string& str) {
    if (str.empty()) return false;

    // First character must be letter, underscore, or dot
    char first = str[0];
    if (!std::isalpha(static_cast<unsigned char>(first)) && first != '_' && first != '.') {
        return false;
    }

    for (size_t i = 1; i < str.length(); i++) {
        char c = str[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return false;
        }
    }

    return true;
}

bool is_valid_label(const std::string& str) {
    if (str.empty()) return false;

    char first = str[0];
    if (!std::isalpha(static_cast<unsigned char>(first)) &&
        first != '_' && first != ':' && first != '.') {
        return false;
    }

    for (size_t i = 1; i < str.length(); i++) {
        char c = str[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != ':' && c != '.') {
            return false;
        }
    }

    return true;
}

}  // namespace vmt
