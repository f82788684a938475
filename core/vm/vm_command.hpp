// ==============================================================================
// VM Command Representation
// ==============================================================================
// How a classified VM instruction is represented once the parser is done
// with it. Each retained line becomes exactly one VMCommand.
//
// Arguments are kept as the parser saw them (operator and segment names as
// strings). Validating them against the operator set and the segment table is
// the code writer's job, so it can reject them before emitting anything.
// ==============================================================================

#ifndef VMTRANSLATOR_VM_COMMAND_HPP
#define VMTRANSLATOR_VM_COMMAND_HPP

#include "types.hpp"
#include <string>
#include <variant>

namespace vmt {

// ==============================================================================
// Arithmetic Commands
// ==============================================================================

/**
 * @brief An arithmetic/logical VM command: add, sub, neg, eq, gt, lt, and, or, not
 *
 * Example VM code:
 *   push constant 7
 *   push constant 8
 *   add           // pops 8 and 7, pushes 15
 */
struct ArithmeticCommand {
    std::string operation;   // The operator keyword itself

    LineNumber source_line = 0;
};

// ==============================================================================
// Memory Access Commands (Push/Pop)
// ==============================================================================

/**
 * @brief push segment index
 *
 * Example: "push local 2" pushes the value of local variable 2 onto the stack
 */
struct PushCommand {
    std::string segment;     // Segment keyword, resolved by the code writer
    uint16_t index = 0;

    LineNumber source_line = 0;
};

/**
 * @brief pop segment index
 *
 * Example: "pop temp 0" moves the top of the stack into RAM[5]
 */
struct PopCommand {
    std::string segment;
    uint16_t index = 0;

    LineNumber source_line = 0;
};

// ==============================================================================
// Program Flow Commands
// ==============================================================================

/**
 * @brief label LABEL_NAME, or the bracketed form (LABEL_NAME)
 *
 * Labels are scoped to the enclosing function when translated.
 */
struct LabelCommand {
    std::string label_name;

    LineNumber source_line = 0;
};

/**
 * @brief goto LABEL_NAME
 */
struct GotoCommand {
    std::string label_name;

    LineNumber source_line = 0;
};

/**
 * @brief if-goto LABEL_NAME
 *
 * Pops the top value; jumps when it is not zero.
 */
struct IfGotoCommand {
    std::string label_name;

    LineNumber source_line = 0;
};

// ==============================================================================
// Function Commands
// ==============================================================================

/**
 * @brief function functionName nVars
 *
 * Declares a function entry point and zero-initializes nVars locals.
 */
struct FunctionCommand {
    std::string function_name;   // e.g. "Main.main"
    uint16_t num_locals = 0;

    LineNumber source_line = 0;
};

/**
 * @brief call functionName nArgs
 *
 * The caller has already pushed nArgs arguments.
 */
struct CallCommand {
    std::string function_name;
    uint16_t num_args = 0;

    LineNumber source_line = 0;
};

/**
 * @brief return
 *
 * Places the return value at ARG[0], restores the caller's frame and jumps
 * to the saved return address.
 */
struct ReturnCommand {
    LineNumber source_line = 0;
};

// ==============================================================================
// VMCommand - Unified Command Type
// ==============================================================================

/**
 * @brief A single VM command (any type)
 *
 * Consumers dispatch with std::visit and a visitor that has one overload
 * per alternative, so adding a command kind without handling it fails to
 * compile instead of being ignored at runtime.
 */
using VMCommand = std::variant<
    ArithmeticCommand,
    PushCommand,
    PopCommand,
    LabelCommand,
    GotoCommand,
    IfGotoCommand,
    FunctionCommand,
    CallCommand,
    ReturnCommand
>;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Get the source line number from any command
 */
LineNumber get_source_line(const VMCommand& cmd);

/**
 * @brief Get the CommandType tag for a command
 */
CommandType get_command_type(const VMCommand& cmd);

/**
 * @brief Convert a command back to VM source form
 *
 * Example: PushCommand{"local", 2} -> "push local 2"
 */
std::string command_to_string(const VMCommand& cmd);

/**
 * @brief Check if a string is a valid VM identifier (function name)
 *
 * Valid identifiers start with a letter, underscore or dot and contain
 * only letters, digits, underscores, and dots.
 */
bool is_valid_identifier(const std::string& str);

/**
 * @brief Check if a string is a valid label name
 *
 * Labels can contain letters, digits, underscores, dots, and colons,
 * and must not start with a digit.
 */
bool is_valid_label(const std::string& str);

}  // namespace vmt

#endif  // VMTRANSLATOR_VM_COMMAND_HPP
