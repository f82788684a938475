// ==============================================================================
// Common Type Definitions
// ==============================================================================
// Basic types shared by the VM translator and the Hack verification harness.
// Using explicit types makes the code more readable and helps catch bugs.
// ==============================================================================

#ifndef VMTRANSLATOR_COMMON_TYPES_HPP
#define VMTRANSLATOR_COMMON_TYPES_HPP

#include <cstdint>      // For fixed-width integer types
#include <cstddef>      // For size_t
#include <string>       // For std::string
#include <optional>     // For std::optional (values that might not exist)

namespace vmt {  // vmt = VM translator namespace

// ==============================================================================
// Hack Computer Basic Types
// ==============================================================================

/**
 * @brief A 16-bit word in the Hack computer
 *
 * All Hack memory cells, instructions and registers are 16 bits wide.
 */
using Word = uint16_t;

/**
 * @brief A 15-bit memory address
 *
 * Hack RAM has 32K words addressed with 15 bits.
 * Valid range: 0 to 32,767
 */
using Address = uint16_t;

// ==============================================================================
// Hack RAM Layout
// ==============================================================================
// The VM mapping on the Hack platform reserves the low RAM addresses for
// the virtual registers. The translator and the emulator share these.
// ==============================================================================

namespace HackAddress {
    constexpr Address SP   = 0;
    constexpr Address LCL  = 1;
    constexpr Address ARG  = 2;
    constexpr Address THIS = 3;
    constexpr Address THAT = 4;
    constexpr Address TEMP_BASE = 5;
    constexpr Address R13  = 13;
    constexpr Address R14  = 14;
    constexpr Address R15  = 15;
    constexpr Address STATIC_BASE = 16;
    constexpr Address STACK_BASE = 256;

    constexpr Address SCREEN_BASE = 16384;
    constexpr Address KEYBOARD = 24576;

    constexpr size_t RAM_SIZE = 32768;
    constexpr size_t ROM_SIZE = 32768;
}

/**
 * @brief Boolean values as the VM represents them on the stack
 *
 * true is all bits set (-1), false is all bits clear (0).
 */
constexpr Word VM_TRUE  = 0xFFFF;
constexpr Word VM_FALSE = 0x0000;

// ==============================================================================
// VM Types
// ==============================================================================

/**
 * @brief VM memory segment types
 *
 * The VM has 8 memory segments:
 * - LOCAL, ARGUMENT, THIS, THAT: based on a pointer stored in RAM[1..4]
 * - CONSTANT: the index itself, never stored
 * - STATIC: global variables, RAM[16..255]
 * - TEMP: 8 temporaries, RAM[5..12]
 * - POINTER: the THIS/THAT registers themselves (pointer 0 = THIS, 1 = THAT)
 */
enum class SegmentType {
    LOCAL,
    ARGUMENT,
    THIS,
    THAT,
    CONSTANT,
    STATIC,
    TEMP,
    POINTER
};

/**
 * @brief VM command types
 *
 * - ARITHMETIC: add, sub, neg, eq, gt, lt, and, or, not
 * - PUSH / POP: stack <-> segment transfers
 * - LABEL, GOTO, IF_GOTO: program flow
 * - FUNCTION, CALL, RETURN: function protocol
 */
enum class CommandType {
    ARITHMETIC,
    PUSH,
    POP,
    LABEL,
    GOTO,
    IF_GOTO,
    FUNCTION,
    RETURN,
    CALL
};

/**
 * @brief Arithmetic/logical operations in the VM
 *
 * - Binary operations (ADD, SUB, AND, OR): pop two values, push result
 * - Unary operations (NEG, NOT): rewrite the top value in place
 * - Comparison operations (EQ, GT, LT): pop two values, push -1 (true) or 0 (false)
 */
enum class ArithmeticOp {
    ADD,   // x + y
    SUB,   // x - y (x was pushed first)
    NEG,   // -y (unary)
    EQ,    // x == y
    GT,    // x > y
    LT,    // x < y
    AND,   // x & y (bitwise AND)
    OR,    // x | y (bitwise OR)
    NOT    // ~y (bitwise NOT, unary)
};

// ==============================================================================
// Utility Type Aliases
// ==============================================================================

/**
 * @brief Source code line number (1-based, 0 = unknown)
 */
using LineNumber = size_t;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Convert SegmentType to its VM keyword
 *
 * @return e.g. "local", "argument"
 */
const char* segment_to_string(SegmentType segment);

/**
 * @brief Look up a segment by its VM keyword
 *
 * @return The segment, or nullopt if the name is not a VM segment
 */
std::optional<SegmentType> segment_from_string(const std::string& name);

/**
 * @brief Convert ArithmeticOp to its VM keyword
 *
 * @return e.g. "add", "eq"
 */
const char* arithmetic_op_to_string(ArithmeticOp op);

/**
 * @brief Look up an arithmetic operation by its VM keyword
 *
 * Only the nine exact keywords match; there is no case folding.
 */
std::optional<ArithmeticOp> arithmetic_op_from_string(const std::string& name);

/**
 * @brief Convert CommandType to a readable name for diagnostics
 */
const char* command_type_to_string(CommandType type);

}  // namespace vmt

#endif  // VMTRANSLATOR_COMMON_TYPES_HPP
