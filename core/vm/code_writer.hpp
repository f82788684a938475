// ==============================================================================
// Hack Code Writer
// ==============================================================================
// Generates Hack assembly for classified VM commands.
//
// The output program is a list of Blocks. Each Block holds the assembly for
// exactly one VM command, optionally led by an echo comment. The writer
// seeds a prologue Block (SP = 256) on construction and appends a halting
// epilogue Block exactly once on close().
//
// Stack discipline: SP (RAM[0]) always holds the address of the next free
// slot. Every emitted Block leaves SP consistent with the VM semantics of its
// command.
//
// A command is fully validated before any of its instructions are emitted;
// a rejected command leaves the program untouched.
// ==============================================================================

#ifndef VMTRANSLATOR_CODE_WRITER_HPP
#define VMTRANSLATOR_CODE_WRITER_HPP

#include "vm_command.hpp"
#include "segment_table.hpp"
#include "error.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace vmt {

// ==============================================================================
// Configuration
// ==============================================================================

/**
 * @brief Options shared by the code writer and the translator
 */
struct TranslatorConfig {
    Address stack_base = HackAddress::STACK_BASE;  // Initial SP value

    // Call Sys.init from the prologue (full programs built from functions)
    bool bootstrap = false;

    // Prefix each Block with a "// <command>" echo line
    bool emit_comments = true;
};

// ==============================================================================
// Code Writer Class
// ==============================================================================

/**
 * @brief Accumulates a Hack assembly program, one Block per VM command
 *
 * Usage:
 *   CodeWriter writer;
 *   writer.write_push_pop(CommandType::PUSH, "constant", 7);
 *   writer.write_push_pop(CommandType::PUSH, "constant", 8);
 *   writer.write_arithmetic("add");
 *   writer.close();
 *   writer.write_to(out);
 */
class CodeWriter {
public:
    using Block = std::vector<std::string>;

    /**
     * @brief Create a writer and seed the prologue Block
     */
    explicit CodeWriter(const TranslatorConfig& config = TranslatorConfig());

    // =========================================================================
    // Stack Arithmetic
    // =========================================================================

    /**
     * @brief Emit one Block for an arithmetic/logical command
     *
     * @param command One of add, sub, neg, eq, gt, lt, and, or, not
     * @throws InvalidOperatorError for anything else (nothing is emitted)
     */
    void write_arithmetic(const std::string& command);

    // =========================================================================
    // Memory Access
    // =========================================================================

    /**
     * @brief Emit one Block for a push or pop
     *
     * @param command CommandType::PUSH or CommandType::POP
     * @param segment Segment keyword (local, argument, ..., pointer)
     * @param index Index within the segment
     * @throws UnknownSegmentError if the segment is not in the table
     * @throws InvalidArgumentError for pop constant or an out-of-range index
     * @throws UsageError if command is neither PUSH nor POP
     */
    void write_push_pop(CommandType command, const std::string& segment, uint16_t index);

    // =========================================================================
    // Program Flow
    // =========================================================================
    // Outside a function, labels that would shadow END, a comparison label
    // or an assembler register symbol throw InvalidArgumentError.

    void write_label(const std::string& label);
    void write_goto(const std::string& label);

    /**
     * @brief Pop the top value and jump to label if it is not zero
     */
    void write_if(const std::string& label);

    // =========================================================================
    // Function Protocol
    // =========================================================================

    /**
     * @brief Declare a function entry and zero its local variables
     *
     * Also makes `name` the scope for subsequent labels.
     */
    void write_function(const std::string& name, uint16_t num_locals);

    /**
     * @brief Save the caller's frame, reposition ARG/LCL and jump to `name`
     */
    void write_call(const std::string& name, uint16_t num_args);

    /**
     * @brief Put the return value at ARG[0], restore the caller's frame and
     * jump back to the return address
     */
    void write_return();

    /**
     * @brief Dispatch any VMCommand to the matching write_* method
     */
    void write(const VMCommand& command);

    // =========================================================================
    // Finalization and Output
    // =========================================================================

    /**
     * @brief Append the halting epilogue Block
     *
     * Idempotent: the epilogue is appended on the first call only. After
     * close(), further write_* calls throw UsageError.
     */
    void close();

    bool is_closed() const { return closed_; }

    /**
     * @brief Write every Block in order, one instruction per line
     *
     * @throws UsageError if the writer is not closed yet
     * @throws FileError if the stream fails
     */
    void write_to(std::ostream& out) const;

    /**
     * @brief The closed program as text
     */
    std::string to_string() const;

    // =========================================================================
    // Inspection
    // =========================================================================

    const std::vector<Block>& program() const { return program_; }

    /**
     * @brief Number of ROM instructions emitted so far
     *
     * Comment lines and label declarations don't occupy ROM.
     */
    size_t instruction_count() const;

    /**
     * @brief How many comparisons have been emitted (next label number)
     */
    int comparison_count() const { return comparison_counter_; }

    /**
     * @brief Function that currently scopes labels ("" outside any function)
     */
    const std::string& current_function() const { return current_function_; }

    const TranslatorConfig& config() const { return config_; }

private:
    TranslatorConfig config_;
    std::vector<Block> program_;
    Block block_;  // Block under construction

    // Seeds the <OP>_TRUE_n / <OP>_END_n pair for eq, gt and lt
    int comparison_counter_ = 0;

    // Seeds return-address labels for call
    int return_counter_ = 0;

    std::string current_function_;
    bool closed_ = false;

    // =========================================================================
    // Block Assembly
    // =========================================================================

    void begin_block(const std::string& comment);
    void emit(const std::string& line);
    void commit_block();
    void require_open(const char* operation) const;

    // =========================================================================
    // Code Fragments
    // =========================================================================

    // SP--, D = *SP (leaves A pointing at the popped slot)
    void emit_pop_to_d();

    // *SP = D, SP++
    void emit_push_d();

    void emit_binary(const char* computation);
    void emit_unary(const char* computation);
    void emit_comparison(ArithmeticOp op);

    void emit_push(const SegmentInfo& segment, uint16_t index);
    void emit_pop(const SegmentInfo& segment, uint16_t index);

    void emit_call(const std::string& name, uint16_t num_args);

    std::string scoped_label(const std::string& label) const;
    std::string next_return_label();
    void check_label(const std::string& label) const;
    void check_function_name(const std::string& name) const;
};

}  // namespace vmt

#endif  // VMTRANSLATOR_CODE_WRITER_HPP
