// ==============================================================================
// Hack Assembler
// ==============================================================================
// Turns symbolic Hack assembly (the translator's output) into machine words
// that the CPU engine can execute.
//
// Two passes:
//   1. Record the ROM address of every (LABEL) declaration.
//   2. Encode instructions, resolving @symbol through predefined symbols,
//      labels, and variables allocated from RAM[16] upward.
// ==============================================================================

#ifndef VMTRANSLATOR_CPU_ASSEMBLER_HPP
#define VMTRANSLATOR_CPU_ASSEMBLER_HPP

#include "instruction.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vmt {

/**
 * @brief Two-pass assembler for Hack assembly text
 *
 * Usage:
 *   HackAssembler assembler;
 *   std::vector<Word> rom = assembler.assemble(asm_text, "StackTest.asm");
 *   Address end = *assembler.lookup("END");
 */
class HackAssembler {
public:
    HackAssembler() = default;

    /**
     * @brief Assemble a complete program
     *
     * Each call starts from a fresh symbol table.
     *
     * @param source Assembly text, one instruction per line
     * @param source_name Name to use in error messages
     * @throws ParseError for malformed instructions or duplicate labels
     */
    std::vector<Word> assemble(const std::string& source,
                               const std::string& source_name = "<asm>");

    /**
     * @brief Address bound to a symbol by the last assemble() call
     */
    std::optional<Address> lookup(const std::string& symbol) const;

    const std::unordered_map<std::string, Address>& symbols() const { return symbols_; }

private:
    std::unordered_map<std::string, Address> symbols_;
    Address next_variable_ = HackAddress::STATIC_BASE;
    std::string source_name_;

    void load_predefined_symbols();
    Word assemble_a_instruction(const std::string& operand, LineNumber line);
    Word assemble_c_instruction(const std::string& text, LineNumber line);

    [[noreturn]] void error(LineNumber line, const std::string& message) const;
};

/**
 * @brief Remove the // comment and every whitespace character
 *
 * Hack assembly ignores spaces inside instructions ("D = M + 1" is "D=M+1").
 */
std::string strip_assembly_line(const std::string& line);

}  // namespace vmt

#endif  // VMTRANSLATOR_CPU_ASSEMBLER_HPP
