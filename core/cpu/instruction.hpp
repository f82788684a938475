// ==============================================================================
// Hack Instruction Encoding
// ==============================================================================
// Field tables for the two Hack instruction formats:
//   A-instruction: 0vvvvvvvvvvvvvvv
//   C-instruction: 111a cccccc ddd jjj
//
// The assembler encodes the translator's mnemonics with these tables and the
// CPU engine rejects words whose comp field names no ALU operation.
// ==============================================================================

#ifndef VMTRANSLATOR_CPU_INSTRUCTION_HPP
#define VMTRANSLATOR_CPU_INSTRUCTION_HPP

#include "types.hpp"
#include "error.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace vmt {

// C-instruction field masks
namespace HackBits {
    constexpr Word C_PREFIX  = 0xE000;  // 111
    constexpr Word A_BIT     = 0x1000;  // comp reads M instead of A
    constexpr Word DEST_A    = 0x0020;
    constexpr Word DEST_D    = 0x0010;
    constexpr Word DEST_M    = 0x0008;
    constexpr Word JUMP_LT   = 0x0004;
    constexpr Word JUMP_EQ   = 0x0002;
    constexpr Word JUMP_GT   = 0x0001;
    constexpr Word MAX_VALUE = 0x7FFF;  // largest A-instruction constant
}

/**
 * @brief 7-bit comp field (a plus the six ALU control bits) for a mnemonic.
 *
 * Accepts the canonical spellings ("D+M", "D&A") and the commuted forms
 * some assemblers also take ("M+D", "A&D").
 */
std::optional<uint8_t> computation_bits(const std::string& comp);

/**
 * @brief 3-bit dest field for "", "M", "D", "MD", "A", "AM", "AD", "AMD".
 *
 * Letters may come in any order but each at most once.
 */
std::optional<uint8_t> destination_bits(const std::string& dest);

/**
 * @brief 3-bit jump field for "", "JGT", ..., "JMP".
 */
std::optional<uint8_t> jump_bits(const std::string& jump);

/**
 * @brief True if a 7-bit comp field is one of the 28 Hack ALU operations.
 */
bool is_valid_computation(uint8_t comp);

Word encode_c_instruction(uint8_t comp, uint8_t dest, uint8_t jump);

/**
 * @brief Encode an A-instruction word.
 *
 * @throws ParseError if value does not fit in 15 bits
 */
Word encode_a_instruction(Word value);

}  // namespace vmt

#endif  // VMTRANSLATOR_CPU_INSTRUCTION_HPP
