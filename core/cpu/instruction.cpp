// ==============================================================================
// Hack Instruction Encoding Implementation
// ==============================================================================

#include "instruction.hpp"
#include <array>

namespace vmt {

namespace {

struct CompEntry {
    const char* mnemonic;
    uint8_t bits;
};

// Rows with a=1 are the a=0 rows with A replaced by M
constexpr std::array<CompEntry, 34> COMP_TABLE = {{
    {"0",   0b0101010}, {"1",   0b0111111}, {"-1",  0b0111010},
    {"D",   0b0001100}, {"A",   0b0110000}, {"M",   0b1110000},
    {"!D",  0b0001101}, {"!A",  0b0110001}, {"!M",  0b1110001},
    {"-D",  0b0001111}, {"-A",  0b0110011}, {"-M",  0b1110011},
    {"D+1", 0b0011111}, {"A+1", 0b0110111}, {"M+1", 0b1110111},
    {"D-1", 0b0001110}, {"A-1", 0b0110010}, {"M-1", 0b1110010},
    {"D+A", 0b0000010}, {"D+M", 0b1000010},
    {"D-A", 0b0010011}, {"D-M", 0b1010011},
    {"A-D", 0b0000111}, {"M-D", 0b1000111},
    {"D&A", 0b0000000}, {"D&M", 0b1000000},
    {"D|A", 0b0010101}, {"D|M", 0b1010101},
    // commuted spellings
    {"A+D", 0b0000010}, {"M+D", 0b1000010},
    {"A&D", 0b0000000}, {"M&D", 0b1000000},
    {"A|D", 0b0010101}, {"M|D", 0b1010101},
}};

constexpr std::array<const char*, 8> JUMP_TABLE = {{
    "", "JGT", "JEQ", "JGE", "JLT", "JNE", "JLE", "JMP"
}};

}  // namespace

std::optional<uint8_t> computation_bits(const std::string& comp) {
    for (const CompEntry& entry : COMP_TABLE) {
        if (comp == entry.mnemonic) {
            return entry.bits;
        }
    }
    return std::nullopt;
}

std::optional<uint8_t> destination_bits(const std::string& dest) {
    uint8_t bits = 0;
    for (char c : dest) {
        uint8_t flag = 0;
        switch (c) {
            case 'A': flag = 0b100; break;
            case 'D': flag = 0b010; break;
            case 'M': flag = 0b001; break;
            default:  return std::nullopt;
        }
        if (bits & flag) {
            return std::nullopt;  // Repeated letter
        }
        bits |= flag;
    }
    return bits;
}

std::optional<uint8_t> jump_bits(const std::string& jump) {
    for (size_t i = 0; i < JUMP_TABLE.size(); i++) {
        if (jump == JUMP_TABLE[i]) {
            return static_cast<uint8_t>(i);
        }
    }
    return std::nullopt;
}

bool is_valid_computation(uint8_t comp) {
    for (const CompEntry& entry : COMP_TABLE) {
        if (entry.bits == comp) {
            return true;
        }
    }
    return false;
}

Word encode_c_instruction(uint8_t comp, uint8_t dest, uint8_t jump) {
    return static_cast<Word>(HackBits::C_PREFIX |
                             ((comp & 0x7F) << 6) | ((dest & 0x7) << 3) | (jump & 0x7));
}

Word encode_a_instruction(Word value) {
    if (value > HackBits::MAX_VALUE) {
        throw ParseError(build_error_message(
            "A-instruction value ", value, " does not fit in 15 bits (max 32767)"));
    }
    return value;
}

}  // namespace vmt
