// ==============================================================================
// Hack CPU Engine Implementation
// ==============================================================================

#include "cpu.hpp"
#include "assembler.hpp"
#include <algorithm>

namespace vmt {

namespace {

// 0;JMP
constexpr Word IDLE_JUMP = 0xEA87;

bool jump_taken(Word instruction, Word out) {
    const auto value = static_cast<int16_t>(out);
    return (value < 0 && (instruction & HackBits::JUMP_LT)) ||
           (value == 0 && (instruction & HackBits::JUMP_EQ)) ||
           (value > 0 && (instruction & HackBits::JUMP_GT));
}

}  // namespace

Word hack_alu(uint8_t comp, Word x, Word y) {
    if (comp & 0b100000) x = 0;                          // zx
    if (comp & 0b010000) x = static_cast<Word>(~x);      // nx
    if (comp & 0b001000) y = 0;                          // zy
    if (comp & 0b000100) y = static_cast<Word>(~y);      // ny
    Word out = (comp & 0b000010) ? static_cast<Word>(x + y)
                                 : static_cast<Word>(x & y);  // f
    if (comp & 0b000001) out = static_cast<Word>(~out);  // no
    return out;
}

CPUEngine::CPUEngine()
    : ram_(HackAddress::RAM_SIZE, 0)
{}

// ==============================================================================
// Loading
// ==============================================================================

void CPUEngine::load(const std::vector<Word>& program) {
    if (program.size() > HackAddress::ROM_SIZE) {
        throw RuntimeError(build_error_message(
            "Program of ", program.size(), " words does not fit in ROM (",
            HackAddress::ROM_SIZE, " words)"));
    }

    for (size_t address = 0; address < program.size(); address++) {
        Word word = program[address];
        if ((word & 0x8000) && !is_valid_computation(static_cast<uint8_t>((word >> 6) & 0x7F))) {
            throw ParseError("<rom>", static_cast<LineNumber>(address + 1), build_error_message(
                "Word ", word, " at ROM[", address, "] has no valid ALU computation"));
        }
    }

    rom_ = program;
    reset();
}

void CPUEngine::load_assembly(const std::string& assembly, const std::string& source_name) {
    HackAssembler assembler;
    load(assembler.assemble(assembly, source_name));
}

void CPUEngine::reset() {
    std::fill(ram_.begin(), ram_.end(), 0);
    a_ = 0;
    d_ = 0;
    pc_ = 0;
    executed_ = 0;
    error_message_.clear();
    state_ = CPUState::READY;
}

// ==============================================================================
// Memory
// ==============================================================================

Word CPUEngine::read_ram(Address address) const {
    if (address >= ram_.size()) {
        throw RuntimeError(build_error_message("RAM read out of bounds: ", address));
    }
    return ram_[address];
}

void CPUEngine::write_ram(Address address, Word value) {
    if (address >= ram_.size()) {
        throw RuntimeError(build_error_message("RAM write out of bounds: ", address));
    }
    ram_[address] = value;
}

// ==============================================================================
// Execution
// ==============================================================================

bool CPUEngine::at_halt() const {
    if (pc_ >= rom_.size()) {
        return true;
    }
    return pc_ + 1u < rom_.size() && rom_[pc_] == pc_ && rom_[pc_ + 1] == IDLE_JUMP;
}

CPUState CPUEngine::run_for(uint64_t max_instructions) {
    if (state_ == CPUState::HALTED || state_ == CPUState::ERROR) {
        return state_;
    }

    for (uint64_t count = 0; count < max_instructions; count++) {
        if (at_halt()) {
            state_ = CPUState::HALTED;
            return state_;
        }
        try {
            execute(rom_[pc_]);
        } catch (const RuntimeError& e) {
            error_message_ = build_error_message(e.what(), " (PC=", pc_, ")");
            state_ = CPUState::ERROR;
            return state_;
        }
        executed_++;
    }

    state_ = at_halt() ? CPUState::HALTED : CPUState::PAUSED;
    return state_;
}

void CPUEngine::execute(Word instruction) {
    if (!(instruction & 0x8000)) {
        a_ = instruction;
        pc_++;
        return;
    }

    const bool uses_m = (instruction & HackBits::A_BIT) != 0;
    const Word y = uses_m ? read_ram(a_) : a_;
    const Word out = hack_alu(static_cast<uint8_t>((instruction >> 6) & 0x3F), d_, y);

    // M and the jump target both use A as it was before this instruction
    const Address old_a = a_;
    if (instruction & HackBits::DEST_M) write_ram(old_a, out);
    if (instruction & HackBits::DEST_A) a_ = out;
    if (instruction & HackBits::DEST_D) d_ = out;

    pc_ = jump_taken(instruction, out) ? old_a : static_cast<Address>(pc_ + 1);
}

}  // namespace vmt
