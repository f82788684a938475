// ==============================================================================
// Hack CPU Engine
// ==============================================================================
// Runs assembled translator output on the Hack machine: 32K words of ROM,
// 32K words of RAM, and the A, D, and PC registers.
//
// Translated programs end in the idle loop (END) @END 0;JMP. The engine
// stops with HALTED when PC reaches such a loop (or runs off the program)
// rather than spinning until the instruction budget runs out.
// ==============================================================================

#ifndef VMTRANSLATOR_CPU_HPP
#define VMTRANSLATOR_CPU_HPP

#include "instruction.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vmt {

enum class CPUState {
    READY,      // Program loaded, nothing executed yet
    PAUSED,     // Instruction budget used up before halting
    HALTED,     // Reached an idle loop or the end of the program
    ERROR       // Memory access outside RAM
};

/**
 * @brief Hack CPU used to check translator output by running it.
 *
 * Usage:
 *   CPUEngine cpu;
 *   cpu.load_assembly(translate_string("push constant 7\n"));
 *   cpu.run_for(10000);
 *   Word top = cpu.read_ram(cpu.read_ram(0) - 1);
 */
class CPUEngine {
public:
    CPUEngine();

    /**
     * @brief Replace ROM with a program and reset the machine.
     *
     * @throws ParseError if a word has no valid ALU computation
     * @throws RuntimeError if the program does not fit in ROM
     */
    void load(const std::vector<Word>& program);

    /**
     * @brief Assemble Hack assembly text and load the result.
     *
     * @throws ParseError if the assembly is malformed
     */
    void load_assembly(const std::string& assembly,
                       const std::string& source_name = "<asm>");

    /**
     * @brief Zero registers and RAM; the loaded program stays.
     */
    void reset();

    /**
     * @brief Execute until halt, error, or max_instructions have run.
     *
     * Resumes a PAUSED machine. A HALTED or ERROR machine is left as is.
     */
    CPUState run_for(uint64_t max_instructions);

    CPUState get_state() const { return state_; }

    Word get_a() const { return a_; }
    Word get_d() const { return d_; }
    Address get_pc() const { return pc_; }

    /// @throws RuntimeError if address is outside RAM
    Word read_ram(Address address) const;
    /// @throws RuntimeError if address is outside RAM
    void write_ram(Address address, Word value);

    size_t rom_size() const { return rom_.size(); }
    uint64_t instructions_executed() const { return executed_; }
    const std::string& get_error_message() const { return error_message_; }

private:
    std::vector<Word> rom_;
    std::vector<Word> ram_;

    Word a_ = 0;
    Word d_ = 0;
    Address pc_ = 0;

    CPUState state_ = CPUState::READY;
    uint64_t executed_ = 0;
    std::string error_message_;

    bool at_halt() const;
    void execute(Word instruction);
};

/**
 * @brief The Hack ALU: apply a 7-bit comp field to D and A (or M).
 *
 * Evaluates the zx, nx, zy, ny, f, no control bits in order; the a bit only
 * selects which operand the caller passes as y.
 */
Word hack_alu(uint8_t comp, Word x, Word y);

}  // namespace vmt

#endif  // VMTRANSLATOR_CPU_HPP
