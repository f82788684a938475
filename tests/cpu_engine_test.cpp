// ==============================================================================
// CPU Engine Tests
// ==============================================================================
// The Hack toolchain the translator tests run their output on: field
// encoding, the two-pass assembler, and the CPU engine.
// ==============================================================================

#include "cpu.hpp"
#include "assembler.hpp"
#include "instruction.hpp"
#include <iostream>
#include <cassert>

using namespace vmt;

static int test_count = 0;
static int pass_count = 0;

static void check(bool condition, const std::string& name) {
    test_count++;
    if (condition) {
        pass_count++;
        std::cout << "PASS: " << name << std::endl;
    } else {
        std::cout << "FAIL: " << name << std::endl;
        assert(false);
    }
}

// ==============================================================================
// Field Encoding
// ==============================================================================

void test_encode() {
    std::cout << "--- Field Encoding ---\n";

    check(encode_a_instruction(5) == 0b0000000000000101, "encode @5");
    check(encode_a_instruction(32767) == 0x7FFF, "encode @32767");

    bool threw = false;
    try { encode_a_instruction(32768); } catch (const ParseError&) { threw = true; }
    check(threw, "encode @32768 throws ParseError");

    auto comp = computation_bits("D+M");
    auto dest = destination_bits("M");
    auto jump = jump_bits("");
    check(comp.has_value() && dest.has_value() && jump.has_value(), "M=D+M fields parse");
    check(encode_c_instruction(*comp, *dest, *jump) == 0b1111000010001000, "encode M=D+M");
    check(encode_c_instruction(*computation_bits("0"), 0, *jump_bits("JMP")) == 0xEA87,
          "encode 0;JMP");

    check(computation_bits("M+D") == computation_bits("D+M"), "M+D is an alias of D+M");
    check(computation_bits("A&D") == computation_bits("D&A"), "A&D is an alias of D&A");
    check(!computation_bits("D*M").has_value(), "D*M is not an ALU op");

    check(destination_bits("MD") == uint8_t{0b011}, "dest MD");
    check(destination_bits("DM") == uint8_t{0b011}, "dest letters in any order");
    check(destination_bits("AMD") == uint8_t{0b111}, "dest AMD");
    check(!destination_bits("MM").has_value(), "repeated dest letter rejected");
    check(!destination_bits("X").has_value(), "unknown dest letter rejected");

    check(jump_bits("JLE") == uint8_t{0b110}, "jump JLE");
    check(!jump_bits("JXX").has_value(), "unknown jump rejected");

    check(is_valid_computation(0b1110111), "M+1 is a valid comp field");
    check(!is_valid_computation(0b1111111), "a=1 with the 1 pattern is not");
}

// ==============================================================================
// Assembler Tests
// ==============================================================================

void test_assembler() {
    std::cout << "\n--- Assembler ---\n";

    HackAssembler assembler;
    auto program = assembler.assemble(
        "// Adds 2 and 3\n"
        "@2\n"
        "D=A\n"
        "@3\n"
        "D = D + A   // spaces are ignored\n"
        "@0\n"
        "M=D\n");
    check(program.size() == 6, "6 instructions, comments dropped");
    check(program[0] == 0b0000000000000010, "@2");
    check(program[3] == 0b1110000010010000, "D=D+A with spaces");
    check(program[5] == 0b1110001100001000, "M=D");

    program = assembler.assemble(
        "@SP\n"
        "M=M+1\n"
        "(LOOP)\n"
        "@LOOP\n"
        "0;JMP\n"
        "@counter\n"
        "@other\n"
        "@counter\n"
        "@SCREEN\n"
        "@R13\n");
    check(program[0] == 0, "@SP is RAM[0]");
    check(assembler.lookup("LOOP") == Address{2}, "label bound to the next instruction");
    check(program[2] == 2, "@LOOP resolves forward to 2");
    check(program[4] == 16 && program[5] == 17, "variables allocated from 16");
    check(program[6] == 16, "variable reused on second reference");
    check(program[7] == HackAddress::SCREEN_BASE, "@SCREEN predefined");
    check(program[8] == 13, "@R13 predefined");

    // Forward reference to a label declared later
    program = assembler.assemble("@END\n0;JMP\n(END)\n@END\n0;JMP\n");
    check(program[0] == 2, "forward label reference");

    bool threw = false;
    try {
        assembler.assemble("@1\nD=X\n", "Bad.asm");
    } catch (const ParseError& e) {
        threw = true;
        check(e.line() == 2 && e.file() == "Bad.asm", "assembler error located");
    }
    check(threw, "invalid computation throws ParseError");

    threw = false;
    try { assembler.assemble("(A)\n(A)\n"); } catch (const ParseError&) { threw = true; }
    check(threw, "duplicate label throws ParseError");

    threw = false;
    try { assembler.assemble("@32768\n"); } catch (const ParseError&) { threw = true; }
    check(threw, "constant out of range throws ParseError");

    check(strip_assembly_line("  A = M - 1 // comment") == "A=M-1", "strip_assembly_line");
}

// ==============================================================================
// ALU
// ==============================================================================

void test_alu() {
    std::cout << "\n--- ALU ---\n";

    const Word d = 12;
    const Word a = 5;
    auto alu = [&](const char* mnemonic) {
        return hack_alu(static_cast<uint8_t>(*computation_bits(mnemonic) & 0x3F), d, a);
    };

    check(alu("0") == 0 && alu("1") == 1 && alu("-1") == 0xFFFF, "constants");
    check(alu("D") == 12 && alu("A") == 5, "pass-through");
    check(alu("!D") == static_cast<Word>(~12), "!D");
    check(alu("-A") == static_cast<Word>(-5), "-A");
    check(alu("D+1") == 13 && alu("A-1") == 4, "increment and decrement");
    check(alu("D+A") == 17 && alu("D-A") == 7, "D+A and D-A");
    check(alu("A-D") == static_cast<Word>(-7), "A-D wraps below zero");
    check(alu("D&A") == (12 & 5) && alu("D|A") == (12 | 5), "bitwise and/or");
    check(hack_alu(0b000010, 0x7FFF, 1) == 0x8000, "16-bit addition wraps");
}

// ==============================================================================
// CPU Engine
// ==============================================================================

void test_cpu_arithmetic() {
    std::cout << "\n--- CPU Arithmetic ---\n";

    CPUEngine cpu;
    check(cpu.get_state() == CPUState::READY, "new engine is READY");

    cpu.load_assembly("@7\nD=A\n@8\nD=D+A\n@0\nM=D\n");
    check(cpu.rom_size() == 6, "six words loaded");
    check(cpu.run_for(100) == CPUState::HALTED, "runs off the end and halts");
    check(cpu.read_ram(0) == 15, "RAM[0] = 7 + 8");
    check(cpu.get_d() == 15 && cpu.get_a() == 0, "registers after the run");
    check(cpu.instructions_executed() == 6, "six instructions executed");

    cpu.load_assembly("@3\nD=-A\n@1\nM=D\nM=M-1\n");
    cpu.run_for(100);
    check(cpu.read_ram(1) == static_cast<Word>(-4), "negative values are two's complement");
}

void test_cpu_jumps() {
    std::cout << "\n--- CPU Jumps ---\n";

    // RAM[1] = 1 only when RAM[0] > 0
    const char* program =
        "@0\nD=M\n@SKIP\nD;JLE\n@1\nM=1\n(SKIP)\n@SKIP\n0;JMP\n";

    CPUEngine cpu;
    cpu.load_assembly(program);
    cpu.write_ram(0, 3);
    check(cpu.run_for(100) == CPUState::HALTED, "positive: halts at SKIP");
    check(cpu.read_ram(1) == 1, "positive: JLE not taken");

    cpu.load_assembly(program);
    cpu.write_ram(0, static_cast<Word>(-3));
    cpu.run_for(100);
    check(cpu.read_ram(1) == 0, "negative: JLE taken");
    check(cpu.get_pc() == 6, "halted at the idle loop head");

    // A=D;JMP jumps through the old A, not the new one
    cpu.load_assembly("@4\nD=A\n@6\nA=D;JMP\n@2\nM=1\n@0\nM=1\n");
    cpu.run_for(100);
    check(cpu.read_ram(0) == 1 && cpu.read_ram(2) == 0, "jump target is A before the write");
}

void test_cpu_countdown() {
    std::cout << "\n--- CPU Countdown Loop ---\n";

    CPUEngine cpu;
    cpu.load_assembly(
        "@3\nD=A\n@0\nM=D\n"
        "(LOOP)\n"
        "@0\nMD=M-1\n@LOOP\nD;JGT\n"
        "(END)\n@END\n0;JMP\n");
    check(cpu.run_for(1000) == CPUState::HALTED, "countdown halts at END");
    check(cpu.read_ram(0) == 0, "counter reaches 0");
    check(cpu.get_pc() == 8, "PC rests on the END head");
    check(cpu.instructions_executed() == 4 + 3 * 4, "4 setup + 3 loop passes");
}

void test_cpu_budget_and_reset() {
    std::cout << "\n--- CPU Budget and Reset ---\n";

    CPUEngine cpu;
    // Spins through a two-instruction loop the idle check does not match
    cpu.load_assembly("(SPIN)\n@0\nM=M+1\n@SPIN\n0;JMP\n");
    check(cpu.run_for(10) == CPUState::PAUSED, "budget exhausted leaves PAUSED");
    check(cpu.instructions_executed() == 10, "exactly the budget executed");
    cpu.run_for(10);
    check(cpu.read_ram(0) == 5, "run_for resumes a PAUSED engine");

    cpu.reset();
    check(cpu.get_state() == CPUState::READY && cpu.read_ram(0) == 0, "reset clears RAM");
    check(cpu.get_pc() == 0 && cpu.rom_size() == 4, "reset keeps the program");

    cpu.load_assembly("@5\n");
    cpu.run_for(10);
    check(cpu.run_for(10) == CPUState::HALTED, "a HALTED engine stays halted");
}

void test_cpu_errors() {
    std::cout << "\n--- CPU Errors ---\n";

    CPUEngine cpu;

    bool threw = false;
    try { cpu.load({0xFFC0}); } catch (const ParseError&) { threw = true; }
    check(threw, "word with an invalid comp field rejected at load");

    threw = false;
    try { cpu.load(std::vector<Word>(HackAddress::ROM_SIZE + 1, 0)); } catch (const RuntimeError&) { threw = true; }
    check(threw, "program larger than ROM rejected");

    cpu.load(std::vector<Word>(HackAddress::ROM_SIZE, 0));
    check(cpu.rom_size() == HackAddress::ROM_SIZE, "program filling ROM accepted");

    threw = false;
    try { cpu.read_ram(static_cast<Address>(HackAddress::RAM_SIZE)); } catch (const RuntimeError&) { threw = true; }
    check(threw, "read_ram past RAM throws RuntimeError");

    // A = -1 (65535) is past the end of RAM
    cpu.load_assembly("A=-1\nM=1\n");
    check(cpu.run_for(10) == CPUState::ERROR, "out-of-range M write stops with ERROR");
    check(cpu.get_error_message().find("65535") != std::string::npos, "error names the address");
    check(cpu.run_for(10) == CPUState::ERROR, "ERROR is sticky");
}

// ==============================================================================
// Main
// ==============================================================================

int main() {
    std::cout << "=== CPU Engine Tests ===\n\n";

    test_encode();
    test_assembler();
    test_alu();
    test_cpu_arithmetic();
    test_cpu_jumps();
    test_cpu_countdown();
    test_cpu_budget_and_reset();
    test_cpu_errors();

    std::cout << "\n=== " << pass_count << "/" << test_count << " tests passed! ===\n";
    return 0;
}
