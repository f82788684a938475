// ==============================================================================
// Code Writer Tests
// ==============================================================================
// Checks the shape of the generated Blocks. Execution of the generated code
// is covered by vm_translator_test.
// ==============================================================================

#include "code_writer.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
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

static bool contains(const CodeWriter::Block& block, const std::string& line) {
    return std::find(block.begin(), block.end(), line) != block.end();
}

static size_t count_of(const CodeWriter::Block& block, const std::string& line) {
    return static_cast<size_t>(std::count(block.begin(), block.end(), line));
}

// ==============================================================================
// Prologue and Epilogue
// ==============================================================================

void test_prologue() {
    std::cout << "--- Prologue ---\n";

    CodeWriter writer;
    check(writer.program().size() == 1, "new writer holds only the prologue");

    const auto& prologue = writer.program()[0];
    check(prologue.size() == 5, "prologue is comment + 4 instructions");
    check(prologue[0] == "// initialize register values", "prologue comment");
    check(prologue[1] == "@256" && prologue[2] == "D=A", "prologue loads 256");
    check(prologue[3] == "@SP" && prologue[4] == "M=D", "prologue stores into SP");

    TranslatorConfig config;
    config.stack_base = 300;
    config.emit_comments = false;
    CodeWriter custom(config);
    check(custom.program()[0].size() == 4, "no prologue comment when comments off");
    check(custom.program()[0][0] == "@300", "custom stack base");

    TranslatorConfig boot;
    boot.bootstrap = true;
    CodeWriter bootstrapped(boot);
    const auto& block = bootstrapped.program()[0];
    check(contains(block, "@Sys.init"), "bootstrap jumps to Sys.init");
    check(contains(block, "(Bootstrap$ret.0)"), "bootstrap return label");
}

void test_close() {
    std::cout << "\n--- Close ---\n";

    CodeWriter writer;
    bool threw = false;
    try { writer.to_string(); } catch (const UsageError&) { threw = true; }
    check(threw, "output before close throws UsageError");

    writer.close();
    check(writer.is_closed(), "writer closed");
    check(writer.program().size() == 2, "epilogue appended");

    const auto& epilogue = writer.program().back();
    check(epilogue.size() == 3, "epilogue has 3 lines");
    check(epilogue[0] == "(END)" && epilogue[1] == "@END" && epilogue[2] == "0;JMP",
          "epilogue is (END) @END 0;JMP");

    writer.close();
    check(writer.program().size() == 2, "second close appends nothing");

    threw = false;
    try { writer.write_arithmetic("add"); } catch (const UsageError&) { threw = true; }
    check(threw, "write after close throws UsageError");

    std::string text = writer.to_string();
    check(text == "// initialize register values\n@256\nD=A\n@SP\nM=D\n(END)\n@END\n0;JMP\n",
          "empty program text");
    check(writer.instruction_count() == 6, "instruction count skips comments and labels");
}

// ==============================================================================
// Arithmetic
// ==============================================================================

void test_binary_block() {
    std::cout << "\n--- Binary Operators ---\n";

    CodeWriter writer;
    writer.write_arithmetic("add");
    const auto& block = writer.program().back();

    CodeWriter::Block expected = {
        "// add", "@SP", "AM=M-1", "D=M", "A=A-1", "M=D+M"
    };
    check(block == expected, "add block shape");

    writer.write_arithmetic("sub");
    check(writer.program().back().back() == "M=M-D", "sub computes x - y");
    writer.write_arithmetic("and");
    check(writer.program().back().back() == "M=D&M", "and");
    writer.write_arithmetic("or");
    check(writer.program().back().back() == "M=D|M", "or");
}

void test_unary_block() {
    std::cout << "\n--- Unary Operators ---\n";

    CodeWriter writer;
    writer.write_arithmetic("neg");
    CodeWriter::Block expected = {"// neg", "@SP", "A=M-1", "M=-M"};
    check(writer.program().back() == expected, "neg block shape");

    writer.write_arithmetic("not");
    check(writer.program().back().back() == "M=!M", "not");
}

void test_comparison_labels() {
    std::cout << "\n--- Comparison Labels ---\n";

    CodeWriter writer;
    writer.write_arithmetic("eq");
    writer.write_arithmetic("eq");
    writer.write_arithmetic("gt");
    writer.write_arithmetic("lt");

    const auto& program = writer.program();
    check(contains(program[1], "(EQ_TRUE_0)") && contains(program[1], "(EQ_END_0)"),
          "first eq uses counter 0");
    check(contains(program[2], "(EQ_TRUE_1)") && contains(program[2], "(EQ_END_1)"),
          "second eq uses counter 1");
    check(contains(program[3], "(GT_TRUE_2)") && contains(program[3], "D;JGT"),
          "gt uses counter 2 and JGT");
    check(contains(program[4], "(LT_TRUE_3)") && contains(program[4], "D;JLT"),
          "lt uses counter 3 and JLT");
    check(writer.comparison_count() == 4, "comparison counter advanced 4 times");

    check(contains(program[1], "M=-1") && contains(program[1], "M=0"),
          "comparison writes -1 or 0");
}

void test_invalid_operator() {
    std::cout << "\n--- Invalid Operator ---\n";

    CodeWriter writer;
    writer.write_arithmetic("add");
    size_t before = writer.program().size();

    for (const char* op : {"mul", "ADD", "", "push"}) {
        bool threw = false;
        try {
            writer.write_arithmetic(op);
        } catch (const InvalidOperatorError& e) {
            threw = true;
            check(e.category() == ErrorCategory::INVALID_OPERATOR, "category INVALID_OPERATOR");
        }
        check(threw, std::string("'") + op + "' throws InvalidOperatorError");
    }
    check(writer.program().size() == before, "rejected operators emit nothing");
    check(writer.comparison_count() == 0, "rejected operators leave the counter alone");
}

// ==============================================================================
// Memory Access
// ==============================================================================

void test_push_constant() {
    std::cout << "\n--- Push Constant ---\n";

    CodeWriter writer;
    writer.write_push_pop(CommandType::PUSH, "constant", 7);
    CodeWriter::Block expected = {
        "// push constant 7", "@7", "D=A", "@SP", "A=M", "M=D", "@SP", "M=M+1"
    };
    check(writer.program().back() == expected, "push constant block shape");
}

void test_fixed_segments() {
    std::cout << "\n--- Fixed Segments ---\n";

    CodeWriter writer;
    writer.write_push_pop(CommandType::PUSH, "temp", 3);
    check(contains(writer.program().back(), "@8"), "temp 3 is RAM[8]");
    check(contains(writer.program().back(), "D=M"), "temp push reads memory");

    writer.write_push_pop(CommandType::POP, "pointer", 1);
    const auto& pop = writer.program().back();
    check(contains(pop, "@4") && pop.back() == "M=D", "pop pointer 1 stores RAM[4]");

    writer.write_push_pop(CommandType::PUSH, "static", 2);
    check(contains(writer.program().back(), "@18"), "static 2 is RAM[18]");
}

void test_indirect_segments() {
    std::cout << "\n--- Pointer-Indirect Segments ---\n";

    CodeWriter writer;
    writer.write_push_pop(CommandType::PUSH, "local", 2);
    CodeWriter::Block expected = {
        "// push local 2", "@2", "D=A", "@LCL", "A=D+M", "D=M",
        "@SP", "A=M", "M=D", "@SP", "M=M+1"
    };
    check(writer.program().back() == expected, "push local block shape");

    writer.write_push_pop(CommandType::POP, "argument", 1);
    const auto& pop = writer.program().back();
    check(contains(pop, "@ARG") && contains(pop, "D=D+M"), "pop argument computes the address");
    check(count_of(pop, "@R13") == 2, "pop argument parks the address in R13");

    writer.write_push_pop(CommandType::PUSH, "this", 0);
    check(contains(writer.program().back(), "@THIS"), "this goes through THIS");
    writer.write_push_pop(CommandType::PUSH, "that", 0);
    check(contains(writer.program().back(), "@THAT"), "that goes through THAT");
}

void test_push_pop_errors() {
    std::cout << "\n--- Push/Pop Errors ---\n";

    CodeWriter writer;
    size_t before = writer.program().size();

    bool threw = false;
    try {
        writer.write_push_pop(CommandType::PUSH, "heap", 0);
    } catch (const UnknownSegmentError& e) {
        threw = true;
        check(e.category() == ErrorCategory::UNKNOWN_SEGMENT, "category UNKNOWN_SEGMENT");
    }
    check(threw, "unknown segment throws UnknownSegmentError");

    threw = false;
    try { writer.write_push_pop(CommandType::POP, "constant", 5); }
    catch (const InvalidArgumentError&) { threw = true; }
    check(threw, "pop constant throws InvalidArgumentError");

    threw = false;
    try { writer.write_push_pop(CommandType::PUSH, "temp", 8); }
    catch (const InvalidArgumentError&) { threw = true; }
    check(threw, "temp 8 is out of range");

    threw = false;
    try { writer.write_push_pop(CommandType::POP, "pointer", 2); }
    catch (const InvalidArgumentError&) { threw = true; }
    check(threw, "pointer 2 is out of range");

    threw = false;
    try { writer.write_push_pop(CommandType::ARITHMETIC, "constant", 1); }
    catch (const UsageError&) { threw = true; }
    check(threw, "non push/pop command throws UsageError");

    check(writer.program().size() == before, "rejected push/pop emit nothing");
}

// ==============================================================================
// Flow and Functions
// ==============================================================================

void test_flow_blocks() {
    std::cout << "\n--- Program Flow ---\n";

    CodeWriter writer;
    writer.write_label("LOOP");
    check(writer.program().back().back() == "(LOOP)", "top-level label is unscoped");

    writer.write_function("Main.main", 0);
    writer.write_label("LOOP");
    check(writer.program().back().back() == "(Main.main$LOOP)", "label scoped by function");

    writer.write_goto("LOOP");
    const auto& go = writer.program().back();
    check(go[1] == "@Main.main$LOOP" && go[2] == "0;JMP", "goto jumps unconditionally");

    writer.write_if("LOOP");
    const auto& branch = writer.program().back();
    check(contains(branch, "AM=M-1") && branch.back() == "D;JNE", "if-goto pops and tests");

    bool threw = false;
    try { writer.write_label("1BAD"); } catch (const InvalidArgumentError&) { threw = true; }
    check(threw, "label starting with a digit is rejected");
}

void test_generated_symbol_collisions() {
    std::cout << "\n--- Generated Symbol Collisions ---\n";

    CodeWriter writer;
    writer.write_arithmetic("eq");
    size_t before = writer.program().size();

    for (const char* label : {"END", "EQ_TRUE_0", "EQ_END_0", "GT_TRUE_7", "LT_END_12",
                              "SP", "THAT", "R0", "R15", "SCREEN", "KBD"}) {
        bool threw = false;
        try {
            writer.write_label(label);
        } catch (const InvalidArgumentError& e) {
            threw = true;
            check(e.category() == ErrorCategory::INVALID_ARGUMENT, "category INVALID_ARGUMENT");
        }
        check(threw, std::string("top-level label ") + label + " is rejected");
    }

    bool threw = false;
    try { writer.write_goto("END"); } catch (const InvalidArgumentError&) { threw = true; }
    check(threw, "top-level goto END is rejected");

    threw = false;
    try { writer.write_function("EQ_TRUE_1", 0); } catch (const InvalidArgumentError&) { threw = true; }
    check(threw, "function named like a comparison label is rejected");
    threw = false;
    try { writer.write_function("END", 0); } catch (const InvalidArgumentError&) { threw = true; }
    check(threw, "function named END is rejected");
    check(writer.program().size() == before, "rejected names emit nothing");

    // Near misses stay legal
    for (const char* label : {"ENDING", "EQ_TRUE", "EQ_TRUE_x", "R16", "R01", "END_1", "ret.0"}) {
        writer.write_label(label);
        check(writer.program().back().back() == std::string("(") + label + ")",
              std::string("top-level label ") + label + " accepted");
    }

    // Inside a function END is scoped away, but ret.<n> would shadow a return address
    writer.write_function("Main.main", 0);
    writer.write_label("END");
    check(writer.program().back().back() == "(Main.main$END)", "END inside a function is scoped");
    threw = false;
    try { writer.write_label("ret.0"); } catch (const InvalidArgumentError&) { threw = true; }
    check(threw, "ret.0 inside a function is rejected");
    writer.write_label("ret.x");
    check(writer.program().back().back() == "(Main.main$ret.x)", "ret.x inside a function accepted");
}

void test_function_blocks() {
    std::cout << "\n--- Function Protocol ---\n";

    TranslatorConfig config;
    config.emit_comments = false;
    CodeWriter writer(config);

    writer.write_function("Math.triple", 2);
    const auto& fn = writer.program().back();
    check(fn[0] == "(Math.triple)", "function entry label");
    check(count_of(fn, "M=0") == 2, "two locals zeroed");
    check(writer.current_function() == "Math.triple", "function scope set");

    writer.write_call("Math.double", 1);
    const auto& call = writer.program().back();
    check(call[0] == "@Math.triple$ret.0", "call pushes its return label first");
    check(call.back() == "(Math.triple$ret.0)", "call ends with the return label");
    check(contains(call, "@Math.double"), "call jumps to callee");

    writer.write_call("Math.double", 1);
    check(writer.program().back().back() == "(Math.triple$ret.1)", "return labels are unique");

    writer.write_return();
    const auto& ret = writer.program().back();
    check(contains(ret, "@R14") && ret.back() == "0;JMP", "return jumps through R14");
}

void test_variant_dispatch() {
    std::cout << "\n--- Variant Dispatch ---\n";

    CodeWriter writer;
    writer.write(PushCommand{"constant", 3, 1});
    writer.write(ArithmeticCommand{"neg", 2});
    writer.write(ReturnCommand{3});

    check(writer.program().size() == 4, "one Block per command");
    check(writer.program()[1][0] == "// push constant 3", "push dispatched");
    check(writer.program()[2][0] == "// neg", "arithmetic dispatched");
    check(writer.program()[3][0] == "// return", "return dispatched");
}

// ==============================================================================
// Main
// ==============================================================================

int main() {
    std::cout << "=== Code Writer Tests ===\n\n";

    test_prologue();
    test_close();
    test_binary_block();
    test_unary_block();
    test_comparison_labels();
    test_invalid_operator();
    test_push_constant();
    test_fixed_segments();
    test_indirect_segments();
    test_push_pop_errors();
    test_flow_blocks();
    test_generated_symbol_collisions();
    test_function_blocks();
    test_variant_dispatch();

    std::cout << "\n=== " << pass_count << "/" << test_count << " tests passed! ===\n";
    return 0;
}
