// ==============================================================================
// Hack Code Writer Implementation
// ==============================================================================

#include "code_writer.hpp"
#include <cctype>
#include <sstream>
#include <type_traits>

namespace vmt {

namespace {

// Jump condition that makes x - y select the true branch
const char* comparison_jump(ArithmeticOp op) {
    switch (op) {
        case ArithmeticOp::EQ: return "JEQ";
        case ArithmeticOp::GT: return "JGT";
        case ArithmeticOp::LT: return "JLT";
        default:               return nullptr;
    }
}

std::string upper(const std::string& text) {
    std::string result = text;
    for (char& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

// Terminal label of the halting epilogue
constexpr const char* END_LABEL = "END";

bool all_digits(const std::string& text, size_t from) {
    if (from >= text.size()) return false;
    for (size_t i = from; i < text.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

// Names the emitted program already defines at top level: the epilogue
// label, the comparison label pairs and the assembler's register symbols.
bool is_reserved_symbol(const std::string& name) {
    if (name == END_LABEL) return true;

    for (const char* reg : {"SP", "LCL", "ARG", "THIS", "THAT", "SCREEN", "KBD"}) {
        if (name == reg) return true;
    }
    // R0-R15
    if (name.size() <= 3 && name[0] == 'R' && all_digits(name, 1)) {
        return name.size() == 2 || (name[1] == '1' && name[2] <= '5');
    }

    for (const char* stem : {"EQ", "GT", "LT"}) {
        for (const char* part : {"_TRUE_", "_END_"}) {
            const std::string prefix = std::string(stem) + part;
            if (name.compare(0, prefix.size(), prefix) == 0 && all_digits(name, prefix.size())) {
                return true;
            }
        }
    }
    return false;
}

// ret.<n> inside a function scopes to <fn>$ret.<n>, a return address label
bool is_return_suffix(const std::string& label) {
    return label.compare(0, 4, "ret.") == 0 && all_digits(label, 4);
}

}  // namespace

// ==============================================================================
// Construction
// ==============================================================================

CodeWriter::CodeWriter(const TranslatorConfig& config)
    : config_(config)
{
    begin_block("initialize register values");
    emit("@" + std::to_string(config_.stack_base));
    emit("D=A");
    emit("@SP");
    emit("M=D");

    if (config_.bootstrap) {
        emit_call("Sys.init", 0);
    }

    commit_block();
}

// ==============================================================================
// Stack Arithmetic
// ==============================================================================

void CodeWriter::write_arithmetic(const std::string& command) {
    require_open("write_arithmetic");

    auto op = arithmetic_op_from_string(command);
    if (!op.has_value()) {
        throw InvalidOperatorError("Unknown arithmetic operation: '" + command +
            "'. Expected one of: add, sub, neg, eq, gt, lt, and, or, not");
    }

    begin_block(command);

    switch (*op) {
        case ArithmeticOp::ADD: emit_binary("D+M"); break;
        case ArithmeticOp::SUB: emit_binary("M-D"); break;
        case ArithmeticOp::AND: emit_binary("D&M"); break;
        case ArithmeticOp::OR:  emit_binary("D|M"); break;
        case ArithmeticOp::NEG: emit_unary("-M");   break;
        case ArithmeticOp::NOT: emit_unary("!M");   break;
        case ArithmeticOp::EQ:
        case ArithmeticOp::GT:
        case ArithmeticOp::LT:
            emit_comparison(*op);
            break;
    }

    commit_block();
}

void CodeWriter::emit_binary(const char* computation) {
    // y -> D, then combine into x's slot in place; SP ends one lower
    emit_pop_to_d();
    emit("A=A-1");
    emit(std::string("M=") + computation);
}

void CodeWriter::emit_unary(const char* computation) {
    emit("@SP");
    emit("A=M-1");
    emit(std::string("M=") + computation);
}

void CodeWriter::emit_comparison(ArithmeticOp op) {
    const std::string stem = upper(arithmetic_op_to_string(op));
    const std::string n = std::to_string(comparison_counter_);
    const std::string true_label = stem + "_TRUE_" + n;
    const std::string end_label = stem + "_END_" + n;

    // D = y
    emit_pop_to_d();

    // D = x - y, SP now at x's slot
    emit("@SP");
    emit("AM=M-1");
    emit("D=M-D");

    emit("@" + true_label);
    emit(std::string("D;") + comparison_jump(op));

    // false unless the jump was taken
    emit("@SP");
    emit("A=M");
    emit("M=0");
    emit("@" + end_label);
    emit("0;JMP");

    emit("(" + true_label + ")");
    emit("@SP");
    emit("A=M");
    emit("M=-1");

    emit("(" + end_label + ")");
    emit("@SP");
    emit("M=M+1");

    comparison_counter_++;
}

// ==============================================================================
// Memory Access
// ==============================================================================

void CodeWriter::write_push_pop(CommandType command, const std::string& segment, uint16_t index) {
    require_open("write_push_pop");

    if (command != CommandType::PUSH && command != CommandType::POP) {
        throw UsageError(std::string("write_push_pop() needs push or pop, got ") +
                         command_type_to_string(command));
    }

    SegmentInfo info = resolve_segment(segment);
    if (command == CommandType::POP && info.type == SegmentType::CONSTANT) {
        throw InvalidArgumentError(build_error_message(
            "Cannot pop to constant segment (constants are read-only): pop constant ", index));
    }
    check_segment_index(info, index);

    begin_block((command == CommandType::PUSH ? "push " : "pop ") + segment +
                " " + std::to_string(index));
    if (command == CommandType::PUSH) {
        emit_push(info, index);
    } else {
        emit_pop(info, index);
    }
    commit_block();
}

void CodeWriter::emit_push(const SegmentInfo& segment, uint16_t index) {
    std::visit([&](const auto& location) {
        using T = std::decay_t<decltype(location)>;

        if constexpr (std::is_same_v<T, ConstantSegment>) {
            emit("@" + std::to_string(index));
            emit("D=A");
        } else if constexpr (std::is_same_v<T, FixedAbsolute>) {
            emit("@" + std::to_string(location.base + index));
            emit("D=M");
        } else {
            static_assert(std::is_same_v<T, PointerIndirect>, "unhandled segment location");
            emit("@" + std::to_string(index));
            emit("D=A");
            emit(std::string("@") + location.base_register);
            emit("A=D+M");
            emit("D=M");
        }
    }, segment.location);

    emit_push_d();
}

void CodeWriter::emit_pop(const SegmentInfo& segment, uint16_t index) {
    std::visit([&](const auto& location) {
        using T = std::decay_t<decltype(location)>;

        if constexpr (std::is_same_v<T, ConstantSegment>) {
            throw InternalError("emit_pop reached the constant segment");
        } else if constexpr (std::is_same_v<T, FixedAbsolute>) {
            emit_pop_to_d();
            emit("@" + std::to_string(location.base + index));
            emit("M=D");
        } else {
            static_assert(std::is_same_v<T, PointerIndirect>, "unhandled segment location");
            // Target address is only known at runtime; park it in R13
            emit("@" + std::to_string(index));
            emit("D=A");
            emit(std::string("@") + location.base_register);
            emit("D=D+M");
            emit("@R13");
            emit("M=D");
            emit_pop_to_d();
            emit("@R13");
            emit("A=M");
            emit("M=D");
        }
    }, segment.location);
}

void CodeWriter::emit_pop_to_d() {
    emit("@SP");
    emit("AM=M-1");
    emit("D=M");
}

void CodeWriter::emit_push_d() {
    emit("@SP");
    emit("A=M");
    emit("M=D");
    emit("@SP");
    emit("M=M+1");
}

// ==============================================================================
// Program Flow
// ==============================================================================

void CodeWriter::write_label(const std::string& label) {
    require_open("write_label");
    check_label(label);

    begin_block("label " + label);
    emit("(" + scoped_label(label) + ")");
    commit_block();
}

void CodeWriter::write_goto(const std::string& label) {
    require_open("write_goto");
    check_label(label);

    begin_block("goto " + label);
    emit("@" + scoped_label(label));
    emit("0;JMP");
    commit_block();
}

void CodeWriter::write_if(const std::string& label) {
    require_open("write_if");
    check_label(label);

    begin_block("if-goto " + label);
    emit_pop_to_d();
    emit("@" + scoped_label(label));
    emit("D;JNE");
    commit_block();
}

std::string CodeWriter::scoped_label(const std::string& label) const {
    if (current_function_.empty()) {
        return label;
    }
    return current_function_ + "$" + label;
}

void CodeWriter::check_label(const std::string& label) const {
    if (!is_valid_label(label)) {
        throw InvalidArgumentError("Invalid label name: '" + label +
            "'. Labels must start with a letter, _, :, or . and contain only letters, digits, _, :, and .");
    }
    if (current_function_.empty() ? is_reserved_symbol(label) : is_return_suffix(label)) {
        throw InvalidArgumentError("Label '" + label + "' collides with a generated symbol" +
            (current_function_.empty() ? std::string() : " in " + current_function_));
    }
}

// ==============================================================================
// Function Protocol
// ==============================================================================

void CodeWriter::write_function(const std::string& name, uint16_t num_locals) {
    require_open("write_function");
    check_function_name(name);

    begin_block("function " + name + " " + std::to_string(num_locals));
    current_function_ = name;
    emit("(" + name + ")");
    for (uint16_t i = 0; i < num_locals; i++) {
        emit("@SP");
        emit("A=M");
        emit("M=0");
        emit("@SP");
        emit("M=M+1");
    }
    commit_block();
}

void CodeWriter::write_call(const std::string& name, uint16_t num_args) {
    require_open("write_call");
    check_function_name(name);

    begin_block("call " + name + " " + std::to_string(num_args));
    emit_call(name, num_args);
    commit_block();
}

void CodeWriter::emit_call(const std::string& name, uint16_t num_args) {
    const std::string return_label = next_return_label();

    // push return-address
    emit("@" + return_label);
    emit("D=A");
    emit_push_d();

    // push LCL, ARG, THIS, THAT
    for (const char* reg : {"LCL", "ARG", "THIS", "THAT"}) {
        emit(std::string("@") + reg);
        emit("D=M");
        emit_push_d();
    }

    // ARG = SP - 5 - nArgs
    emit("@SP");
    emit("D=M");
    emit("@5");
    emit("D=D-A");
    emit("@" + std::to_string(num_args));
    emit("D=D-A");
    emit("@ARG");
    emit("M=D");

    // LCL = SP
    emit("@SP");
    emit("D=M");
    emit("@LCL");
    emit("M=D");

    emit("@" + name);
    emit("0;JMP");
    emit("(" + return_label + ")");
}

void CodeWriter::write_return() {
    require_open("write_return");

    begin_block("return");

    // R13 = frame = LCL
    emit("@LCL");
    emit("D=M");
    emit("@R13");
    emit("M=D");

    // R14 = *(frame - 5), read before ARG[0] may overwrite it
    emit("@5");
    emit("A=D-A");
    emit("D=M");
    emit("@R14");
    emit("M=D");

    // *ARG = pop()
    emit_pop_to_d();
    emit("@ARG");
    emit("A=M");
    emit("M=D");

    // SP = ARG + 1
    emit("@ARG");
    emit("D=M+1");
    emit("@SP");
    emit("M=D");

    // THAT, THIS, ARG, LCL = *(frame-1) .. *(frame-4)
    for (const char* reg : {"THAT", "THIS", "ARG", "LCL"}) {
        emit("@R13");
        emit("AM=M-1");
        emit("D=M");
        emit(std::string("@") + reg);
        emit("M=D");
    }

    emit("@R14");
    emit("A=M");
    emit("0;JMP");

    commit_block();
}

std::string CodeWriter::next_return_label() {
    const std::string caller = current_function_.empty() ? "Bootstrap" : current_function_;
    return caller + "$ret." + std::to_string(return_counter_++);
}

void CodeWriter::check_function_name(const std::string& name) const {
    if (!is_valid_identifier(name)) {
        throw InvalidArgumentError("Invalid function name: '" + name + "'");
    }
    if (is_reserved_symbol(name)) {
        throw InvalidArgumentError("Function name '" + name + "' collides with a generated symbol");
    }
}

// ==============================================================================
// Variant Dispatch
// ==============================================================================

namespace {

// One overload per VMCommand alternative. A new alternative without an
// overload here is a compile error.
struct CommandDispatcher {
    CodeWriter& writer;

    void operator()(const ArithmeticCommand& c) const {
        writer.write_arithmetic(c.operation);
    }
    void operator()(const PushCommand& c) const {
        writer.write_push_pop(CommandType::PUSH, c.segment, c.index);
    }
    void operator()(const PopCommand& c) const {
        writer.write_push_pop(CommandType::POP, c.segment, c.index);
    }
    void operator()(const LabelCommand& c) const {
        writer.write_label(c.label_name);
    }
    void operator()(const GotoCommand& c) const {
        writer.write_goto(c.label_name);
    }
    void operator()(const IfGotoCommand& c) const {
        writer.write_if(c.label_name);
    }
    void operator()(const FunctionCommand& c) const {
        writer.write_function(c.function_name, c.num_locals);
    }
    void operator()(const CallCommand& c) const {
        writer.write_call(c.function_name, c.num_args);
    }
    void operator()(const ReturnCommand&) const {
        writer.write_return();
    }
};

}  // namespace

void CodeWriter::write(const VMCommand& command) {
    std::visit(CommandDispatcher{*this}, command);
}

// ==============================================================================
// Finalization and Output
// ==============================================================================

void CodeWriter::close() {
    if (closed_) {
        return;
    }

    // (END) @END 0;JMP spins forever; the emulator treats it as halt
    block_.clear();
    emit(std::string("(") + END_LABEL + ")");
    emit(std::string("@") + END_LABEL);
    emit("0;JMP");
    commit_block();

    closed_ = true;
}

void CodeWriter::write_to(std::ostream& out) const {
    if (!closed_) {
        throw UsageError("write_to() called before close(); the program has no epilogue yet");
    }

    for (const Block& block : program_) {
        for (const std::string& line : block) {
            out << line << '\n';
        }
    }
    out.flush();

    if (!out) {
        throw FileError("Failed writing assembly output");
    }
}

std::string CodeWriter::to_string() const {
    std::ostringstream oss;
    write_to(oss);
    return oss.str();
}

size_t CodeWriter::instruction_count() const {
    size_t count = 0;
    for (const Block& block : program_) {
        for (const std::string& line : block) {
            if (line.rfind("//", 0) == 0 || line.front() == '(') {
                continue;
            }
            count++;
        }
    }
    return count;
}

// ==============================================================================
// Block Assembly
// ==============================================================================

void CodeWriter::begin_block(const std::string& comment) {
    block_.clear();
    if (config_.emit_comments) {
        block_.push_back("// " + comment);
    }
}

void CodeWriter::emit(const std::string& line) {
    block_.push_back(line);
}

void CodeWriter::commit_block() {
    program_.push_back(std::move(block_));
    block_.clear();
}

void CodeWriter::require_open(const char* operation) const {
    if (closed_) {
        throw UsageError(std::string(operation) + "() called after close()");
    }
}

}  // namespace vmt
