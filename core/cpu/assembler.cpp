// ==============================================================================
// Hack Assembler Implementation
// ==============================================================================

#include "assembler.hpp"
#include <cctype>
#include <sstream>

namespace vmt {

namespace {

bool is_number(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_symbol(const std::string& text) {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    for (char c : text) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '.' && c != '$' && c != ':') {
            return false;
        }
    }
    return true;
}

// One retained line and its position in the source
struct AsmLine {
    std::string text;
    LineNumber line;
};

}  // namespace

// ==============================================================================
// Assembly
// ==============================================================================

std::vector<Word> HackAssembler::assemble(const std::string& source,
                                          const std::string& source_name) {
    source_name_ = source_name;
    symbols_.clear();
    next_variable_ = HackAddress::STATIC_BASE;
    load_predefined_symbols();

    std::vector<AsmLine> lines;
    {
        std::istringstream stream(source);
        std::string raw;
        LineNumber line_number = 0;
        while (std::getline(stream, raw)) {
            line_number++;
            std::string text = strip_assembly_line(raw);
            if (!text.empty()) {
                lines.push_back(AsmLine{text, line_number});
            }
        }
    }

    // Pass 1: label addresses
    Address rom_address = 0;
    for (const AsmLine& line : lines) {
        if (line.text.front() != '(') {
            rom_address++;
            continue;
        }

        if (line.text.back() != ')' || line.text.size() < 3) {
            error(line.line, "Malformed label declaration: '" + line.text + "'");
        }
        std::string label = line.text.substr(1, line.text.size() - 2);
        if (!is_symbol(label)) {
            error(line.line, "Invalid label name: '" + label + "'");
        }
        if (symbols_.count(label) > 0) {
            error(line.line, "Duplicate label: '" + label + "'");
        }
        symbols_[label] = rom_address;
    }

    // Pass 2: encode
    std::vector<Word> program;
    program.reserve(rom_address);
    for (const AsmLine& line : lines) {
        if (line.text.front() == '(') {
            continue;
        }
        if (line.text.front() == '@') {
            program.push_back(assemble_a_instruction(line.text.substr(1), line.line));
        } else {
            program.push_back(assemble_c_instruction(line.text, line.line));
        }
    }

    return program;
}

std::optional<Address> HackAssembler::lookup(const std::string& symbol) const {
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void HackAssembler::load_predefined_symbols() {
    symbols_["SP"]   = HackAddress::SP;
    symbols_["LCL"]  = HackAddress::LCL;
    symbols_["ARG"]  = HackAddress::ARG;
    symbols_["THIS"] = HackAddress::THIS;
    symbols_["THAT"] = HackAddress::THAT;
    for (Address r = 0; r < 16; r++) {
        symbols_["R" + std::to_string(r)] = r;
    }
    symbols_["SCREEN"] = HackAddress::SCREEN_BASE;
    symbols_["KBD"]    = HackAddress::KEYBOARD;
}

// ==============================================================================
// Instruction Encoding
// ==============================================================================

Word HackAssembler::assemble_a_instruction(const std::string& operand, LineNumber line) {
    if (is_number(operand)) {
        if (operand.size() > 5 || std::stoul(operand) > 0x7FFF) {
            error(line, "A-instruction constant out of range (max 32767): @" + operand);
        }
        return encode_a_instruction(static_cast<Word>(std::stoul(operand)));
    }

    if (!is_symbol(operand)) {
        error(line, "Invalid A-instruction operand: '@" + operand + "'");
    }

    auto it = symbols_.find(operand);
    if (it != symbols_.end()) {
        return encode_a_instruction(it->second);
    }

    // First use of an unknown symbol declares a variable
    Address address = next_variable_++;
    symbols_[operand] = address;
    return encode_a_instruction(address);
}

Word HackAssembler::assemble_c_instruction(const std::string& text, LineNumber line) {
    // dest=comp;jump, dest and jump optional
    std::string dest_part;
    std::string comp_part = text;
    std::string jump_part;

    size_t eq = comp_part.find('=');
    if (eq != std::string::npos) {
        dest_part = comp_part.substr(0, eq);
        comp_part = comp_part.substr(eq + 1);
    }

    size_t semi = comp_part.find(';');
    if (semi != std::string::npos) {
        jump_part = comp_part.substr(semi + 1);
        comp_part = comp_part.substr(0, semi);
    }

    auto dest = destination_bits(dest_part);
    if (!dest.has_value() || (eq != std::string::npos && dest_part.empty())) {
        error(line, "Invalid destination '" + dest_part + "' in '" + text + "'");
    }

    auto comp = computation_bits(comp_part);
    if (!comp.has_value()) {
        error(line, "Invalid computation '" + comp_part + "' in '" + text + "'");
    }

    auto jump = jump_bits(jump_part);
    if (!jump.has_value() || (semi != std::string::npos && jump_part.empty())) {
        error(line, "Invalid jump '" + jump_part + "' in '" + text + "'");
    }

    return encode_c_instruction(*comp, *dest, *jump);
}

void HackAssembler::error(LineNumber line, const std::string& message) const {
    throw ParseError(source_name_, line, message);
}

// ==============================================================================
// Utility Functions
// ==============================================================================

std::string strip_assembly_line(const std::string& line) {
    std::string result;
    size_t comment_pos = line.find("//");
    size_t end = (comment_pos == std::string::npos) ? line.size() : comment_pos;

    for (size_t i = 0; i < end; i++) {
        if (!std::isspace(static_cast<unsigned char>(line[i]))) {
            result += line[i];
        }
    }
    return result;
}

}  // namespace vmt
