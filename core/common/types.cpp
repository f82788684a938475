// ==============================================================================
// Common Type Implementations
// ==============================================================================

#include "types.hpp"

namespace vmt {

const char* segment_to_string(SegmentType segment) {
    switch (segment) {
        case SegmentType::LOCAL:    return "local";
        case SegmentType::ARGUMENT: return "argument";
        case SegmentType::THIS:     return "this";
        case SegmentType::THAT:     return "that";
        case SegmentType::CONSTANT: return "constant";
        case SegmentType::STATIC:   return "static";
        case SegmentType::TEMP:     return "temp";
        case SegmentType::POINTER:  return "pointer";
        default:                    return "unknown";
    }
}

std::optional<SegmentType> segment_from_string(const std::string& name) {
    if (name == "local")    return SegmentType::LOCAL;
    if (name == "argument") return SegmentType::ARGUMENT;
    if (name == "this")     return SegmentType::THIS;
    if (name == "that")     return SegmentType::THAT;
    if (name == "constant") return SegmentType::CONSTANT;
    if (name == "static")   return SegmentType::STATIC;
    if (name == "temp")     return SegmentType::TEMP;
    if (name == "pointer")  return SegmentType::POINTER;
    return std::nullopt;
}

const char* arithmetic_op_to_string(ArithmeticOp op) {
    switch (op) {
        case ArithmeticOp::ADD: return "add";
        case ArithmeticOp::SUB: return "sub";
        case ArithmeticOp::NEG: return "neg";
        case ArithmeticOp::EQ:  return "eq";
        case ArithmeticOp::GT:  return "gt";
        case ArithmeticOp::LT:  return "lt";
        case ArithmeticOp::AND: return "and";
        case ArithmeticOp::OR:  return "or";
        case ArithmeticOp::NOT: return "not";
        default:                return "unknown";
    }
}

std::optional<ArithmeticOp> arithmetic_op_from_string(const std::string& name) {
    if (name == "add") return ArithmeticOp::ADD;
    if (name == "sub") return ArithmeticOp::SUB;
    if (name == "neg") return ArithmeticOp::NEG;
    if (name == "eq")  return ArithmeticOp::EQ;
    if (name == "gt")  return ArithmeticOp::GT;
    if (name == "lt")  return ArithmeticOp::LT;
    if (name == "and") return ArithmeticOp::AND;
    if (name == "or")  return ArithmeticOp::OR;
    if (name == "not") return ArithmeticOp::NOT;
    return std::nullopt;
}

const char* command_type_to_string(CommandType type) {
    switch (type) {
        case CommandType::ARITHMETIC: return "arithmetic";
        case CommandType::PUSH:       return "push";
        case CommandType::POP:        return "pop";
        case CommandType::LABEL:      return "label";
        case CommandType::GOTO:       return "goto";
        case CommandType::IF_GOTO:    return "if-goto";
        case CommandType::FUNCTION:   return "function";
        case CommandType::RETURN:     return "return";
        case CommandType::CALL:       return "call";
        default:                      return "unknown";
    }
}

}  // namespace vmt
