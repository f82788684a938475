// ==============================================================================
// VM Segment Table Implementation
// ==============================================================================

#include "segment_table.hpp"

namespace vmt {

SegmentInfo describe_segment(SegmentType segment) {
    switch (segment) {
        case SegmentType::LOCAL:
            return {segment, PointerIndirect{"LCL"}, 32767};
        case SegmentType::ARGUMENT:
            return {segment, PointerIndirect{"ARG"}, 32767};
        case SegmentType::THIS:
            return {segment, PointerIndirect{"THIS"}, 32767};
        case SegmentType::THAT:
            return {segment, PointerIndirect{"THAT"}, 32767};
        case SegmentType::CONSTANT:
            return {segment, ConstantSegment{}, 32767};
        case SegmentType::STATIC:
            // RAM[16..255]; the stack starts at 256
            return {segment, FixedAbsolute{HackAddress::STATIC_BASE},
                    HackAddress::STACK_BASE - HackAddress::STATIC_BASE - 1};
        case SegmentType::TEMP:
            // RAM[5..12]
            return {segment, FixedAbsolute{HackAddress::TEMP_BASE}, 7};
        case SegmentType::POINTER:
            // pointer 0 = THIS, pointer 1 = THAT
            return {segment, FixedAbsolute{HackAddress::THIS}, 1};
    }
    throw InternalError("describe_segment: unhandled segment type");
}

SegmentInfo resolve_segment(const std::string& name) {
    auto segment = segment_from_string(name);
    if (segment.has_value()) {
        return describe_segment(*segment);
    }

    // Check for common typos
    if (name == "loc" || name == "lcl") {
        throw UnknownSegmentError("Unknown segment: " + format_suggestion(name, "local"));
    }
    if (name == "arg" || name == "args") {
        throw UnknownSegmentError("Unknown segment: " + format_suggestion(name, "argument"));
    }
    if (name == "const") {
        throw UnknownSegmentError("Unknown segment: " + format_suggestion(name, "constant"));
    }
    if (name == "tmp") {
        throw UnknownSegmentError("Unknown segment: " + format_suggestion(name, "temp"));
    }
    if (name == "ptr") {
        throw UnknownSegmentError("Unknown segment: " + format_suggestion(name, "pointer"));
    }

    throw UnknownSegmentError("Unknown segment: '" + name +
        "'. Valid segments: local, argument, this, that, constant, static, temp, pointer");
}

void check_segment_index(const SegmentInfo& segment, uint16_t index) {
    if (index > segment.max_index) {
        throw InvalidArgumentError(build_error_message(
            segment_to_string(segment.type), " segment only has indices 0-",
            segment.max_index, ", got ", index));
    }
}

}  // namespace vmt
