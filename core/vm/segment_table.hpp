// ==============================================================================
// VM Segment Table
// ==============================================================================
// Maps VM segment names to where they live on the Hack platform.
//
// Segments come in two kinds, and the generated code differs per kind:
//
//   FixedAbsolute    temp, pointer, static
//                    The segment starts at a known RAM address, so
//                    segment[i] is simply RAM[base + i].
//
//   PointerIndirect  local, argument, this, that
//                    The base address is itself stored in a register
//                    (LCL, ARG, THIS, THAT), so segment[i] is
//                    RAM[RAM[reg] + i] and has to be computed at runtime.
//
//   Constant         push-only; the index is the value.
// ==============================================================================

#ifndef VMTRANSLATOR_SEGMENT_TABLE_HPP
#define VMTRANSLATOR_SEGMENT_TABLE_HPP

#include "types.hpp"
#include "error.hpp"
#include <string>
#include <variant>

namespace vmt {

struct FixedAbsolute {
    Address base;       // RAM address of segment[0]
};

struct PointerIndirect {
    const char* base_register;   // Assembler symbol holding the base (e.g. "LCL")
};

struct ConstantSegment {};

using SegmentLocation = std::variant<FixedAbsolute, PointerIndirect, ConstantSegment>;

/**
 * @brief A resolved segment: what it is, where it lives, how big it is
 */
struct SegmentInfo {
    SegmentType type;
    SegmentLocation location;
    uint16_t max_index;  // Largest valid index (inclusive)
};

/**
 * @brief Get the location and bounds of a segment
 */
SegmentInfo describe_segment(SegmentType segment);

/**
 * @brief Resolve a segment keyword through the table
 *
 * @throws UnknownSegmentError if the name is not a VM segment
 */
SegmentInfo resolve_segment(const std::string& name);

/**
 * @brief Check an index against the segment's bounds
 *
 * @throws InvalidArgumentError if the index is past the end of the segment
 */
void check_segment_index(const SegmentInfo& segment, uint16_t index);

}  // namespace vmt

#endif  // VMTRANSLATOR_SEGMENT_TABLE_HPP
