// ==============================================================================
// VM Translator
// ==============================================================================
// Drives a VMParser into a CodeWriter and owns the run/close lifecycle:
//
//   IDLE --run()--> RUNNING --close()--> CLOSED
//     |                |
//     +----close()-----+---(error)---> FAILED
//
// Output is written exactly once, at close(). A run that fails never touches
// the output sink, so no partial .asm file is produced.
// ==============================================================================

#ifndef VMTRANSLATOR_VM_TRANSLATOR_HPP
#define VMTRANSLATOR_VM_TRANSLATOR_HPP

#include "vm_parser.hpp"
#include "code_writer.hpp"
#include <cstdint>
#include <ostream>
#include <string>

namespace vmt {

// ==============================================================================
// Translator State
// ==============================================================================

enum class TranslatorState {
    IDLE,       // Input loaded, nothing translated yet
    RUNNING,    // run() in progress or finished, output not written
    CLOSED,     // Output written; terminal
    FAILED      // A translation error aborted the run; terminal
};

const char* translator_state_to_string(TranslatorState state);

// ==============================================================================
// Translation Statistics
// ==============================================================================

/**
 * @brief Counters collected while translating
 */
struct TranslationStats {
    uint64_t commands_translated = 0;   // VM commands turned into Blocks
    uint64_t arithmetic_count = 0;      // add, sub, neg, and, or, not
    uint64_t comparison_count = 0;      // eq, gt, lt
    uint64_t push_count = 0;
    uint64_t pop_count = 0;
    uint64_t flow_count = 0;            // label, goto, if-goto
    uint64_t function_count = 0;
    uint64_t call_count = 0;
    uint64_t return_count = 0;
    uint64_t instructions_emitted = 0;  // Hack ROM instructions, prologue/epilogue included

    void reset() {
        commands_translated = 0;
        arithmetic_count = 0;
        comparison_count = 0;
        push_count = 0;
        pop_count = 0;
        flow_count = 0;
        function_count = 0;
        call_count = 0;
        return_count = 0;
        instructions_emitted = 0;
    }
};

// ==============================================================================
// VM Translator Class
// ==============================================================================

/**
 * @brief Translates one VM source into one Hack assembly program
 *
 * Usage:
 *   VMTranslator translator(VMParser::from_file("StackTest.vm"));
 *   translator.run();
 *   translator.close_to_file("StackTest.asm");
 */
class VMTranslator {
public:
    explicit VMTranslator(VMParser parser,
                          const TranslatorConfig& config = TranslatorConfig());

    /**
     * @brief Translate every remaining instruction
     *
     * Errors propagate unchanged (with the source location attached) and
     * leave the translator FAILED.
     *
     * @throws UsageError if the translator is CLOSED or FAILED
     */
    void run();

    /**
     * @brief Append the epilogue and write the whole program to `out`
     *
     * A second call is a no-op.
     *
     * @throws UsageError if the translator is FAILED
     * @throws FileError if the stream fails
     */
    void close(std::ostream& out);

    /**
     * @brief Open `output_path`, write the program, and close the file
     *
     * The file is opened here and nowhere else. A second call is a no-op.
     *
     * @throws UsageError if the translator is FAILED
     * @throws FileError if the file cannot be opened or written
     */
    void close_to_file(const std::string& output_path);

    TranslatorState get_state() const { return state_; }
    const TranslationStats& get_stats() const { return stats_; }

    const VMParser& parser() const { return parser_; }
    const CodeWriter& writer() const { return writer_; }

private:
    VMParser parser_;
    CodeWriter writer_;
    TranslatorState state_ = TranslatorState::IDLE;
    TranslationStats stats_;

    void record(const VMCommand& command);
};

// ==============================================================================
// Convenience Functions
// ==============================================================================

/**
 * @brief Translate a .vm file into a .asm file
 *
 * @return Statistics of the translation
 */
TranslationStats translate_file(const std::string& input_path,
                                const std::string& output_path,
                                const TranslatorConfig& config = TranslatorConfig());

/**
 * @brief Translate VM source held in memory and return the assembly text
 */
std::string translate_string(const std::string& source,
                             const TranslatorConfig& config = TranslatorConfig());

/**
 * @brief Default output path: the input path with a .asm extension
 *
 * Example: "dir/StackTest.vm" -> "dir/StackTest.asm"
 */
std::string default_output_path(const std::string& input_path);

}  // namespace vmt

#endif  // VMTRANSLATOR_VM_TRANSLATOR_HPP
