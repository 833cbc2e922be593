#pragma once

#include <isbnkit/isbn.hpp>
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace isbnkit {

enum class OutputFormat { Display, Normalized, Both };

const char* output_format_name(OutputFormat fmt);
Result<OutputFormat> parse_output_format(const std::string& name);

// [output] section
struct OutputConfig {
    OutputFormat format = OutputFormat::Display;
    bool show_type = true;
    bool show_input = false;
    bool fail_fast = false;
};

// One tab-separated line per input:
//   [raw\t][ISBN-13\t]978-3-16148-410-0
//   [raw\t]invalid\tChecksum failed for ISBN-13
std::string render(const std::string& raw, const ValidationResult& result,
                   const OutputConfig& cfg);

struct Summary {
    size_t total = 0;
    size_t valid = 0;
    size_t invalid = 0;

    void record(const ValidationResult& result);
    bool all_valid() const { return invalid == 0; }
};

// Reads candidate ISBNs, one per line. Surrounding whitespace is trimmed;
// blank lines and lines starting with '#' are skipped.
std::vector<std::string> read_inputs(std::istream& in);

} // namespace isbnkit
