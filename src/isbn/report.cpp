#include <isbnkit/report.hpp>
#include <algorithm>
#include <cctype>

namespace isbnkit {

const char* output_format_name(OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::Display:    return "display";
        case OutputFormat::Normalized: return "normalized";
        case OutputFormat::Both:       return "both";
    }
    return "unknown";
}

Result<OutputFormat> parse_output_format(const std::string& name) {
    for (OutputFormat fmt : {OutputFormat::Display, OutputFormat::Normalized,
                             OutputFormat::Both}) {
        if (name == output_format_name(fmt)) {
            return Result<OutputFormat>::ok(fmt);
        }
    }
    return IsbnkitError{IsbnkitError::Config,
        "unknown output format '" + name + "'",
        "expected one of: display, normalized, both"};
}

std::string render(const std::string& raw, const ValidationResult& result,
                   const OutputConfig& cfg) {
    std::string line;
    if (cfg.show_input) {
        line += raw;
        line += '\t';
    }

    if (result.is_err()) {
        line += "invalid\t";
        line += result.error().message;
        return line;
    }

    const Isbn& isbn = result.value();
    if (cfg.show_type) {
        line += type_name(isbn.type());
        line += '\t';
    }
    switch (cfg.format) {
        case OutputFormat::Display:
            line += isbn.display();
            break;
        case OutputFormat::Normalized:
            line += isbn.normalized();
            break;
        case OutputFormat::Both:
            line += isbn.normalized();
            line += ' ';
            line += isbn.display();
            break;
    }
    return line;
}

void Summary::record(const ValidationResult& result) {
    ++total;
    if (result.is_ok()) {
        ++valid;
    } else {
        ++invalid;
    }
}

static std::string trim(const std::string& s) {
    auto not_space = [](char c) {
        return !std::isspace(static_cast<unsigned char>(c));
    };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

std::vector<std::string> read_inputs(std::istream& in) {
    std::vector<std::string> inputs;
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        inputs.push_back(std::move(t));
    }
    return inputs;
}

} // namespace isbnkit
