#include <isbnkit/error.hpp>

namespace isbnkit {

const char* IsbnkitError::code_name(Code c) {
    switch (c) {
        case IO:                 return "IO";
        case Parse:              return "Parse";
        case Config:             return "Config";
        case InvalidArg:         return "InvalidArg";
        case InvalidLength:      return "InvalidLength";
        case InvalidCharacter:   return "InvalidCharacter";
        case InvalidCheckDigit:  return "InvalidCheckDigit";
        case UnrecognizedPrefix: return "UnrecognizedPrefix";
        case Checksum:           return "Checksum";
    }
    return "Unknown";
}

std::string IsbnkitError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace isbnkit
