#include <isbnkit/isbn.hpp>
#include <algorithm>
#include <cctype>

namespace isbnkit {

// ---- Character helpers ----

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static int digit_val(char c) {
    return is_digit(c) ? c - '0' : -1;
}

static std::string sanitize(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (is_digit(c) || c == 'X' || c == 'x') {
            out += c;
        }
    }
    return out;
}

// ---- ISBN-10: weights 1..10, sum % 11 == 0, 'X' check = 10 ----

static Status check_isbn10(std::string& isbn) {
    std::transform(isbn.begin(), isbn.end(), isbn.begin(),
                   [](char c) -> char {
                       return static_cast<char>(
                           std::toupper(static_cast<unsigned char>(c)));
                   });

    int sum = 0;
    for (int i = 0; i < 9; ++i) {
        int digit = digit_val(isbn[i]);
        if (digit < 0) {
            return IsbnkitError{IsbnkitError::InvalidCharacter,
                "Invalid character in ISBN-10",
                "only the last character of an ISBN-10 may be 'X'"};
        }
        sum += (i + 1) * digit;
    }

    int check;
    if (isbn[9] == 'X') {
        check = 10;
    } else if (is_digit(isbn[9])) {
        check = digit_val(isbn[9]);
    } else {
        return IsbnkitError{IsbnkitError::InvalidCheckDigit,
            "Invalid check digit in ISBN-10"};
    }
    sum += 10 * check;

    if (sum % 11 != 0) {
        return IsbnkitError{IsbnkitError::Checksum,
            "Checksum failed for ISBN-10"};
    }
    return ok_status();
}

// ---- ISBN-13: EAN weights 1,3,1,3,... over the first 12 digits ----

static Status check_isbn13(const std::string& isbn) {
    std::string prefix = isbn.substr(0, 3);
    if (prefix != "978" && prefix != "979") {
        return IsbnkitError{IsbnkitError::UnrecognizedPrefix,
            "Not a recognized prefix",
            "ISBN-13 must start with 978 or 979"};
    }

    int digits[13];
    for (int i = 0; i < 13; ++i) {
        digits[i] = digit_val(isbn[i]);
        if (digits[i] < 0) {
            return IsbnkitError{IsbnkitError::InvalidCharacter,
                "Invalid character in ISBN-13",
                "ISBN-13 has no 'X' check character"};
        }
    }

    int sum = 0;
    for (int i = 0; i < 12; ++i) {
        sum += digits[i] * (i % 2 == 0 ? 1 : 3);
    }

    int expected = (10 - (sum % 10)) % 10;
    if (expected != digits[12]) {
        return IsbnkitError{IsbnkitError::Checksum,
            "Checksum failed for ISBN-13"};
    }
    return ok_status();
}

// ---- Public API ----

const char* type_name(IsbnType type) {
    switch (type) {
        case IsbnType::Isbn10: return "ISBN-10";
        case IsbnType::Isbn13: return "ISBN-13";
    }
    return "unknown";
}

std::string format_display(const std::string& normalized, IsbnType type) {
    if (type == IsbnType::Isbn10 && normalized.size() == 10) {
        return normalized.substr(0, 1) + "-" + normalized.substr(1, 4) + "-" +
               normalized.substr(5, 4) + "-" + normalized.substr(9, 1);
    }
    if (type == IsbnType::Isbn13 && normalized.size() == 13) {
        return normalized.substr(0, 3) + "-" + normalized.substr(3, 1) + "-" +
               normalized.substr(4, 5) + "-" + normalized.substr(9, 3) + "-" +
               normalized.substr(12, 1);
    }
    return normalized;
}

ValidationResult validate(const std::string& raw) {
    std::string clean = sanitize(raw);

    IsbnType type;
    switch (clean.size()) {
        case 10:
            ISBNKIT_TRY(check_isbn10(clean));
            type = IsbnType::Isbn10;
            break;
        case 13:
            ISBNKIT_TRY(check_isbn13(clean));
            type = IsbnType::Isbn13;
            break;
        default:
            return IsbnkitError{IsbnkitError::InvalidLength,
                "Invalid length: " + std::to_string(clean.size()),
                "expected 10 or 13 digits after removing separators"};
    }

    return ValidationResult::ok(Isbn(std::move(clean), type));
}

// ---- Isbn ----

Isbn::Isbn(std::string normalized, IsbnType type)
    : normalized_(std::move(normalized)), type_(type) {
    display_ = format_display(normalized_, type_);
}

bool Isbn::operator==(const Isbn& o) const {
    return type_ == o.type_ && normalized_ == o.normalized_ &&
           display_ == o.display_;
}

bool Isbn::operator!=(const Isbn& o) const {
    return !(*this == o);
}

} // namespace isbnkit
