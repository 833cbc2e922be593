#pragma once

#include <isbnkit/result.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace isbnkit {

enum class IsbnType { Isbn10, Isbn13 };

// "ISBN-10" / "ISBN-13"
const char* type_name(IsbnType type);

class Isbn;

// Outcome of validate(): the Isbn on success, otherwise an error whose
// message is the human-readable reason.
using ValidationResult = Result<Isbn>;

// Cleans and validates an ISBN-10 or ISBN-13 string.
//
// Everything except ASCII digits and 'X'/'x' is discarded first, so
// "0-306-40615-2", "ISBN 0 306 40615 2" and "0306406152" are equivalent.
// Never throws; every failure is reported through the returned Result.
ValidationResult validate(const std::string& raw);

// Hyphenated rendering of a normalized value: 1-4-4-1 for ISBN-10 and
// 3-1-5-3-1 for ISBN-13. Positional only, not registrant-group aware.
// A value whose length does not match the type is returned unchanged.
std::string format_display(const std::string& normalized, IsbnType type);

// A validated ISBN. Only validate() can construct one.
class Isbn {
public:
    const std::string& normalized() const { return normalized_; }
    const std::string& display() const { return display_; }
    IsbnType type() const { return type_; }

    bool operator==(const Isbn& o) const;
    bool operator!=(const Isbn& o) const;

private:
    Isbn(std::string normalized, IsbnType type);

    friend ValidationResult validate(const std::string& raw);

    std::string normalized_;
    std::string display_;
    IsbnType type_;
};

} // namespace isbnkit

namespace std {

template<>
struct hash<isbnkit::Isbn> {
    size_t operator()(const isbnkit::Isbn& isbn) const noexcept {
        size_t h = hash<string>{}(isbn.normalized());
        h ^= hash<string>{}(isbn.display()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= static_cast<size_t>(isbn.type()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std
