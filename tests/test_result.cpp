#include <catch2/catch.hpp>
#include <isbnkit/isbn.hpp>
#include <isbnkit/result.hpp>
#include <string>
#include <vector>

using namespace isbnkit;

// Normalizes every entry or returns the first validation failure
static Result<std::vector<std::string>> normalize_all(const std::vector<std::string>& raws) {
    std::vector<std::string> out;
    for (const auto& raw : raws) {
        auto r = validate(raw);
        ISBNKIT_TRY(r);
        out.push_back(r.value().normalized());
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static Status require_isbn13(const std::string& raw) {
    auto r = validate(raw);
    ISBNKIT_TRY(r);
    if (r.value().type() != IsbnType::Isbn13) {
        return IsbnkitError{IsbnkitError::InvalidArg,
            "expected an ISBN-13, got " + r.value().display()};
    }
    return ok_status();
}

TEST_CASE("ISBNKIT_TRY carries a validation error out unchanged", "[result]") {
    auto r = normalize_all({"0-306-40615-2", "978-3-16-148410-1", "052159104X"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == IsbnkitError::Checksum);
    REQUIRE(r.error().message == "Checksum failed for ISBN-13");
}

TEST_CASE("ISBNKIT_TRY falls through when every input validates", "[result]") {
    auto r = normalize_all({"0-306-40615-2", "978-3-16-148410-0"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"0306406152", "9783161484100"});

    auto empty = normalize_all({});
    REQUIRE(empty.is_ok());
    REQUIRE(empty.value().empty());
}

TEST_CASE("Status from a validation step", "[result]") {
    REQUIRE(require_isbn13("9783161484100").is_ok());

    auto wrong_type = require_isbn13("0306406152");
    REQUIRE(wrong_type.is_err());
    REQUIRE(wrong_type.error().code == IsbnkitError::InvalidArg);
    REQUIRE(wrong_type.error().message == "expected an ISBN-13, got 0-3064-0615-2");

    auto bad_prefix = require_isbn13("1234567890123");
    REQUIRE(bad_prefix.error().code == IsbnkitError::UnrecognizedPrefix);
}

TEST_CASE("map() projects a valid ISBN", "[result]") {
    auto display = validate("979 0 2600 0043 8").map([](Isbn& isbn) {
        return isbn.display();
    });
    REQUIRE(display.is_ok());
    REQUIRE(display.value() == "979-0-26000-043-8");
}

TEST_CASE("map() leaves an invalid result alone", "[result]") {
    bool called = false;
    auto length = validate("12-34").map([&](Isbn& isbn) {
        called = true;
        return isbn.normalized().size();
    });
    REQUIRE_FALSE(called);
    REQUIRE(length.is_err());
    REQUIRE(length.error().code == IsbnkitError::InvalidLength);
    REQUIRE(length.error().message == "Invalid length: 4");
}

TEST_CASE("Bool conversion follows validity", "[result]") {
    REQUIRE(static_cast<bool>(validate("0306406152")));
    REQUIRE_FALSE(static_cast<bool>(validate("0306406153")));
}

TEST_CASE("Wrong-side access throws bad_variant_access", "[result]") {
    auto invalid = validate("X306406152");
    REQUIRE_THROWS_AS(invalid.value(), std::bad_variant_access);

    auto valid = validate("0306406152");
    REQUIRE_THROWS_AS(valid.error(), std::bad_variant_access);
}

TEST_CASE("error() can be moved out of a result", "[result]") {
    IsbnkitError e = validate("").error();
    REQUIRE(e.message == "Invalid length: 0");
    REQUIRE(e.hint == "expected 10 or 13 digits after removing separators");
}

// ===== IsbnkitError =====

TEST_CASE("IsbnkitError format() output", "[error]") {
    IsbnkitError e{IsbnkitError::Config, "unknown log level 'loud'",
                   "expected one of: trace, debug, info, warn, error",
                   "isbnkit.toml", 2};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]") != std::string::npos);
    REQUIRE(formatted.find("unknown log level 'loud'") != std::string::npos);
    REQUIRE(formatted.find("hint: expected one of") != std::string::npos);
    REQUIRE(formatted.find("--> isbnkit.toml:2") != std::string::npos);
}

TEST_CASE("format() of a validation failure", "[error]") {
    REQUIRE(validate("0306406153").error().format() ==
            "error[Checksum]: Checksum failed for ISBN-10");
    REQUIRE(validate("1234567890123").error().format() ==
            "error[UnrecognizedPrefix]: Not a recognized prefix\n"
            "  hint: ISBN-13 must start with 978 or 979");
}

TEST_CASE("IsbnkitError format() with file but no line", "[error]") {
    IsbnkitError e{IsbnkitError::Parse, "bad TOML", "", "books.toml", 0};
    auto formatted = e.format();
    REQUIRE(formatted.find("--> books.toml") != std::string::npos);
    REQUIRE(formatted.find("books.toml:") == std::string::npos);
}

TEST_CASE("IsbnkitError code_name() for all codes", "[error]") {
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::IO)) == "IO");
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::Parse)) == "Parse");
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::Config)) == "Config");
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::InvalidLength)) == "InvalidLength");
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::InvalidCharacter)) == "InvalidCharacter");
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::InvalidCheckDigit)) == "InvalidCheckDigit");
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::UnrecognizedPrefix)) == "UnrecognizedPrefix");
    REQUIRE(std::string(IsbnkitError::code_name(IsbnkitError::Checksum)) == "Checksum");
}
