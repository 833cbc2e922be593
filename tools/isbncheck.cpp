// isbncheck.cpp
//
// Validates ISBNs given on the command line, or one per line on stdin when
// no arguments are given:
//
//     isbncheck 0-306-40615-2 978-3-16-148410-0
//     isbncheck --config books.toml < isbns.txt
//
// Exit status: 0 if every input is a valid ISBN, 1 if any is invalid,
// 2 on usage or configuration errors.

#include <isbnkit/cli.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return isbnkit::run(args, std::cin, std::cout, std::cerr);
}
