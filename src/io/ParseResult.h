/**
 * @file ParseResult.h
 * @brief Result type for parsing external JSON data into strict types
 */
#ifndef STACKCAD_IO_PARSERESULT_H
#define STACKCAD_IO_PARSERESULT_H

#include <string>
#include <variant>

namespace stackcad::io {

/**
 * @brief First problem found while parsing, located by a JSON path
 *        such as "chain.links[2].sigma".
 */
struct ParseError {
    std::string path;
    std::string message;

    std::string toString() const {
        return path.empty() ? message : path + ": " + message;
    }
};

template <typename T>
using ParseResult = std::variant<T, ParseError>;

template <typename T>
bool isOk(const ParseResult<T>& result) {
    return std::holds_alternative<T>(result);
}

} // namespace stackcad::io

#endif // STACKCAD_IO_PARSERESULT_H
