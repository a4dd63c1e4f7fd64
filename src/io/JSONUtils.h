/**
 * @file JSONUtils.h
 * @brief Canonical JSON output and strict field access for parsers
 */
#ifndef STACKCAD_IO_JSONUTILS_H
#define STACKCAD_IO_JSONUTILS_H

#include "ParseResult.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace stackcad::io {

class JSONUtils {
public:
    /**
     * @brief Compact JSON with keys in sorted order, stable for hashing.
     */
    static QByteArray toCanonicalJson(const QJsonObject& object);

    /**
     * @brief Hex SHA-256 of the canonical form.
     */
    static QString contentHash(const QJsonObject& object);

    static QJsonArray toArray(const std::array<double, 3>& values);

    /**
     * @brief Read a whole file as a JSON object.
     */
    static bool readObjectFile(const QString& path, QJsonObject& object, QString& errorMessage);

    /**
     * @brief Write canonical or indented JSON atomically.
     */
    static bool writeObjectFile(const QString& path, const QJsonObject& object,
                                bool canonical, QString& errorMessage);

    /**
     * @brief Check the format tag and version of a persisted document.
     */
    static std::optional<ParseError> checkHeader(const QJsonObject& document,
                                                 const char* format, int currentVersion);
};

/**
 * @brief Strict typed reads from one JSON object.
 *
 * The first failure is recorded with its path and later reads return
 * defaults, so a parser can read every field and check ok() once.
 */
class JsonReader {
public:
    JsonReader(const QJsonObject& object, std::string path);

    bool ok() const { return !error_.has_value(); }
    const ParseError& error() const { return *error_; }

    bool has(const char* key) const;
    std::string childPath(const char* key) const;
    std::string childPath(const char* key, int index) const;

    double number(const char* key);
    std::optional<double> optionalNumber(const char* key);
    double numberOr(const char* key, double fallback);
    long long integer(const char* key);
    // Integer that must fit in int; out-of-range values fail like type errors.
    int smallInteger(const char* key);
    int integerOr(const char* key, int fallback);
    bool booleanOr(const char* key, bool fallback);

    std::string string(const char* key);
    std::string stringOr(const char* key, const std::string& fallback);

    std::array<double, 3> triple(const char* key);
    std::optional<std::array<double, 3>> optionalTriple(const char* key);

    QJsonObject object(const char* key);
    QJsonArray array(const char* key);

    void fail(const std::string& path, const std::string& message);

private:
    QJsonValue required(const char* key);
    long long integerInRange(const char* key, long long minimum, long long maximum);

    QJsonObject object_;
    std::string path_;
    std::optional<ParseError> error_;
};

/**
 * @brief Move a nested parse result into out, or record its error on reader.
 */
template <typename T>
bool unwrapInto(ParseResult<T>&& parsed, T& out, JsonReader& reader) {
    if (const auto* error = std::get_if<ParseError>(&parsed)) {
        reader.fail(error->path, error->message);
        return false;
    }
    out = std::move(std::get<T>(parsed));
    return true;
}

} // namespace stackcad::io

#endif // STACKCAD_IO_JSONUTILS_H
