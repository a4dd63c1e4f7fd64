#include "JSONUtils.h"

#include <QCryptographicHash>
#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>

#include <cmath>
#include <limits>

namespace stackcad::io {

QByteArray JSONUtils::toCanonicalJson(const QJsonObject& object) {
    // QJsonObject keeps its keys sorted, so compact output is canonical
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

QString JSONUtils::contentHash(const QJsonObject& object) {
    const QByteArray digest = QCryptographicHash::hash(toCanonicalJson(object),
                                                       QCryptographicHash::Sha256);
    return QString::fromLatin1(digest.toHex());
}

QJsonArray JSONUtils::toArray(const std::array<double, 3>& values) {
    return QJsonArray{values[0], values[1], values[2]};
}

bool JSONUtils::readObjectFile(const QString& path, QJsonObject& object, QString& errorMessage) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        errorMessage = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        errorMessage = QString("Invalid JSON in %1 at offset %2: %3")
                           .arg(path)
                           .arg(parseError.offset)
                           .arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        errorMessage = QString("Expected a JSON object in %1").arg(path);
        return false;
    }

    object = doc.object();
    return true;
}

bool JSONUtils::writeObjectFile(const QString& path, const QJsonObject& object,
                                bool canonical, QString& errorMessage) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        errorMessage = QString("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }

    const QByteArray data = canonical ? toCanonicalJson(object)
                                      : QJsonDocument(object).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size() || !file.commit()) {
        errorMessage = QString("Failed writing %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

std::optional<ParseError> JSONUtils::checkHeader(const QJsonObject& document,
                                                 const char* format, int currentVersion) {
    const QJsonValue formatValue = document.value("format");
    if (!formatValue.isString()) {
        return ParseError{"format", "missing format tag"};
    }
    if (formatValue.toString() != QLatin1String(format)) {
        return ParseError{"format", "expected \"" + std::string(format) + "\", got \""
                                        + formatValue.toString().toStdString() + "\""};
    }

    const QJsonValue versionValue = document.value("version");
    if (!versionValue.isDouble()) {
        return ParseError{"version", "missing version"};
    }
    const double version = versionValue.toDouble();
    if (version != std::floor(version) || version < 1.0) {
        return ParseError{"version", "invalid version"};
    }
    if (version > currentVersion) {
        return ParseError{"version", "unsupported version " + std::to_string(static_cast<long long>(version))
                                         + " (newest supported is " + std::to_string(currentVersion) + ")"};
    }
    return std::nullopt;
}

//==============================================================================
// JsonReader
//==============================================================================

JsonReader::JsonReader(const QJsonObject& object, std::string path)
    : object_(object)
    , path_(std::move(path)) {}

bool JsonReader::has(const char* key) const {
    const QJsonValue value = object_.value(QLatin1String(key));
    return !value.isUndefined() && !value.isNull();
}

std::string JsonReader::childPath(const char* key) const {
    return path_.empty() ? std::string(key) : path_ + "." + key;
}

std::string JsonReader::childPath(const char* key, int index) const {
    return childPath(key) + "[" + std::to_string(index) + "]";
}

void JsonReader::fail(const std::string& path, const std::string& message) {
    if (!error_) {
        error_ = ParseError{path, message};
    }
}

QJsonValue JsonReader::required(const char* key) {
    if (!has(key)) {
        fail(childPath(key), "missing required field");
        return QJsonValue(QJsonValue::Undefined);
    }
    return object_.value(QLatin1String(key));
}

double JsonReader::number(const char* key) {
    const QJsonValue value = required(key);
    if (value.isUndefined()) {
        return 0.0;
    }
    if (!value.isDouble() || !std::isfinite(value.toDouble())) {
        fail(childPath(key), "expected a finite number");
        return 0.0;
    }
    return value.toDouble();
}

std::optional<double> JsonReader::optionalNumber(const char* key) {
    if (!has(key)) {
        return std::nullopt;
    }
    return number(key);
}

double JsonReader::numberOr(const char* key, double fallback) {
    return has(key) ? number(key) : fallback;
}

long long JsonReader::integer(const char* key) {
    return integerInRange(key, std::numeric_limits<long long>::min(), std::numeric_limits<long long>::max());
}

int JsonReader::smallInteger(const char* key) {
    return static_cast<int>(integerInRange(key, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

int JsonReader::integerOr(const char* key, int fallback) {
    return has(key) ? smallInteger(key) : fallback;
}

long long JsonReader::integerInRange(const char* key, long long minimum, long long maximum) {
    const double value = number(key);
    if (value != std::floor(value)) {
        fail(childPath(key), "expected an integer");
        return 0;
    }
    // The long long maximum rounds up to 2^63, which is already out of range.
    if (value < static_cast<double>(minimum) || value >= static_cast<double>(maximum) + 1.0) {
        fail(childPath(key), "integer out of range");
        return 0;
    }
    return static_cast<long long>(value);
}

bool JsonReader::booleanOr(const char* key, bool fallback) {
    if (!has(key)) {
        return fallback;
    }
    const QJsonValue value = object_.value(QLatin1String(key));
    if (!value.isBool()) {
        fail(childPath(key), "expected a boolean");
        return fallback;
    }
    return value.toBool();
}

std::string JsonReader::string(const char* key) {
    const QJsonValue value = required(key);
    if (value.isUndefined()) {
        return {};
    }
    if (!value.isString()) {
        fail(childPath(key), "expected a string");
        return {};
    }
    return value.toString().toStdString();
}

std::string JsonReader::stringOr(const char* key, const std::string& fallback) {
    return has(key) ? string(key) : fallback;
}

std::array<double, 3> JsonReader::triple(const char* key) {
    std::array<double, 3> result{0.0, 0.0, 0.0};
    const QJsonValue value = required(key);
    if (value.isUndefined()) {
        return result;
    }
    const QJsonArray values = value.toArray();
    if (!value.isArray() || values.size() != 3) {
        fail(childPath(key), "expected an array of 3 numbers");
        return result;
    }
    for (int i = 0; i < 3; ++i) {
        if (!values[i].isDouble() || !std::isfinite(values[i].toDouble())) {
            fail(childPath(key, i), "expected a finite number");
            return result;
        }
        result[static_cast<size_t>(i)] = values[i].toDouble();
    }
    return result;
}

std::optional<std::array<double, 3>> JsonReader::optionalTriple(const char* key) {
    if (!has(key)) {
        return std::nullopt;
    }
    return triple(key);
}

QJsonObject JsonReader::object(const char* key) {
    const QJsonValue value = required(key);
    if (value.isUndefined()) {
        return {};
    }
    if (!value.isObject()) {
        fail(childPath(key), "expected an object");
        return {};
    }
    return value.toObject();
}

QJsonArray JsonReader::array(const char* key) {
    const QJsonValue value = required(key);
    if (value.isUndefined()) {
        return {};
    }
    if (!value.isArray()) {
        fail(childPath(key), "expected an array");
        return {};
    }
    return value.toArray();
}

} // namespace stackcad::io
