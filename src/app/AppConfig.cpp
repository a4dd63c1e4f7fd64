#include "AppConfig.h"
#include "../io/ChainIO.h"
#include "../io/JSONUtils.h"

#include <QLoggingCategory>
#include <QSettings>

#include <cmath>
#include <limits>

namespace stackcad::app {

using core::assembly::ChainGeneratorConfig;
using core::assembly::DetectionParams;
using core::tolerance::CalculationOptions;

Q_LOGGING_CATEGORY(logAppConfig, "stackcad.app.config")

namespace {

struct DoubleField {
    const char* key;
    double DetectionParams::*member;
    double minimum;
    bool exclusive; // divisors and scales must stay strictly above minimum
};

bool accepts(const DoubleField& field, double value) {
    return field.exclusive ? value > field.minimum : value >= field.minimum;
}

const DoubleField kDetectionDoubles[] = {
    {"proximityThreshold", &DetectionParams::proximityThreshold, 0.0, false},
    {"normalThreshold", &DetectionParams::normalThreshold, 0.0, false},
    {"minContactArea", &DetectionParams::minContactArea, 0.0, false},
    {"proximityScale", &DetectionParams::proximityScale, 0.0, true},
    {"missingBoxDiagonal", &DetectionParams::missingBoxDiagonal, 0.0, true},
    {"admitAlignment", &DetectionParams::admitAlignment, -1.0, false},
    {"faceToFaceAlignment", &DetectionParams::faceToFaceAlignment, -1.0, false},
    {"pinRadiusTolerance", &DetectionParams::pinRadiusTolerance, 0.0, false},
    {"proximityScoreLength", &DetectionParams::proximityScoreLength, 0.0, true},
    {"faceToFaceContactArea", &DetectionParams::faceToFaceContactArea, 0.0, false},
    {"defaultCylinderRadius", &DetectionParams::defaultCylinderRadius, 0.0, false},
    {"fallbackContactArea", &DetectionParams::fallbackContactArea, 0.0, false},
};

struct IntField {
    const char* key;
    int DetectionParams::*member;
};

const IntField kDetectionInts[] = {
    {"maxInterfacesPerPair", &DetectionParams::maxInterfacesPerPair},
    {"workerCount", &DetectionParams::workerCount},
};

struct ChainField {
    const char* key;
    double ChainGeneratorConfig::*member;
};

const ChainField kChainDoubles[] = {
    {"fallbackPartLength", &ChainGeneratorConfig::fallbackPartLength},
    {"partToleranceRatio", &ChainGeneratorConfig::partToleranceRatio},
    {"fallbackGap", &ChainGeneratorConfig::fallbackGap},
};

QString settingsKey(const char* group, const char* key) {
    return QStringLiteral("%1/%2").arg(QLatin1String(group), QLatin1String(key));
}

std::optional<double> settingsDouble(QSettings& settings, const QString& key) {
    if (!settings.contains(key)) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok || !std::isfinite(value)) {
        qCWarning(logAppConfig) << "loadSettings:ignored-invalid" << key;
        return std::nullopt;
    }
    return value;
}

std::optional<long long> settingsInteger(QSettings& settings, const QString& key, long long minimum,
                                         long long maximum = std::numeric_limits<int>::max()) {
    if (!settings.contains(key)) {
        return std::nullopt;
    }
    bool ok = false;
    const long long value = settings.value(key).toLongLong(&ok);
    if (!ok || value < minimum || value > maximum) {
        qCWarning(logAppConfig) << "loadSettings:ignored-invalid" << key;
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

void AppConfig::loadSettings(QSettings& settings) {
    for (const auto& field : kDetectionDoubles) {
        if (auto value = settingsDouble(settings, settingsKey("detection", field.key))) {
            if (accepts(field, *value)) {
                detection.*field.member = *value;
            } else {
                qCWarning(logAppConfig) << "loadSettings:ignored-invalid" << field.key;
            }
        }
    }
    for (const auto& field : kDetectionInts) {
        if (auto value = settingsInteger(settings, settingsKey("detection", field.key), 1)) {
            detection.*field.member = static_cast<int>(*value);
        }
    }

    if (settings.contains("analysis/runMonteCarlo")) {
        analysis.runMonteCarlo = settings.value("analysis/runMonteCarlo").toBool();
    }
    if (auto value = settingsInteger(settings, "analysis/monteCarloSamples", 0)) {
        analysis.monteCarloSamples = static_cast<int>(*value);
    }
    if (auto value = settingsInteger(settings, "analysis/workerCount", 1)) {
        analysis.workerCount = static_cast<int>(*value);
    }
    if (auto value = settingsInteger(settings, "analysis/seed", 0,
                                      std::numeric_limits<long long>::max())) {
        analysis.seed = static_cast<std::uint64_t>(*value);
    }

    for (const auto& field : kChainDoubles) {
        if (auto value = settingsDouble(settings, settingsKey("chains", field.key))) {
            if (*value >= 0.0) {
                chainGeneration.*field.member = *value;
            }
        }
    }
    if (auto value = settingsInteger(settings, "chains/maxInterfaceLinks", 0)) {
        chainGeneration.maxInterfaceLinks = static_cast<size_t>(*value);
    }

    qCDebug(logAppConfig) << "loadSettings:done" << "file=" << settings.fileName();
}

void AppConfig::saveSettings(QSettings& settings) const {
    for (const auto& field : kDetectionDoubles) {
        settings.setValue(settingsKey("detection", field.key), detection.*field.member);
    }
    for (const auto& field : kDetectionInts) {
        settings.setValue(settingsKey("detection", field.key), detection.*field.member);
    }

    settings.setValue("analysis/runMonteCarlo", analysis.runMonteCarlo);
    settings.setValue("analysis/monteCarloSamples", analysis.monteCarloSamples);
    settings.setValue("analysis/workerCount", analysis.workerCount);
    if (analysis.seed) {
        settings.setValue("analysis/seed", static_cast<qulonglong>(*analysis.seed));
    } else {
        settings.remove("analysis/seed");
    }

    for (const auto& field : kChainDoubles) {
        settings.setValue(settingsKey("chains", field.key), chainGeneration.*field.member);
    }
    settings.setValue("chains/maxInterfaceLinks", static_cast<qulonglong>(chainGeneration.maxInterfaceLinks));
    settings.sync();
}

io::ParseResult<AppConfig> AppConfig::applyJson(const QJsonObject& json, AppConfig base) {
    io::JsonReader reader(json, {});

    if (reader.has("detection")) {
        io::JsonReader section(reader.object("detection"), "detection");
        for (const auto& field : kDetectionDoubles) {
            const double value = section.numberOr(field.key, base.detection.*field.member);
            if (!accepts(field, value)) {
                section.fail(section.childPath(field.key),
                             field.exclusive ? "must be above minimum" : "value below minimum");
            }
            base.detection.*field.member = value;
        }
        for (const auto& field : kDetectionInts) {
            const int value = section.integerOr(field.key, base.detection.*field.member);
            if (value < 1) {
                section.fail(section.childPath(field.key), "must be at least 1");
            }
            base.detection.*field.member = value;
        }
        if (!section.ok()) {
            return section.error();
        }
    }

    if (reader.has("analysis")) {
        io::JsonReader section(reader.object("analysis"), "analysis");
        base.analysis.runMonteCarlo = section.booleanOr("runMonteCarlo", base.analysis.runMonteCarlo);

        base.analysis.monteCarloSamples = section.integerOr("monteCarloSamples",
                                                            base.analysis.monteCarloSamples);
        if (base.analysis.monteCarloSamples < 0) {
            section.fail(section.childPath("monteCarloSamples"), "must not be negative");
        }

        base.analysis.workerCount = section.integerOr("workerCount", base.analysis.workerCount);
        if (base.analysis.workerCount < 1) {
            section.fail(section.childPath("workerCount"), "must be at least 1");
        }

        if (section.has("seed")) {
            const long long seed = section.integer("seed");
            if (seed < 0) {
                section.fail(section.childPath("seed"), "must not be negative");
            }
            base.analysis.seed = static_cast<std::uint64_t>(seed);
        }

        if (section.has("targetSpec")) {
            core::tolerance::TargetSpec spec;
            if (io::unwrapInto(io::ChainIO::parseTargetSpec(section.object("targetSpec"),
                                                            section.childPath("targetSpec")),
                               spec, section)) {
                base.analysis.targetSpec = spec;
            }
        }
        if (!section.ok()) {
            return section.error();
        }
    }

    if (reader.has("chainGeneration")) {
        io::JsonReader section(reader.object("chainGeneration"), "chainGeneration");
        for (const auto& field : kChainDoubles) {
            const double value = section.numberOr(field.key, base.chainGeneration.*field.member);
            if (value < 0.0) {
                section.fail(section.childPath(field.key), "must not be negative");
            }
            base.chainGeneration.*field.member = value;
        }
        const int maxLinks = section.integerOr("maxInterfaceLinks",
                                               static_cast<int>(base.chainGeneration.maxInterfaceLinks));
        if (maxLinks < 0) {
            section.fail(section.childPath("maxInterfaceLinks"), "must not be negative");
        } else {
            base.chainGeneration.maxInterfaceLinks = static_cast<size_t>(maxLinks);
        }
        if (!section.ok()) {
            return section.error();
        }
    }

    if (!reader.ok()) {
        return reader.error();
    }
    return base;
}

bool AppConfig::loadFile(const QString& path, AppConfig& config, QString& errorMessage) {
    qCInfo(logAppConfig) << "loadFile:start" << "path=" << path;
    QJsonObject json;
    if (!io::JSONUtils::readObjectFile(path, json, errorMessage)) {
        qCWarning(logAppConfig) << "loadFile:failed-read" << errorMessage;
        return false;
    }

    auto parsed = applyJson(json, config);
    if (const auto* error = std::get_if<io::ParseError>(&parsed)) {
        errorMessage = QString::fromStdString(error->toString());
        qCWarning(logAppConfig) << "loadFile:invalid" << errorMessage;
        return false;
    }

    config = std::get<AppConfig>(parsed);
    qCInfo(logAppConfig) << "loadFile:done";
    return true;
}

} // namespace stackcad::app
