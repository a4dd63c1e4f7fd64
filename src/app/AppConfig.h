/**
 * @file AppConfig.h
 * @brief Layered configuration for detection, analysis and chain generation
 *
 * Precedence, lowest first: built-in defaults, QSettings ("StackCAD", groups
 * detection/, analysis/, chains/), a JSON config file, command-line options.
 */
#ifndef STACKCAD_APP_APPCONFIG_H
#define STACKCAD_APP_APPCONFIG_H

#include "../core/assembly/ChainGenerator.h"
#include "../core/assembly/InterfaceDetector.h"
#include "../core/tolerance/StackupCalculator.h"
#include "../io/ParseResult.h"

#include <QJsonObject>
#include <QString>

class QSettings;

namespace stackcad::app {

struct AppConfig {
    core::assembly::DetectionParams detection;
    core::tolerance::CalculationOptions analysis;
    core::assembly::ChainGeneratorConfig chainGeneration;

    /**
     * @brief Overlay stored settings. Unusable values are ignored with a warning.
     */
    void loadSettings(QSettings& settings);
    void saveSettings(QSettings& settings) const;

    /**
     * @brief Overlay a JSON config object onto base. Any invalid value fails the whole load.
     */
    static io::ParseResult<AppConfig> applyJson(const QJsonObject& json, AppConfig base);

    static bool loadFile(const QString& path, AppConfig& config, QString& errorMessage);
};

} // namespace stackcad::app

#endif // STACKCAD_APP_APPCONFIG_H
