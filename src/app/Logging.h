/**
 * @file Logging.h
 * @brief Process-wide Qt message handler for the command-line driver
 */
#ifndef STACKCAD_APP_LOGGING_H
#define STACKCAD_APP_LOGGING_H

#include <QString>

namespace stackcad::app {

struct LoggingOptions {
    QString appName = QStringLiteral("stackcad");
    bool debugBuild = false;

    /// Echo info/debug records to stderr; warnings are always echoed
    bool verboseConsole = false;

    /// Write a per-run log file next to earlier runs
    bool writeLogFile = true;
};

/**
 * @brief Installs the message and terminate handlers.
 *
 * Records are formatted as
 * `timestamp [LEVEL] [tid] [category] [file:line] [function] message`.
 * Console output goes to stderr so reports on stdout stay clean.
 *
 * Environment: STACKCAD_LOG_DEBUG, STACKCAD_LOG_DEBUG_CATEGORIES, STACKCAD_LOG_DIR.
 */
class Logging {
public:
    static bool initialize(const LoggingOptions& options);
    static void shutdown();

    static QString logFilePath();
    static bool isDebugLoggingEnabled();
};

} // namespace stackcad::app

#endif // STACKCAD_APP_LOGGING_H
