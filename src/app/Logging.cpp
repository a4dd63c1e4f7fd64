#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>
#include <QThread>

#include <cstdlib>
#include <exception>
#include <iostream>

namespace stackcad::app {

Q_LOGGING_CATEGORY(logLogging, "stackcad.app.logging")

namespace {

QMutex gLogMutex;
QFile gLogFile;
QString gLogFilePath;
QtMessageHandler gPreviousHandler = nullptr;
bool gInitialized = false;
bool gDebugLoggingEnabled = false;
bool gVerboseConsole = false;
std::terminate_handler gPreviousTerminateHandler = nullptr;

constexpr int kLogRetentionDays = 30;
constexpr int kMaxRunLogFiles = 30;

const char* levelToString(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return "DEBUG";
        case QtInfoMsg:
            return "INFO";
        case QtWarningMsg:
            return "WARN";
        case QtCriticalMsg:
            return "ERROR";
        case QtFatalMsg:
            return "FATAL";
    }
    return "UNKNOWN";
}

bool isEnabledFlag(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

QStringList debugCategoriesFromEnvironment() {
    QString configured = qEnvironmentVariable("STACKCAD_LOG_DEBUG_CATEGORIES").trimmed();
    if (configured.isEmpty()) {
        configured = QStringLiteral("stackcad.main,stackcad.app.*,stackcad.io.*");
    }

    QStringList categories;
    for (const QString& token : configured.split(',', Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty()) {
            categories.push_back(category);
        }
    }
    categories.removeDuplicates();
    return categories;
}

void applyFilterRules(bool debugBuild) {
    gDebugLoggingEnabled = debugBuild || isEnabledFlag(qEnvironmentVariable("STACKCAD_LOG_DEBUG"));

    QStringList rules{QStringLiteral("*.info=true"),
                      QStringLiteral("*.warning=true"),
                      QStringLiteral("*.critical=true")};

    if (gDebugLoggingEnabled) {
        rules << QStringLiteral("*.debug=true");
    } else {
        rules << QStringLiteral("*.debug=false");
        for (const QString& category : debugCategoriesFromEnvironment()) {
            rules << QStringLiteral("%1.debug=true").arg(category);
        }
    }

    QLoggingCategory::setFilterRules(rules.join('\n'));
}

QString formatRecord(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    const QString threadId = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16);

    const QString location = (context.file && context.line > 0)
                                 ? QStringLiteral("%1:%2").arg(context.file).arg(context.line)
                                 : QStringLiteral("<unknown>");
    const QString function = context.function ? QString::fromUtf8(context.function) : QStringLiteral("<unknown>");
    const QString category = context.category ? QString::fromUtf8(context.category) : QStringLiteral("default");

    return QStringLiteral("%1 [%2] [tid=0x%3] [%4] [%5] [%6] %7")
        .arg(timestamp,
             QString::fromLatin1(levelToString(type)),
             threadId,
             category,
             location,
             function,
             msg);
}

void appendToLogFile(const QString& line) {
    QMutexLocker lock(&gLogMutex);
    if (gLogFile.isOpen()) {
        QTextStream stream(&gLogFile);
        stream << line << Qt::endl;
        gLogFile.flush();
    }
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString formatted = formatRecord(type, context, msg);
    appendToLogFile(formatted);

    const bool severe = type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
    // Sole console writer; the previous handler is only restored on shutdown
    if (severe || gVerboseConsole) {
        std::cerr << formatted.toStdString() << std::endl;
    }

    if (type == QtFatalMsg) {
        std::abort();
    }
}

void terminateHandler() {
    QString reason = QStringLiteral("unknown exception");
    if (std::exception_ptr current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            reason = QString::fromUtf8(e.what());
        } catch (...) {
            reason = QStringLiteral("non-standard exception");
        }
    }

    const QString message = QStringLiteral("%1 [FATAL] [terminate] Unhandled exception: %2")
                                .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs), reason);
    appendToLogFile(message);
    std::cerr << message.toStdString() << std::endl;

    if (gPreviousTerminateHandler != nullptr) {
        gPreviousTerminateHandler();
    }
    std::abort();
}

QString logDirectoryPath() {
    const QString overridePath = qEnvironmentVariable("STACKCAD_LOG_DIR").trimmed();
    if (!overridePath.isEmpty()) {
        return overridePath;
    }

    const QString appDataPath = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!appDataPath.isEmpty()) {
        return QDir(appDataPath).filePath(QStringLiteral("logs"));
    }
    return QDir::current().filePath(QStringLiteral("logs"));
}

// Newest first; keeps the current run plus up to kMaxRunLogFiles recent, young files
int pruneOldLogs(const QDir& dir, const QString& currentLogPath) {
    const QFileInfoList logFiles = dir.entryInfoList({QStringLiteral("*.log")}, QDir::Files, QDir::Time);
    const QDateTime cutoff = QDateTime::currentDateTime().addDays(-kLogRetentionDays);

    int retained = 0;
    int removed = 0;
    for (const QFileInfo& fileInfo : logFiles) {
        if (fileInfo.absoluteFilePath() == currentLogPath) {
            ++retained;
            continue;
        }

        const bool expired = fileInfo.lastModified().isValid() && fileInfo.lastModified() < cutoff;
        if (expired || retained >= kMaxRunLogFiles) {
            if (QFile::remove(fileInfo.absoluteFilePath())) {
                ++removed;
            }
            continue;
        }
        ++retained;
    }
    return removed;
}

bool openLogFile(const QString& appName, QString& directory) {
    const QString dirPath = logDirectoryPath();
    QDir dir(dirPath);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        std::cerr << "Failed to create log directory: " << dirPath.toStdString() << std::endl;
        return false;
    }

    const QString timestamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz"));
    gLogFilePath = dir.filePath(QStringLiteral("%1_%2_%3.log")
                                    .arg(appName.toLower(), timestamp)
                                    .arg(QCoreApplication::applicationPid()));

    gLogFile.setFileName(gLogFilePath);
    if (!gLogFile.open(QIODevice::WriteOnly | QIODevice::Text)) {
        std::cerr << "Failed to open log file: " << gLogFilePath.toStdString() << std::endl;
        gLogFilePath.clear();
        return false;
    }

    directory = dir.absolutePath();
    return true;
}

} // namespace

bool Logging::initialize(const LoggingOptions& options) {
    QString logDirectory;
    QString logFile;

    {
        QMutexLocker lock(&gLogMutex);
        if (gInitialized) {
            return true;
        }

        applyFilterRules(options.debugBuild);
        gVerboseConsole = options.verboseConsole;

        if (options.writeLogFile && !openLogFile(options.appName, logDirectory)) {
            return false;
        }

        gPreviousHandler = qInstallMessageHandler(messageHandler);
        gPreviousTerminateHandler = std::set_terminate(terminateHandler);
        gInitialized = true;
        logFile = gLogFilePath;
    }

    qCInfo(logLogging).noquote() << "initialize:done"
                                 << "logFile=" << (logFile.isEmpty() ? QStringLiteral("<none>") : logFile)
                                 << "debugBuild=" << options.debugBuild
                                 << "debugLogsEnabled=" << gDebugLoggingEnabled
                                 << "verboseConsole=" << options.verboseConsole;

    if (!logFile.isEmpty()) {
        const int removed = pruneOldLogs(QDir(logDirectory), logFile);
        qCDebug(logLogging) << "initialize:pruned"
                            << "removed=" << removed
                            << "days=" << kLogRetentionDays
                            << "maxFiles=" << kMaxRunLogFiles;
    }
    return true;
}

void Logging::shutdown() {
    QString closingLogFilePath;

    {
        QMutexLocker lock(&gLogMutex);
        if (!gInitialized) {
            return;
        }
        closingLogFilePath = gLogFilePath;
    }

    qCInfo(logLogging).noquote() << "shutdown" << "logFile=" << closingLogFilePath;

    QMutexLocker lock(&gLogMutex);
    qInstallMessageHandler(gPreviousHandler);
    gPreviousHandler = nullptr;

    std::set_terminate(gPreviousTerminateHandler);
    gPreviousTerminateHandler = nullptr;

    if (gLogFile.isOpen()) {
        gLogFile.flush();
        gLogFile.close();
    }

    gLogFilePath.clear();
    gInitialized = false;
}

QString Logging::logFilePath() {
    QMutexLocker lock(&gLogMutex);
    return gLogFilePath;
}

bool Logging::isDebugLoggingEnabled() {
    QMutexLocker lock(&gLogMutex);
    return gDebugLoggingEnabled;
}

} // namespace stackcad::app
