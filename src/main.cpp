/**
 * @file main.cpp
 * @brief stackcad command-line driver: interface detection, chain generation
 *        and tolerance stackup analysis.
 */

#include "app/AppConfig.h"
#include "app/Logging.h"
#include "core/assembly/AssemblyGraphBuilder.h"
#include "core/assembly/ChainGenerator.h"
#include "core/assembly/InterfaceDetector.h"
#include "core/tolerance/InsightGenerator.h"
#include "core/tolerance/StackupCalculator.h"
#include "io/AssemblyIO.h"
#include "io/ChainIO.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace stackcad;

Q_LOGGING_CATEGORY(logMain, "stackcad.main")

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

QString mm(double value) {
    return QString::number(value, 'f', 4);
}

bool parseNumberList(const QString& text, int expected, std::vector<double>& values) {
    const QStringList tokens = text.split(',', Qt::SkipEmptyParts);
    if (tokens.size() != expected) {
        return false;
    }
    values.clear();
    for (const QString& token : tokens) {
        bool ok = false;
        const double value = token.trimmed().toDouble(&ok);
        if (!ok) {
            return false;
        }
        values.push_back(value);
    }
    return true;
}

bool applyCommandLine(const QCommandLineParser& parser,
                      const QCommandLineOption& samplesOption,
                      const QCommandLineOption& noMonteCarloOption,
                      const QCommandLineOption& seedOption,
                      const QCommandLineOption& workersOption,
                      const QCommandLineOption& targetOption,
                      app::AppConfig& config,
                      QString& errorMessage) {
    if (parser.isSet(samplesOption)) {
        bool ok = false;
        const int samples = parser.value(samplesOption).toInt(&ok);
        if (!ok || samples < 0) {
            errorMessage = QStringLiteral("--samples expects a non-negative integer");
            return false;
        }
        config.analysis.monteCarloSamples = samples;
    }
    if (parser.isSet(noMonteCarloOption)) {
        config.analysis.runMonteCarlo = false;
    }
    if (parser.isSet(seedOption)) {
        bool ok = false;
        const qulonglong seed = parser.value(seedOption).toULongLong(&ok);
        if (!ok) {
            errorMessage = QStringLiteral("--seed expects a non-negative integer");
            return false;
        }
        config.analysis.seed = seed;
    }
    if (parser.isSet(workersOption)) {
        bool ok = false;
        const int workers = parser.value(workersOption).toInt(&ok);
        if (!ok || workers < 1) {
            errorMessage = QStringLiteral("--workers expects a positive integer");
            return false;
        }
        config.analysis.workerCount = workers;
        config.detection.workerCount = workers;
    }
    if (parser.isSet(targetOption)) {
        std::vector<double> values;
        if (!parseNumberList(parser.value(targetOption), 3, values)) {
            errorMessage = QStringLiteral("--target expects <nominal>,<plus>,<minus>");
            return false;
        }
        config.analysis.targetSpec = core::tolerance::TargetSpec{values[0], values[1], values[2]};
    }
    return true;
}

void printDetection(const core::assembly::InterfaceDetectionResult& detection) {
    out() << "Interfaces: " << detection.interfaces.size() << "\n";
    for (const auto& iface : detection.interfaces) {
        out() << "  " << QString::fromStdString(iface.id)
              << "  " << QString::fromStdString(iface.partA.partId)
              << " <-> " << QString::fromStdString(iface.partB.partId)
              << "  " << core::assembly::interfaceTypeName(iface.interfaceType)
              << "  proximity=" << mm(iface.proximity)
              << "  area=" << QString::number(iface.contactArea, 'f', 2)
              << (iface.isJunction ? "  [junction]" : "") << "\n";
    }

    out() << "Junction parts:";
    if (detection.junctionParts.empty()) {
        out() << " none";
    }
    for (const auto& partId : detection.junctionParts) {
        out() << " " << QString::fromStdString(partId);
    }
    out() << "\n";
}

void printReport(const core::tolerance::ToleranceChain& chain,
                 const core::tolerance::ToleranceResult& result,
                 const std::vector<std::string>& insights) {
    out() << "Chain: " << QString::fromStdString(chain.name)
          << " (" << result.linkCount << " links)\n";
    out() << "  Total nominal: " << mm(result.totalNominal) << "\n";
    out() << "  Worst case:    " << mm(result.worstCase.min) << " .. " << mm(result.worstCase.max)
          << "  (+/-" << mm(result.worstCase.tolerance) << ")\n";
    out() << "  RSS:           " << mm(result.rss.min) << " .. " << mm(result.rss.max)
          << "  (+/-" << mm(result.rss.tolerance) << ", sigma " << mm(result.rss.sigma) << ")\n";

    if (result.monteCarlo) {
        const auto& mc = *result.monteCarlo;
        out() << "  Monte Carlo:   mean " << mm(mc.mean) << ", std " << mm(mc.stdDev)
              << ", range " << mm(mc.min) << " .. " << mm(mc.max)
              << ", Cpk " << QString::number(mc.cpk, 'f', 2)
              << " (" << mc.sampleSize << " samples)\n";
        out() << "  Percentiles:   p0.1 " << mm(mc.percentiles.p0_1)
              << "  p50 " << mm(mc.percentiles.p50)
              << "  p99.9 " << mm(mc.percentiles.p99_9) << "\n";
    }

    out() << "  Contributions:\n";
    for (const auto& c : result.contributions) {
        out() << "    " << QString::fromStdString(c.linkName).leftJustified(28)
              << QString::number(c.percentOfTotal, 'f', 1).rightJustified(6) << "%\n";
    }

    if (result.targetSpec) {
        out() << "  Target:        " << mm(result.targetSpec->lowerLimit())
              << " .. " << mm(result.targetSpec->upperLimit())
              << "  meets spec: " << (result.meetsSpec.value_or(false) ? "yes" : "no")
              << ", margin " << mm(result.margin.value_or(0.0)) << "\n";
    }

    if (!insights.empty()) {
        out() << "Insights:\n";
        for (const auto& insight : insights) {
            out() << "  - " << QString::fromStdString(insight) << "\n";
        }
    }
    out().flush();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("StackCAD"));
    QCoreApplication::setApplicationName(QStringLiteral("StackCAD"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Mechanical tolerance stackup analysis"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption assemblyOption("assembly", "Part summaries from the geometry front end.", "file");
    const QCommandLineOption pathOption("path", "Generate a chain along the path between two parts.", "from,to");
    const QCommandLineOption autoChainOption("auto-chain", "Generate a chain from the whole assembly.");
    const QCommandLineOption saveGraphOption("save-graph", "Write the assembly graph.", "file");
    const QCommandLineOption chainOption("chain", "Analyze a saved chain.", "file");
    const QCommandLineOption saveChainOption("save-chain", "Write the analyzed chain.", "file");
    const QCommandLineOption samplesOption("samples", "Monte Carlo sample count.", "n");
    const QCommandLineOption noMonteCarloOption("no-monte-carlo", "Skip the Monte Carlo simulation.");
    const QCommandLineOption seedOption("seed", "Seed for a reproducible simulation.", "n");
    const QCommandLineOption workersOption("workers", "Worker threads for detection and simulation.", "n");
    const QCommandLineOption targetOption("target", "Target specification.", "nominal,plus,minus");
    const QCommandLineOption jsonOption("json", "Write the result and insights as JSON.", "file");
    const QCommandLineOption configOption("config", "JSON configuration file.", "file");
    const QCommandLineOption verboseOption("verbose", "Echo info and debug logs to stderr.");
    const QCommandLineOption noLogFileOption("no-log-file", "Do not write a log file.");

    parser.addOptions({assemblyOption, pathOption, autoChainOption, saveGraphOption,
                       chainOption, saveChainOption, samplesOption, noMonteCarloOption,
                       seedOption, workersOption, targetOption, jsonOption, configOption,
                       verboseOption, noLogFileOption});
    parser.process(app);

    app::LoggingOptions loggingOptions;
#ifndef NDEBUG
    loggingOptions.debugBuild = true;
#endif
    loggingOptions.verboseConsole = parser.isSet(verboseOption);
    loggingOptions.writeLogFile = !parser.isSet(noLogFileOption);
    if (!app::Logging::initialize(loggingOptions)) {
        err() << "Logging could not be initialized; continuing without a log file\n";
    }

    const int exitCode = [&]() -> int {
        if (!parser.isSet(assemblyOption) && !parser.isSet(chainOption)) {
            err() << "Nothing to do: pass --assembly and/or --chain\n" << parser.helpText();
            return kExitFailure;
        }
        if (parser.isSet(pathOption) && parser.isSet(autoChainOption)) {
            err() << "--path and --auto-chain are mutually exclusive\n";
            return kExitFailure;
        }

        app::AppConfig config;
        QSettings settings(QStringLiteral("StackCAD"), QStringLiteral("StackCAD"));
        config.loadSettings(settings);

        QString errorMessage;
        if (parser.isSet(configOption)
            && !app::AppConfig::loadFile(parser.value(configOption), config, errorMessage)) {
            err() << "Invalid configuration: " << errorMessage << "\n";
            return kExitFailure;
        }
        if (!applyCommandLine(parser, samplesOption, noMonteCarloOption, seedOption,
                              workersOption, targetOption, config, errorMessage)) {
            err() << errorMessage << "\n";
            return kExitFailure;
        }

        std::optional<core::tolerance::ToleranceChain> chain;
        std::optional<core::assembly::AssemblyGraph> graph;
        bool chainFromGraph = false;

        // The graph carries the generated chain in whatever state it reached.
        const auto storeGraph = [&]() {
            if (!graph) {
                return true;
            }
            if (chainFromGraph) {
                graph->setChain(*chain);
            }
            if (parser.isSet(saveGraphOption)
                && !io::AssemblyIO::saveGraph(*graph, parser.value(saveGraphOption), errorMessage)) {
                err() << "Cannot save graph: " << errorMessage << "\n";
                return false;
            }
            return true;
        };

        if (parser.isSet(assemblyOption)) {
            std::vector<core::assembly::AssemblyPart> parts;
            if (!io::AssemblyIO::loadParts(parser.value(assemblyOption), parts, errorMessage)) {
                err() << "Cannot load assembly: " << errorMessage << "\n";
                return kExitFailure;
            }

            const core::assembly::InterfaceDetector detector(config.detection);
            const auto detection = detector.detect(parts);
            graph = core::assembly::AssemblyGraphBuilder::build(parts, detection.interfaces);
            printDetection(detection);

            if (parser.isSet(pathOption)) {
                const QStringList ends = parser.value(pathOption).split(',', Qt::SkipEmptyParts);
                if (ends.size() != 2) {
                    err() << "--path expects <from>,<to>\n";
                    return kExitFailure;
                }
                const auto path = core::assembly::AssemblyGraphBuilder::findPath(
                    *graph, ends[0].trimmed().toStdString(), ends[1].trimmed().toStdString());
                if (!path) {
                    err() << "No path between " << ends[0] << " and " << ends[1] << "\n";
                    return kExitFailure;
                }
                chain = core::assembly::ChainGenerator::generateFromPath("chain-path", *graph, *path,
                                                                         config.chainGeneration);
            } else if (parser.isSet(autoChainOption)) {
                chain = core::assembly::ChainGenerator::generateFromAssembly(
                    "chain-auto", graph->parts(), detection.interfaces, config.chainGeneration);
            }
            chainFromGraph = chain.has_value();
        }

        if (parser.isSet(chainOption)) {
            core::tolerance::ToleranceChain loaded;
            if (!io::ChainIO::loadChain(parser.value(chainOption), loaded, errorMessage)) {
                err() << "Cannot load chain: " << errorMessage << "\n";
                return kExitFailure;
            }
            if (!storeGraph()) {
                return kExitFailure;
            }
            graph.reset();
            chainFromGraph = false;
            chain = std::move(loaded);
        }

        if (!chain) {
            return storeGraph() ? kExitOk : kExitFailure;
        }

        core::tolerance::StackupCalculator calculator;
        const auto outcome = calculator.calculate(chain->links, config.analysis);
        if (!outcome.success) {
            err() << "Chain rejected: " << QString::fromStdString(outcome.errorMessage) << "\n";
            for (const auto& issue : outcome.issues) {
                err() << "  " << QString::fromStdString(issue.linkId.empty() ? "target" : issue.linkId)
                      << "." << QString::fromStdString(issue.field)
                      << ": " << QString::fromStdString(issue.message) << "\n";
            }
            static_cast<void>(storeGraph()); // already failing; storeGraph reports its own error
            return kExitFailure;
        }

        chain->result = outcome.result;
        chain->isCalculated = true;
        if (!storeGraph()) {
            return kExitFailure;
        }

        const auto insights = core::tolerance::InsightGenerator::generate(outcome.result);
        printReport(*chain, outcome.result, insights);

        if (parser.isSet(jsonOption)
            && !io::ChainIO::saveReport(outcome.result, insights, parser.value(jsonOption), errorMessage)) {
            err() << "Cannot write report: " << errorMessage << "\n";
            return kExitFailure;
        }
        if (parser.isSet(saveChainOption)
            && !io::ChainIO::saveChain(*chain, parser.value(saveChainOption), errorMessage)) {
            err() << "Cannot save chain: " << errorMessage << "\n";
            return kExitFailure;
        }
        return kExitOk;
    }();

    qCInfo(logMain) << "main:exit" << "code=" << exitCode;
    err().flush();
    app::Logging::shutdown();
    return exitCode;
}
