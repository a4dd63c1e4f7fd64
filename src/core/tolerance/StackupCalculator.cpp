#include "StackupCalculator.h"

#include "ContributionAnalyzer.h"
#include "MonteCarloSimulator.h"
#include "RssAnalyzer.h"
#include "WorstCaseAnalyzer.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>

namespace stackcad::core::tolerance {

Q_LOGGING_CATEGORY(logStackup, "stackcad.core.tolerance.stackup")

namespace {

void checkFinite(std::vector<LinkIssue>& issues, const std::string& linkId,
                 const char* field, double value) {
    if (!std::isfinite(value)) {
        issues.push_back({linkId, field, std::string(field) + " must be a finite number"});
    }
}

void checkTolerance(std::vector<LinkIssue>& issues, const std::string& linkId,
                    const char* field, double value) {
    if (!std::isfinite(value)) {
        issues.push_back({linkId, field, std::string(field) + " must be a finite number"});
    } else if (value < 0.0) {
        issues.push_back({linkId, field, std::string(field) + " must be a non-negative magnitude"});
    }
}

} // anonymous namespace

StackupCalculator::StackupCalculator()
    : ownedRandom_(std::make_unique<SystemRandomSource>())
    , random_(ownedRandom_.get())
{
}

StackupCalculator::StackupCalculator(RandomSource& random)
    : random_(&random)
{
}

StackupCalculator::~StackupCalculator() = default;

std::vector<LinkIssue> StackupCalculator::validate(const std::vector<ChainLink>& links,
                                                   const std::optional<TargetSpec>& targetSpec) {
    std::vector<LinkIssue> issues;

    for (const auto& link : links) {
        checkFinite(issues, link.id, "nominal", link.nominal);
        checkTolerance(issues, link.id, "plusTolerance", link.plusTolerance);
        checkTolerance(issues, link.id, "minusTolerance", link.minusTolerance);
        if (!std::isfinite(link.sigma) || link.sigma <= 0.0) {
            issues.push_back({link.id, "sigma", "sigma must be a finite positive number"});
        }
    }

    if (targetSpec) {
        checkFinite(issues, {}, "targetSpec.nominal", targetSpec->nominal);
        checkTolerance(issues, {}, "targetSpec.plusTolerance", targetSpec->plusTolerance);
        checkTolerance(issues, {}, "targetSpec.minusTolerance", targetSpec->minusTolerance);
    }

    return issues;
}

ToleranceResult StackupCalculator::analyze(const std::vector<ChainLink>& links,
                                           const CalculationOptions& options,
                                           RandomSource& random) {
    ToleranceResult result;
    result.totalNominal = totalNominal(links);
    result.linkCount = static_cast<int>(links.size());

    result.worstCase = WorstCaseAnalyzer::analyze(links);

    RssAnalyzer::Analysis rss = RssAnalyzer::analyze(links);
    result.rss = rss.result;

    if (options.runMonteCarlo) {
        MonteCarloConfig config;
        config.samples = options.monteCarloSamples;
        config.workerCount = options.workerCount;
        config.targetSpec = options.targetSpec;

        MonteCarloSimulator simulator(random);
        result.monteCarlo = simulator.run(links, config);
    }

    result.contributions = ContributionAnalyzer::analyze(links, rss.variances);

    if (options.targetSpec) {
        const double upper = options.targetSpec->upperLimit();
        const double lower = options.targetSpec->lowerLimit();
        result.targetSpec = options.targetSpec;
        result.meetsSpec = result.rss.min >= lower && result.rss.max <= upper;
        result.margin = std::min(result.rss.min - lower, upper - result.rss.max);
    }

    return result;
}

CalculationOutcome StackupCalculator::calculate(const std::vector<ChainLink>& links,
                                                const CalculationOptions& options) {
    qCInfo(logStackup) << "calculate:start"
                       << "links=" << links.size()
                       << "monteCarlo=" << options.runMonteCarlo
                       << "samples=" << options.monteCarloSamples
                       << "target=" << options.targetSpec.has_value();

    CalculationOutcome outcome;
    outcome.issues = validate(links, options.targetSpec);
    if (!outcome.issues.empty()) {
        outcome.success = false;
        outcome.errorMessage = "Invalid input: " + std::to_string(outcome.issues.size()) + " issue(s)";
        for (const auto& issue : outcome.issues) {
            qCWarning(logStackup) << "calculate:invalid"
                                  << "linkId=" << QString::fromStdString(issue.linkId)
                                  << "field=" << QString::fromStdString(issue.field)
                                  << QString::fromStdString(issue.message);
        }
        return outcome;
    }

    if (options.seed) {
        SeededRandomSource seeded(*options.seed);
        outcome.result = analyze(links, options, seeded);
    } else {
        outcome.result = analyze(links, options, *random_);
    }

    qCInfo(logStackup) << "calculate:done"
                       << "totalNominal=" << outcome.result.totalNominal
                       << "worstCaseTol=" << outcome.result.worstCase.tolerance
                       << "rssTol=" << outcome.result.rss.tolerance;
    return outcome;
}

} // namespace stackcad::core::tolerance
