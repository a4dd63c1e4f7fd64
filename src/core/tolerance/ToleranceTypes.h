/**
 * @file ToleranceTypes.h
 * @brief Core type definitions for tolerance stackup analysis
 *
 * A stackup is an ordered chain of signed, toleranced links. The analyzers
 * operate on scalar magnitudes along the chain's nominal measurement axis.
 */

#ifndef STACKCAD_CORE_TOLERANCE_TYPES_H
#define STACKCAD_CORE_TOLERANCE_TYPES_H

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace stackcad::core::tolerance {

//==============================================================================
// Enumerations
//==============================================================================

/**
 * @brief Statistical distribution assumed for a link's variation
 */
enum class DistributionType {
    Normal,
    Uniform,
    Triangular
};

/**
 * @brief Sign of a link's contribution to the stackup total
 */
enum class ContributionDirection {
    Positive,
    Negative
};

/**
 * @brief Semantic role of a link in a chain
 */
enum class LinkType {
    PartDimension,
    InterfaceGap,
    DatumReference
};

//==============================================================================
// Chain Model
//==============================================================================

/**
 * @brief One additive or subtractive term in a stackup
 */
struct ChainLink {
    std::string id;
    LinkType type = LinkType::PartDimension;
    std::string name;

    // Back-references into the assembly (empty when unset)
    std::string partId;
    std::string interfaceId;
    std::string faceId;

    double nominal = 0.0;           // mm, signed
    double plusTolerance = 0.0;     // +mm
    double minusTolerance = 0.0;    // -mm, stored as a positive magnitude

    ContributionDirection direction = ContributionDirection::Positive;
    DistributionType distribution = DistributionType::Normal;
    double sigma = 3.0;             // Standard deviations covered by the tolerance band

    double sign() const { return direction == ContributionDirection::Negative ? -1.0 : 1.0; }
    double totalTolerance() const { return plusTolerance + minusTolerance; }
};

/**
 * @brief Datum face anchoring one end of a chain
 */
struct DatumReference {
    std::string partId;
    std::string faceId;
    std::string description;
};

/**
 * @brief Target specification limits for an assembly requirement
 */
struct TargetSpec {
    double nominal = 0.0;
    double plusTolerance = 0.0;
    double minusTolerance = 0.0;

    double upperLimit() const { return nominal + plusTolerance; }
    double lowerLimit() const { return nominal - minusTolerance; }
};

//==============================================================================
// Result Types
//==============================================================================

struct WorstCaseResult {
    double min = 0.0;
    double max = 0.0;
    double tolerance = 0.0;         // (max - min) / 2
    double range = 0.0;             // max - min
};

struct RssResult {
    double min = 0.0;               // totalNominal - tolerance
    double max = 0.0;               // totalNominal + tolerance
    double tolerance = 0.0;         // 3 * sigma
    double sigma = 0.0;             // Combined standard deviation
    double processCapability = 1.0;
};

struct Percentiles {
    double p0_1 = 0.0;
    double p1 = 0.0;
    double p5 = 0.0;
    double p50 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
    double p99_9 = 0.0;
};

struct HistogramBin {
    double min = 0.0;
    double max = 0.0;
    int count = 0;
    double percentage = 0.0;
};

struct MonteCarloResult {
    double mean = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double cpk = 1.0;
    Percentiles percentiles;
    std::vector<HistogramBin> histogram;
    int sampleSize = 0;
};

struct LinkContribution {
    std::string linkId;
    std::string linkName;
    double nominalContribution = 0.0;
    double toleranceContribution = 0.0;
    double varianceContribution = 0.0;
    double percentOfTotal = 0.0;
};

/**
 * @brief Complete stackup result, recomputed on every calculation
 */
struct ToleranceResult {
    double totalNominal = 0.0;
    int linkCount = 0;

    WorstCaseResult worstCase;
    RssResult rss;
    std::optional<MonteCarloResult> monteCarlo;

    std::vector<LinkContribution> contributions;

    std::optional<TargetSpec> targetSpec;
    std::optional<bool> meetsSpec;
    std::optional<double> margin;
};

/**
 * @brief Ordered chain of links with optional datum anchors
 */
struct ToleranceChain {
    std::string id;
    std::string name;
    std::string description;

    // Measurement direction (informational, analyzers use scalar magnitudes)
    std::array<double, 3> direction{1.0, 0.0, 0.0};

    std::vector<ChainLink> links;

    std::optional<DatumReference> startDatum;
    std::optional<DatumReference> endDatum;

    std::optional<ToleranceResult> result;

    bool isComplete = false;
    bool isCalculated = false;
};

//==============================================================================
// Tolerance Tables
//==============================================================================

/**
 * @brief Symmetric plus/minus tolerance pair (mm)
 */
struct TolerancePair {
    double plus = 0.0;
    double minus = 0.0;
};

/**
 * @brief ISO hole-basis fit: deviations of the hole and the shaft
 */
struct StandardFit {
    enum class Kind { Clearance, Transition, Interference };

    const char* designation;
    Kind kind;
    TolerancePair hole;
    TolerancePair shaft;
};

/**
 * @brief All tabulated standard fits, grouped clearance → interference
 */
const std::vector<StandardFit>& standardFits();

/**
 * @brief Look up a fit by designation (e.g. "H7g6")
 */
std::optional<StandardFit> findStandardFit(const std::string& designation);

//==============================================================================
// Construction Helpers
//==============================================================================

/**
 * @brief Create an empty chain measured along +X
 */
ToleranceChain createNewChain(const std::string& id, const std::string& name);

/**
 * @brief Create a link with the default ±0.1 mm normal tolerance at 3σ
 */
ChainLink createNewLink(const std::string& id,
                        LinkType type,
                        const std::string& name,
                        double nominal = 0.0);

/**
 * @brief Signed sum of link nominals
 */
double totalNominal(const std::vector<ChainLink>& links);

//==============================================================================
// Name Conversions
//==============================================================================

const char* distributionTypeName(DistributionType type);
const char* contributionDirectionName(ContributionDirection direction);
const char* linkTypeName(LinkType type);

std::optional<DistributionType> distributionTypeFromName(const std::string& name);
std::optional<ContributionDirection> contributionDirectionFromName(const std::string& name);
std::optional<LinkType> linkTypeFromName(const std::string& name);

} // namespace stackcad::core::tolerance

#endif // STACKCAD_CORE_TOLERANCE_TYPES_H
