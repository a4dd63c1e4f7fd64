#include "ToleranceTypes.h"

namespace stackcad::core::tolerance {

namespace {

using Kind = StandardFit::Kind;

const std::vector<StandardFit> kStandardFits = {
    {"H7g6", Kind::Clearance,    {0.025, 0.0}, {0.0, 0.016}},
    {"H8f7", Kind::Clearance,    {0.033, 0.0}, {0.0, 0.025}},
    {"H9d9", Kind::Clearance,    {0.052, 0.0}, {0.0, 0.052}},
    {"H7k6", Kind::Transition,   {0.025, 0.0}, {0.015, 0.001}},
    {"H7n6", Kind::Transition,   {0.025, 0.0}, {0.023, 0.002}},
    {"H7p6", Kind::Interference, {0.025, 0.0}, {0.035, 0.022}},
    {"H7s6", Kind::Interference, {0.025, 0.0}, {0.043, 0.035}},
};

} // anonymous namespace

const std::vector<StandardFit>& standardFits() {
    return kStandardFits;
}

std::optional<StandardFit> findStandardFit(const std::string& designation) {
    for (const auto& fit : kStandardFits) {
        if (designation == fit.designation) {
            return fit;
        }
    }
    return std::nullopt;
}

ToleranceChain createNewChain(const std::string& id, const std::string& name) {
    ToleranceChain chain;
    chain.id = id;
    chain.name = name;
    chain.direction = {1.0, 0.0, 0.0};
    return chain;
}

ChainLink createNewLink(const std::string& id,
                        LinkType type,
                        const std::string& name,
                        double nominal) {
    ChainLink link;
    link.id = id;
    link.type = type;
    link.name = name;
    link.nominal = nominal;
    link.plusTolerance = 0.1;
    link.minusTolerance = 0.1;
    link.direction = ContributionDirection::Positive;
    link.distribution = DistributionType::Normal;
    link.sigma = 3.0;
    return link;
}

double totalNominal(const std::vector<ChainLink>& links) {
    double total = 0.0;
    for (const auto& link : links) {
        total += link.sign() * link.nominal;
    }
    return total;
}

const char* distributionTypeName(DistributionType type) {
    switch (type) {
        case DistributionType::Normal: return "normal";
        case DistributionType::Uniform: return "uniform";
        case DistributionType::Triangular: return "triangular";
        default: return "normal";
    }
}

const char* contributionDirectionName(ContributionDirection direction) {
    switch (direction) {
        case ContributionDirection::Positive: return "positive";
        case ContributionDirection::Negative: return "negative";
        default: return "positive";
    }
}

const char* linkTypeName(LinkType type) {
    switch (type) {
        case LinkType::PartDimension: return "part_dimension";
        case LinkType::InterfaceGap: return "interface_gap";
        case LinkType::DatumReference: return "datum_reference";
        default: return "part_dimension";
    }
}

std::optional<DistributionType> distributionTypeFromName(const std::string& name) {
    if (name == "normal") return DistributionType::Normal;
    if (name == "uniform") return DistributionType::Uniform;
    if (name == "triangular") return DistributionType::Triangular;
    return std::nullopt;
}

std::optional<ContributionDirection> contributionDirectionFromName(const std::string& name) {
    if (name == "positive") return ContributionDirection::Positive;
    if (name == "negative") return ContributionDirection::Negative;
    return std::nullopt;
}

std::optional<LinkType> linkTypeFromName(const std::string& name) {
    if (name == "part_dimension") return LinkType::PartDimension;
    if (name == "interface_gap") return LinkType::InterfaceGap;
    if (name == "datum_reference") return LinkType::DatumReference;
    return std::nullopt;
}

} // namespace stackcad::core::tolerance
