/**
 * @file ChainIO.cpp
 * @brief Implementation of chain and result serialization
 */

#include "ChainIO.h"
#include "JSONUtils.h"

#include <QJsonArray>
#include <QLoggingCategory>

#include <cmath>
#include <limits>

namespace stackcad::io {

using namespace core::tolerance;

Q_LOGGING_CATEGORY(logChainIO, "stackcad.io.chain")

namespace {

void putOptionalString(QJsonObject& json, const char* key, const std::string& value) {
    if (!value.empty()) {
        json[key] = QString::fromStdString(value);
    }
}

QJsonValue cpkToJson(double cpk) {
    if (std::isinf(cpk)) {
        return cpk > 0.0 ? QStringLiteral("inf") : QStringLiteral("-inf");
    }
    return cpk;
}

double cpkFromJson(JsonReader& reader, const QJsonObject& json) {
    const QJsonValue value = json.value("cpk");
    if (value.isString()) {
        if (value.toString() == "inf") return std::numeric_limits<double>::infinity();
        if (value.toString() == "-inf") return -std::numeric_limits<double>::infinity();
        reader.fail(reader.childPath("cpk"), "expected a number, \"inf\" or \"-inf\"");
        return 0.0;
    }
    return reader.number("cpk");
}

QJsonObject serializeDatum(const DatumReference& datum) {
    QJsonObject json;
    json["partId"] = QString::fromStdString(datum.partId);
    json["faceId"] = QString::fromStdString(datum.faceId);
    putOptionalString(json, "description", datum.description);
    return json;
}

DatumReference parseDatum(JsonReader& parent, const char* key) {
    JsonReader reader(parent.object(key), parent.childPath(key));
    DatumReference datum;
    datum.partId = reader.string("partId");
    datum.faceId = reader.string("faceId");
    datum.description = reader.stringOr("description", {});
    if (!reader.ok()) {
        parent.fail(reader.error().path, reader.error().message);
    }
    return datum;
}

QJsonObject serializeMonteCarlo(const MonteCarloResult& mc) {
    QJsonObject json;
    json["mean"] = mc.mean;
    json["stdDev"] = mc.stdDev;
    json["min"] = mc.min;
    json["max"] = mc.max;
    json["cpk"] = cpkToJson(mc.cpk);
    json["sampleSize"] = mc.sampleSize;

    QJsonObject percentiles;
    percentiles["p0_1"] = mc.percentiles.p0_1;
    percentiles["p1"] = mc.percentiles.p1;
    percentiles["p5"] = mc.percentiles.p5;
    percentiles["p50"] = mc.percentiles.p50;
    percentiles["p95"] = mc.percentiles.p95;
    percentiles["p99"] = mc.percentiles.p99;
    percentiles["p99_9"] = mc.percentiles.p99_9;
    json["percentiles"] = percentiles;

    QJsonArray histogram;
    for (const auto& bin : mc.histogram) {
        QJsonObject binJson;
        binJson["min"] = bin.min;
        binJson["max"] = bin.max;
        binJson["count"] = bin.count;
        binJson["percentage"] = bin.percentage;
        histogram.append(binJson);
    }
    json["histogram"] = histogram;
    return json;
}

MonteCarloResult parseMonteCarlo(JsonReader& parent, const char* key) {
    const QJsonObject json = parent.object(key);
    JsonReader reader(json, parent.childPath(key));

    MonteCarloResult mc;
    mc.mean = reader.number("mean");
    mc.stdDev = reader.number("stdDev");
    mc.min = reader.number("min");
    mc.max = reader.number("max");
    mc.cpk = cpkFromJson(reader, json);
    mc.sampleSize = reader.smallInteger("sampleSize");

    JsonReader pReader(reader.object("percentiles"), reader.childPath("percentiles"));
    mc.percentiles.p0_1 = pReader.number("p0_1");
    mc.percentiles.p1 = pReader.number("p1");
    mc.percentiles.p5 = pReader.number("p5");
    mc.percentiles.p50 = pReader.number("p50");
    mc.percentiles.p95 = pReader.number("p95");
    mc.percentiles.p99 = pReader.number("p99");
    mc.percentiles.p99_9 = pReader.number("p99_9");
    if (!pReader.ok()) {
        reader.fail(pReader.error().path, pReader.error().message);
    }

    const QJsonArray histogram = reader.array("histogram");
    for (int i = 0; i < histogram.size() && reader.ok(); ++i) {
        JsonReader binReader(histogram[i].toObject(), reader.childPath("histogram", i));
        HistogramBin bin;
        bin.min = binReader.number("min");
        bin.max = binReader.number("max");
        bin.count = binReader.smallInteger("count");
        bin.percentage = binReader.number("percentage");
        if (!binReader.ok()) {
            reader.fail(binReader.error().path, binReader.error().message);
        }
        mc.histogram.push_back(bin);
    }

    if (!reader.ok()) {
        parent.fail(reader.error().path, reader.error().message);
    }
    return mc;
}

} // anonymous namespace

QJsonObject ChainIO::serializeLink(const ChainLink& link) {
    QJsonObject json;
    json["id"] = QString::fromStdString(link.id);
    json["type"] = linkTypeName(link.type);
    json["name"] = QString::fromStdString(link.name);
    putOptionalString(json, "partId", link.partId);
    putOptionalString(json, "interfaceId", link.interfaceId);
    putOptionalString(json, "faceId", link.faceId);
    json["nominal"] = link.nominal;
    json["plusTolerance"] = link.plusTolerance;
    json["minusTolerance"] = link.minusTolerance;
    json["direction"] = contributionDirectionName(link.direction);
    json["distribution"] = distributionTypeName(link.distribution);
    json["sigma"] = link.sigma;
    return json;
}

ParseResult<ChainLink> ChainIO::parseLink(const QJsonObject& json, const std::string& path) {
    JsonReader reader(json, path);
    ChainLink link;

    link.id = reader.string("id");
    link.name = reader.stringOr("name", {});
    link.partId = reader.stringOr("partId", {});
    link.interfaceId = reader.stringOr("interfaceId", {});
    link.faceId = reader.stringOr("faceId", {});
    link.nominal = reader.number("nominal");
    link.plusTolerance = reader.number("plusTolerance");
    link.minusTolerance = reader.number("minusTolerance");
    link.sigma = reader.numberOr("sigma", 3.0);

    const std::string type = reader.stringOr("type", "part_dimension");
    if (auto parsed = linkTypeFromName(type)) {
        link.type = *parsed;
    } else {
        reader.fail(reader.childPath("type"), "unknown link type \"" + type + "\"");
    }

    const std::string direction = reader.stringOr("direction", "positive");
    if (auto parsed = contributionDirectionFromName(direction)) {
        link.direction = *parsed;
    } else {
        reader.fail(reader.childPath("direction"), "unknown direction \"" + direction + "\"");
    }

    const std::string distribution = reader.stringOr("distribution", "normal");
    if (auto parsed = distributionTypeFromName(distribution)) {
        link.distribution = *parsed;
    } else {
        reader.fail(reader.childPath("distribution"),
                    "unknown distribution \"" + distribution + "\"");
    }

    if (!reader.ok()) {
        return reader.error();
    }
    return link;
}

QJsonObject ChainIO::serializeTargetSpec(const TargetSpec& spec) {
    QJsonObject json;
    json["nominal"] = spec.nominal;
    json["plusTolerance"] = spec.plusTolerance;
    json["minusTolerance"] = spec.minusTolerance;
    return json;
}

ParseResult<TargetSpec> ChainIO::parseTargetSpec(const QJsonObject& json, const std::string& path) {
    JsonReader reader(json, path);
    TargetSpec spec;
    spec.nominal = reader.number("nominal");
    spec.plusTolerance = reader.number("plusTolerance");
    spec.minusTolerance = reader.number("minusTolerance");
    if (!reader.ok()) {
        return reader.error();
    }
    return spec;
}

QJsonObject ChainIO::serializeResult(const ToleranceResult& result) {
    QJsonObject json;
    json["totalNominal"] = result.totalNominal;
    json["linkCount"] = result.linkCount;

    QJsonObject worstCase;
    worstCase["min"] = result.worstCase.min;
    worstCase["max"] = result.worstCase.max;
    worstCase["tolerance"] = result.worstCase.tolerance;
    worstCase["range"] = result.worstCase.range;
    json["worstCase"] = worstCase;

    QJsonObject rss;
    rss["min"] = result.rss.min;
    rss["max"] = result.rss.max;
    rss["tolerance"] = result.rss.tolerance;
    rss["sigma"] = result.rss.sigma;
    rss["processCapability"] = result.rss.processCapability;
    json["rss"] = rss;

    if (result.monteCarlo) {
        json["monteCarlo"] = serializeMonteCarlo(*result.monteCarlo);
    }

    QJsonArray contributions;
    for (const auto& c : result.contributions) {
        QJsonObject cJson;
        cJson["linkId"] = QString::fromStdString(c.linkId);
        cJson["linkName"] = QString::fromStdString(c.linkName);
        cJson["nominalContribution"] = c.nominalContribution;
        cJson["toleranceContribution"] = c.toleranceContribution;
        cJson["varianceContribution"] = c.varianceContribution;
        cJson["percentOfTotal"] = c.percentOfTotal;
        contributions.append(cJson);
    }
    json["contributions"] = contributions;

    if (result.targetSpec) {
        json["targetSpec"] = serializeTargetSpec(*result.targetSpec);
    }
    if (result.meetsSpec) {
        json["meetsSpec"] = *result.meetsSpec;
    }
    if (result.margin) {
        json["margin"] = *result.margin;
    }
    return json;
}

ParseResult<ToleranceResult> ChainIO::parseResult(const QJsonObject& json, const std::string& path) {
    JsonReader reader(json, path);
    ToleranceResult result;

    result.totalNominal = reader.number("totalNominal");
    result.linkCount = reader.smallInteger("linkCount");

    JsonReader wcReader(reader.object("worstCase"), reader.childPath("worstCase"));
    result.worstCase.min = wcReader.number("min");
    result.worstCase.max = wcReader.number("max");
    result.worstCase.tolerance = wcReader.number("tolerance");
    result.worstCase.range = wcReader.number("range");
    if (!wcReader.ok()) {
        reader.fail(wcReader.error().path, wcReader.error().message);
    }

    JsonReader rssReader(reader.object("rss"), reader.childPath("rss"));
    result.rss.min = rssReader.number("min");
    result.rss.max = rssReader.number("max");
    result.rss.tolerance = rssReader.number("tolerance");
    result.rss.sigma = rssReader.number("sigma");
    result.rss.processCapability = rssReader.numberOr("processCapability", 1.0);
    if (!rssReader.ok()) {
        reader.fail(rssReader.error().path, rssReader.error().message);
    }

    if (reader.has("monteCarlo")) {
        result.monteCarlo = parseMonteCarlo(reader, "monteCarlo");
    }

    const QJsonArray contributions = reader.array("contributions");
    for (int i = 0; i < contributions.size() && reader.ok(); ++i) {
        JsonReader cReader(contributions[i].toObject(), reader.childPath("contributions", i));
        LinkContribution c;
        c.linkId = cReader.string("linkId");
        c.linkName = cReader.stringOr("linkName", {});
        c.nominalContribution = cReader.number("nominalContribution");
        c.toleranceContribution = cReader.number("toleranceContribution");
        c.varianceContribution = cReader.number("varianceContribution");
        c.percentOfTotal = cReader.number("percentOfTotal");
        if (!cReader.ok()) {
            reader.fail(cReader.error().path, cReader.error().message);
        }
        result.contributions.push_back(std::move(c));
    }

    if (reader.has("targetSpec")) {
        TargetSpec spec;
        if (unwrapInto(parseTargetSpec(reader.object("targetSpec"), reader.childPath("targetSpec")),
                       spec, reader)) {
            result.targetSpec = spec;
        }
    }
    if (reader.has("meetsSpec")) {
        result.meetsSpec = reader.booleanOr("meetsSpec", false);
    }
    result.margin = reader.optionalNumber("margin");

    if (!reader.ok()) {
        return reader.error();
    }
    return result;
}

QJsonObject ChainIO::serializeChain(const ToleranceChain& chain) {
    QJsonObject json;
    json["id"] = QString::fromStdString(chain.id);
    json["name"] = QString::fromStdString(chain.name);
    putOptionalString(json, "description", chain.description);
    json["direction"] = JSONUtils::toArray(chain.direction);

    QJsonArray links;
    for (const auto& link : chain.links) {
        links.append(serializeLink(link));
    }
    json["links"] = links;

    if (chain.startDatum) {
        json["startDatum"] = serializeDatum(*chain.startDatum);
    }
    if (chain.endDatum) {
        json["endDatum"] = serializeDatum(*chain.endDatum);
    }
    if (chain.result) {
        json["result"] = serializeResult(*chain.result);
    }
    json["isComplete"] = chain.isComplete;
    json["isCalculated"] = chain.isCalculated;
    return json;
}

ParseResult<ToleranceChain> ChainIO::parseChain(const QJsonObject& json, const std::string& path) {
    JsonReader reader(json, path);
    ToleranceChain chain;

    chain.id = reader.string("id");
    chain.name = reader.stringOr("name", {});
    chain.description = reader.stringOr("description", {});
    if (reader.has("direction")) {
        chain.direction = reader.triple("direction");
    }

    const QJsonArray links = reader.array("links");
    for (int i = 0; i < links.size() && reader.ok(); ++i) {
        if (!links[i].isObject()) {
            reader.fail(reader.childPath("links", i), "expected an object");
            break;
        }
        ChainLink link;
        if (unwrapInto(parseLink(links[i].toObject(), reader.childPath("links", i)), link, reader)) {
            chain.links.push_back(std::move(link));
        }
    }

    if (reader.has("startDatum")) {
        chain.startDatum = parseDatum(reader, "startDatum");
    }
    if (reader.has("endDatum")) {
        chain.endDatum = parseDatum(reader, "endDatum");
    }
    if (reader.has("result")) {
        ToleranceResult result;
        if (unwrapInto(parseResult(reader.object("result"), reader.childPath("result")),
                       result, reader)) {
            chain.result = std::move(result);
        }
    }

    chain.isComplete = reader.booleanOr("isComplete", chain.links.size() >= 2);
    chain.isCalculated = reader.booleanOr("isCalculated", chain.result.has_value());

    if (!reader.ok()) {
        return reader.error();
    }
    return chain;
}

QJsonObject ChainIO::toDocument(const ToleranceChain& chain) {
    QJsonObject document;
    document["format"] = kFormat;
    document["version"] = kVersion;
    document["chain"] = serializeChain(chain);
    return document;
}

ParseResult<ToleranceChain> ChainIO::fromDocument(const QJsonObject& document) {
    if (auto error = JSONUtils::checkHeader(document, kFormat, kVersion)) {
        return *error;
    }
    const QJsonValue chain = document.value("chain");
    if (!chain.isObject()) {
        return ParseError{"chain", "missing chain object"};
    }
    return parseChain(chain.toObject(), "chain");
}

bool ChainIO::saveChain(const ToleranceChain& chain, const QString& path, QString& errorMessage) {
    qCInfo(logChainIO) << "saveChain:start" << "path=" << path
                       << "links=" << chain.links.size();
    if (!JSONUtils::writeObjectFile(path, toDocument(chain), false, errorMessage)) {
        qCWarning(logChainIO) << "saveChain:failed" << errorMessage;
        return false;
    }
    qCInfo(logChainIO) << "saveChain:done";
    return true;
}

bool ChainIO::loadChain(const QString& path, ToleranceChain& chain, QString& errorMessage) {
    qCInfo(logChainIO) << "loadChain:start" << "path=" << path;
    QJsonObject document;
    if (!JSONUtils::readObjectFile(path, document, errorMessage)) {
        qCWarning(logChainIO) << "loadChain:failed-read" << errorMessage;
        return false;
    }

    auto parsed = fromDocument(document);
    if (const auto* error = std::get_if<ParseError>(&parsed)) {
        errorMessage = QString::fromStdString(error->toString());
        qCWarning(logChainIO) << "loadChain:invalid" << errorMessage;
        return false;
    }

    chain = std::move(std::get<ToleranceChain>(parsed));
    qCInfo(logChainIO) << "loadChain:done" << "links=" << chain.links.size();
    return true;
}

bool ChainIO::saveReport(const ToleranceResult& result,
                         const std::vector<std::string>& insights,
                         const QString& path,
                         QString& errorMessage) {
    QJsonObject report;
    report["result"] = serializeResult(result);
    QJsonArray insightArray;
    for (const auto& insight : insights) {
        insightArray.append(QString::fromStdString(insight));
    }
    report["insights"] = insightArray;

    if (!JSONUtils::writeObjectFile(path, report, false, errorMessage)) {
        qCWarning(logChainIO) << "saveReport:failed" << errorMessage;
        return false;
    }
    qCInfo(logChainIO) << "saveReport:done" << "path=" << path;
    return true;
}

} // namespace stackcad::io
