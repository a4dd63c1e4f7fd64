/**
 * @file proto_persistence.cpp
 * @brief Prototype tests for chain and graph JSON persistence and layered
 *        configuration.
 *
 * Test cases:
 * 1. Chain document round trip with a Monte Carlo result and infinite Cpk
 * 2. Rejection of newer versions, wrong formats and bad fields by path
 * 3. Graph round trip keeps insertion order and hashes identically
 * 4. Rejection of asymmetric adjacency and mismatched keys
 * 5. Front-end part input
 * 6. Config overlay from JSON, QSettings and a config file
 */

#include "app/AppConfig.h"
#include "core/assembly/AssemblyGraphBuilder.h"
#include "core/tolerance/StackupCalculator.h"
#include "io/AssemblyIO.h"
#include "io/ChainIO.h"
#include "io/JSONUtils.h"

#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSettings>
#include <QTemporaryDir>

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <variant>
#include <vector>

using namespace stackcad;
using namespace stackcad::core::assembly;
using namespace stackcad::core::tolerance;

namespace {

template <typename T>
const io::ParseError& errorOf(const io::ParseResult<T>& result) {
    return std::get<io::ParseError>(result);
}

ToleranceChain makeCalculatedChain() {
    ToleranceChain chain = createNewChain("chain-1", "Bearing Gap");
    chain.description = "Housing bore to bearing seat";

    ChainLink housing = createNewLink("link-housing", LinkType::PartDimension, "Housing", 25.0);
    housing.partId = "housing";
    housing.faceId = "housing-face-3";

    ChainLink shim = createNewLink("link-shim", LinkType::InterfaceGap, "Shim", 0.5);
    shim.interfaceId = "interface-0";
    shim.plusTolerance = 0.05;
    shim.minusTolerance = 0.02;
    shim.direction = ContributionDirection::Negative;
    shim.distribution = DistributionType::Triangular;
    shim.sigma = 2.0;

    chain.links = {housing, shim};
    chain.startDatum = DatumReference{"housing", "housing-face-3", "Start datum"};
    chain.endDatum = DatumReference{"shim", "shim-face-1", {}};
    chain.isComplete = true;

    CalculationOptions options;
    options.monteCarloSamples = 500;
    options.seed = 11;
    options.targetSpec = TargetSpec{24.5, 0.3, 0.3};

    StackupCalculator calculator;
    const auto outcome = calculator.calculate(chain.links, options);
    assert(outcome.success);
    chain.result = outcome.result;
    chain.isCalculated = true;
    return chain;
}

AssemblyPart makeBlock(const std::string& id, double x) {
    AssemblyPart part;
    part.id = id;
    part.name = "Block " + id;
    part.stepEntityId = 100 + static_cast<std::int64_t>(x);
    part.transform = identityTransform();
    part.transform[12] = x;
    part.boundingBox = BoundingBox{{0.0, 0.0, 0.0}, {10.0, 10.0, 10.0}};

    PartFace right;
    right.id = 1;
    right.faceType = FaceType::Planar;
    right.center = {10.0, 5.0, 5.0};
    right.normal = {1.0, 0.0, 0.0};
    right.area = 100.0;

    PartFace left = right;
    left.id = 2;
    left.center = {0.0, 5.0, 5.0};
    left.normal = {-1.0, 0.0, 0.0};

    part.faces = {right, left};
    return part;
}

MatingInterface makeInterface(const std::string& id, const std::string& a, const std::string& b) {
    MatingInterface iface;
    iface.id = id;
    iface.partA = {a, a + "-face-1"};
    iface.partB = {b, b + "-face-2"};
    iface.interfaceType = InterfaceType::FaceToFace;
    iface.normalAlignment = 1.0;
    iface.contactArea = 10.0;
    iface.defaultTolerance = 0.05;
    iface.contactPoint = {10.0, 5.0, 5.0};
    return iface;
}

// Parts deliberately out of alphabetical order
AssemblyGraph makeGraph() {
    AssemblyGraph graph = AssemblyGraphBuilder::build(
        {makeBlock("zeta", 0.0), makeBlock("alpha", 10.0), makeBlock("mid", 20.0)},
        {makeInterface("if-2", "zeta", "alpha"), makeInterface("if-1", "alpha", "mid")});
    graph.setChain(makeCalculatedChain());
    return graph;
}

void testChainRoundTrip() {
    std::cout << "Test 1: Chain document round trip..." << std::flush;

    ToleranceChain chain = makeCalculatedChain();
    chain.result->monteCarlo->cpk = std::numeric_limits<double>::infinity();

    const QJsonObject document = io::ChainIO::toDocument(chain);
    assert(document.value("format").toString() == "stackcad.chain");
    assert(document.value("version").toInt() == 1);
    assert(document["chain"].toObject()["result"].toObject()["monteCarlo"]
               .toObject()["cpk"].toString() == "inf");

    // Through text, as it would be on disk
    const QJsonObject reread = QJsonDocument::fromJson(
        QJsonDocument(document).toJson()).object();
    const auto parsed = io::ChainIO::fromDocument(reread);
    assert(io::isOk(parsed));
    const ToleranceChain& loaded = std::get<ToleranceChain>(parsed);

    assert(loaded.id == "chain-1");
    assert(loaded.description == "Housing bore to bearing seat");
    assert(loaded.links.size() == 2);
    assert(loaded.links[0].partId == "housing" && loaded.links[0].faceId == "housing-face-3");

    const ChainLink& shim = loaded.links[1];
    assert(shim.type == LinkType::InterfaceGap);
    assert(shim.interfaceId == "interface-0");
    assert(shim.direction == ContributionDirection::Negative);
    assert(shim.distribution == DistributionType::Triangular);
    assert(shim.plusTolerance == 0.05 && shim.minusTolerance == 0.02 && shim.sigma == 2.0);

    assert(loaded.startDatum && loaded.startDatum->description == "Start datum");
    assert(loaded.endDatum && loaded.endDatum->faceId == "shim-face-1");
    assert(loaded.isComplete && loaded.isCalculated);

    const ToleranceResult& original = *chain.result;
    const ToleranceResult& result = *loaded.result;
    assert(result.totalNominal == original.totalNominal);
    assert(result.worstCase.min == original.worstCase.min);
    assert(result.rss.sigma == original.rss.sigma);
    assert(result.contributions.size() == 2);
    assert(result.contributions[1].linkName == "Shim");
    assert(result.targetSpec && result.targetSpec->nominal == 24.5);
    assert(result.meetsSpec == original.meetsSpec);
    assert(result.margin == original.margin);

    assert(result.monteCarlo);
    assert(std::isinf(result.monteCarlo->cpk) && result.monteCarlo->cpk > 0.0);
    assert(result.monteCarlo->sampleSize == 500);
    assert(result.monteCarlo->histogram.size() == original.monteCarlo->histogram.size());
    assert(result.monteCarlo->percentiles.p50 == original.monteCarlo->percentiles.p50);

    // A second serialization is byte-identical
    assert(io::JSONUtils::toCanonicalJson(io::ChainIO::toDocument(loaded))
           == io::JSONUtils::toCanonicalJson(reread));

    std::cout << " PASS\n";
}

void testChainRejections() {
    std::cout << "Test 2: Rejected chain documents name the problem..." << std::flush;

    const QJsonObject good = io::ChainIO::toDocument(makeCalculatedChain());

    QJsonObject newer = good;
    newer["version"] = 2;
    const auto newerResult = io::ChainIO::fromDocument(newer);
    assert(!io::isOk(newerResult));
    assert(errorOf(newerResult).path == "version");

    QJsonObject foreign = good;
    foreign["format"] = "stackcad.assembly";
    const auto foreignResult = io::ChainIO::fromDocument(foreign);
    assert(!io::isOk(foreignResult) && errorOf(foreignResult).path == "format");

    QJsonObject badSigma = good;
    QJsonObject chain = badSigma["chain"].toObject();
    QJsonArray links = chain["links"].toArray();
    QJsonObject link = links[1].toObject();
    link["sigma"] = "three";
    links[1] = link;
    chain["links"] = links;
    badSigma["chain"] = chain;
    const auto sigmaResult = io::ChainIO::fromDocument(badSigma);
    assert(!io::isOk(sigmaResult));
    assert(errorOf(sigmaResult).path == "chain.links[1].sigma");
    assert(errorOf(sigmaResult).toString().find("chain.links[1].sigma: ") == 0);

    link["sigma"] = 3.0;
    link["distribution"] = "lognormal";
    links[1] = link;
    chain["links"] = links;
    chain.remove("result");
    badSigma["chain"] = chain;
    const auto distResult = io::ChainIO::fromDocument(badSigma);
    assert(!io::isOk(distResult));
    assert(errorOf(distResult).path == "chain.links[1].distribution");

    QJsonObject noNominal = io::ChainIO::serializeLink(createNewLink("l", LinkType::PartDimension, "L", 1.0));
    noNominal.remove("nominal");
    const auto missing = io::ChainIO::parseLink(noNominal, "link");
    assert(!io::isOk(missing) && errorOf(missing).path == "link.nominal");

    std::cout << " PASS\n";
}

void testGraphRoundTrip() {
    std::cout << "Test 3: Graph round trip keeps order and hash..." << std::flush;

    const AssemblyGraph graph = makeGraph();
    const QJsonObject document = io::AssemblyIO::serializeGraph(graph);

    // Keyed collections are [key, value] pairs in insertion order
    const QJsonArray parts = document["parts"].toArray();
    assert(parts.size() == 3);
    assert(parts[0].toArray()[0].toString() == "zeta");
    assert(parts[2].toArray()[0].toString() == "mid");

    const auto parsed = io::AssemblyIO::parseGraph(
        QJsonDocument::fromJson(io::JSONUtils::toCanonicalJson(document)).object());
    assert(io::isOk(parsed));
    const AssemblyGraph& loaded = std::get<AssemblyGraph>(parsed);

    assert(loaded.partIds() == graph.partIds());
    assert(loaded.interfaceIds() == graph.interfaceIds());
    assert(loaded.chainIds() == graph.chainIds());
    assert(loaded.adjacencyKeys() == graph.adjacencyKeys());
    assert((loaded.adjacentParts("alpha") == std::vector<std::string>{"zeta", "mid"}));
    assert(loaded.isAdjacencySymmetric());

    const AssemblyPart* alpha = loaded.getPart("alpha");
    assert(alpha && alpha->transform[12] == 10.0 && alpha->stepEntityId == 110);
    assert(alpha->faces.size() == 2 && alpha->faces[1].globalId == "alpha-face-2");
    assert(alpha->color == graph.getPart("alpha")->color);

    const MatingInterface* iface = loaded.getInterface("if-2");
    assert(iface && iface->partB.faceId == "alpha-face-2");
    assert(iface->interfaceType == InterfaceType::FaceToFace);

    const ToleranceChain* chain = loaded.getChain("chain-1");
    assert(chain && chain->links.size() == 2 && chain->result);

    assert(io::JSONUtils::contentHash(io::AssemblyIO::serializeGraph(loaded))
           == io::JSONUtils::contentHash(document));
    assert(io::JSONUtils::contentHash(document).size() == 64);

    std::cout << " PASS\n";
}

void testGraphRejections() {
    std::cout << "Test 4: Inconsistent graph documents are rejected..." << std::flush;

    const QJsonObject good = io::AssemblyIO::serializeGraph(makeGraph());

    // Drop "zeta" from alpha's neighbors, leaving zeta -> alpha one-sided
    QJsonObject asymmetric = good;
    QJsonArray adjacency = asymmetric["adjacency"].toArray();
    for (int i = 0; i < adjacency.size(); ++i) {
        QJsonArray entry = adjacency[i].toArray();
        if (entry[0].toString() == "alpha") {
            entry[1] = QJsonArray{QStringLiteral("mid")};
            adjacency[i] = entry;
        }
    }
    asymmetric["adjacency"] = adjacency;
    const auto asymmetricResult = io::AssemblyIO::parseGraph(asymmetric);
    assert(!io::isOk(asymmetricResult));
    assert(errorOf(asymmetricResult).path == "adjacency");

    QJsonObject mismatched = good;
    QJsonArray parts = mismatched["parts"].toArray();
    QJsonArray first = parts[0].toArray();
    first[0] = "not-zeta";
    parts[0] = first;
    mismatched["parts"] = parts;
    const auto mismatchedResult = io::AssemblyIO::parseGraph(mismatched);
    assert(!io::isOk(mismatchedResult));
    assert(errorOf(mismatchedResult).path == "parts[0]");

    QJsonObject dangling = good;
    QJsonArray interfaces = dangling["interfaces"].toArray();
    QJsonArray entry = interfaces[0].toArray();
    QJsonObject ifaceJson = entry[1].toObject();
    QJsonObject side = ifaceJson["partA"].toObject();
    side["partId"] = "ghost";
    ifaceJson["partA"] = side;
    entry[1] = ifaceJson;
    interfaces[0] = entry;
    dangling["interfaces"] = interfaces;
    assert(!io::isOk(io::AssemblyIO::parseGraph(dangling)));

    QJsonObject newer = good;
    newer["version"] = 7;
    assert(!io::isOk(io::AssemblyIO::parseGraph(newer)));

    std::cout << " PASS\n";
}

void testPartInput() {
    std::cout << "Test 5: Front-end part summaries..." << std::flush;

    const QByteArray text = R"({
        "parts": [
            {
                "id": "pin",
                "name": "Dowel Pin",
                "stepEntityId": 42,
                "boundingBox": {"min": [-5, -5, 0], "max": [5, 5, 20]},
                "faces": [
                    {"id": 7, "faceType": "cylindrical", "normal": [1, 0, 0],
                     "center": [0, 0, 10], "area": 628.3, "radius": 5, "axis": [0, 0, 1]},
                    {"id": 8, "faceType": "planar", "normal": [0, 0, 1], "center": [0, 0, 20]}
                ]
            },
            {"id": "plate", "transform": [1,0,0,0, 0,1,0,0, 0,0,1,0, 0,0,20,1]}
        ]
    })";

    const auto parsed = io::AssemblyIO::parseParts(QJsonDocument::fromJson(text).object());
    assert(io::isOk(parsed));
    const auto& parts = std::get<std::vector<AssemblyPart>>(parsed);
    assert(parts.size() == 2);

    const AssemblyPart& pin = parts[0];
    assert(pin.stepEntityId == 42);
    assert(pin.transform == identityTransform());
    assert(pin.boundingBox && pin.boundingBox->max.z == 20.0);
    assert(pin.faces[0].faceType == FaceType::Cylindrical);
    assert(pin.faces[0].radius && *pin.faces[0].radius == 5.0);
    assert(pin.faces[0].globalId == "pin-face-7");
    assert(pin.faces[1].area == 0.0 && !pin.faces[1].radius);

    const AssemblyPart& plate = parts[1];
    assert(plate.name == "plate");
    assert(plate.transform[14] == 20.0);
    assert(!plate.boundingBox && plate.faces.empty());

    const QByteArray badTransform = R"({"parts": [{"id": "p", "transform": [1, 0, 0]}]})";
    const auto bad = io::AssemblyIO::parseParts(QJsonDocument::fromJson(badTransform).object());
    assert(!io::isOk(bad) && errorOf(bad).path == "parts[0].transform");

    const QByteArray badFace = R"({"parts": [{"id": "p", "faces": [
        {"id": 1, "faceType": "nurbs", "normal": [0, 0, 1], "center": [0, 0, 0]}]}]})";
    const auto badType = io::AssemblyIO::parseParts(QJsonDocument::fromJson(badFace).object());
    assert(!io::isOk(badType) && errorOf(badType).path == "parts[0].faces[0].faceType");

    std::cout << " PASS\n";
}

void testConfigLayers(const QString& dir) {
    std::cout << "Test 6: Config overlay from JSON, settings and file..." << std::flush;

    const QJsonObject json = QJsonDocument::fromJson(R"({
        "detection": {"proximityThreshold": 1.5, "maxInterfacesPerPair": 4},
        "analysis": {"monteCarloSamples": 2000, "seed": 9,
                     "targetSpec": {"nominal": 10, "plusTolerance": 0.1, "minusTolerance": 0.2}},
        "chainGeneration": {"fallbackGap": 0.1, "maxInterfaceLinks": 5}
    })").object();

    const auto applied = app::AppConfig::applyJson(json, app::AppConfig{});
    assert(io::isOk(applied));
    const app::AppConfig& config = std::get<app::AppConfig>(applied);
    assert(config.detection.proximityThreshold == 1.5);
    assert(config.detection.maxInterfacesPerPair == 4);
    assert(config.detection.minContactArea == 1.0);
    assert(config.analysis.monteCarloSamples == 2000);
    assert(config.analysis.seed && *config.analysis.seed == 9);
    assert(config.analysis.targetSpec && config.analysis.targetSpec->minusTolerance == 0.2);
    assert(config.chainGeneration.fallbackGap == 0.1);
    assert(config.chainGeneration.maxInterfaceLinks == 5);

    const QJsonObject invalid = QJsonDocument::fromJson(
        R"({"analysis": {"workerCount": 0}})").object();
    const auto rejected = app::AppConfig::applyJson(invalid, app::AppConfig{});
    assert(!io::isOk(rejected) && errorOf(rejected).path == "analysis.workerCount");

    const QJsonObject wrongType = QJsonDocument::fromJson(
        R"({"detection": {"minContactArea": "large"}})").object();
    const auto wrongTypeResult = app::AppConfig::applyJson(wrongType, app::AppConfig{});
    assert(!io::isOk(wrongTypeResult));
    assert(errorOf(wrongTypeResult).path == "detection.minContactArea");

    // Settings round trip; an unusable stored value keeps the default
    const QString iniPath = dir + "/stackcad.ini";
    {
        QSettings settings(iniPath, QSettings::IniFormat);
        config.saveSettings(settings);
        settings.setValue("detection/minContactArea", "not-a-number");
        settings.setValue("analysis/workerCount", 0);
        settings.sync();
    }
    app::AppConfig restored;
    {
        QSettings settings(iniPath, QSettings::IniFormat);
        restored.loadSettings(settings);
    }
    assert(restored.detection.proximityThreshold == 1.5);
    assert(restored.detection.maxInterfacesPerPair == 4);
    assert(restored.detection.minContactArea == 1.0);
    assert(restored.analysis.workerCount == 1);
    assert(restored.analysis.seed && *restored.analysis.seed == 9);
    assert(restored.chainGeneration.maxInterfaceLinks == 5);

    // A config file overlays whatever the settings produced
    const QString configPath = dir + "/config.json";
    QFile file(configPath);
    assert(file.open(QIODevice::WriteOnly));
    file.write(R"({"detection": {"workerCount": 3}})");
    file.close();

    QString error;
    assert(app::AppConfig::loadFile(configPath, restored, error));
    assert(restored.detection.workerCount == 3);
    assert(restored.detection.proximityThreshold == 1.5);

    const app::AppConfig before = restored;
    assert(!app::AppConfig::loadFile(dir + "/missing.json", restored, error));
    assert(!error.isEmpty());
    assert(restored.detection.workerCount == before.detection.workerCount);

    std::cout << " PASS\n";
}

void testFileRoundTrip(const QString& dir) {
    std::cout << "Test 7: Save and load through files..." << std::flush;

    QString error;
    const AssemblyGraph graph = makeGraph();
    const QString graphPath = dir + "/assembly.json";
    assert(io::AssemblyIO::saveGraph(graph, graphPath, error));

    AssemblyGraph loaded;
    assert(io::AssemblyIO::loadGraph(graphPath, loaded, error));
    assert(loaded.partIds() == graph.partIds());

    const ToleranceChain chain = makeCalculatedChain();
    const QString chainPath = dir + "/chain.json";
    assert(io::ChainIO::saveChain(chain, chainPath, error));

    ToleranceChain chainLoaded;
    assert(io::ChainIO::loadChain(chainPath, chainLoaded, error));
    assert(chainLoaded.links.size() == 2);

    const QString reportPath = dir + "/report.json";
    assert(io::ChainIO::saveReport(*chain.result, {"first insight"}, reportPath, error));
    QJsonObject report;
    assert(io::JSONUtils::readObjectFile(reportPath, report, error));
    assert(report["insights"].toArray().size() == 1);
    assert(report["result"].toObject()["linkCount"].toInt() == 2);

    QFile garbage(dir + "/garbage.json");
    assert(garbage.open(QIODevice::WriteOnly));
    garbage.write("{ not json");
    garbage.close();
    assert(!io::ChainIO::loadChain(dir + "/garbage.json", chainLoaded, error));
    assert(error.contains("garbage.json"));

    std::cout << " PASS\n";
}

void testIntegerRanges(const QString& dir) {
    std::cout << "Test 8: Integers outside their range are rejected..." << std::flush;

    const QByteArray hugeFaceId = R"({"parts": [{"id": "p", "faces": [
        {"id": 1e20, "faceType": "planar", "normal": [0, 0, 1], "center": [0, 0, 0]}]}]})";
    const auto faceResult = io::AssemblyIO::parseParts(QJsonDocument::fromJson(hugeFaceId).object());
    assert(!io::isOk(faceResult));
    assert(errorOf(faceResult).path == "parts[0].faces[0].id");

    // Fits in long long but not in int
    const QByteArray wideFaceId = R"({"parts": [{"id": "p", "faces": [
        {"id": 3000000000, "faceType": "planar", "normal": [0, 0, 1], "center": [0, 0, 0]}]}]})";
    const auto wideResult = io::AssemblyIO::parseParts(QJsonDocument::fromJson(wideFaceId).object());
    assert(!io::isOk(wideResult));
    assert(errorOf(wideResult).path == "parts[0].faces[0].id");

    const QByteArray hugeEntity = R"({"parts": [{"id": "p", "stepEntityId": 1e30}]})";
    const auto entityResult = io::AssemblyIO::parseParts(QJsonDocument::fromJson(hugeEntity).object());
    assert(!io::isOk(entityResult));
    assert(errorOf(entityResult).path == "parts[0].stepEntityId");

    QJsonObject document = io::ChainIO::toDocument(makeCalculatedChain());
    QJsonObject chain = document["chain"].toObject();
    QJsonObject result = chain["result"].toObject();
    QJsonObject monteCarlo = result["monteCarlo"].toObject();
    monteCarlo["sampleSize"] = 1e30;
    result["monteCarlo"] = monteCarlo;
    chain["result"] = result;
    document["chain"] = chain;
    const auto sampleResult = io::ChainIO::fromDocument(document);
    assert(!io::isOk(sampleResult));
    assert(errorOf(sampleResult).path == "chain.result.monteCarlo.sampleSize");

    const QJsonObject manySamples = QJsonDocument::fromJson(
        R"({"analysis": {"monteCarloSamples": 5000000000}})").object();
    const auto samplesResult = app::AppConfig::applyJson(manySamples, app::AppConfig{});
    assert(!io::isOk(samplesResult));
    assert(errorOf(samplesResult).path == "analysis.monteCarloSamples");

    const QJsonObject hugeSeed = QJsonDocument::fromJson(R"({"analysis": {"seed": 1e19}})").object();
    const auto seedResult = app::AppConfig::applyJson(hugeSeed, app::AppConfig{});
    assert(!io::isOk(seedResult) && errorOf(seedResult).path == "analysis.seed");

    const QString iniPath = dir + "/wide.ini";
    {
        QSettings settings(iniPath, QSettings::IniFormat);
        settings.setValue("analysis/monteCarloSamples", QStringLiteral("5000000000"));
        settings.sync();
    }
    app::AppConfig restored;
    {
        QSettings settings(iniPath, QSettings::IniFormat);
        restored.loadSettings(settings);
    }
    assert(restored.analysis.monteCarloSamples == app::AppConfig{}.analysis.monteCarloSamples);

    std::cout << " PASS\n";
}

void testDivisorsMustBePositive(const QString& dir) {
    std::cout << "Test 9: Zero divisors and scales are rejected..." << std::flush;

    for (const char* key : {"proximityScoreLength", "proximityScale", "missingBoxDiagonal"}) {
        QJsonObject detection;
        detection[QLatin1String(key)] = 0.0;
        QJsonObject json;
        json["detection"] = detection;
        const auto result = app::AppConfig::applyJson(json, app::AppConfig{});
        assert(!io::isOk(result));
        assert(errorOf(result).path == std::string("detection.") + key);
    }

    // Zero stays legal for plain thresholds
    const QJsonObject zeroThreshold = QJsonDocument::fromJson(
        R"({"detection": {"proximityThreshold": 0, "proximityScoreLength": 0.5}})").object();
    const auto accepted = app::AppConfig::applyJson(zeroThreshold, app::AppConfig{});
    assert(io::isOk(accepted));
    assert(std::get<app::AppConfig>(accepted).detection.proximityThreshold == 0.0);
    assert(std::get<app::AppConfig>(accepted).detection.proximityScoreLength == 0.5);

    const QString iniPath = dir + "/divisors.ini";
    {
        QSettings settings(iniPath, QSettings::IniFormat);
        settings.setValue("detection/proximityScoreLength", 0.0);
        settings.setValue("detection/proximityScale", -2.0);
        settings.setValue("detection/proximityThreshold", 0.0);
        settings.sync();
    }
    const app::AppConfig defaults;
    app::AppConfig restored;
    {
        QSettings settings(iniPath, QSettings::IniFormat);
        restored.loadSettings(settings);
    }
    assert(restored.detection.proximityScoreLength == defaults.detection.proximityScoreLength);
    assert(restored.detection.proximityScale == defaults.detection.proximityScale);
    assert(restored.detection.proximityThreshold == 0.0);

    std::cout << " PASS\n";
}

void testBuiltGraphReloads() {
    std::cout << "Test 10: Built graph with a dangling interface reloads..." << std::flush;

    const AssemblyGraph graph = AssemblyGraphBuilder::build(
        {makeBlock("left", 0.0), makeBlock("right", 10.0)},
        {makeInterface("if-1", "left", "right"), makeInterface("if-ghost", "right", "ghost")});
    assert(graph.interfaceCount() == 1);
    assert(graph.getInterface("if-1"));
    assert(!graph.getInterface("if-ghost"));
    assert(graph.adjacentParts("right").size() == 1);

    const QJsonObject document = io::AssemblyIO::serializeGraph(graph);
    const auto reloaded = io::AssemblyIO::parseGraph(document);
    assert(io::isOk(reloaded));
    const AssemblyGraph& loaded = std::get<AssemblyGraph>(reloaded);
    assert(loaded.interfaceIds() == graph.interfaceIds());
    assert(io::JSONUtils::contentHash(io::AssemblyIO::serializeGraph(loaded))
           == io::JSONUtils::contentHash(document));

    std::cout << " PASS\n";
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        std::cerr << "Failed to create temporary directory\n";
        return 1;
    }

    std::cout << "\n=== Persistence Prototype Tests ===\n\n";

    testChainRoundTrip();
    testChainRejections();
    testGraphRoundTrip();
    testGraphRejections();
    testPartInput();
    testConfigLayers(tempDir.path());
    testFileRoundTrip(tempDir.path());
    testIntegerRanges(tempDir.path());
    testDivisorsMustBePositive(tempDir.path());
    testBuiltGraphReloads();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
