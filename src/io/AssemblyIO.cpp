/**
 * @file AssemblyIO.cpp
 * @brief Implementation of assembly input and graph serialization
 */

#include "AssemblyIO.h"
#include "ChainIO.h"
#include "JSONUtils.h"

#include <QJsonArray>
#include <QLoggingCategory>

#include <cmath>

namespace stackcad::io {

using namespace core::assembly;

Q_LOGGING_CATEGORY(logAssemblyIO, "stackcad.io.assembly")

namespace {

QJsonArray vecToJson(const Vec3d& v) {
    return QJsonArray{v.x, v.y, v.z};
}

Vec3d vecFromTriple(const std::array<double, 3>& values) {
    return {values[0], values[1], values[2]};
}

Transform parseTransform(JsonReader& reader) {
    Transform transform = identityTransform();
    if (!reader.has("transform")) {
        return transform;
    }
    const QJsonArray values = reader.array("transform");
    if (!reader.ok()) {
        return transform;
    }
    if (values.size() != 16) {
        reader.fail(reader.childPath("transform"), "expected an array of 16 numbers");
        return transform;
    }
    for (int i = 0; i < 16; ++i) {
        if (!values[i].isDouble() || !std::isfinite(values[i].toDouble())) {
            reader.fail(reader.childPath("transform", i), "expected a finite number");
            return transform;
        }
        transform[static_cast<size_t>(i)] = values[i].toDouble();
    }
    return transform;
}

QJsonObject serializeFace(const PartFace& face) {
    QJsonObject json;
    json["id"] = face.id;
    json["globalId"] = QString::fromStdString(face.globalId);
    json["faceType"] = faceTypeName(face.faceType);
    json["normal"] = vecToJson(face.normal);
    json["center"] = vecToJson(face.center);
    json["area"] = face.area;
    if (face.radius) {
        json["radius"] = *face.radius;
    }
    if (face.axis) {
        json["axis"] = vecToJson(*face.axis);
    }
    return json;
}

PartFace parseFace(const QJsonObject& json, const std::string& path, JsonReader& parent) {
    JsonReader reader(json, path);
    PartFace face;
    face.id = reader.smallInteger("id");
    face.globalId = reader.stringOr("globalId", {});

    const std::string faceType = reader.stringOr("faceType", "freeform");
    if (auto parsed = faceTypeFromName(faceType)) {
        face.faceType = *parsed;
    } else {
        reader.fail(reader.childPath("faceType"), "unknown face type \"" + faceType + "\"");
    }

    face.normal = vecFromTriple(reader.triple("normal"));
    face.center = vecFromTriple(reader.triple("center"));
    face.area = reader.numberOr("area", 0.0);
    face.radius = reader.optionalNumber("radius");
    if (auto axis = reader.optionalTriple("axis")) {
        face.axis = vecFromTriple(*axis);
    }

    if (!reader.ok()) {
        parent.fail(reader.error().path, reader.error().message);
    }
    return face;
}

QJsonObject serializeSide(const InterfaceSide& side) {
    QJsonObject json;
    json["partId"] = QString::fromStdString(side.partId);
    json["faceId"] = QString::fromStdString(side.faceId);
    return json;
}

InterfaceSide parseSide(JsonReader& parent, const char* key) {
    JsonReader reader(parent.object(key), parent.childPath(key));
    InterfaceSide side;
    side.partId = reader.string("partId");
    side.faceId = reader.string("faceId");
    if (!reader.ok()) {
        parent.fail(reader.error().path, reader.error().message);
    }
    return side;
}

/**
 * @brief Check one [key, value] pair and return its value object.
 */
bool readKeyedEntry(const QJsonValue& entry,
                    const std::string& path,
                    JsonReader& reader,
                    std::string& key,
                    QJsonValue& value) {
    const QJsonArray pair = entry.toArray();
    if (!entry.isArray() || pair.size() != 2 || !pair[0].isString()) {
        reader.fail(path, "expected a [key, value] pair");
        return false;
    }
    key = pair[0].toString().toStdString();
    value = pair[1];
    return true;
}

} // anonymous namespace

QJsonObject AssemblyIO::serializePart(const AssemblyPart& part) {
    QJsonObject json;
    json["id"] = QString::fromStdString(part.id);
    json["name"] = QString::fromStdString(part.name);
    json["stepEntityId"] = static_cast<qint64>(part.stepEntityId);

    QJsonArray transform;
    for (double value : part.transform) {
        transform.append(value);
    }
    json["transform"] = transform;

    if (part.boundingBox) {
        QJsonObject box;
        box["min"] = vecToJson(part.boundingBox->min);
        box["max"] = vecToJson(part.boundingBox->max);
        json["boundingBox"] = box;
    }

    QJsonArray faces;
    for (const auto& face : part.faces) {
        faces.append(serializeFace(face));
    }
    json["faces"] = faces;

    if (part.color) {
        json["color"] = JSONUtils::toArray(*part.color);
    }
    return json;
}

ParseResult<AssemblyPart> AssemblyIO::parsePart(const QJsonObject& json, const std::string& path) {
    JsonReader reader(json, path);
    AssemblyPart part;

    part.id = reader.string("id");
    part.name = reader.stringOr("name", part.id);
    part.stepEntityId = reader.has("stepEntityId") ? reader.integer("stepEntityId") : 0;
    part.transform = parseTransform(reader);

    if (reader.has("boundingBox")) {
        JsonReader boxReader(reader.object("boundingBox"), reader.childPath("boundingBox"));
        BoundingBox box;
        box.min = vecFromTriple(boxReader.triple("min"));
        box.max = vecFromTriple(boxReader.triple("max"));
        if (!boxReader.ok()) {
            reader.fail(boxReader.error().path, boxReader.error().message);
        }
        part.boundingBox = box;
    }

    if (reader.has("faces")) {
        const QJsonArray faces = reader.array("faces");
        for (int i = 0; i < faces.size() && reader.ok(); ++i) {
            PartFace face = parseFace(faces[i].toObject(), reader.childPath("faces", i), reader);
            if (face.globalId.empty()) {
                face.globalId = makeFaceGlobalId(part.id, face.id);
            }
            part.faces.push_back(std::move(face));
        }
    }

    part.color = reader.optionalTriple("color");

    if (!reader.ok()) {
        return reader.error();
    }
    return part;
}

QJsonObject AssemblyIO::serializeInterface(const MatingInterface& iface) {
    QJsonObject json;
    json["id"] = QString::fromStdString(iface.id);
    json["partA"] = serializeSide(iface.partA);
    json["partB"] = serializeSide(iface.partB);
    json["interfaceType"] = interfaceTypeName(iface.interfaceType);
    json["proximity"] = iface.proximity;
    json["normalAlignment"] = iface.normalAlignment;
    json["contactArea"] = iface.contactArea;
    json["defaultTolerance"] = iface.defaultTolerance;
    json["defaultDistribution"] = core::tolerance::distributionTypeName(iface.defaultDistribution);
    json["contactPoint"] = vecToJson(iface.contactPoint);
    json["isJunction"] = iface.isJunction;
    return json;
}

ParseResult<MatingInterface> AssemblyIO::parseInterface(const QJsonObject& json, const std::string& path) {
    JsonReader reader(json, path);
    MatingInterface iface;

    iface.id = reader.string("id");
    iface.partA = parseSide(reader, "partA");
    iface.partB = parseSide(reader, "partB");

    const std::string type = reader.stringOr("interfaceType", "unknown");
    if (auto parsed = interfaceTypeFromName(type)) {
        iface.interfaceType = *parsed;
    } else {
        reader.fail(reader.childPath("interfaceType"), "unknown interface type \"" + type + "\"");
    }

    iface.proximity = reader.number("proximity");
    iface.normalAlignment = reader.numberOr("normalAlignment", 0.0);
    iface.contactArea = reader.numberOr("contactArea", 0.0);
    iface.defaultTolerance = reader.numberOr("defaultTolerance", 0.1);

    const std::string distribution = reader.stringOr("defaultDistribution", "normal");
    if (auto parsed = core::tolerance::distributionTypeFromName(distribution)) {
        iface.defaultDistribution = *parsed;
    } else {
        reader.fail(reader.childPath("defaultDistribution"),
                    "unknown distribution \"" + distribution + "\"");
    }

    if (auto point = reader.optionalTriple("contactPoint")) {
        iface.contactPoint = vecFromTriple(*point);
    }
    iface.isJunction = reader.booleanOr("isJunction", false);

    if (!reader.ok()) {
        return reader.error();
    }
    return iface;
}

ParseResult<std::vector<AssemblyPart>> AssemblyIO::parseParts(const QJsonObject& document) {
    JsonReader reader(document, {});
    std::vector<AssemblyPart> parts;

    const QJsonArray array = reader.array("parts");
    for (int i = 0; i < array.size() && reader.ok(); ++i) {
        if (!array[i].isObject()) {
            reader.fail(reader.childPath("parts", i), "expected an object");
            break;
        }
        AssemblyPart part;
        if (unwrapInto(parsePart(array[i].toObject(), reader.childPath("parts", i)), part, reader)) {
            parts.push_back(std::move(part));
        }
    }

    if (!reader.ok()) {
        return reader.error();
    }
    return parts;
}

QJsonObject AssemblyIO::serializeDetection(const InterfaceDetectionResult& detection) {
    QJsonObject json;
    QJsonArray interfaces;
    for (const auto& iface : detection.interfaces) {
        interfaces.append(serializeInterface(iface));
    }
    json["interfaces"] = interfaces;

    QJsonArray junctions;
    for (const auto& partId : detection.junctionParts) {
        junctions.append(QString::fromStdString(partId));
    }
    json["junctionParts"] = junctions;
    return json;
}

QJsonObject AssemblyIO::serializeGraph(const AssemblyGraph& graph) {
    QJsonObject document;
    document["format"] = kFormat;
    document["version"] = kVersion;

    QJsonArray parts;
    for (const auto& partId : graph.partIds()) {
        parts.append(QJsonArray{QString::fromStdString(partId),
                                serializePart(*graph.getPart(partId))});
    }
    document["parts"] = parts;

    QJsonArray interfaces;
    for (const auto& interfaceId : graph.interfaceIds()) {
        interfaces.append(QJsonArray{QString::fromStdString(interfaceId),
                                     serializeInterface(*graph.getInterface(interfaceId))});
    }
    document["interfaces"] = interfaces;

    QJsonArray chains;
    for (const auto& chainId : graph.chainIds()) {
        chains.append(QJsonArray{QString::fromStdString(chainId),
                                 ChainIO::serializeChain(*graph.getChain(chainId))});
    }
    document["chains"] = chains;

    QJsonArray adjacency;
    for (const auto& partId : graph.adjacencyKeys()) {
        QJsonArray neighbors;
        for (const auto& neighbor : graph.adjacentParts(partId)) {
            neighbors.append(QString::fromStdString(neighbor));
        }
        adjacency.append(QJsonArray{QString::fromStdString(partId), neighbors});
    }
    document["adjacency"] = adjacency;

    return document;
}

ParseResult<AssemblyGraph> AssemblyIO::parseGraph(const QJsonObject& document) {
    if (auto error = JSONUtils::checkHeader(document, kFormat, kVersion)) {
        return *error;
    }

    JsonReader reader(document, {});
    AssemblyGraph graph;
    std::string key;
    QJsonValue value;

    const QJsonArray parts = reader.array("parts");
    for (int i = 0; i < parts.size() && reader.ok(); ++i) {
        const std::string path = reader.childPath("parts", i);
        if (!readKeyedEntry(parts[i], path, reader, key, value)) {
            break;
        }
        AssemblyPart part;
        if (!unwrapInto(parsePart(value.toObject(), path + "[1]"), part, reader)) {
            break;
        }
        if (part.id != key) {
            reader.fail(path, "key \"" + key + "\" does not match part id \"" + part.id + "\"");
        } else if (!graph.addPart(std::move(part))) {
            reader.fail(path, "duplicate part id \"" + key + "\"");
        }
    }

    const QJsonArray interfaces = reader.array("interfaces");
    for (int i = 0; i < interfaces.size() && reader.ok(); ++i) {
        const std::string path = reader.childPath("interfaces", i);
        if (!readKeyedEntry(interfaces[i], path, reader, key, value)) {
            break;
        }
        MatingInterface iface;
        if (!unwrapInto(parseInterface(value.toObject(), path + "[1]"), iface, reader)) {
            break;
        }
        if (iface.id != key) {
            reader.fail(path, "key \"" + key + "\" does not match interface id \"" + iface.id + "\"");
        } else if (!graph.getPart(iface.partA.partId) || !graph.getPart(iface.partB.partId)) {
            reader.fail(path, "interface \"" + key + "\" references an unknown part");
        } else if (!graph.addInterface(std::move(iface))) {
            reader.fail(path, "duplicate interface id \"" + key + "\"");
        }
    }

    if (reader.has("chains")) {
        const QJsonArray chains = reader.array("chains");
        for (int i = 0; i < chains.size() && reader.ok(); ++i) {
            const std::string path = reader.childPath("chains", i);
            if (!readKeyedEntry(chains[i], path, reader, key, value)) {
                break;
            }
            core::tolerance::ToleranceChain chain;
            if (!unwrapInto(ChainIO::parseChain(value.toObject(), path + "[1]"), chain, reader)) {
                break;
            }
            if (chain.id != key) {
                reader.fail(path, "key \"" + key + "\" does not match chain id \"" + chain.id + "\"");
            } else {
                graph.setChain(std::move(chain));
            }
        }
    }

    const QJsonArray adjacency = reader.array("adjacency");
    for (int i = 0; i < adjacency.size() && reader.ok(); ++i) {
        const std::string path = reader.childPath("adjacency", i);
        if (!readKeyedEntry(adjacency[i], path, reader, key, value)) {
            break;
        }
        if (!graph.getPart(key) || !value.isArray()) {
            reader.fail(path, "invalid adjacency entry for \"" + key + "\"");
            break;
        }
        std::vector<std::string> neighbors;
        for (const auto& neighbor : value.toArray()) {
            const std::string neighborId = neighbor.toString().toStdString();
            if (!neighbor.isString() || !graph.getPart(neighborId)) {
                reader.fail(path, "unknown neighbor of \"" + key + "\"");
                break;
            }
            neighbors.push_back(neighborId);
        }
        graph.setAdjacency(key, std::move(neighbors));
    }

    if (reader.ok() && !graph.isAdjacencySymmetric()) {
        reader.fail("adjacency", "adjacency is not symmetric");
    }

    if (!reader.ok()) {
        qCWarning(logAssemblyIO) << "parseGraph:invalid"
                                 << QString::fromStdString(reader.error().toString());
        return reader.error();
    }
    return graph;
}

bool AssemblyIO::loadParts(const QString& path, std::vector<AssemblyPart>& parts, QString& errorMessage) {
    qCInfo(logAssemblyIO) << "loadParts:start" << "path=" << path;
    QJsonObject document;
    if (!JSONUtils::readObjectFile(path, document, errorMessage)) {
        qCWarning(logAssemblyIO) << "loadParts:failed-read" << errorMessage;
        return false;
    }

    auto parsed = parseParts(document);
    if (const auto* error = std::get_if<ParseError>(&parsed)) {
        errorMessage = QString::fromStdString(error->toString());
        qCWarning(logAssemblyIO) << "loadParts:invalid" << errorMessage;
        return false;
    }

    parts = std::move(std::get<std::vector<AssemblyPart>>(parsed));
    qCInfo(logAssemblyIO) << "loadParts:done" << "parts=" << parts.size();
    return true;
}

bool AssemblyIO::saveGraph(const AssemblyGraph& graph, const QString& path, QString& errorMessage) {
    qCInfo(logAssemblyIO) << "saveGraph:start" << "path=" << path
                          << "parts=" << graph.partCount()
                          << "interfaces=" << graph.interfaceCount();
    if (!JSONUtils::writeObjectFile(path, serializeGraph(graph), true, errorMessage)) {
        qCWarning(logAssemblyIO) << "saveGraph:failed" << errorMessage;
        return false;
    }
    qCInfo(logAssemblyIO) << "saveGraph:done";
    return true;
}

bool AssemblyIO::loadGraph(const QString& path, AssemblyGraph& graph, QString& errorMessage) {
    qCInfo(logAssemblyIO) << "loadGraph:start" << "path=" << path;
    QJsonObject document;
    if (!JSONUtils::readObjectFile(path, document, errorMessage)) {
        qCWarning(logAssemblyIO) << "loadGraph:failed-read" << errorMessage;
        return false;
    }

    auto parsed = parseGraph(document);
    if (const auto* error = std::get_if<ParseError>(&parsed)) {
        errorMessage = QString::fromStdString(error->toString());
        return false;
    }

    graph = std::move(std::get<AssemblyGraph>(parsed));
    qCInfo(logAssemblyIO) << "loadGraph:done" << "parts=" << graph.partCount();
    return true;
}

} // namespace stackcad::io
