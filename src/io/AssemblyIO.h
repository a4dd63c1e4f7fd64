/**
 * @file AssemblyIO.h
 * @brief JSON input of front-end part summaries and persistence of assembly graphs
 *
 * Graph documents are tagged {"format": "stackcad.assembly", "version": 1}.
 * Keyed collections are stored as ordered arrays of [key, value] pairs so
 * that insertion order survives a round trip.
 */
#ifndef STACKCAD_IO_ASSEMBLYIO_H
#define STACKCAD_IO_ASSEMBLYIO_H

#include "ParseResult.h"
#include "../core/assembly/AssemblyGraph.h"
#include "../core/assembly/AssemblyTypes.h"
#include "../core/assembly/InterfaceDetector.h"

#include <QJsonObject>
#include <QString>

#include <string>
#include <vector>

namespace stackcad::io {

class AssemblyIO {
public:
    static constexpr const char* kFormat = "stackcad.assembly";
    static constexpr int kVersion = 1;

    static QJsonObject serializePart(const core::assembly::AssemblyPart& part);
    static ParseResult<core::assembly::AssemblyPart> parsePart(const QJsonObject& json,
                                                               const std::string& path);

    static QJsonObject serializeInterface(const core::assembly::MatingInterface& iface);
    static ParseResult<core::assembly::MatingInterface> parseInterface(const QJsonObject& json,
                                                                       const std::string& path);

    /**
     * @brief Parse {"parts": [...]} as delivered by the geometry front end.
     */
    static ParseResult<std::vector<core::assembly::AssemblyPart>> parseParts(const QJsonObject& document);

    /**
     * @brief {"interfaces": [...], "junctionParts": [...]}
     */
    static QJsonObject serializeDetection(const core::assembly::InterfaceDetectionResult& detection);

    static QJsonObject serializeGraph(const core::assembly::AssemblyGraph& graph);

    /**
     * @brief Rebuild a graph. Rejects unknown versions, mismatched keys,
     *        references to unknown parts and asymmetric adjacency.
     */
    static ParseResult<core::assembly::AssemblyGraph> parseGraph(const QJsonObject& document);

    static bool loadParts(const QString& path,
                          std::vector<core::assembly::AssemblyPart>& parts,
                          QString& errorMessage);
    static bool saveGraph(const core::assembly::AssemblyGraph& graph,
                          const QString& path,
                          QString& errorMessage);
    static bool loadGraph(const QString& path,
                          core::assembly::AssemblyGraph& graph,
                          QString& errorMessage);
};

} // namespace stackcad::io

#endif // STACKCAD_IO_ASSEMBLYIO_H
