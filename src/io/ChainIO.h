/**
 * @file ChainIO.h
 * @brief JSON persistence for tolerance chains and stackup results
 *
 * Documents are tagged {"format": "stackcad.chain", "version": 1, "chain": {...}}.
 */
#ifndef STACKCAD_IO_CHAINIO_H
#define STACKCAD_IO_CHAINIO_H

#include "ParseResult.h"
#include "../core/tolerance/ToleranceTypes.h"

#include <QJsonObject>
#include <QString>

#include <string>
#include <vector>

namespace stackcad::io {

class ChainIO {
public:
    static constexpr const char* kFormat = "stackcad.chain";
    static constexpr int kVersion = 1;

    static QJsonObject serializeLink(const core::tolerance::ChainLink& link);
    static ParseResult<core::tolerance::ChainLink> parseLink(const QJsonObject& json,
                                                             const std::string& path);

    static QJsonObject serializeTargetSpec(const core::tolerance::TargetSpec& spec);
    static ParseResult<core::tolerance::TargetSpec> parseTargetSpec(const QJsonObject& json,
                                                                    const std::string& path);

    /**
     * @brief Serialize a result. Infinite Cpk values are written as "inf"/"-inf".
     */
    static QJsonObject serializeResult(const core::tolerance::ToleranceResult& result);
    static ParseResult<core::tolerance::ToleranceResult> parseResult(const QJsonObject& json,
                                                                     const std::string& path);

    static QJsonObject serializeChain(const core::tolerance::ToleranceChain& chain);
    static ParseResult<core::tolerance::ToleranceChain> parseChain(const QJsonObject& json,
                                                                   const std::string& path);

    /**
     * @brief Wrap a chain in a versioned document / unwrap and check it.
     */
    static QJsonObject toDocument(const core::tolerance::ToleranceChain& chain);
    static ParseResult<core::tolerance::ToleranceChain> fromDocument(const QJsonObject& document);

    static bool saveChain(const core::tolerance::ToleranceChain& chain,
                          const QString& path,
                          QString& errorMessage);
    static bool loadChain(const QString& path,
                          core::tolerance::ToleranceChain& chain,
                          QString& errorMessage);

    /**
     * @brief Write a result report: {"result": {...}, "insights": [...]}.
     */
    static bool saveReport(const core::tolerance::ToleranceResult& result,
                           const std::vector<std::string>& insights,
                           const QString& path,
                           QString& errorMessage);
};

} // namespace stackcad::io

#endif // STACKCAD_IO_CHAINIO_H
