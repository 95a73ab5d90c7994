#include "metalayout/Generator.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Schema.hpp"
#include "metalayout/Validator.hpp"

#include "spdlog/spdlog.h"

namespace metalayout {

const WidthFormula* Artifacts::widthFormula(std::string_view tableName) const {
    auto iter = widthFormulas.find(std::string(tableName));
    return iter != widthFormulas.end() ? &iter->second : nullptr;
}

const DecodePlan* Artifacts::decodePlan(std::string_view tableName) const {
    auto iter = decodePlans.find(std::string(tableName));
    return iter != decodePlans.end() ? &iter->second : nullptr;
}

const CodedDispatch* Artifacts::codedDispatch(std::string_view schemeName) const {
    auto iter = codedDispatches.find(std::string(schemeName));
    return iter != codedDispatches.end() ? &iter->second : nullptr;
}

Generator::Generator(): m_errorReporter(std::make_shared<ErrorReporter>()) {}

Generator::Generator(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(std::move(errorReporter)) {}

std::unique_ptr<Artifacts> Generator::generate(const Schema& schema, const SchemeSet& schemes) {
    auto artifacts = std::make_unique<Artifacts>();

    CatalogBuilder catalogBuilder(m_errorReporter);
    if (!catalogBuilder.build(schema, artifacts->catalog)) {
        SPDLOG_ERROR("Catalog build failed with {} faults", m_errorReporter->errorCount());
        return nullptr;
    }

    if (!Validator::validateReferences(schema, schemes, artifacts->catalog, m_errorReporter.get())) {
        SPDLOG_ERROR("Schema has {} unresolved references", m_errorReporter->errorCount());
        return nullptr;
    }

    WidthFormulaBuilder widthBuilder(m_errorReporter);
    if (!widthBuilder.build(schema, artifacts->catalog, artifacts->widthFormulas)) {
        return nullptr;
    }

    DecodePlanBuilder planBuilder(m_errorReporter);
    if (!planBuilder.build(schema, schemes, artifacts->catalog, artifacts->decodePlans)) {
        return nullptr;
    }

    CodedDispatchBuilder dispatchBuilder(m_errorReporter);
    if (!dispatchBuilder.build(schema, schemes, artifacts->catalog, artifacts->codedDispatches)) {
        return nullptr;
    }

    RegistryBuilder registryBuilder;
    registryBuilder.build(artifacts->catalog, artifacts->registry);

    // Faults reported before this run, e.g. by the schema loader, also void it.
    if (!m_errorReporter->ok()) {
        return nullptr;
    }

    SPDLOG_INFO("Generated layout for {} tables, {} coded schemes, {} visible", artifacts->catalog.entries().size(),
                artifacts->codedDispatches.size(), artifacts->registry.size());
    return artifacts;
}

} // namespace metalayout
