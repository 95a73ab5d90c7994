#include "metalayout/CodedDispatch.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Validator.hpp"

#include "spdlog/spdlog.h"

namespace metalayout {

TableId CodedDispatch::lookupTag(uint32_t tag) const {
    if (tag >= m_tagTables.size()) {
        return m_none;
    }
    return m_tagTables[tag];
}

TableId CodedDispatch::lookupTable(TableId table) const {
    if (table == m_none) {
        return m_none;
    }
    for (auto tagTable : m_tagTables) {
        if (tagTable == table) {
            return table;
        }
    }
    return m_none;
}

CodedDispatchBuilder::CodedDispatchBuilder(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(std::move(errorReporter)) {}

bool CodedDispatchBuilder::build(const Schema& schema, const SchemeSet& schemes, const Catalog& catalog,
                                 CodedDispatches& dispatches) {
    bool ok = true;
    CodedDispatches built;

    for (const auto scheme : Validator::usedSchemes(schema, schemes)) {
        CodedDispatch dispatch;
        dispatch.m_scheme = scheme->name;
        dispatch.m_tagBits = scheme->tagBits;
        dispatch.m_none = catalog.none();
        dispatch.m_tagTables.reserve(scheme->tables.size());

        for (const auto& tableName : scheme->tables) {
            if (tableName.empty()) {
                dispatch.m_tagTables.emplace_back(catalog.none());
                continue;
            }
            auto id = catalog.find(tableName);
            if (id == catalog.none()) {
                m_errorReporter->addUnresolvedReferenceFault(scheme->name, "lists table", tableName);
                ok = false;
                continue;
            }
            // Internal-only tables keep their tag slot but are unreachable through it.
            if (!catalog.isVisible(id)) {
                SPDLOG_TRACE("Scheme {} tag {} names internal table {}", scheme->name, dispatch.m_tagTables.size(),
                             tableName);
                id = catalog.none();
            }
            dispatch.m_tagTables.emplace_back(id);
        }

        built.emplace(scheme->name, std::move(dispatch));
    }

    if (!ok) {
        return false;
    }

    dispatches = std::move(built);
    return true;
}

} // namespace metalayout
