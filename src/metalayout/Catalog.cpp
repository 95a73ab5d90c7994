#include "metalayout/Catalog.hpp"

#include "metalayout/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <array>

namespace metalayout {

TableId Catalog::find(std::string_view name) const {
    auto iter = m_ids.find(std::string(name));
    if (iter == m_ids.end()) {
        return none();
    }
    return iter->second;
}

const CatalogEntry* Catalog::entry(TableId id) const {
    if (id < 0 || id >= m_tableCount) {
        return nullptr;
    }
    auto slot = m_slots[id];
    if (slot < 0) {
        return nullptr;
    }
    return &m_entries[slot];
}

bool Catalog::isVisible(TableId id) const {
    auto catalogEntry = entry(id);
    return catalogEntry != nullptr && catalogEntry->visible;
}

CatalogBuilder::CatalogBuilder(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(std::move(errorReporter)) {}

bool CatalogBuilder::build(const Schema& schema, Catalog& catalog) {
    bool ok = true;

    // Index into schema.tables of the first table to claim each code.
    std::array<int32_t, kMaxCode + 1> owners;
    owners.fill(-1);
    std::unordered_map<std::string, size_t> names;

    for (size_t i = 0; i < schema.tables.size(); ++i) {
        const auto& table = schema.tables[i];
        if (!names.emplace(table.name, i).second) {
            m_errorReporter->addDuplicateNameFault(table.name);
            ok = false;
        }
        if (table.code < 0 || table.code > kMaxCode) {
            m_errorReporter->addCodeOutOfRangeFault(table.name, table.code);
            ok = false;
            continue;
        }
        if (owners[table.code] >= 0) {
            m_errorReporter->addDuplicateCodeFault(schema.tables[owners[table.code]].name, table.name, table.code);
            ok = false;
            continue;
        }
        owners[table.code] = static_cast<int32_t>(i);
    }

    if (!ok) {
        return false;
    }

    std::vector<CatalogEntry> entries;
    entries.reserve(schema.tables.size());
    for (size_t i = 0; i < schema.tables.size(); ++i) {
        const auto& table = schema.tables[i];
        entries.emplace_back(CatalogEntry{table.name, table.code, table.visible, i});
    }
    // Ascending order is for deterministic, readable output only. Codes are unique so the sort is total.
    std::sort(entries.begin(), entries.end(),
              [](const CatalogEntry& a, const CatalogEntry& b) { return a.id < b.id; });

    catalog.m_tableCount = entries.size() ? entries.back().id + 1 : 0;
    catalog.m_slots.assign(catalog.m_tableCount, -1);
    catalog.m_ids.clear();
    for (size_t i = 0; i < entries.size(); ++i) {
        catalog.m_slots[entries[i].id] = static_cast<int32_t>(i);
        catalog.m_ids.emplace(entries[i].name, entries[i].id);
    }
    catalog.m_entries = std::move(entries);

    SPDLOG_DEBUG("Catalog built with {} tables, tableCount {}", catalog.m_entries.size(), catalog.m_tableCount);
    return true;
}

} // namespace metalayout
