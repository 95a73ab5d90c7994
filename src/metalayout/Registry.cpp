#include "metalayout/Registry.hpp"

#include "metalayout/Catalog.hpp"

#include "spdlog/spdlog.h"

namespace metalayout {

const RegistryEntry* Registry::find(TableId id) const {
    if (id < 0 || static_cast<size_t>(id) >= m_slots.size() || m_slots[id] < 0) {
        return nullptr;
    }
    return &m_entries[m_slots[id]];
}

void RegistryBuilder::build(const Catalog& catalog, Registry& registry) {
    registry.m_entries.clear();
    registry.m_slots.assign(catalog.tableCount(), -1);

    for (const auto& entry : catalog.entries()) {
        if (!entry.visible) {
            continue;
        }
        registry.m_slots[entry.id] = static_cast<int32_t>(registry.m_entries.size());
        registry.m_entries.emplace_back(RegistryEntry{entry.name, entry.id});
    }

    SPDLOG_DEBUG("Registry holds {} of {} tables", registry.m_entries.size(), catalog.entries().size());
}

} // namespace metalayout
