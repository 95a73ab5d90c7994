#ifndef SRC_METALAYOUT_REGISTRY_HPP_
#define SRC_METALAYOUT_REGISTRY_HPP_

#include "metalayout/Schema.hpp"

#include <string>
#include <vector>

namespace metalayout {

class Catalog;

struct RegistryEntry {
    std::string name;
    TableId id;
};

// Initialization order for the table accessors of a decoded container: one accessor per visible table, ascending
// by id.
class Registry {
public:
    Registry() = default;
    ~Registry() = default;

    const std::vector<RegistryEntry>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    // Constant time. Returns nullptr for internal-only tables and ids no table uses.
    const RegistryEntry* find(TableId id) const;

private:
    friend class RegistryBuilder;

    std::vector<RegistryEntry> m_entries;
    // Indexed by id, index into m_entries or -1.
    std::vector<int32_t> m_slots;
};

class RegistryBuilder {
public:
    RegistryBuilder() = default;
    ~RegistryBuilder() = default;

    // Cannot fail once the catalog has been built.
    void build(const Catalog& catalog, Registry& registry);
};

} // namespace metalayout

#endif // SRC_METALAYOUT_REGISTRY_HPP_
