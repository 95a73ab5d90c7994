#ifndef SRC_METALAYOUT_CATALOG_HPP_
#define SRC_METALAYOUT_CATALOG_HPP_

#include "metalayout/Schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace metalayout {

class ErrorReporter;

struct CatalogEntry {
    std::string name;
    TableId id;
    bool visible;
    // Position of the table in the Schema it was built from.
    size_t schemaIndex;
};

// The id-ordered list of tables. Ids are the on-disk codes, so the catalog can be sparse: tableCount() is one past
// the largest code, not the number of tables.
class Catalog {
public:
    Catalog() = default;
    ~Catalog() = default;

    // Ascending by id.
    const std::vector<CatalogEntry>& entries() const { return m_entries; }
    int32_t tableCount() const { return m_tableCount; }
    // The "no table" sentinel. Equal to tableCount(), so never a real id.
    TableId none() const { return m_tableCount; }

    // Returns none() if there is no table named |name|.
    TableId find(std::string_view name) const;
    // Returns nullptr if |id| names no table.
    const CatalogEntry* entry(TableId id) const;
    bool isVisible(TableId id) const;

private:
    friend class CatalogBuilder;

    std::vector<CatalogEntry> m_entries;
    // Indexed by id, index into m_entries or -1 for codes no table uses.
    std::vector<int32_t> m_slots;
    std::unordered_map<std::string, TableId> m_ids;
    int32_t m_tableCount = 0;
};

// Validates table codes and names and assigns each table its id. Runs before every other builder.
class CatalogBuilder {
public:
    CatalogBuilder() = delete;
    explicit CatalogBuilder(std::shared_ptr<ErrorReporter> errorReporter);
    ~CatalogBuilder() = default;

    static constexpr int kMaxCode = 255;

    // Returns false and leaves |catalog| untouched if any code is out of range or shared, or any name is shared.
    // Every such fault in the schema is reported, not just the first.
    bool build(const Schema& schema, Catalog& catalog);

private:
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_CATALOG_HPP_
