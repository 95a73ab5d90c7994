#ifndef SRC_METALAYOUT_CODED_DISPATCH_HPP_
#define SRC_METALAYOUT_CODED_DISPATCH_HPP_

#include "metalayout/Schema.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace metalayout {

class Catalog;
class ErrorReporter;

// Maps the tag of one scheme's coded references to the table it designates. Only visible tables are reachable, every
// other tag resolves to none(), which is a valid empty answer and not an error.
class CodedDispatch {
public:
    CodedDispatch() = default;
    ~CodedDispatch() = default;

    const std::string& scheme() const { return m_scheme; }
    int tagBits() const { return m_tagBits; }
    TableId none() const { return m_none; }
    // Indexed by tag.
    const std::vector<TableId>& tagTables() const { return m_tagTables; }

    TableId lookupTag(uint32_t tag) const;
    // Dispatch on an already resolved table id. Returns |table| if it is visible and participates in the scheme.
    TableId lookupTable(TableId table) const;

private:
    friend class CodedDispatchBuilder;

    std::string m_scheme;
    int m_tagBits = 0;
    TableId m_none = 0;
    std::vector<TableId> m_tagTables;
};

using CodedDispatches = std::unordered_map<std::string, CodedDispatch>;

class CodedDispatchBuilder {
public:
    CodedDispatchBuilder() = delete;
    explicit CodedDispatchBuilder(std::shared_ptr<ErrorReporter> errorReporter);
    ~CodedDispatchBuilder() = default;

    // Builds a dispatch for every scheme the schema references, keyed by scheme name.
    bool build(const Schema& schema, const SchemeSet& schemes, const Catalog& catalog, CodedDispatches& dispatches);

private:
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_CODED_DISPATCH_HPP_
