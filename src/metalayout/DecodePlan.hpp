#ifndef SRC_METALAYOUT_DECODE_PLAN_HPP_
#define SRC_METALAYOUT_DECODE_PLAN_HPP_

#include "metalayout/Schema.hpp"
#include "metalayout/WidthFormula.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace metalayout {

class Catalog;
class ErrorReporter;
class LayoutContext;

// One primitive read against a record cursor, and the record field it fills.
struct DecodeStep {
    enum Op { kUInt8, kUInt16, kUInt32, kHeapIndex, kTableIndex, kCodedIndex, kRowRange };

    Op op;
    // Index of the populated field within the table, equal to the step's position in the plan.
    size_t field;
    std::string fieldName;
    // Width of the read, shared with the table's WidthFormula.
    WidthTerm width;

    // kUInt*: name of the bit-flag type, or empty.
    std::string flagType;
    // kHeapIndex
    Heap heap = Heap::kString;
    // kTableIndex and kRowRange: the indexed table.
    std::string target;
    TableId targetId = 0;
    // kCodedIndex
    std::string scheme;
    int tagBits = 0;
    // Table id for each tag of the scheme, Catalog::none() for unused tag slots.
    std::vector<TableId> tagTables;
};

const char* decodeOpName(DecodeStep::Op op);

// The ordered reads that decode one record of |table|. Steps must run in order against one cursor.
struct DecodePlan {
    std::string table;
    TableId id = 0;
    std::vector<DecodeStep> steps;
};

using DecodePlans = std::unordered_map<std::string, DecodePlan>;

class DecodePlanBuilder {
public:
    DecodePlanBuilder() = delete;
    explicit DecodePlanBuilder(std::shared_ptr<ErrorReporter> errorReporter);
    ~DecodePlanBuilder() = default;

    // Builds one plan per table in |catalog|, keyed by table name. The schema must already have passed
    // Validator::validateReferences().
    bool build(const Schema& schema, const SchemeSet& schemes, const Catalog& catalog, DecodePlans& plans);

private:
    bool buildStep(const TableDefinition& table, size_t index, const SchemeSet& schemes, const Catalog& catalog,
                   DecodeStep& step);

    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_DECODE_PLAN_HPP_
