#ifndef SRC_METALAYOUT_RECORD_DECODER_HPP_
#define SRC_METALAYOUT_RECORD_DECODER_HPP_

#include "metalayout/DecodePlan.hpp"
#include "metalayout/RecordCursor.hpp"
#include "metalayout/Schema.hpp"

#include <cstdint>
#include <vector>

namespace metalayout {

class LayoutContext;
struct WidthFormula;

struct FieldValue {
    // The read that produced this value.
    DecodeStep::Op op;
    // Integer value, heap offset or row index depending on |op|.
    uint32_t value = 0;
    // Table the row index points into for table, range and coded reads, otherwise the owning Catalog's none().
    TableId table = 0;
};

// A fully decoded table row. values[i] holds the column described by plan.steps[i].
struct Record {
    TableId table = 0;
    std::vector<FieldValue> values;
};

class RecordDecoder {
public:
    // Applies |plan| to |cursor|. On success moves the decoded values into |record| and returns true. On failure
    // returns false with |record| untouched, and the cause in cursor.error(). |none| is the catalog sentinel stored
    // in FieldValue::table for columns that do not reference a table.
    static bool decode(const DecodePlan& plan, const LayoutContext& layout, TableId none, RecordCursor& cursor,
                       Record& record);

    // Decodes row |row| out of |tableData|, the packed records of one table. The cursor is bounded to the row, so
    // a plan that disagrees with |formula| can never read into the next record; that disagreement is reported as a
    // failure.
    static bool decodeRow(const WidthFormula& formula, const DecodePlan& plan, const LayoutContext& layout,
                          TableId none, const std::vector<uint8_t>& tableData, uint32_t row, Record& record,
                          RecordCursor::Error& error);
};

} // namespace metalayout

#endif // SRC_METALAYOUT_RECORD_DECODER_HPP_
