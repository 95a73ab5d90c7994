#include "metalayout/RecordDecoder.hpp"

#include "metalayout/LayoutContext.hpp"
#include "metalayout/WidthFormula.hpp"

#include "spdlog/spdlog.h"

namespace metalayout {

// static
bool RecordDecoder::decode(const DecodePlan& plan, const LayoutContext& layout, TableId none, RecordCursor& cursor,
                           Record& record) {
    Record scratch;
    scratch.table = plan.id;
    scratch.values.reserve(plan.steps.size());

    for (const auto& step : plan.steps) {
        FieldValue fieldValue;
        fieldValue.op = step.op;
        fieldValue.table = none;
        auto width = step.width.evaluate(layout);

        switch (step.op) {
        case DecodeStep::kUInt8:
        case DecodeStep::kUInt16:
        case DecodeStep::kUInt32:
        case DecodeStep::kHeapIndex:
            fieldValue.value = cursor.readUInt(width);
            break;

        case DecodeStep::kTableIndex:
        case DecodeStep::kRowRange:
            fieldValue.value = cursor.readUInt(width);
            fieldValue.table = step.targetId;
            break;

        case DecodeStep::kCodedIndex:
            cursor.readCoded(width, step.tagBits, step.tagTables, none, fieldValue.table, fieldValue.value);
            break;
        }

        if (!cursor.ok()) {
            SPDLOG_TRACE("Decoding {}.{} failed at byte {}: {}", plan.table, step.fieldName, cursor.position(),
                         cursorErrorName(cursor.error()));
            return false;
        }
        scratch.values.emplace_back(fieldValue);
    }

    record = std::move(scratch);
    return true;
}

// static
bool RecordDecoder::decodeRow(const WidthFormula& formula, const DecodePlan& plan, const LayoutContext& layout,
                              TableId none, const std::vector<uint8_t>& tableData, uint32_t row, Record& record,
                              RecordCursor::Error& error) {
    size_t width = static_cast<size_t>(formula.evaluate(layout));
    size_t offset = static_cast<size_t>(row) * width;
    if (width == 0 || offset + width > tableData.size()) {
        error = RecordCursor::kExhausted;
        return false;
    }

    RecordCursor cursor(tableData.data() + offset, width);
    Record decoded;
    if (!decode(plan, layout, none, cursor, decoded)) {
        error = cursor.error();
        return false;
    }
    if (cursor.position() != width) {
        SPDLOG_ERROR("Decode plan for {} consumed {} bytes of a {} byte record", plan.table, cursor.position(),
                     width);
        error = RecordCursor::kInvalidWidth;
        return false;
    }

    record = std::move(decoded);
    error = RecordCursor::kNone;
    return true;
}

} // namespace metalayout
