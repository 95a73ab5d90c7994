#include "metalayout/DecodePlan.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace metalayout {

const char* decodeOpName(DecodeStep::Op op) {
    switch (op) {
    case DecodeStep::kUInt8:
        return "uint8";
    case DecodeStep::kUInt16:
        return "uint16";
    case DecodeStep::kUInt32:
        return "uint32";
    case DecodeStep::kHeapIndex:
        return "heap";
    case DecodeStep::kTableIndex:
        return "index";
    case DecodeStep::kCodedIndex:
        return "coded";
    case DecodeStep::kRowRange:
        return "range";
    }
    return "unknown";
}

DecodePlanBuilder::DecodePlanBuilder(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(std::move(errorReporter)) {}

bool DecodePlanBuilder::build(const Schema& schema, const SchemeSet& schemes, const Catalog& catalog,
                              DecodePlans& plans) {
    bool ok = true;
    DecodePlans built;

    for (const auto& entry : catalog.entries()) {
        const auto& table = schema.tables[entry.schemaIndex];
        if (table.fields.empty()) {
            m_errorReporter->addUnsupportedKindFault(table.name, "", "table declares no fields");
            ok = false;
            continue;
        }

        DecodePlan plan;
        plan.table = table.name;
        plan.id = entry.id;
        plan.steps.reserve(table.fields.size());
        for (size_t i = 0; i < table.fields.size(); ++i) {
            DecodeStep step;
            if (!buildStep(table, i, schemes, catalog, step)) {
                ok = false;
                continue;
            }
            plan.steps.emplace_back(std::move(step));
        }
        built.emplace(table.name, std::move(plan));
    }

    if (!ok) {
        return false;
    }

    SPDLOG_DEBUG("Built {} decode plans", built.size());
    plans = std::move(built);
    return true;
}

bool DecodePlanBuilder::buildStep(const TableDefinition& table, size_t index, const SchemeSet& schemes,
                                  const Catalog& catalog, DecodeStep& step) {
    const auto& field = table.fields[index];
    if (!WidthTerm::forField(field, step.width)) {
        auto detail = field.kind == FieldDefinition::kFixedInt
            ? fmt::format("no decode rule for {}-byte integers", field.sizeBytes)
            : fmt::format("no decode rule for kind '{}'", field.kindName);
        m_errorReporter->addUnsupportedKindFault(table.name, field.name, detail);
        return false;
    }

    step.field = index;
    step.fieldName = field.name;

    switch (field.kind) {
    case FieldDefinition::kFixedInt:
        step.op = field.sizeBytes == 1 ? DecodeStep::kUInt8
                                       : (field.sizeBytes == 2 ? DecodeStep::kUInt16 : DecodeStep::kUInt32);
        step.flagType = field.flagType;
        return true;

    case FieldDefinition::kHeapIndex:
        step.op = DecodeStep::kHeapIndex;
        step.heap = field.heap;
        return true;

    case FieldDefinition::kTableRef:
    case FieldDefinition::kRowRange:
        step.op = field.kind == FieldDefinition::kTableRef ? DecodeStep::kTableIndex : DecodeStep::kRowRange;
        step.target = field.target;
        step.targetId = catalog.find(field.target);
        if (step.targetId == catalog.none()) {
            m_errorReporter->addUnresolvedReferenceFault(table.name + "." + field.name, "references table",
                                                         field.target);
            return false;
        }
        return true;

    case FieldDefinition::kCodedRef: {
        step.op = DecodeStep::kCodedIndex;
        step.scheme = field.scheme;
        auto scheme = schemes.find(field.scheme);
        if (!scheme) {
            m_errorReporter->addUnresolvedReferenceFault(table.name + "." + field.name, "references scheme",
                                                         field.scheme);
            return false;
        }
        step.tagBits = scheme->tagBits;
        step.tagTables.reserve(scheme->tables.size());
        for (const auto& tableName : scheme->tables) {
            // Empty names are unused tags, and find() maps them to none() as well.
            step.tagTables.emplace_back(catalog.find(tableName));
        }
        return true;
    }

    case FieldDefinition::kUnsupported:
        break;
    }

    return false;
}

} // namespace metalayout
