#include "metalayout/WidthFormula.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"
#include "metalayout/LayoutContext.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace metalayout {

int WidthTerm::evaluate(const LayoutContext& layout) const {
    switch (kind) {
    case kConstant:
        return constant;
    case kHeapIndex:
        return layout.heapIndexWidth(heap);
    case kTableIndex:
        return layout.tableIndexWidth(name);
    case kCodedIndex:
        return layout.codedIndexWidth(name);
    }
    return 0;
}

// static
bool WidthTerm::forField(const FieldDefinition& field, WidthTerm& term) {
    switch (field.kind) {
    case FieldDefinition::kFixedInt:
        if (field.sizeBytes != 1 && field.sizeBytes != 2 && field.sizeBytes != 4) {
            return false;
        }
        term.kind = kConstant;
        term.constant = field.sizeBytes;
        return true;

    case FieldDefinition::kHeapIndex:
        term.kind = kHeapIndex;
        term.heap = field.heap;
        return true;

    // A row range stores a single row index, so it is as wide as a plain reference into the same table.
    case FieldDefinition::kTableRef:
    case FieldDefinition::kRowRange:
        term.kind = kTableIndex;
        term.name = field.target;
        return true;

    case FieldDefinition::kCodedRef:
        term.kind = kCodedIndex;
        term.name = field.scheme;
        return true;

    case FieldDefinition::kUnsupported:
        return false;
    }
    return false;
}

int WidthFormula::evaluate(const LayoutContext& layout) const {
    int width = 0;
    for (const auto& term : terms) {
        width += term.evaluate(layout);
    }
    return width;
}

bool WidthFormula::isConstant() const {
    for (const auto& term : terms) {
        if (term.kind != WidthTerm::kConstant) {
            return false;
        }
    }
    return true;
}

WidthFormulaBuilder::WidthFormulaBuilder(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(std::move(errorReporter)) {}

bool WidthFormulaBuilder::build(const Schema& schema, const Catalog& catalog, WidthFormulas& formulas) {
    bool ok = true;
    WidthFormulas built;

    for (const auto& entry : catalog.entries()) {
        const auto& table = schema.tables[entry.schemaIndex];
        if (table.fields.empty()) {
            m_errorReporter->addUnsupportedKindFault(table.name, "", "table declares no fields");
            ok = false;
            continue;
        }

        WidthFormula formula;
        formula.table = table.name;
        formula.terms.reserve(table.fields.size());
        for (const auto& field : table.fields) {
            WidthTerm term;
            if (!WidthTerm::forField(field, term)) {
                auto detail = field.kind == FieldDefinition::kFixedInt
                    ? fmt::format("no width rule for {}-byte integers", field.sizeBytes)
                    : fmt::format("no width rule for kind '{}'", field.kindName);
                m_errorReporter->addUnsupportedKindFault(table.name, field.name, detail);
                ok = false;
                continue;
            }
            formula.terms.emplace_back(std::move(term));
        }
        built.emplace(table.name, std::move(formula));
    }

    if (!ok) {
        return false;
    }

    SPDLOG_DEBUG("Built {} width formulas", built.size());
    formulas = std::move(built);
    return true;
}

} // namespace metalayout
