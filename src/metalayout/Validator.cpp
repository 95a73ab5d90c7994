#include "metalayout/Validator.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Schema.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <unordered_set>

namespace metalayout {

// static
bool Validator::validateReferences(const Schema& schema, const SchemeSet& schemes, const Catalog& catalog,
                                   ErrorReporter* errorReporter) {
    bool ok = true;
    for (const auto& table : schema.tables) {
        for (const auto& field : table.fields) {
            switch (field.kind) {
            case FieldDefinition::kTableRef:
            case FieldDefinition::kRowRange:
                if (catalog.find(field.target) == catalog.none()) {
                    errorReporter->addUnresolvedReferenceFault(table.name + "." + field.name, "references table",
                                                               field.target);
                    ok = false;
                }
                break;

            case FieldDefinition::kCodedRef:
                if (schemes.find(field.scheme) == nullptr) {
                    errorReporter->addUnresolvedReferenceFault(table.name + "." + field.name, "references scheme",
                                                               field.scheme);
                    ok = false;
                }
                break;

            // Nothing to resolve. Unsupported kinds are reported by the width and decode builders.
            case FieldDefinition::kFixedInt:
            case FieldDefinition::kHeapIndex:
            case FieldDefinition::kUnsupported:
                break;
            }
        }
    }

    for (const auto scheme : usedSchemes(schema, schemes)) {
        ok &= validateScheme(*scheme, catalog, errorReporter);
    }

    return ok;
}

// static
std::vector<const CodeScheme*> Validator::usedSchemes(const Schema& schema, const SchemeSet& schemes) {
    std::unordered_set<std::string> names;
    for (const auto& table : schema.tables) {
        for (const auto& field : table.fields) {
            if (field.kind == FieldDefinition::kCodedRef) {
                names.emplace(field.scheme);
            }
        }
    }

    std::vector<const CodeScheme*> used;
    for (const auto& scheme : schemes.schemes) {
        if (names.count(scheme.name)) {
            used.emplace_back(&scheme);
        }
    }
    return used;
}

// static
bool Validator::validateScheme(const CodeScheme& scheme, const Catalog& catalog, ErrorReporter* errorReporter) {
    if (scheme.tagBits < 1 || scheme.tagBits > CodeScheme::kMaxTagBits) {
        errorReporter->addFault(Fault::kUnresolvedReference,
                                fmt::format("scheme '{}' declares {} tag bits, expected 1 to {}", scheme.name,
                                            scheme.tagBits, CodeScheme::kMaxTagBits));
        return false;
    }
    if (scheme.tables.size() > (size_t{1} << scheme.tagBits)) {
        errorReporter->addFault(Fault::kUnresolvedReference,
                                fmt::format("scheme '{}' lists {} tables but {} tag bits address only {}",
                                            scheme.name, scheme.tables.size(), scheme.tagBits,
                                            size_t{1} << scheme.tagBits));
        return false;
    }

    bool ok = true;
    for (const auto& tableName : scheme.tables) {
        if (tableName.empty()) {
            continue;
        }
        if (catalog.find(tableName) == catalog.none()) {
            errorReporter->addUnresolvedReferenceFault(scheme.name, "lists table", tableName);
            ok = false;
        }
    }

    if (ok) {
        SPDLOG_TRACE("Scheme {} resolved {} tables with {} tag bits", scheme.name, scheme.tables.size(),
                     scheme.tagBits);
    }
    return ok;
}

} // namespace metalayout
