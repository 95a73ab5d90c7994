#include "metalayout/Schema.hpp"

namespace metalayout {

const char* heapName(Heap heap) {
    switch (heap) {
    case Heap::kString:
        return "String";
    case Heap::kBlob:
        return "Blob";
    case Heap::kGUID:
        return "GUID";
    }
    return "Unknown";
}

const char* fieldKindName(FieldDefinition::Kind kind) {
    switch (kind) {
    case FieldDefinition::kFixedInt:
        return "FixedInt";
    case FieldDefinition::kHeapIndex:
        return "HeapIndex";
    case FieldDefinition::kTableRef:
        return "TableRef";
    case FieldDefinition::kCodedRef:
        return "CodedRef";
    case FieldDefinition::kRowRange:
        return "RowRange";
    case FieldDefinition::kUnsupported:
        return "Unsupported";
    }
    return "Unknown";
}

// static
FieldDefinition FieldDefinition::makeFixedInt(std::string name, int sizeBytes, std::string flagType) {
    FieldDefinition field;
    field.name = std::move(name);
    field.kind = kFixedInt;
    field.sizeBytes = sizeBytes;
    field.flagType = std::move(flagType);
    return field;
}

// static
FieldDefinition FieldDefinition::makeHeapIndex(std::string name, Heap heap) {
    FieldDefinition field;
    field.name = std::move(name);
    field.kind = kHeapIndex;
    field.heap = heap;
    return field;
}

// static
FieldDefinition FieldDefinition::makeTableRef(std::string name, std::string target) {
    FieldDefinition field;
    field.name = std::move(name);
    field.kind = kTableRef;
    field.target = std::move(target);
    return field;
}

// static
FieldDefinition FieldDefinition::makeCodedRef(std::string name, std::string scheme) {
    FieldDefinition field;
    field.name = std::move(name);
    field.kind = kCodedRef;
    field.scheme = std::move(scheme);
    return field;
}

// static
FieldDefinition FieldDefinition::makeRowRange(std::string name, std::string target) {
    FieldDefinition field;
    field.name = std::move(name);
    field.kind = kRowRange;
    field.target = std::move(target);
    return field;
}

// static
FieldDefinition FieldDefinition::makeUnsupported(std::string name, std::string kindName) {
    FieldDefinition field;
    field.name = std::move(name);
    field.kind = kUnsupported;
    field.kindName = std::move(kindName);
    return field;
}

const TableDefinition* Schema::findTable(std::string_view name) const {
    for (const auto& table : tables) {
        if (table.name == name) {
            return &table;
        }
    }
    return nullptr;
}

const CodeScheme* SchemeSet::find(std::string_view name) const {
    for (const auto& scheme : schemes) {
        if (scheme.name == name) {
            return &scheme;
        }
    }
    return nullptr;
}

} // namespace metalayout
