#ifndef SRC_METALAYOUT_SCHEMA_HPP_
#define SRC_METALAYOUT_SCHEMA_HPP_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace metalayout {

// Tables are identified at runtime by their on-disk code. Stored wider than a byte so that the "no table" sentinel,
// which is one past the largest code, always fits.
using TableId = int32_t;

// The three shared variable-length data pools that table records reference by offset.
enum class Heap : int8_t { kString = 0, kBlob = 1, kGUID = 2 };
static constexpr size_t kNumberOfHeaps = 3;

const char* heapName(Heap heap);

// One column of a table. Exactly one group of the kind-specific members is meaningful, selected by |kind|.
struct FieldDefinition {
    enum Kind {
        kFixedInt,
        kHeapIndex,
        kTableRef,
        kCodedRef,
        kRowRange,
        // A kind the schema source named but that has no width or decode rule. Kept so the generator can report it
        // instead of silently dropping the column.
        kUnsupported
    };

    std::string name;
    Kind kind = kUnsupported;

    // kFixedInt: 1, 2 or 4. Any other value is unsupported.
    int sizeBytes = 0;
    // kFixedInt: the name of the bit-flag type the integer is reinterpreted as, or empty for a plain integer.
    std::string flagType;
    // kHeapIndex
    Heap heap = Heap::kString;
    // kTableRef and kRowRange: name of the table indexed.
    std::string target;
    // kCodedRef: name of the code scheme.
    std::string scheme;
    // kUnsupported: the kind as spelled in the schema source, for diagnostics.
    std::string kindName;

    static FieldDefinition makeFixedInt(std::string name, int sizeBytes, std::string flagType = "");
    static FieldDefinition makeHeapIndex(std::string name, Heap heap);
    static FieldDefinition makeTableRef(std::string name, std::string target);
    static FieldDefinition makeCodedRef(std::string name, std::string scheme);
    static FieldDefinition makeRowRange(std::string name, std::string target);
    static FieldDefinition makeUnsupported(std::string name, std::string kindName);
};

const char* fieldKindName(FieldDefinition::Kind kind);

struct TableDefinition {
    std::string name;
    // On-disk identifier, valid in [0, 255]. Kept as a plain int so out-of-range declarations can be reported.
    int code = 0;
    // Internal-only tables exist for composition but are never reachable through the registry or coded references.
    bool visible = true;
    // Order is the on-disk column order and the decode order.
    std::vector<FieldDefinition> fields;
};

struct Schema {
    std::vector<TableDefinition> tables;

    // Returns nullptr if no table is named |name|.
    const TableDefinition* findTable(std::string_view name) const;
};

// A coded reference packs a table tag in its low |tagBits| bits and a row index in the remaining bits. The position
// of a table name in |tables| is its tag, an empty name marks a tag slot that designates no table.
struct CodeScheme {
    std::string name;
    // Tags must fit in a byte, and leave at least one bit of a 2-byte coded index for the row.
    static constexpr int kMaxTagBits = 8;

    int tagBits = 0;
    std::vector<std::string> tables;
};

// Externally supplied code schemes, looked up by name.
struct SchemeSet {
    std::vector<CodeScheme> schemes;

    // Returns nullptr if no scheme is named |name|.
    const CodeScheme* find(std::string_view name) const;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_SCHEMA_HPP_
