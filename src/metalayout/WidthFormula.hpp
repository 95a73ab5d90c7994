#ifndef SRC_METALAYOUT_WIDTH_FORMULA_HPP_
#define SRC_METALAYOUT_WIDTH_FORMULA_HPP_

#include "metalayout/Schema.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace metalayout {

class Catalog;
class ErrorReporter;
class LayoutContext;

// Width in bytes of a single column, either a constant or a lookup into the LayoutContext.
struct WidthTerm {
    enum Kind { kConstant, kHeapIndex, kTableIndex, kCodedIndex };

    Kind kind = kConstant;
    int constant = 0;
    Heap heap = Heap::kString;
    // Table name for kTableIndex, scheme name for kCodedIndex.
    std::string name;

    int evaluate(const LayoutContext& layout) const;

    // Returns false if |field| has no width rule. This is the single definition of column width, the decode steps
    // size their reads from the same terms.
    static bool forField(const FieldDefinition& field, WidthTerm& term);
};

// Byte width of one record, as the ordered sum of its column terms.
struct WidthFormula {
    std::string table;
    std::vector<WidthTerm> terms;

    int evaluate(const LayoutContext& layout) const;
    // True if every term is a constant, so the width does not depend on the layout.
    bool isConstant() const;
};

using WidthFormulas = std::unordered_map<std::string, WidthFormula>;

class WidthFormulaBuilder {
public:
    WidthFormulaBuilder() = delete;
    explicit WidthFormulaBuilder(std::shared_ptr<ErrorReporter> errorReporter);
    ~WidthFormulaBuilder() = default;

    // Builds one formula per table in |catalog|, keyed by table name. Reports an UnsupportedKindFault for each
    // column without a width rule and for each table without columns.
    bool build(const Schema& schema, const Catalog& catalog, WidthFormulas& formulas);

private:
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_WIDTH_FORMULA_HPP_
