#include "metalayout/WidthFormula.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"
#include "metalayout/LayoutContext.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace metalayout {

namespace {
TableDefinition makeTable(std::string name, int code, std::vector<FieldDefinition> fields) {
    TableDefinition table;
    table.name = std::move(name);
    table.code = code;
    table.fields = std::move(fields);
    return table;
}

Catalog buildCatalog(const Schema& schema) {
    CatalogBuilder builder(std::make_shared<ErrorReporter>(true));
    Catalog catalog;
    REQUIRE(builder.build(schema, catalog));
    return catalog;
}
} // namespace

TEST_CASE("WidthTerm for fields") {
    WidthTerm term;
    SUBCASE("fixed integers") {
        for (int size : { 1, 2, 4 }) {
            REQUIRE(WidthTerm::forField(FieldDefinition::makeFixedInt("Value", size), term));
            CHECK(term.kind == WidthTerm::kConstant);
            CHECK(term.constant == size);
        }
        CHECK(!WidthTerm::forField(FieldDefinition::makeFixedInt("Value", 3), term));
        CHECK(!WidthTerm::forField(FieldDefinition::makeFixedInt("Value", 8), term));
    }
    SUBCASE("heap index") {
        REQUIRE(WidthTerm::forField(FieldDefinition::makeHeapIndex("Signature", Heap::kBlob), term));
        CHECK(term.kind == WidthTerm::kHeapIndex);
        CHECK(term.heap == Heap::kBlob);
    }
    SUBCASE("table reference and row range share a rule") {
        WidthTerm range;
        REQUIRE(WidthTerm::forField(FieldDefinition::makeTableRef("Parent", "TypeDef"), term));
        REQUIRE(WidthTerm::forField(FieldDefinition::makeRowRange("FieldList", "TypeDef"), range));
        CHECK(term.kind == WidthTerm::kTableIndex);
        CHECK(range.kind == WidthTerm::kTableIndex);
        CHECK(term.name == "TypeDef");
        CHECK(range.name == "TypeDef");
    }
    SUBCASE("coded reference") {
        REQUIRE(WidthTerm::forField(FieldDefinition::makeCodedRef("Extends", "TypeDefOrRef"), term));
        CHECK(term.kind == WidthTerm::kCodedIndex);
        CHECK(term.name == "TypeDefOrRef");
    }
    SUBCASE("unsupported") { CHECK(!WidthTerm::forField(FieldDefinition::makeUnsupported("X", "float"), term)); }
}

TEST_CASE("WidthFormulaBuilder constant table") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("T", 3, { FieldDefinition::makeFixedInt("Value", 2) }));
    auto catalog = buildCatalog(schema);

    WidthFormulaBuilder builder(errorReporter);
    WidthFormulas formulas;
    REQUIRE(builder.build(schema, catalog, formulas));
    REQUIRE(formulas.size() == 1);
    const auto& formula = formulas.at("T");
    CHECK(formula.table == "T");
    CHECK(formula.isConstant());
    CHECK(formula.evaluate(LayoutContext()) == 2);
}

TEST_CASE("WidthFormulaBuilder reference terms") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeTableRef("Parent", "B") }));
    schema.tables.emplace_back(makeTable("B", 1, { FieldDefinition::makeFixedInt("Value", 4) }));
    auto catalog = buildCatalog(schema);

    WidthFormulaBuilder builder(errorReporter);
    WidthFormulas formulas;
    REQUIRE(builder.build(schema, catalog, formulas));
    const auto& formula = formulas.at("A");
    REQUIRE(formula.terms.size() == 1);
    CHECK(formula.terms[0].kind == WidthTerm::kTableIndex);
    CHECK(formula.terms[0].name == "B");
    CHECK(!formula.isConstant());

    LayoutContext narrow;
    narrow.setTableIndexWidth("B", 2);
    CHECK(formula.evaluate(narrow) == 2);
    LayoutContext wide;
    wide.setTableIndexWidth("B", 4);
    CHECK(formula.evaluate(wide) == 4);
}

TEST_CASE("WidthFormulaBuilder sums terms in field order") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("TypeDef", 2,
                                         { FieldDefinition::makeFixedInt("Flags", 4, "TypeAttributes"),
                                           FieldDefinition::makeHeapIndex("TypeName", Heap::kString),
                                           FieldDefinition::makeHeapIndex("TypeNamespace", Heap::kString),
                                           FieldDefinition::makeCodedRef("Extends", "TypeDefOrRef"),
                                           FieldDefinition::makeRowRange("FieldList", "Field"),
                                           FieldDefinition::makeRowRange("MethodList", "MethodDef") }));
    schema.tables.emplace_back(makeTable("Field", 4, { FieldDefinition::makeFixedInt("Flags", 2) }));
    schema.tables.emplace_back(makeTable("MethodDef", 6, { FieldDefinition::makeFixedInt("Flags", 2) }));
    auto catalog = buildCatalog(schema);

    WidthFormulaBuilder builder(errorReporter);
    WidthFormulas formulas;
    REQUIRE(builder.build(schema, catalog, formulas));
    const auto& formula = formulas.at("TypeDef");
    REQUIRE(formula.terms.size() == 6);
    CHECK(formula.terms[0].kind == WidthTerm::kConstant);
    CHECK(formula.terms[1].kind == WidthTerm::kHeapIndex);
    CHECK(formula.terms[3].kind == WidthTerm::kCodedIndex);
    CHECK(formula.terms[5].name == "MethodDef");

    LayoutContext layout;
    layout.setHeapIndexWidth(Heap::kString, 4);
    layout.setCodedIndexWidth("TypeDefOrRef", 2);
    layout.setTableIndexWidth("Field", 4);
    layout.setTableIndexWidth("MethodDef", 2);
    CHECK(formula.evaluate(layout) == 4 + 4 + 4 + 2 + 4 + 2);

    int sum = 0;
    for (auto iter = formula.terms.rbegin(); iter != formula.terms.rend(); ++iter) {
        sum += iter->evaluate(layout);
    }
    CHECK(sum == formula.evaluate(layout));
}

TEST_CASE("WidthFormulaBuilder faults") {
    SUBCASE("unsupported kind") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0,
                                             { FieldDefinition::makeFixedInt("Value", 2),
                                               FieldDefinition::makeUnsupported("Ratio", "float") }));
        auto catalog = buildCatalog(schema);
        WidthFormulaBuilder builder(errorReporter);
        WidthFormulas formulas;
        CHECK(!builder.build(schema, catalog, formulas));
        CHECK(formulas.empty());
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->faults()[0].kind == Fault::kUnsupportedKind);
        CHECK(errorReporter->faults()[0].message.find("Ratio") != std::string::npos);
        CHECK(errorReporter->faults()[0].message.find("float") != std::string::npos);
    }
    SUBCASE("unsupported integer size") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeFixedInt("Value", 8) }));
        auto catalog = buildCatalog(schema);
        WidthFormulaBuilder builder(errorReporter);
        WidthFormulas formulas;
        CHECK(!builder.build(schema, catalog, formulas));
        CHECK(errorReporter->hasFault(Fault::kUnsupportedKind));
    }
    SUBCASE("table without fields") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        schema.tables.emplace_back(makeTable("Empty", 0, {}));
        auto catalog = buildCatalog(schema);
        WidthFormulaBuilder builder(errorReporter);
        WidthFormulas formulas;
        CHECK(!builder.build(schema, catalog, formulas));
        CHECK(errorReporter->hasFault(Fault::kUnsupportedKind));
    }
}

} // namespace metalayout
