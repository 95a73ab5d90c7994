#include "metalayout/Generator.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/LayoutContext.hpp"
#include "metalayout/Schema.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace metalayout {

namespace {
TableDefinition makeTable(std::string name, int code, std::vector<FieldDefinition> fields, bool visible = true) {
    TableDefinition table;
    table.name = std::move(name);
    table.code = code;
    table.visible = visible;
    table.fields = std::move(fields);
    return table;
}
} // namespace

TEST_CASE("Generator single table") {
    Schema schema;
    schema.tables.emplace_back(makeTable("T", 3, { FieldDefinition::makeFixedInt("Value", 2) }));
    Generator generator(std::make_shared<ErrorReporter>(true));
    auto artifacts = generator.generate(schema, SchemeSet());
    REQUIRE(artifacts);
    CHECK(generator.errorReporter()->ok());

    CHECK(artifacts->catalog.tableCount() == 4);
    CHECK(artifacts->catalog.none() == 4);
    REQUIRE(artifacts->widthFormula("T") != nullptr);
    CHECK(artifacts->widthFormula("T")->evaluate(LayoutContext()) == 2);
    REQUIRE(artifacts->decodePlan("T") != nullptr);
    CHECK(artifacts->decodePlan("T")->steps.size() == 1);
    CHECK(artifacts->codedDispatches.empty());
    REQUIRE(artifacts->registry.size() == 1);
    CHECK(artifacts->registry.entries()[0].name == "T");

    CHECK(artifacts->widthFormula("Missing") == nullptr);
    CHECK(artifacts->decodePlan("Missing") == nullptr);
    CHECK(artifacts->codedDispatch("Missing") == nullptr);
}

TEST_CASE("Generator table reference") {
    Schema schema;
    schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeTableRef("Parent", "B") }));
    schema.tables.emplace_back(makeTable("B", 1, { FieldDefinition::makeFixedInt("Value", 4) }));
    Generator generator(std::make_shared<ErrorReporter>(true));
    auto artifacts = generator.generate(schema, SchemeSet());
    REQUIRE(artifacts);

    const auto formula = artifacts->widthFormula("A");
    REQUIRE(formula != nullptr);
    REQUIRE(formula->terms.size() == 1);
    CHECK(formula->terms[0].kind == WidthTerm::kTableIndex);
    CHECK(formula->terms[0].name == "B");

    const auto plan = artifacts->decodePlan("A");
    REQUIRE(plan != nullptr);
    REQUIRE(plan->steps.size() == 1);
    CHECK(plan->steps[0].op == DecodeStep::kTableIndex);
    CHECK(plan->steps[0].target == "B");
    CHECK(plan->steps[0].targetId == 1);
}

TEST_CASE("Generator visibility") {
    Schema schema;
    schema.tables.emplace_back(makeTable("Owner", 0, { FieldDefinition::makeCodedRef("Target", "S") }));
    schema.tables.emplace_back(makeTable("Internal", 1, { FieldDefinition::makeFixedInt("Value", 2) }, false));
    schema.tables.emplace_back(makeTable("Public", 2, { FieldDefinition::makeFixedInt("Value", 2) }));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "S", 1, { "Internal", "Public" } });
    Generator generator(std::make_shared<ErrorReporter>(true));
    auto artifacts = generator.generate(schema, schemes);
    REQUIRE(artifacts);

    // Internal tables still get a catalog entry, a width and a decode plan.
    CHECK(artifacts->catalog.entries().size() == 3);
    CHECK(artifacts->widthFormula("Internal") != nullptr);
    CHECK(artifacts->decodePlan("Internal") != nullptr);

    CHECK(artifacts->registry.size() == 2);
    CHECK(artifacts->registry.find(1) == nullptr);
    const auto dispatch = artifacts->codedDispatch("S");
    REQUIRE(dispatch != nullptr);
    CHECK(dispatch->lookupTag(0) == artifacts->catalog.none());
    CHECK(dispatch->lookupTag(1) == 2);
}

TEST_CASE("Generator faults produce no artifacts") {
    SUBCASE("duplicate codes") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 5, { FieldDefinition::makeFixedInt("Value", 2) }));
        schema.tables.emplace_back(makeTable("B", 5, { FieldDefinition::makeFixedInt("Value", 2) }));
        Generator generator(std::make_shared<ErrorReporter>(true));
        CHECK(generator.generate(schema, SchemeSet()) == nullptr);
        REQUIRE(generator.errorReporter()->errorCount() == 1);
        const auto& fault = generator.errorReporter()->faults()[0];
        CHECK(fault.kind == Fault::kDuplicateCode);
        CHECK(fault.message.find("'A'") != std::string::npos);
        CHECK(fault.message.find("'B'") != std::string::npos);
    }
    SUBCASE("unresolved reference") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeTableRef("Parent", "Nope") }));
        Generator generator(std::make_shared<ErrorReporter>(true));
        CHECK(generator.generate(schema, SchemeSet()) == nullptr);
        CHECK(generator.errorReporter()->hasFault(Fault::kUnresolvedReference));
    }
    SUBCASE("unsupported kind") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeUnsupported("Ratio", "float") }));
        Generator generator(std::make_shared<ErrorReporter>(true));
        CHECK(generator.generate(schema, SchemeSet()) == nullptr);
        CHECK(generator.errorReporter()->hasFault(Fault::kUnsupportedKind));
    }
    SUBCASE("earlier faults on the shared reporter") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        errorReporter->addMalformedSchemaFault("table 3 is not an object");
        Schema schema;
        schema.tables.emplace_back(makeTable("T", 0, { FieldDefinition::makeFixedInt("Value", 2) }));
        Generator generator(errorReporter);
        CHECK(generator.generate(schema, SchemeSet()) == nullptr);
        CHECK(errorReporter->errorCount() == 1);
    }
}

} // namespace metalayout
