#include "metalayout/DecodePlan.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"

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

Catalog buildCatalog(const Schema& schema) {
    CatalogBuilder builder(std::make_shared<ErrorReporter>(true));
    Catalog catalog;
    REQUIRE(builder.build(schema, catalog));
    return catalog;
}
} // namespace

TEST_CASE("DecodePlanBuilder steps") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("Owner", 0,
                                         { FieldDefinition::makeFixedInt("Tiny", 1),
                                           FieldDefinition::makeFixedInt("Small", 2),
                                           FieldDefinition::makeFixedInt("Flags", 4, "OwnerAttributes"),
                                           FieldDefinition::makeHeapIndex("Name", Heap::kString),
                                           FieldDefinition::makeHeapIndex("Id", Heap::kGUID),
                                           FieldDefinition::makeTableRef("Parent", "Child"),
                                           FieldDefinition::makeRowRange("Children", "Child"),
                                           FieldDefinition::makeCodedRef("Related", "Relation") }));
    schema.tables.emplace_back(makeTable("Hidden", 1, { FieldDefinition::makeFixedInt("Value", 2) }, false));
    schema.tables.emplace_back(makeTable("Child", 4, { FieldDefinition::makeFixedInt("Value", 2) }));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "Relation", 2, { "Owner", "", "Hidden", "Child" } });
    auto catalog = buildCatalog(schema);

    DecodePlanBuilder builder(errorReporter);
    DecodePlans plans;
    REQUIRE(builder.build(schema, schemes, catalog, plans));
    CHECK(plans.size() == 3);

    const auto& plan = plans.at("Owner");
    CHECK(plan.table == "Owner");
    CHECK(plan.id == 0);
    REQUIRE(plan.steps.size() == 8);
    for (size_t i = 0; i < plan.steps.size(); ++i) {
        CHECK(plan.steps[i].field == i);
        CHECK(plan.steps[i].fieldName == schema.tables[0].fields[i].name);
    }

    CHECK(plan.steps[0].op == DecodeStep::kUInt8);
    CHECK(plan.steps[1].op == DecodeStep::kUInt16);
    CHECK(plan.steps[2].op == DecodeStep::kUInt32);
    CHECK(plan.steps[2].flagType == "OwnerAttributes");
    CHECK(plan.steps[1].flagType.empty());

    CHECK(plan.steps[3].op == DecodeStep::kHeapIndex);
    CHECK(plan.steps[3].heap == Heap::kString);
    CHECK(plan.steps[4].heap == Heap::kGUID);

    CHECK(plan.steps[5].op == DecodeStep::kTableIndex);
    CHECK(plan.steps[5].target == "Child");
    CHECK(plan.steps[5].targetId == 4);
    CHECK(plan.steps[6].op == DecodeStep::kRowRange);
    CHECK(plan.steps[6].targetId == 4);

    const auto& coded = plan.steps[7];
    CHECK(coded.op == DecodeStep::kCodedIndex);
    CHECK(coded.scheme == "Relation");
    CHECK(coded.tagBits == 2);
    REQUIRE(coded.tagTables.size() == 4);
    CHECK(coded.tagTables[0] == 0);
    CHECK(coded.tagTables[1] == catalog.none());
    // Decoding still resolves internal tables, only dispatch hides them.
    CHECK(coded.tagTables[2] == 1);
    CHECK(coded.tagTables[3] == 4);

    SUBCASE("widths match the field rules") {
        CHECK(plan.steps[0].width.kind == WidthTerm::kConstant);
        CHECK(plan.steps[0].width.constant == 1);
        CHECK(plan.steps[3].width.kind == WidthTerm::kHeapIndex);
        CHECK(plan.steps[6].width.kind == WidthTerm::kTableIndex);
        CHECK(plan.steps[6].width.name == "Child");
        CHECK(coded.width.kind == WidthTerm::kCodedIndex);
        CHECK(coded.width.name == "Relation");
    }
}

TEST_CASE("DecodePlanBuilder faults") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("A", 0,
                                         { FieldDefinition::makeFixedInt("Value", 2),
                                           FieldDefinition::makeUnsupported("When", "timestamp") }));
    auto catalog = buildCatalog(schema);

    DecodePlanBuilder builder(errorReporter);
    DecodePlans plans;
    CHECK(!builder.build(schema, SchemeSet(), catalog, plans));
    CHECK(plans.empty());
    REQUIRE(errorReporter->errorCount() == 1);
    CHECK(errorReporter->faults()[0].kind == Fault::kUnsupportedKind);
    CHECK(errorReporter->faults()[0].message.find("timestamp") != std::string::npos);
}

TEST_CASE("decodeOpName") {
    CHECK(std::string(decodeOpName(DecodeStep::kUInt16)) == "uint16");
    CHECK(std::string(decodeOpName(DecodeStep::kCodedIndex)) == "coded");
    CHECK(std::string(decodeOpName(DecodeStep::kRowRange)) == "range");
}

} // namespace metalayout
