#include "metalayout/CodedDispatch.hpp"

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

TEST_CASE("CodedDispatchBuilder visible tables") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("TypeDef", 2, { FieldDefinition::makeCodedRef("Extends", "TypeDefOrRef") }));
    schema.tables.emplace_back(makeTable("TypeRef", 1, { FieldDefinition::makeFixedInt("Value", 2) }));
    schema.tables.emplace_back(makeTable("TypePtr", 3, { FieldDefinition::makeFixedInt("Value", 2) }, false));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "TypeDefOrRef", 2, { "TypeDef", "TypeRef", "TypePtr" } });
    schemes.schemes.emplace_back(CodeScheme{ "Unused", 1, { "TypeRef" } });
    auto catalog = buildCatalog(schema);

    CodedDispatchBuilder builder(errorReporter);
    CodedDispatches dispatches;
    REQUIRE(builder.build(schema, schemes, catalog, dispatches));
    CHECK(dispatches.size() == 1);
    CHECK(dispatches.count("Unused") == 0);

    const auto& dispatch = dispatches.at("TypeDefOrRef");
    CHECK(dispatch.scheme() == "TypeDefOrRef");
    CHECK(dispatch.tagBits() == 2);
    CHECK(dispatch.none() == catalog.none());
    REQUIRE(dispatch.tagTables().size() == 3);

    CHECK(dispatch.lookupTag(0) == 2);
    CHECK(dispatch.lookupTag(1) == 1);
    SUBCASE("internal table is unreachable") { CHECK(dispatch.lookupTag(2) == catalog.none()); }
    SUBCASE("unknown tags resolve to none") {
        CHECK(dispatch.lookupTag(3) == catalog.none());
        CHECK(dispatch.lookupTag(0xffffffff) == catalog.none());
    }
    SUBCASE("lookup by table") {
        CHECK(dispatch.lookupTable(2) == 2);
        CHECK(dispatch.lookupTable(1) == 1);
        CHECK(dispatch.lookupTable(3) == catalog.none());
        CHECK(dispatch.lookupTable(0) == catalog.none());
        CHECK(dispatch.lookupTable(catalog.none()) == catalog.none());
    }
}

TEST_CASE("CodedDispatchBuilder unused tag slots") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("MethodDef", 6, { FieldDefinition::makeFixedInt("Flags", 2) }));
    schema.tables.emplace_back(makeTable("MemberRef", 10, { FieldDefinition::makeFixedInt("Flags", 2) }));
    schema.tables.emplace_back(makeTable("CustomAttribute", 12,
                                         { FieldDefinition::makeCodedRef("Type", "CustomAttributeType") }));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "CustomAttributeType", 3, { "", "", "MethodDef", "MemberRef", "" } });
    auto catalog = buildCatalog(schema);

    CodedDispatchBuilder builder(errorReporter);
    CodedDispatches dispatches;
    REQUIRE(builder.build(schema, schemes, catalog, dispatches));
    const auto& dispatch = dispatches.at("CustomAttributeType");
    CHECK(dispatch.lookupTag(0) == catalog.none());
    CHECK(dispatch.lookupTag(1) == catalog.none());
    CHECK(dispatch.lookupTag(2) == 6);
    CHECK(dispatch.lookupTag(3) == 10);
    CHECK(dispatch.lookupTag(4) == catalog.none());
    CHECK(dispatch.lookupTag(7) == catalog.none());
}

TEST_CASE("CodedDispatchBuilder unresolved table") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeCodedRef("Owner", "S") }));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "S", 1, { "A", "Ghost" } });
    auto catalog = buildCatalog(schema);

    CodedDispatchBuilder builder(errorReporter);
    CodedDispatches dispatches;
    CHECK(!builder.build(schema, schemes, catalog, dispatches));
    CHECK(dispatches.empty());
    CHECK(errorReporter->hasFault(Fault::kUnresolvedReference));
}

} // namespace metalayout
