#include "metalayout/Validator.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Schema.hpp"

#include "doctest/doctest.h"

#include <memory>

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

TEST_CASE("Validator resolved references") {
    Schema schema;
    schema.tables.emplace_back(makeTable("B", 1, { FieldDefinition::makeFixedInt("Value", 2) }));
    schema.tables.emplace_back(makeTable("A", 0,
                                         { FieldDefinition::makeTableRef("Parent", "B"),
                                           FieldDefinition::makeRowRange("Children", "B"),
                                           FieldDefinition::makeCodedRef("Owner", "AorB") }));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "AorB", 1, { "A", "B" } });
    auto catalog = buildCatalog(schema);

    ErrorReporter errorReporter(true);
    CHECK(Validator::validateReferences(schema, schemes, catalog, &errorReporter));
    CHECK(errorReporter.ok());
}

TEST_CASE("Validator unresolved references") {
    SUBCASE("table reference") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeTableRef("Parent", "Missing") }));
        auto catalog = buildCatalog(schema);
        ErrorReporter errorReporter(true);
        CHECK(!Validator::validateReferences(schema, SchemeSet(), catalog, &errorReporter));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.faults()[0].kind == Fault::kUnresolvedReference);
        CHECK(errorReporter.faults()[0].message.find("A.Parent") != std::string::npos);
        CHECK(errorReporter.faults()[0].message.find("Missing") != std::string::npos);
    }
    SUBCASE("row range") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeRowRange("List", "Missing") }));
        auto catalog = buildCatalog(schema);
        ErrorReporter errorReporter(true);
        CHECK(!Validator::validateReferences(schema, SchemeSet(), catalog, &errorReporter));
        CHECK(errorReporter.hasFault(Fault::kUnresolvedReference));
    }
    SUBCASE("coded scheme") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeCodedRef("Owner", "Nowhere") }));
        auto catalog = buildCatalog(schema);
        ErrorReporter errorReporter(true);
        CHECK(!Validator::validateReferences(schema, SchemeSet(), catalog, &errorReporter));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.faults()[0].message.find("Nowhere") != std::string::npos);
    }
    SUBCASE("scheme lists unknown table") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeCodedRef("Owner", "S") }));
        SchemeSet schemes;
        schemes.schemes.emplace_back(CodeScheme{ "S", 2, { "A", "", "Ghost" } });
        auto catalog = buildCatalog(schema);
        ErrorReporter errorReporter(true);
        CHECK(!Validator::validateReferences(schema, schemes, catalog, &errorReporter));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.faults()[0].message.find("Ghost") != std::string::npos);
    }
    SUBCASE("scheme with more tables than tags") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeCodedRef("Owner", "S") }));
        SchemeSet schemes;
        schemes.schemes.emplace_back(CodeScheme{ "S", 1, { "A", "A", "A" } });
        auto catalog = buildCatalog(schema);
        ErrorReporter errorReporter(true);
        CHECK(!Validator::validateReferences(schema, schemes, catalog, &errorReporter));
        CHECK(errorReporter.hasFault(Fault::kUnresolvedReference));
    }
    SUBCASE("scheme with invalid tag bits") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0, { FieldDefinition::makeCodedRef("Owner", "S") }));
        SchemeSet schemes;
        schemes.schemes.emplace_back(CodeScheme{ "S", 0, { "A" } });
        auto catalog = buildCatalog(schema);
        ErrorReporter errorReporter(true);
        CHECK(!Validator::validateReferences(schema, schemes, catalog, &errorReporter));
    }
    SUBCASE("every broken reference is reported") {
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 0,
                                             { FieldDefinition::makeTableRef("X", "Missing1"),
                                               FieldDefinition::makeTableRef("Y", "Missing2") }));
        schema.tables.emplace_back(makeTable("B", 1, { FieldDefinition::makeCodedRef("Z", "Missing3") }));
        auto catalog = buildCatalog(schema);
        ErrorReporter errorReporter(true);
        CHECK(!Validator::validateReferences(schema, SchemeSet(), catalog, &errorReporter));
        CHECK(errorReporter.errorCount() == 3);
    }
}

TEST_CASE("Validator used schemes") {
    Schema schema;
    schema.tables.emplace_back(makeTable("A", 0,
                                         { FieldDefinition::makeCodedRef("First", "Used2"),
                                           FieldDefinition::makeCodedRef("Second", "Used1"),
                                           FieldDefinition::makeCodedRef("Third", "Used2") }));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "Used1", 1, { "A" } });
    schemes.schemes.emplace_back(CodeScheme{ "Unused", 1, { "Ghost" } });
    schemes.schemes.emplace_back(CodeScheme{ "Used2", 1, { "A" } });

    auto used = Validator::usedSchemes(schema, schemes);
    REQUIRE(used.size() == 2);
    CHECK(used[0]->name == "Used1");
    CHECK(used[1]->name == "Used2");

    SUBCASE("unused schemes are not validated") {
        auto catalog = buildCatalog(schema);
        ErrorReporter errorReporter(true);
        CHECK(Validator::validateReferences(schema, schemes, catalog, &errorReporter));
        CHECK(errorReporter.ok());
    }
}

} // namespace metalayout
