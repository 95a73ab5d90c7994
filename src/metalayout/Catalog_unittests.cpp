#include "metalayout/Catalog.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Schema.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace metalayout {

namespace {
TableDefinition makeTable(std::string name, int code, bool visible = true) {
    TableDefinition table;
    table.name = std::move(name);
    table.code = code;
    table.visible = visible;
    table.fields.emplace_back(FieldDefinition::makeFixedInt("Value", 4));
    return table;
}
} // namespace

TEST_CASE("CatalogBuilder single table") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("T", 3));

    CatalogBuilder builder(errorReporter);
    Catalog catalog;
    REQUIRE(builder.build(schema, catalog));
    CHECK(errorReporter->ok());

    REQUIRE(catalog.entries().size() == 1);
    CHECK(catalog.entries()[0].name == "T");
    CHECK(catalog.entries()[0].id == 3);
    CHECK(catalog.tableCount() == 4);
    CHECK(catalog.none() == 4);
    CHECK(catalog.find("T") == 3);
    CHECK(catalog.find("U") == catalog.none());
    REQUIRE(catalog.entry(3) != nullptr);
    CHECK(catalog.entry(3)->name == "T");
    CHECK(catalog.entry(0) == nullptr);
    CHECK(catalog.entry(catalog.none()) == nullptr);
    CHECK(catalog.entry(-1) == nullptr);
}

TEST_CASE("CatalogBuilder ordering") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Schema schema;
    schema.tables.emplace_back(makeTable("Field", 4));
    schema.tables.emplace_back(makeTable("Module", 0));
    schema.tables.emplace_back(makeTable("FieldPtr", 3, false));
    schema.tables.emplace_back(makeTable("TypeDef", 2));

    CatalogBuilder builder(errorReporter);
    Catalog catalog;
    REQUIRE(builder.build(schema, catalog));

    REQUIRE(catalog.entries().size() == 4);
    CHECK(catalog.entries()[0].name == "Module");
    CHECK(catalog.entries()[1].name == "TypeDef");
    CHECK(catalog.entries()[2].name == "FieldPtr");
    CHECK(catalog.entries()[3].name == "Field");
    CHECK(catalog.entries()[3].schemaIndex == 0);
    CHECK(catalog.tableCount() == 5);
    CHECK(catalog.none() == 5);

    SUBCASE("visibility") {
        CHECK(catalog.isVisible(0));
        CHECK(!catalog.isVisible(3));
        // Gap in the codes.
        CHECK(!catalog.isVisible(1));
        CHECK(!catalog.isVisible(catalog.none()));
    }
}

TEST_CASE("CatalogBuilder sentinel never collides") {
    for (int maxCode : { 0, 1, 17, 254, 255 }) {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        schema.tables.emplace_back(makeTable("Max", maxCode));
        if (maxCode > 0) {
            schema.tables.emplace_back(makeTable("Zero", 0));
        }
        CatalogBuilder builder(errorReporter);
        Catalog catalog;
        REQUIRE(builder.build(schema, catalog));
        CHECK(catalog.tableCount() == maxCode + 1);
        CHECK(catalog.none() == catalog.tableCount());
        for (const auto& entry : catalog.entries()) {
            CHECK(entry.id != catalog.none());
        }
        CHECK(catalog.entry(catalog.none()) == nullptr);
    }
}

TEST_CASE("CatalogBuilder empty schema") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    CatalogBuilder builder(errorReporter);
    Catalog catalog;
    REQUIRE(builder.build(Schema(), catalog));
    CHECK(catalog.entries().empty());
    CHECK(catalog.tableCount() == 0);
    CHECK(catalog.none() == 0);
}

TEST_CASE("CatalogBuilder faults") {
    SUBCASE("duplicate codes name both tables") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 5));
        schema.tables.emplace_back(makeTable("B", 5));
        CatalogBuilder builder(errorReporter);
        Catalog catalog;
        CHECK(!builder.build(schema, catalog));
        REQUIRE(errorReporter->errorCount() == 1);
        const auto& fault = errorReporter->faults()[0];
        CHECK(fault.kind == Fault::kDuplicateCode);
        CHECK(fault.message.find("'A'") != std::string::npos);
        CHECK(fault.message.find("'B'") != std::string::npos);
        CHECK(catalog.entries().empty());
    }
    SUBCASE("every collision is reported") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 1));
        schema.tables.emplace_back(makeTable("B", 1));
        schema.tables.emplace_back(makeTable("C", 1));
        schema.tables.emplace_back(makeTable("D", 2));
        CatalogBuilder builder(errorReporter);
        Catalog catalog;
        CHECK(!builder.build(schema, catalog));
        CHECK(errorReporter->errorCount() == 2);
    }
    SUBCASE("code out of range") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        schema.tables.emplace_back(makeTable("High", 256));
        schema.tables.emplace_back(makeTable("Low", -1));
        CatalogBuilder builder(errorReporter);
        Catalog catalog;
        CHECK(!builder.build(schema, catalog));
        REQUIRE(errorReporter->errorCount() == 2);
        CHECK(errorReporter->faults()[0].kind == Fault::kCodeOutOfRange);
        CHECK(errorReporter->faults()[1].kind == Fault::kCodeOutOfRange);
    }
    SUBCASE("duplicate names") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        schema.tables.emplace_back(makeTable("A", 1));
        schema.tables.emplace_back(makeTable("A", 2));
        CatalogBuilder builder(errorReporter);
        Catalog catalog;
        CHECK(!builder.build(schema, catalog));
        CHECK(errorReporter->hasFault(Fault::kDuplicateName));
        CHECK(!errorReporter->hasFault(Fault::kDuplicateCode));
    }
}

} // namespace metalayout
