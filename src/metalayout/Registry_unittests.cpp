#include "metalayout/Registry.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <utility>

namespace metalayout {

namespace {
TableDefinition makeTable(std::string name, int code, bool visible = true) {
    TableDefinition table;
    table.name = std::move(name);
    table.code = code;
    table.visible = visible;
    table.fields.emplace_back(FieldDefinition::makeFixedInt("Value", 2));
    return table;
}
} // namespace

TEST_CASE("RegistryBuilder") {
    Schema schema;
    schema.tables.emplace_back(makeTable("Field", 4));
    schema.tables.emplace_back(makeTable("FieldPtr", 3, false));
    schema.tables.emplace_back(makeTable("Module", 0));
    schema.tables.emplace_back(makeTable("TypeDef", 2));
    CatalogBuilder catalogBuilder(std::make_shared<ErrorReporter>(true));
    Catalog catalog;
    REQUIRE(catalogBuilder.build(schema, catalog));

    RegistryBuilder builder;
    Registry registry;
    builder.build(catalog, registry);

    REQUIRE(registry.size() == 3);
    CHECK(registry.entries()[0].name == "Module");
    CHECK(registry.entries()[0].id == 0);
    CHECK(registry.entries()[1].name == "TypeDef");
    CHECK(registry.entries()[2].name == "Field");

    SUBCASE("find") {
        REQUIRE(registry.find(2) != nullptr);
        CHECK(registry.find(2)->name == "TypeDef");
        CHECK(registry.find(4)->name == "Field");
        CHECK(registry.find(3) == nullptr);
        CHECK(registry.find(1) == nullptr);
        CHECK(registry.find(catalog.none()) == nullptr);
        CHECK(registry.find(-1) == nullptr);
    }
    SUBCASE("rebuild replaces entries") {
        Catalog empty;
        CatalogBuilder emptyBuilder(std::make_shared<ErrorReporter>(true));
        REQUIRE(emptyBuilder.build(Schema(), empty));
        builder.build(empty, registry);
        CHECK(registry.size() == 0);
        CHECK(registry.find(0) == nullptr);
    }
}

} // namespace metalayout
