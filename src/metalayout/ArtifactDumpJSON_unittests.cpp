#include "metalayout/ArtifactDumpJSON.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Generator.hpp"
#include "metalayout/Schema.hpp"

#include "doctest/doctest.h"
#include "rapidjson/document.h"

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

TEST_CASE("ArtifactDumpJSON") {
    Schema schema;
    schema.tables.emplace_back(makeTable("Owner", 0,
                                         { FieldDefinition::makeFixedInt("Flags", 2, "OwnerFlags"),
                                           FieldDefinition::makeHeapIndex("Name", Heap::kString),
                                           FieldDefinition::makeCodedRef("Target", "S") }));
    schema.tables.emplace_back(makeTable("Hidden", 1, { FieldDefinition::makeTableRef("Owner", "Owner") }, false));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "S", 1, { "Owner", "Hidden" } });
    Generator generator(std::make_shared<ErrorReporter>(true));
    auto artifacts = generator.generate(schema, schemes);
    REQUIRE(artifacts);

    for (bool prettyPrint : { false, true }) {
        ArtifactDumpJSON dump;
        REQUIRE(dump.dump(*artifacts, prettyPrint));
        auto json = std::string(dump.json());
        rapidjson::Document doc;
        doc.Parse(json.c_str());
        REQUIRE(!doc.HasParseError());
        REQUIRE(doc.IsObject());

        CHECK(doc["tableCount"].GetInt() == 2);
        CHECK(doc["none"].GetInt() == 2);

        const auto& tables = doc["tables"];
        REQUIRE(tables.IsArray());
        REQUIRE(tables.Size() == 2);
        const auto& owner = tables[0];
        CHECK(std::string(owner["name"].GetString()) == "Owner");
        CHECK(owner["id"].GetInt() == 0);
        CHECK(owner["visible"].GetBool());
        CHECK(!tables[1]["visible"].GetBool());

        const auto& width = owner["width"];
        REQUIRE(width.Size() == 3);
        CHECK(width[0].GetInt() == 2);
        CHECK(std::string(width[1][0].GetString()) == "heap");
        CHECK(std::string(width[1][1].GetString()) == "string");
        CHECK(std::string(width[2][0].GetString()) == "coded");
        CHECK(std::string(width[2][1].GetString()) == "S");

        const auto& steps = owner["decode"];
        REQUIRE(steps.Size() == 3);
        CHECK(std::string(steps[0]["op"].GetString()) == "uint16");
        CHECK(std::string(steps[0]["flags"].GetString()) == "OwnerFlags");
        CHECK(std::string(steps[1]["heap"].GetString()) == "string");
        CHECK(std::string(steps[2]["scheme"].GetString()) == "S");
        CHECK(std::string(tables[1]["decode"][0]["table"].GetString()) == "Owner");

        const auto& tags = doc["coded"]["S"];
        REQUIRE(tags.Size() == 2);
        CHECK(tags[0].GetInt() == 0);
        CHECK(tags[1].GetInt() == 2);

        const auto& registry = doc["registry"];
        REQUIRE(registry.Size() == 1);
        CHECK(std::string(registry[0].GetString()) == "Owner");
    }
}

} // namespace metalayout
