#include "metalayout/SchemaLoader.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Generator.hpp"
#include "metalayout/LayoutContext.hpp"
#include "metalayout/RecordDecoder.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <vector>

namespace metalayout {

TEST_CASE("SchemaLoader field kinds") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaLoader loader(errorReporter);
    REQUIRE(loader.loadString(R"({
        "schemes": [ { "name": "Scope", "tagBits": 1, "tables": [ "Module", "" ] } ],
        "tables": [
            { "name": "Module", "code": 0, "fields": [
                { "name": "Generation", "kind": "uint", "size": 2 },
                { "name": "Flags", "kind": "uint", "size": 4, "flags": "ModuleFlags" },
                { "name": "Name", "kind": "string" },
                { "name": "Sig", "kind": "blob" },
                { "name": "Mvid", "kind": "guid" },
                { "name": "Self", "kind": "index", "table": "Module" },
                { "name": "List", "kind": "range", "table": "Module" },
                { "name": "Owner", "kind": "coded", "scheme": "Scope" } ] },
            { "name": "ModulePtr", "code": 1, "visible": false, "fields": [
                { "name": "Module", "kind": "index", "table": "Module" } ] }
        ]
    })"));
    CHECK(errorReporter->ok());

    const auto& schema = loader.schema();
    REQUIRE(schema.tables.size() == 2);
    CHECK(schema.tables[0].visible);
    CHECK(!schema.tables[1].visible);
    CHECK(schema.tables[1].code == 1);

    const auto& fields = schema.tables[0].fields;
    REQUIRE(fields.size() == 8);
    CHECK(fields[0].kind == FieldDefinition::kFixedInt);
    CHECK(fields[0].sizeBytes == 2);
    CHECK(fields[0].flagType.empty());
    CHECK(fields[1].flagType == "ModuleFlags");
    CHECK(fields[2].kind == FieldDefinition::kHeapIndex);
    CHECK(fields[2].heap == Heap::kString);
    CHECK(fields[3].heap == Heap::kBlob);
    CHECK(fields[4].heap == Heap::kGUID);
    CHECK(fields[5].kind == FieldDefinition::kTableRef);
    CHECK(fields[5].target == "Module");
    CHECK(fields[6].kind == FieldDefinition::kRowRange);
    CHECK(fields[7].kind == FieldDefinition::kCodedRef);
    CHECK(fields[7].scheme == "Scope");

    REQUIRE(loader.schemes().schemes.size() == 1);
    const auto scheme = loader.schemes().find("Scope");
    REQUIRE(scheme != nullptr);
    CHECK(scheme->tagBits == 1);
    REQUIRE(scheme->tables.size() == 2);
    CHECK(scheme->tables[1].empty());
}

TEST_CASE("SchemaLoader unknown kind loads as unsupported") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaLoader loader(errorReporter);
    REQUIRE(loader.loadString(R"({ "tables": [ { "name": "A", "code": 0, "fields": [
        { "name": "Ratio", "kind": "float" } ] } ] })"));
    const auto& field = loader.schema().tables[0].fields[0];
    CHECK(field.kind == FieldDefinition::kUnsupported);
    CHECK(field.kindName == "float");

    Generator generator(errorReporter);
    CHECK(generator.generate(loader.schema(), loader.schemes()) == nullptr);
    CHECK(errorReporter->hasFault(Fault::kUnsupportedKind));
}

TEST_CASE("SchemaLoader malformed input") {
    SUBCASE("parse error reports the line") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SchemaLoader loader(errorReporter);
        CHECK(!loader.loadString("{\n  \"tables\": [\n    { \"name\": }\n  ]\n}"));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->faults()[0].kind == Fault::kMalformedSchema);
        CHECK(errorReporter->faults()[0].message.find("line 3") != std::string::npos);
    }
    SUBCASE("not an object") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SchemaLoader loader(errorReporter);
        CHECK(!loader.loadString("[]"));
        CHECK(errorReporter->hasFault(Fault::kMalformedSchema));
    }
    SUBCASE("missing tables") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SchemaLoader loader(errorReporter);
        CHECK(!loader.loadString(R"({ "schemes": [] })"));
        CHECK(errorReporter->hasFault(Fault::kMalformedSchema));
    }
    SUBCASE("every broken table is reported") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SchemaLoader loader(errorReporter);
        CHECK(!loader.loadString(R"({ "tables": [
            { "code": 0, "fields": [] },
            { "name": "B", "code": "one", "fields": [] },
            { "name": "C", "code": 2, "visible": 1, "fields": [] },
            { "name": "D", "code": 3, "fields": [ { "name": "X", "kind": "uint" } ] },
            { "name": "E", "code": 4, "fields": [ { "name": "Y", "kind": "index" } ] },
            { "name": "F", "code": 5, "fields": [] } ] })"));
        CHECK(errorReporter->errorCount() == 5);
        REQUIRE(loader.schema().tables.size() == 1);
        CHECK(loader.schema().tables[0].name == "F");
    }
    SUBCASE("scheme tables must be strings") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SchemaLoader loader(errorReporter);
        CHECK(!loader.loadString(R"({ "schemes": [ { "name": "S", "tagBits": 1, "tables": [ 3 ] } ],
            "tables": [] })"));
        CHECK(errorReporter->hasFault(Fault::kMalformedSchema));
    }
    SUBCASE("missing file") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SchemaLoader loader(errorReporter);
        CHECK(!loader.loadFile("/definitely/not/a/schema.json"));
        CHECK(errorReporter->hasFault(Fault::kFile));
    }
}

TEST_CASE("SchemaLoader ECMA-335 schema") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaLoader loader(errorReporter);
    REQUIRE(loader.loadFile(std::string(METALAYOUT_SCHEMA_DIR) + "/ecma335.json"));
    Generator generator(errorReporter);
    auto artifacts = generator.generate(loader.schema(), loader.schemes());
    REQUIRE(artifacts);

    const auto& catalog = artifacts->catalog;
    CHECK(catalog.tableCount() == 45);
    CHECK(catalog.none() == 45);
    CHECK(catalog.find("Module") == 0);
    CHECK(catalog.find("TypeDef") == 2);
    CHECK(catalog.find("GenericParamConstraint") == 44);

    // The seven pointer and edit-and-continue tables are internal.
    CHECK(artifacts->registry.size() == 38);
    CHECK(artifacts->registry.find(catalog.find("FieldPtr")) == nullptr);
    CHECK(artifacts->registry.find(catalog.find("ENCMap")) == nullptr);
    CHECK(artifacts->codedDispatches.size() == 13);

    SUBCASE("custom attribute constructors") {
        const auto dispatch = artifacts->codedDispatch("CustomAttributeType");
        REQUIRE(dispatch != nullptr);
        CHECK(dispatch->tagBits() == 3);
        CHECK(dispatch->lookupTag(0) == catalog.none());
        CHECK(dispatch->lookupTag(2) == catalog.find("MethodDef"));
        CHECK(dispatch->lookupTag(3) == catalog.find("MemberRef"));
        CHECK(dispatch->lookupTag(4) == catalog.none());
    }
    SUBCASE("type definition width") {
        const auto formula = artifacts->widthFormula("TypeDef");
        REQUIRE(formula != nullptr);
        auto narrow = LayoutContext::compute(catalog, loader.schemes(), 0, {});
        CHECK(formula->evaluate(narrow) == 4 + 2 + 2 + 2 + 2 + 2);

        std::vector<uint32_t> rowCounts(catalog.tableCount(), 0);
        rowCounts[catalog.find("TypeRef")] = 0x4000;
        rowCounts[catalog.find("Field")] = 0x10000;
        auto wide = LayoutContext::compute(catalog, loader.schemes(), LayoutContext::kStringHeapWideFlag, rowCounts);
        CHECK(formula->evaluate(wide) == 4 + 4 + 4 + 4 + 4 + 2);
    }
    SUBCASE("module row") {
        auto layout = LayoutContext::compute(catalog, loader.schemes(), 0, { 1 });
        // Generation 0, Name 0x0a, Mvid 1, EncId 0, EncBaseId 0.
        std::vector<uint8_t> tableData{ 0x00, 0x00, 0x0a, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00 };
        Record record;
        RecordCursor::Error error = RecordCursor::kNone;
        REQUIRE(RecordDecoder::decodeRow(*artifacts->widthFormula("Module"), *artifacts->decodePlan("Module"), layout,
                                         catalog.none(), tableData, 0, record, error));
        REQUIRE(record.values.size() == 5);
        CHECK(record.values[1].value == 0x0a);
        CHECK(record.values[2].value == 1);
    }
}

} // namespace metalayout
