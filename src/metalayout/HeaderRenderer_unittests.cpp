#include "metalayout/HeaderRenderer.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Generator.hpp"
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

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}
} // namespace

TEST_CASE("HeaderRenderer") {
    Schema schema;
    schema.tables.emplace_back(makeTable("TypeDef", 2,
                                         { FieldDefinition::makeFixedInt("Flags", 4, "TypeAttributes"),
                                           FieldDefinition::makeHeapIndex("TypeName", Heap::kString),
                                           FieldDefinition::makeCodedRef("Extends", "TypeDefOrRef"),
                                           FieldDefinition::makeRowRange("FieldList", "Field") }));
    schema.tables.emplace_back(makeTable("TypeRef", 1, { FieldDefinition::makeHeapIndex("Name", Heap::kString) }));
    schema.tables.emplace_back(makeTable("FieldPtr", 3, { FieldDefinition::makeTableRef("Field", "Field") }, false));
    schema.tables.emplace_back(makeTable("Field", 4, { FieldDefinition::makeHeapIndex("Signature", Heap::kBlob) }));
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "TypeDefOrRef", 2, { "TypeDef", "TypeRef", "FieldPtr" } });
    Generator generator(std::make_shared<ErrorReporter>(true));
    auto artifacts = generator.generate(schema, schemes);
    REQUIRE(artifacts);

    HeaderRenderer renderer("metadata");
    auto header = renderer.render(*artifacts, "gen/Tables.hpp");

    SUBCASE("include guard is stable per path") {
        CHECK(contains(header, "#ifndef METALAYOUT_GENERATED_"));
        CHECK(header == renderer.render(*artifacts, "gen/Tables.hpp"));
        CHECK(header != renderer.render(*artifacts, "gen/Other.hpp"));
    }
    SUBCASE("namespace") {
        CHECK(contains(header, "namespace metadata {"));
        CHECK(contains(HeaderRenderer("other").render(*artifacts, "x.hpp"), "namespace other {"));
    }
    SUBCASE("catalog") {
        CHECK(contains(header, "    kTypeRef = 1,\n    kTypeDef = 2,\n    kFieldPtr = 3,\n    kField = 4,\n"));
        CHECK(contains(header, "static constexpr int kTableCount = 5;"));
        CHECK(contains(header, "static constexpr int kTableNone = kTableCount;"));
        CHECK(contains(header, "kCodedTypeDefOrRef = 0,"));
        CHECK(contains(header, "static constexpr int kCodedCount = 1;"));
        CHECK(contains(header, "enum class TypeAttributes : std::uint32_t;"));
    }
    SUBCASE("widths") {
        CHECK(contains(header, "    case kTypeDef:\n        return 4 + la.stringSize + la.codedSizes[kCodedTypeDefOrRef]"
                               " + la.tableSizes[kField];\n"));
        CHECK(contains(header, "    case kField:\n        return la.blobSize;\n"));
    }
    SUBCASE("records") {
        CHECK(contains(header, "struct TypeDefRow {"));
        CHECK(contains(header, "    TypeAttributes Flags;\n"));
        CHECK(contains(header, "    CodedIndex Extends;\n"));
        CHECK(contains(header, "        decoded.Flags = static_cast<TypeAttributes>(r.uint32());\n"));
        CHECK(contains(header, "        decoded.TypeName = r.string();\n"));
        CHECK(contains(header, "        decoded.Extends = r.coded(kCodedTypeDefOrRef);\n"));
        CHECK(contains(header, "        decoded.FieldList = r.range(kTypeDef, kField);\n"));
        CHECK(contains(header, "        decoded.Field = r.index(kField);\n"));
        CHECK(contains(header, "        decoded.Signature = r.blob();\n"));
    }
    SUBCASE("decode assigns only after every read succeeded") {
        CHECK(contains(header, "    template <typename Reader>\n"
                               "    bool decode(Reader& r) {\n"
                               "        TypeRefRow decoded{};\n"
                               "        decoded.Name = r.string();\n"
                               "        if (!r.ok()) {\n"
                               "            return false;\n"
                               "        }\n"
                               "        *this = decoded;\n"
                               "        return true;\n"
                               "    }\n"));
        CHECK(!contains(header, "return r.ok();"));
    }
    SUBCASE("integer types are namespace qualified") {
        CHECK(contains(header, "#include <cstdint>\n"));
        CHECK(contains(header, "    std::uint8_t stringSize = 2;\n"));
        CHECK(contains(header, "    std::uint32_t row = 0;\n"));
        CHECK(contains(header, "    std::uint32_t TypeName;\n"));
        for (const auto type : { " uint8_t", " uint16_t", " uint32_t", "(uint", "<uint" }) {
            CHECK(!contains(header, type));
        }
    }
    SUBCASE("dispatch leaves out internal tables") {
        auto begin = header.find("inline int codedTable");
        REQUIRE(begin != std::string::npos);
        auto dispatch = header.substr(begin, header.find("// ========== Registry") - begin);
        CHECK(contains(dispatch, "        case kTypeDef:\n        case kTypeRef:\n            return table;\n"));
        CHECK(!contains(dispatch, "kFieldPtr"));
    }
    SUBCASE("registry") {
        CHECK(contains(header, "    t.TypeRef.init(kTypeRef);\n    t.TypeDef.init(kTypeDef);\n"
                               "    t.Field.init(kField);\n"));
        CHECK(!contains(header, "t.FieldPtr"));
    }
    SUBCASE("tables struct holds one accessor per public table") {
        CHECK(contains(header, "template <template <typename> class Table>\n"
                               "struct Tables {\n"
                               "    Table<TypeRefRow> TypeRef;\n"
                               "    Table<TypeDefRow> TypeDef;\n"
                               "    Table<FieldRow> Field;\n"
                               "};\n"));
        CHECK(!contains(header, "Table<FieldPtrRow>"));
    }
}

} // namespace metalayout
