#include "metalayout/RecordDecoder.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/Generator.hpp"
#include "metalayout/LayoutContext.hpp"

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

// A at code 0 references B, B at code 1 holds a coded reference into either table.
std::unique_ptr<Artifacts> generateArtifacts(Schema& schema, SchemeSet& schemes) {
    schema.tables.emplace_back(makeTable("A", 0,
                                         { FieldDefinition::makeFixedInt("Flags", 2),
                                           FieldDefinition::makeHeapIndex("Name", Heap::kString),
                                           FieldDefinition::makeTableRef("Parent", "B") }));
    schema.tables.emplace_back(makeTable("B", 1,
                                         { FieldDefinition::makeFixedInt("Kind", 1),
                                           FieldDefinition::makeCodedRef("Owner", "AorB") }));
    schemes.schemes.emplace_back(CodeScheme{ "AorB", 1, { "A", "B" } });
    Generator generator(std::make_shared<ErrorReporter>(true));
    auto artifacts = generator.generate(schema, schemes);
    REQUIRE(artifacts);
    return artifacts;
}
} // namespace

TEST_CASE("RecordDecoder narrow layout") {
    Schema schema;
    SchemeSet schemes;
    auto artifacts = generateArtifacts(schema, schemes);
    auto layout = LayoutContext::compute(artifacts->catalog, schemes, 0, { 3, 3 });
    const auto& plan = *artifacts->decodePlan("A");
    auto none = artifacts->catalog.none();

    std::vector<uint8_t> bytes{ 0x01, 0x00, 0x10, 0x20, 0x02, 0x00 };
    REQUIRE(artifacts->widthFormula("A")->evaluate(layout) == static_cast<int>(bytes.size()));
    RecordCursor cursor(bytes.data(), bytes.size());
    Record record;
    REQUIRE(RecordDecoder::decode(plan, layout, none, cursor, record));
    CHECK(cursor.position() == bytes.size());
    CHECK(record.table == 0);
    REQUIRE(record.values.size() == 3);
    CHECK(record.values[0].op == DecodeStep::kUInt16);
    CHECK(record.values[0].value == 1);
    CHECK(record.values[0].table == none);
    CHECK(record.values[1].op == DecodeStep::kHeapIndex);
    CHECK(record.values[1].value == 0x2010);
    CHECK(record.values[2].op == DecodeStep::kTableIndex);
    CHECK(record.values[2].value == 2);
    CHECK(record.values[2].table == 1);
}

TEST_CASE("RecordDecoder wide layout") {
    Schema schema;
    SchemeSet schemes;
    auto artifacts = generateArtifacts(schema, schemes);
    auto layout = LayoutContext::compute(artifacts->catalog, schemes, LayoutContext::kStringHeapWideFlag,
                                         { 1, 0x10000 });
    CHECK(layout.tableIndexWidth("B") == 4);
    CHECK(layout.codedIndexWidth("AorB") == 4);

    SUBCASE("table reference") {
        const auto& plan = *artifacts->decodePlan("A");
        std::vector<uint8_t> bytes{ 0x01, 0x00, 0x04, 0x03, 0x02, 0x01, 0x00, 0x00, 0x01, 0x00 };
        REQUIRE(artifacts->widthFormula("A")->evaluate(layout) == static_cast<int>(bytes.size()));
        RecordCursor cursor(bytes.data(), bytes.size());
        Record record;
        REQUIRE(RecordDecoder::decode(plan, layout, artifacts->catalog.none(), cursor, record));
        CHECK(cursor.position() == bytes.size());
        CHECK(record.values[1].value == 0x01020304);
        CHECK(record.values[2].value == 0x10000);
    }
    SUBCASE("coded reference") {
        const auto& plan = *artifacts->decodePlan("B");
        // Tag 1 selects B, row 0x8000.
        std::vector<uint8_t> bytes{ 0x07, 0x01, 0x00, 0x01, 0x00 };
        RecordCursor cursor(bytes.data(), bytes.size());
        Record record;
        REQUIRE(RecordDecoder::decode(plan, layout, artifacts->catalog.none(), cursor, record));
        CHECK(cursor.position() == 5);
        CHECK(record.values[0].value == 7);
        CHECK(record.values[1].op == DecodeStep::kCodedIndex);
        CHECK(record.values[1].table == 1);
        CHECK(record.values[1].value == 0x8000);
    }
}

TEST_CASE("RecordDecoder failures leave the record untouched") {
    Schema schema;
    SchemeSet schemes;
    auto artifacts = generateArtifacts(schema, schemes);
    auto layout = LayoutContext::compute(artifacts->catalog, schemes, 0, {});
    auto none = artifacts->catalog.none();

    Record record;
    record.table = 42;
    record.values.emplace_back(FieldValue{ DecodeStep::kUInt8, 99, none });

    SUBCASE("truncated buffer") {
        std::vector<uint8_t> bytes{ 0x01, 0x00, 0x10 };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(!RecordDecoder::decode(*artifacts->decodePlan("A"), layout, none, cursor, record));
        CHECK(cursor.error() == RecordCursor::kExhausted);
    }
    SUBCASE("invalid coded tag") {
        // Every tag of the full one-bit scheme is valid, so drop tag 1 from the plan.
        auto plan = *artifacts->decodePlan("B");
        plan.steps[1].tagTables.pop_back();
        std::vector<uint8_t> bytes{ 0x00, 0x03, 0x00 };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(!RecordDecoder::decode(plan, layout, none, cursor, record));
        CHECK(cursor.error() == RecordCursor::kInvalidCodedTag);
    }
    CHECK(record.table == 42);
    REQUIRE(record.values.size() == 1);
    CHECK(record.values[0].value == 99);
}

TEST_CASE("RecordDecoder rows") {
    Schema schema;
    SchemeSet schemes;
    auto artifacts = generateArtifacts(schema, schemes);
    auto layout = LayoutContext::compute(artifacts->catalog, schemes, 0, { 0, 2 });
    const auto& formula = *artifacts->widthFormula("B");
    const auto& plan = *artifacts->decodePlan("B");
    auto none = artifacts->catalog.none();
    REQUIRE(formula.evaluate(layout) == 3);

    // Row 0 -> A row 1, row 1 -> B row 2.
    std::vector<uint8_t> tableData{ 0x0a, 0x02, 0x00, 0x0b, 0x05, 0x00 };
    Record record;
    RecordCursor::Error error = RecordCursor::kNone;

    REQUIRE(RecordDecoder::decodeRow(formula, plan, layout, none, tableData, 0, record, error));
    CHECK(error == RecordCursor::kNone);
    CHECK(record.values[0].value == 0x0a);
    CHECK(record.values[1].table == 0);
    CHECK(record.values[1].value == 1);

    REQUIRE(RecordDecoder::decodeRow(formula, plan, layout, none, tableData, 1, record, error));
    CHECK(record.values[0].value == 0x0b);
    CHECK(record.values[1].table == 1);
    CHECK(record.values[1].value == 2);

    SUBCASE("row out of range") {
        CHECK(!RecordDecoder::decodeRow(formula, plan, layout, none, tableData, 2, record, error));
        CHECK(error == RecordCursor::kExhausted);
        CHECK(record.values[0].value == 0x0b);
    }
    SUBCASE("plan shorter than the record") {
        auto shortPlan = plan;
        shortPlan.steps.pop_back();
        CHECK(!RecordDecoder::decodeRow(formula, shortPlan, layout, none, tableData, 0, record, error));
        CHECK(error == RecordCursor::kInvalidWidth);
        CHECK(record.values.size() == 2);
    }
    SUBCASE("plan longer than the record") {
        auto longPlan = plan;
        longPlan.steps.push_back(plan.steps[0]);
        CHECK(!RecordDecoder::decodeRow(formula, longPlan, layout, none, tableData, 0, record, error));
        CHECK(error == RecordCursor::kExhausted);
    }
}

TEST_CASE("RecordDecoder consumes exactly the formula width") {
    Schema schema;
    SchemeSet schemes;
    auto artifacts = generateArtifacts(schema, schemes);
    for (uint8_t heapFlags : { 0x00, 0x01, 0x07 }) {
        for (uint32_t rows : { 0u, 0x7fffu, 0x8000u, 0x10000u }) {
            auto layout = LayoutContext::compute(artifacts->catalog, schemes, heapFlags, { rows, rows });
            for (const auto& entry : artifacts->catalog.entries()) {
                const auto& formula = *artifacts->widthFormula(entry.name);
                auto width = static_cast<size_t>(formula.evaluate(layout));
                // Zeroed records decode coded tag 0, which names A.
                std::vector<uint8_t> bytes(width * 2, 0);
                RecordCursor cursor(bytes.data(), bytes.size());
                Record record;
                REQUIRE(RecordDecoder::decode(*artifacts->decodePlan(entry.name), layout,
                                              artifacts->catalog.none(), cursor, record));
                CHECK(cursor.position() == width);
            }
        }
    }
}

} // namespace metalayout
