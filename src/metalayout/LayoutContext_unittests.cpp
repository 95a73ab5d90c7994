#include "metalayout/LayoutContext.hpp"

#include "metalayout/Catalog.hpp"
#include "metalayout/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace metalayout {

namespace {
Catalog buildCatalog(const std::vector<std::pair<std::string, int>>& tables) {
    Schema schema;
    for (const auto& pair : tables) {
        TableDefinition table;
        table.name = pair.first;
        table.code = pair.second;
        table.fields.emplace_back(FieldDefinition::makeFixedInt("Value", 2));
        schema.tables.emplace_back(std::move(table));
    }
    CatalogBuilder builder(std::make_shared<ErrorReporter>(true));
    Catalog catalog;
    REQUIRE(builder.build(schema, catalog));
    return catalog;
}
} // namespace

TEST_CASE("LayoutContext defaults") {
    LayoutContext layout;
    CHECK(layout.heapIndexWidth(Heap::kString) == 2);
    CHECK(layout.heapIndexWidth(Heap::kBlob) == 2);
    CHECK(layout.heapIndexWidth(Heap::kGUID) == 2);
    CHECK(layout.tableIndexWidth("Anything") == 0);
    CHECK(layout.codedIndexWidth("Anything") == 0);

    layout.setTableIndexWidth("T", 4);
    layout.setCodedIndexWidth("S", 2);
    layout.setHeapIndexWidth(Heap::kBlob, 4);
    CHECK(layout.tableIndexWidth("T") == 4);
    CHECK(layout.codedIndexWidth("S") == 2);
    CHECK(layout.heapIndexWidth(Heap::kBlob) == 4);
    CHECK(layout.heapIndexWidth(Heap::kString) == 2);
}

TEST_CASE("LayoutContext heap widths") {
    auto catalog = buildCatalog({ { "T", 0 } });
    SUBCASE("all narrow") {
        auto layout = LayoutContext::compute(catalog, SchemeSet(), 0x00, {});
        CHECK(layout.heapIndexWidth(Heap::kString) == 2);
        CHECK(layout.heapIndexWidth(Heap::kGUID) == 2);
        CHECK(layout.heapIndexWidth(Heap::kBlob) == 2);
    }
    SUBCASE("each flag selects one heap") {
        auto strings = LayoutContext::compute(catalog, SchemeSet(), LayoutContext::kStringHeapWideFlag, {});
        CHECK(strings.heapIndexWidth(Heap::kString) == 4);
        CHECK(strings.heapIndexWidth(Heap::kGUID) == 2);
        CHECK(strings.heapIndexWidth(Heap::kBlob) == 2);
        auto guids = LayoutContext::compute(catalog, SchemeSet(), LayoutContext::kGUIDHeapWideFlag, {});
        CHECK(guids.heapIndexWidth(Heap::kString) == 2);
        CHECK(guids.heapIndexWidth(Heap::kGUID) == 4);
        auto blobs = LayoutContext::compute(catalog, SchemeSet(), LayoutContext::kBlobHeapWideFlag, {});
        CHECK(blobs.heapIndexWidth(Heap::kBlob) == 4);
        CHECK(blobs.heapIndexWidth(Heap::kString) == 2);
    }
    SUBCASE("all wide") {
        auto layout = LayoutContext::compute(catalog, SchemeSet(), 0x07, {});
        CHECK(layout.heapIndexWidth(Heap::kString) == 4);
        CHECK(layout.heapIndexWidth(Heap::kGUID) == 4);
        CHECK(layout.heapIndexWidth(Heap::kBlob) == 4);
    }
}

TEST_CASE("LayoutContext table widths") {
    auto catalog = buildCatalog({ { "Small", 0 }, { "Edge", 1 }, { "Large", 2 }, { "Unlisted", 5 } });
    auto layout = LayoutContext::compute(catalog, SchemeSet(), 0, { 10, 0xFFFF, 0x10000 });
    CHECK(layout.tableIndexWidth("Small") == 2);
    CHECK(layout.tableIndexWidth("Edge") == 2);
    CHECK(layout.tableIndexWidth("Large") == 4);
    // Ids past the end of the row counts are empty tables.
    CHECK(layout.tableIndexWidth("Unlisted") == 2);
}

TEST_CASE("LayoutContext coded widths") {
    auto catalog = buildCatalog({ { "A", 0 }, { "B", 1 }, { "C", 2 } });
    SchemeSet schemes;
    schemes.schemes.emplace_back(CodeScheme{ "TwoBits", 2, { "A", "B", "", "C" } });
    schemes.schemes.emplace_back(CodeScheme{ "FiveBits", 5, { "A" } });

    SUBCASE("largest table below the row limit") {
        auto layout = LayoutContext::compute(catalog, schemes, 0, { 1, 0x3FFF, 7 });
        CHECK(layout.codedIndexWidth("TwoBits") == 2);
        CHECK(layout.codedIndexWidth("FiveBits") == 2);
    }
    SUBCASE("largest table at the row limit") {
        auto layout = LayoutContext::compute(catalog, schemes, 0, { 1, 7, 0x4000 });
        CHECK(layout.codedIndexWidth("TwoBits") == 4);
        CHECK(layout.codedIndexWidth("FiveBits") == 2);
    }
    SUBCASE("unreferenced schemes with out of range tag bits are wide") {
        SchemeSet unchecked;
        unchecked.schemes.emplace_back(CodeScheme{ "Negative", -20, { "A" } });
        unchecked.schemes.emplace_back(CodeScheme{ "Zero", 0, { "A" } });
        unchecked.schemes.emplace_back(CodeScheme{ "Huge", 40, { "A" } });
        unchecked.schemes.emplace_back(CodeScheme{ "Nine", CodeScheme::kMaxTagBits + 1, { "A" } });
        unchecked.schemes.emplace_back(CodeScheme{ "Eight", CodeScheme::kMaxTagBits, { "A" } });
        auto layout = LayoutContext::compute(catalog, unchecked, 0, { 1 });
        CHECK(layout.codedIndexWidth("Negative") == 4);
        CHECK(layout.codedIndexWidth("Zero") == 4);
        CHECK(layout.codedIndexWidth("Huge") == 4);
        CHECK(layout.codedIndexWidth("Nine") == 4);
        CHECK(layout.codedIndexWidth("Eight") == 2);
    }
    SUBCASE("five tag bits leave eleven row bits") {
        auto narrow = LayoutContext::compute(catalog, schemes, 0, { 0x7FF });
        CHECK(narrow.codedIndexWidth("FiveBits") == 2);
        auto wide = LayoutContext::compute(catalog, schemes, 0, { 0x800 });
        CHECK(wide.codedIndexWidth("FiveBits") == 4);
    }
}

} // namespace metalayout
