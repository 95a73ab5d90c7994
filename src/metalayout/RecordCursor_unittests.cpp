#include "metalayout/RecordCursor.hpp"

#include "doctest/doctest.h"

#include <array>
#include <vector>

namespace metalayout {

TEST_CASE("RecordCursor fixed reads") {
    SUBCASE("little endian") {
        std::array<uint8_t, 7> bytes{ 0x7f, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12 };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(cursor.size() == 7);
        CHECK(cursor.readUInt8() == 0x7f);
        CHECK(cursor.readUInt16() == 0x1234);
        CHECK(cursor.readUInt32() == 0x12345678);
        CHECK(cursor.ok());
        CHECK(cursor.position() == 7);
        CHECK(!cursor.hasOverflow());
    }
    SUBCASE("sized reads") {
        std::array<uint8_t, 7> bytes{ 0xff, 0x01, 0x02, 0x01, 0x02, 0x03, 0x04 };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(cursor.readUInt(1) == 0xff);
        CHECK(cursor.readUInt(2) == 0x0201);
        CHECK(cursor.readUInt(4) == 0x04030201);
        CHECK(cursor.ok());
    }
    SUBCASE("invalid width") {
        std::array<uint8_t, 4> bytes{ 1, 2, 3, 4 };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(cursor.readUInt(3) == 0);
        CHECK(cursor.error() == RecordCursor::kInvalidWidth);
        CHECK(cursor.position() == 0);
        CHECK(cursor.readUInt(0) == 0);
        CHECK(cursor.error() == RecordCursor::kInvalidWidth);
    }
}

TEST_CASE("RecordCursor exhaustion") {
    SUBCASE("empty buffer") {
        std::array<uint8_t, 1> bytes{ 0x55 };
        RecordCursor cursor(bytes.data(), 0);
        CHECK(cursor.size() == 0);
        CHECK(cursor.readUInt8() == 0);
        CHECK(cursor.error() == RecordCursor::kExhausted);
        CHECK(cursor.hasOverflow());
    }
    SUBCASE("partial read still advances") {
        std::array<uint8_t, 3> bytes{ 0xaa, 0xbb, 0xcc };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(cursor.readUInt16() == 0xbbaa);
        CHECK(cursor.ok());
        CHECK(cursor.readUInt32() == 0xcc);
        CHECK(cursor.error() == RecordCursor::kExhausted);
        CHECK(cursor.position() == 6);
        CHECK(cursor.hasOverflow());
    }
    SUBCASE("first error is kept") {
        std::array<uint8_t, 1> bytes{ 0 };
        RecordCursor cursor(bytes.data(), bytes.size());
        cursor.readUInt(3);
        cursor.readUInt32();
        CHECK(cursor.error() == RecordCursor::kInvalidWidth);
    }
    SUBCASE("reset clears the error") {
        std::array<uint8_t, 2> bytes{ 0x01, 0x02 };
        RecordCursor cursor(bytes.data(), bytes.size());
        cursor.readUInt32();
        CHECK(!cursor.ok());
        cursor.reset();
        CHECK(cursor.ok());
        CHECK(cursor.position() == 0);
        CHECK(cursor.readUInt16() == 0x0201);
    }
}

TEST_CASE("RecordCursor coded reads") {
    // Tag 2 of a 2-bit scheme, row 5: (5 << 2) | 2 = 0x16.
    const TableId none = 9;
    std::vector<TableId> tagTables{ 4, none, 7 };
    TableId table = none;
    uint32_t row = 0;

    SUBCASE("valid tag") {
        std::array<uint8_t, 2> bytes{ 0x16, 0x00 };
        RecordCursor cursor(bytes.data(), bytes.size());
        REQUIRE(cursor.readCoded(2, 2, tagTables, none, table, row));
        CHECK(table == 7);
        CHECK(row == 5);
        CHECK(cursor.position() == 2);
    }
    SUBCASE("four byte value") {
        // Tag 0, row 0x10000.
        std::array<uint8_t, 4> bytes{ 0x00, 0x00, 0x04, 0x00 };
        RecordCursor cursor(bytes.data(), bytes.size());
        REQUIRE(cursor.readCoded(4, 2, tagTables, none, table, row));
        CHECK(table == 4);
        CHECK(row == 0x10000);
    }
    SUBCASE("unused tag slot") {
        std::array<uint8_t, 2> bytes{ 0x01, 0x00 };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(!cursor.readCoded(2, 2, tagTables, none, table, row));
        CHECK(cursor.error() == RecordCursor::kInvalidCodedTag);
    }
    SUBCASE("tag past the end of the scheme") {
        std::array<uint8_t, 2> bytes{ 0x03, 0x00 };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(!cursor.readCoded(2, 2, tagTables, none, table, row));
        CHECK(cursor.error() == RecordCursor::kInvalidCodedTag);
        CHECK(table == none);
    }
    SUBCASE("exhausted") {
        std::array<uint8_t, 1> bytes{ 0x16 };
        RecordCursor cursor(bytes.data(), bytes.size());
        CHECK(!cursor.readCoded(2, 2, tagTables, none, table, row));
        CHECK(cursor.error() == RecordCursor::kExhausted);
    }
}

} // namespace metalayout
