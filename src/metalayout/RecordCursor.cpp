#include "metalayout/RecordCursor.hpp"

namespace metalayout {

const char* cursorErrorName(RecordCursor::Error error) {
    switch (error) {
    case RecordCursor::kNone:
        return "none";
    case RecordCursor::kExhausted:
        return "exhausted";
    case RecordCursor::kInvalidCodedTag:
        return "invalid coded tag";
    case RecordCursor::kInvalidWidth:
        return "invalid width";
    }
    return "unknown";
}

RecordCursor::RecordCursor(const uint8_t* data, size_t size) {
    setBuffer(data, size);
}

void RecordCursor::setBuffer(const uint8_t* data, size_t size) {
    m_start = data;
    m_current = data;
    m_end = data + size;
    m_error = kNone;
}

void RecordCursor::reset() {
    m_current = m_start;
    m_error = kNone;
}

uint8_t RecordCursor::readUInt8() {
    return readByte();
}

uint16_t RecordCursor::readUInt16() {
    uint16_t value = readByte();
    value = value | static_cast<uint16_t>(readByte() << 8);
    return value;
}

uint32_t RecordCursor::readUInt32() {
    uint32_t value = 0;
    for (size_t i = 0; i < sizeof(uint32_t); ++i) {
        value = value | (static_cast<uint32_t>(readByte()) << (8 * i));
    }
    return value;
}

uint32_t RecordCursor::readUInt(int width) {
    switch (width) {
    case 1:
        return readUInt8();
    case 2:
        return readUInt16();
    case 4:
        return readUInt32();
    default:
        setError(kInvalidWidth);
        return 0;
    }
}

bool RecordCursor::readCoded(int width, int tagBits, const std::vector<TableId>& tagTables, TableId none,
                             TableId& table, uint32_t& row) {
    auto raw = readUInt(width);
    if (!ok()) {
        return false;
    }
    uint32_t tag = raw & ((1u << tagBits) - 1);
    if (tag >= tagTables.size() || tagTables[tag] == none) {
        setError(kInvalidCodedTag);
        return false;
    }
    table = tagTables[tag];
    row = raw >> tagBits;
    return true;
}

uint8_t RecordCursor::readByte() {
    uint8_t value = 0;
    if (m_current < m_end) {
        value = *m_current;
    } else {
        setError(kExhausted);
    }
    ++m_current;
    return value;
}

void RecordCursor::setError(Error error) {
    if (m_error == kNone) {
        m_error = error;
    }
}

} // namespace metalayout
