#ifndef SRC_METALAYOUT_RECORD_CURSOR_HPP_
#define SRC_METALAYOUT_RECORD_CURSOR_HPP_

#include "metalayout/Schema.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace metalayout {

// Sequential little-endian reader over the bytes of one or more table records. Reads past the end of the buffer
// return zero and set an error, but still advance, so callers can decode a whole record and check the error state
// once at the end.
class RecordCursor {
public:
    enum Error {
        kNone = 0,
        kExhausted,
        kInvalidCodedTag,
        // Asked for a read width other than 1, 2 or 4 bytes.
        kInvalidWidth
    };

    RecordCursor() = default;
    RecordCursor(const uint8_t* data, size_t size);
    ~RecordCursor() = default;

    void setBuffer(const uint8_t* data, size_t size);
    // Moves back to the start of the buffer and clears the error state.
    void reset();

    uint8_t readUInt8();
    uint16_t readUInt16();
    uint32_t readUInt32();
    // Reads an unsigned value |width| bytes wide, as resolved by a LayoutContext.
    uint32_t readUInt(int width);
    // Splits a |width|-byte coded index into the table designated by its tag and the row index. Sets
    // kInvalidCodedTag and returns false if the tag has no entry in |tagTables| or the entry is |none|.
    bool readCoded(int width, int tagBits, const std::vector<TableId>& tagTables, TableId none, TableId& table,
                   uint32_t& row);

    // Only the first error is kept.
    Error error() const { return m_error; }
    bool ok() const { return m_error == kNone; }
    bool hasOverflow() const { return m_current > m_end; }
    // This can return values larger than size() in the event of an overflow.
    size_t position() const { return m_current - m_start; }
    size_t size() const { return m_end - m_start; }

private:
    uint8_t readByte();
    void setError(Error error);

    const uint8_t* m_start = nullptr;
    const uint8_t* m_current = nullptr;
    const uint8_t* m_end = nullptr;
    Error m_error = kNone;
};

const char* cursorErrorName(RecordCursor::Error error);

} // namespace metalayout

#endif // SRC_METALAYOUT_RECORD_CURSOR_HPP_
