#ifndef SRC_METALAYOUT_LAYOUT_CONTEXT_HPP_
#define SRC_METALAYOUT_LAYOUT_CONTEXT_HPP_

#include "metalayout/Schema.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace metalayout {

class Catalog;

// The index widths of one container instance. The binary format picks 2 or 4 byte indices depending on how much data
// the container holds, so these are only known at decode time.
class LayoutContext {
public:
    LayoutContext();
    ~LayoutContext() = default;

    // Bits of the container header HeapSizes byte that select 4-byte heap offsets.
    static constexpr uint8_t kStringHeapWideFlag = 0x01;
    static constexpr uint8_t kGUIDHeapWideFlag = 0x02;
    static constexpr uint8_t kBlobHeapWideFlag = 0x04;

    // Derive all widths from the HeapSizes flags and the per-table row counts of a container. |rowCounts| is indexed
    // by table id, ids past its end count as empty tables. Computes a width for every table in |catalog| and every
    // scheme in |schemes|.
    static LayoutContext compute(const Catalog& catalog, const SchemeSet& schemes, uint8_t heapSizeFlags,
                                 const std::vector<uint32_t>& rowCounts);

    // Each of these returns 0 for a name the context has no width for, which no valid record column has.
    int heapIndexWidth(Heap heap) const;
    int tableIndexWidth(std::string_view tableName) const;
    int codedIndexWidth(std::string_view schemeName) const;

    void setHeapIndexWidth(Heap heap, int width);
    void setTableIndexWidth(std::string tableName, int width);
    void setCodedIndexWidth(std::string schemeName, int width);

private:
    std::array<int, kNumberOfHeaps> m_heapWidths;
    std::unordered_map<std::string, int> m_tableWidths;
    std::unordered_map<std::string, int> m_codedWidths;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_LAYOUT_CONTEXT_HPP_
