#include "metalayout/LayoutContext.hpp"

#include "metalayout/Catalog.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace metalayout {

namespace {
// Row counts at or above this need 4-byte indices.
constexpr uint32_t kMaxNarrowRows = 1u << 16;

uint32_t rowCount(const std::vector<uint32_t>& rowCounts, TableId id) {
    if (id < 0 || static_cast<size_t>(id) >= rowCounts.size()) {
        return 0;
    }
    return rowCounts[id];
}
} // namespace

LayoutContext::LayoutContext() {
    m_heapWidths.fill(2);
}

// static
LayoutContext LayoutContext::compute(const Catalog& catalog, const SchemeSet& schemes, uint8_t heapSizeFlags,
                                     const std::vector<uint32_t>& rowCounts) {
    LayoutContext layout;
    layout.setHeapIndexWidth(Heap::kString, (heapSizeFlags & kStringHeapWideFlag) ? 4 : 2);
    layout.setHeapIndexWidth(Heap::kGUID, (heapSizeFlags & kGUIDHeapWideFlag) ? 4 : 2);
    layout.setHeapIndexWidth(Heap::kBlob, (heapSizeFlags & kBlobHeapWideFlag) ? 4 : 2);

    for (const auto& entry : catalog.entries()) {
        layout.setTableIndexWidth(entry.name, rowCount(rowCounts, entry.id) < kMaxNarrowRows ? 2 : 4);
    }

    // A coded index stays 2 bytes wide as long as the largest participating table still fits in the bits left over
    // after the tag.
    for (const auto& scheme : schemes.schemes) {
        uint32_t maxRows = 0;
        for (const auto& tableName : scheme.tables) {
            if (tableName.empty()) {
                continue;
            }
            maxRows = std::max(maxRows, rowCount(rowCounts, catalog.find(tableName)));
        }
        // Schemes nobody references are never validated, so their tag bits may be anything. Those get the wide form.
        bool validTagBits = scheme.tagBits >= 1 && scheme.tagBits <= CodeScheme::kMaxTagBits;
        bool narrow = validTagBits && maxRows < (1u << (16 - scheme.tagBits));
        layout.setCodedIndexWidth(scheme.name, narrow ? 2 : 4);
    }

    return layout;
}

int LayoutContext::heapIndexWidth(Heap heap) const {
    return m_heapWidths[static_cast<size_t>(heap)];
}

int LayoutContext::tableIndexWidth(std::string_view tableName) const {
    auto iter = m_tableWidths.find(std::string(tableName));
    if (iter == m_tableWidths.end()) {
        SPDLOG_ERROR("Layout has no index width for table '{}'", tableName);
        return 0;
    }
    return iter->second;
}

int LayoutContext::codedIndexWidth(std::string_view schemeName) const {
    auto iter = m_codedWidths.find(std::string(schemeName));
    if (iter == m_codedWidths.end()) {
        SPDLOG_ERROR("Layout has no coded index width for scheme '{}'", schemeName);
        return 0;
    }
    return iter->second;
}

void LayoutContext::setHeapIndexWidth(Heap heap, int width) {
    m_heapWidths[static_cast<size_t>(heap)] = width;
}

void LayoutContext::setTableIndexWidth(std::string tableName, int width) {
    m_tableWidths[std::move(tableName)] = width;
}

void LayoutContext::setCodedIndexWidth(std::string schemeName, int width) {
    m_codedWidths[std::move(schemeName)] = width;
}

} // namespace metalayout
