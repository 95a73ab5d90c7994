#include "metalayout/HeaderRenderer.hpp"

#include "metalayout/Generator.hpp"
#include "metalayout/Hash.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <vector>

namespace metalayout {

namespace {

std::string heapMember(Heap heap) {
    switch (heap) {
    case Heap::kString:
        return "string";
    case Heap::kBlob:
        return "blob";
    case Heap::kGUID:
        return "guid";
    }
    return "unknown";
}

std::string widthExpression(const WidthTerm& term) {
    switch (term.kind) {
    case WidthTerm::kConstant:
        return fmt::format("{}", term.constant);
    case WidthTerm::kHeapIndex:
        return fmt::format("la.{}Size", heapMember(term.heap));
    case WidthTerm::kTableIndex:
        return fmt::format("la.tableSizes[k{}]", term.name);
    case WidthTerm::kCodedIndex:
        return fmt::format("la.codedSizes[kCoded{}]", term.name);
    }
    return "0";
}

std::string uintType(DecodeStep::Op op) {
    switch (op) {
    case DecodeStep::kUInt8:
        return "std::uint8_t";
    case DecodeStep::kUInt16:
        return "std::uint16_t";
    default:
        return "std::uint32_t";
    }
}

std::string memberType(const DecodeStep& step) {
    switch (step.op) {
    case DecodeStep::kUInt8:
    case DecodeStep::kUInt16:
    case DecodeStep::kUInt32:
        return step.flagType.empty() ? uintType(step.op) : step.flagType;
    case DecodeStep::kCodedIndex:
        return "CodedIndex";
    case DecodeStep::kHeapIndex:
    case DecodeStep::kTableIndex:
    case DecodeStep::kRowRange:
        return "std::uint32_t";
    }
    return "std::uint32_t";
}

std::string readExpression(const DecodePlan& plan, const DecodeStep& step) {
    switch (step.op) {
    case DecodeStep::kUInt8:
    case DecodeStep::kUInt16:
    case DecodeStep::kUInt32: {
        auto read = fmt::format("r.{}()", decodeOpName(step.op));
        if (step.flagType.empty()) {
            return read;
        }
        return fmt::format("static_cast<{}>({})", step.flagType, read);
    }
    case DecodeStep::kHeapIndex:
        return fmt::format("r.{}()", heapMember(step.heap));
    case DecodeStep::kTableIndex:
        return fmt::format("r.index(k{})", step.target);
    case DecodeStep::kCodedIndex:
        return fmt::format("r.coded(kCoded{})", step.scheme);
    case DecodeStep::kRowRange:
        return fmt::format("r.range(k{}, k{})", plan.table, step.target);
    }
    return "0";
}

} // namespace

HeaderRenderer::HeaderRenderer(std::string namespaceName): m_namespaceName(std::move(namespaceName)) {}

std::string HeaderRenderer::render(const Artifacts& artifacts, std::string_view outputPath) const {
    const auto& catalog = artifacts.catalog;
    std::ostringstream out;

    auto includeGuard = fmt::format("METALAYOUT_GENERATED_{:08X}", hash(outputPath));
    out << "#ifndef " << includeGuard << "\n";
    out << "#define " << includeGuard << "\n\n";

    out << "// NOTE: layoutgen automatically generated this file from a table schema.\n";
    out << "// Edits will likely be clobbered.\n\n";

    out << "#include <cstdint>\n\n";
    out << "namespace " << m_namespaceName << " {\n\n";

    out << "// ========== Tables\n";
    out << "enum Table : int {\n";
    for (const auto& entry : catalog.entries()) {
        out << fmt::format("    k{} = {},\n", entry.name, entry.id);
    }
    out << "};\n";
    out << fmt::format("static constexpr int kTableCount = {};\n", catalog.tableCount());
    out << "static constexpr int kTableNone = kTableCount;\n\n";

    std::vector<const CodedDispatch*> dispatches;
    for (const auto& pair : artifacts.codedDispatches) {
        dispatches.emplace_back(&pair.second);
    }
    std::sort(dispatches.begin(), dispatches.end(),
              [](const CodedDispatch* a, const CodedDispatch* b) { return a->scheme() < b->scheme(); });

    out << "// ========== Coded index schemes\n";
    out << "enum Coded : int {\n";
    for (size_t i = 0; i < dispatches.size(); ++i) {
        out << fmt::format("    kCoded{} = {},\n", dispatches[i]->scheme(), i);
    }
    out << "};\n";
    out << fmt::format("static constexpr int kCodedCount = {};\n\n", dispatches.size());

    // Flag types are opaque here, the reader defines their enumerators.
    std::map<std::string, std::string> flagTypes;
    for (const auto& entry : catalog.entries()) {
        for (const auto& step : artifacts.decodePlan(entry.name)->steps) {
            if (!step.flagType.empty()) {
                flagTypes.emplace(step.flagType, uintType(step.op));
            }
        }
    }
    if (flagTypes.size()) {
        out << "// ========== Flag types\n";
        for (const auto& pair : flagTypes) {
            out << fmt::format("enum class {} : {};\n", pair.first, pair.second);
        }
        out << "\n";
    }

    out << "// Resolved index widths of one container, in bytes.\n";
    out << "struct Layout {\n";
    out << "    std::uint8_t stringSize = 2;\n";
    out << "    std::uint8_t blobSize = 2;\n";
    out << "    std::uint8_t guidSize = 2;\n";
    out << "    std::uint8_t tableSizes[kTableCount > 0 ? kTableCount : 1] = {};\n";
    out << "    std::uint8_t codedSizes[kCodedCount > 0 ? kCodedCount : 1] = {};\n";
    out << "};\n\n";

    out << "struct CodedIndex {\n";
    out << "    int table = kTableNone;\n";
    out << "    std::uint32_t row = 0;\n";
    out << "};\n\n";

    out << "// ========== Record width\n";
    out << "inline int tableWidth(int table, const Layout& la) {\n";
    out << "    switch (table) {\n";
    for (const auto& entry : catalog.entries()) {
        std::string sum;
        for (const auto& term : artifacts.widthFormula(entry.name)->terms) {
            sum += sum.empty() ? widthExpression(term) : " + " + widthExpression(term);
        }
        out << fmt::format("    case k{}:\n", entry.name);
        out << fmt::format("        return {};\n", sum);
    }
    out << "    default:\n";
    out << "        return 0;\n";
    out << "    }\n";
    out << "}\n\n";

    out << "// ========== Records\n";
    for (const auto& entry : catalog.entries()) {
        const auto plan = artifacts.decodePlan(entry.name);
        out << fmt::format("struct {}Row {{\n", entry.name);
        out << fmt::format("    static constexpr Table kTable = k{};\n\n", entry.name);
        for (const auto& step : plan->steps) {
            out << fmt::format("    {} {};\n", memberType(step), step.fieldName);
        }
        out << "\n    template <typename Reader>\n";
        out << "    bool decode(Reader& r) {\n";
        // Reads land in a local copy so a failed decode leaves the caller's record as it was.
        out << fmt::format("        {}Row decoded{{}};\n", entry.name);
        for (const auto& step : plan->steps) {
            out << fmt::format("        decoded.{} = {};\n", step.fieldName, readExpression(*plan, step));
        }
        out << "        if (!r.ok()) {\n";
        out << "            return false;\n";
        out << "        }\n";
        out << "        *this = decoded;\n";
        out << "        return true;\n";
        out << "    }\n";
        out << "};\n\n";
    }

    out << "// ========== Coded dispatch\n";
    out << "// Returns |table| if a coded index of |coded| can refer to it through the public tables, or kTableNone.\n";
    out << "inline int codedTable(int coded, int table) {\n";
    out << "    switch (coded) {\n";
    for (const auto dispatch : dispatches) {
        out << fmt::format("    case kCoded{}:\n", dispatch->scheme());
        std::vector<std::string> reachable;
        for (auto id : dispatch->tagTables()) {
            if (id != catalog.none()) {
                reachable.emplace_back(catalog.entry(id)->name);
            }
        }
        if (reachable.empty()) {
            out << "        return kTableNone;\n";
            continue;
        }
        out << "        switch (table) {\n";
        for (const auto& name : reachable) {
            out << fmt::format("        case k{}:\n", name);
        }
        out << "            return table;\n";
        out << "        default:\n";
        out << "            return kTableNone;\n";
        out << "        }\n";
    }
    out << "    default:\n";
    out << "        return kTableNone;\n";
    out << "    }\n";
    out << "}\n\n";

    out << "// ========== Registry\n";
    out << "// One accessor per public table. |Table| is the reader's accessor template over a row type.\n";
    out << "template <template <typename> class Table>\n";
    out << "struct Tables {\n";
    for (const auto& entry : artifacts.registry.entries()) {
        out << fmt::format("    Table<{}Row> {};\n", entry.name, entry.name);
    }
    out << "};\n\n";
    out << "template <typename TableSet>\n";
    out << "void initTables(TableSet& t) {\n";
    for (const auto& entry : artifacts.registry.entries()) {
        out << fmt::format("    t.{}.init(k{});\n", entry.name, entry.name);
    }
    out << "}\n\n";

    out << "} // namespace " << m_namespaceName << "\n\n";
    out << "#endif // " << includeGuard << "\n";

    return out.str();
}

} // namespace metalayout
