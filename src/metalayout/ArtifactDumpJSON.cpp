#include "metalayout/ArtifactDumpJSON.hpp"

#include "metalayout/Generator.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <vector>

namespace metalayout {

class ArtifactDumpJSON::Impl {
public:
    ~Impl() = default;

    bool dump(const Artifacts& artifacts, bool prettyPrint) {
        m_doc.SetObject();
        m_buffer.Clear();
        auto& alloc = m_doc.GetAllocator();

        m_doc.AddMember("tableCount", rapidjson::Value(artifacts.catalog.tableCount()), alloc);
        m_doc.AddMember("none", rapidjson::Value(artifacts.catalog.none()), alloc);

        rapidjson::Value tables(rapidjson::kArrayType);
        for (const auto& entry : artifacts.catalog.entries()) {
            rapidjson::Value table(rapidjson::kObjectType);
            table.AddMember("name", encodeString(entry.name), alloc);
            table.AddMember("id", rapidjson::Value(entry.id), alloc);
            table.AddMember("visible", rapidjson::Value(entry.visible), alloc);
            table.AddMember("width", encodeFormula(*artifacts.widthFormula(entry.name)), alloc);
            table.AddMember("decode", encodePlan(*artifacts.decodePlan(entry.name)), alloc);
            tables.PushBack(table, alloc);
        }
        m_doc.AddMember("tables", tables, alloc);

        std::vector<const CodedDispatch*> dispatches;
        for (const auto& pair : artifacts.codedDispatches) {
            dispatches.emplace_back(&pair.second);
        }
        std::sort(dispatches.begin(), dispatches.end(),
                  [](const CodedDispatch* a, const CodedDispatch* b) { return a->scheme() < b->scheme(); });
        rapidjson::Value coded(rapidjson::kObjectType);
        for (const auto dispatch : dispatches) {
            rapidjson::Value tags(rapidjson::kArrayType);
            for (auto id : dispatch->tagTables()) {
                tags.PushBack(rapidjson::Value(id), alloc);
            }
            coded.AddMember(encodeString(dispatch->scheme()), tags, alloc);
        }
        m_doc.AddMember("coded", coded, alloc);

        rapidjson::Value registry(rapidjson::kArrayType);
        for (const auto& entry : artifacts.registry.entries()) {
            registry.PushBack(encodeString(entry.name), alloc);
        }
        m_doc.AddMember("registry", registry, alloc);

        bool result = false;
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        }
        if (!result) {
            SPDLOG_ERROR("Failed to serialize artifacts to JSON");
        }
        return result;
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    rapidjson::Document m_doc;
    rapidjson::StringBuffer m_buffer;

    rapidjson::Value encodeString(const std::string& value) {
        rapidjson::Value encoded;
        encoded.SetString(value.data(), static_cast<rapidjson::SizeType>(value.size()), m_doc.GetAllocator());
        return encoded;
    }

    // Formulas dump as an array of terms, each either an integer constant or a [kind, name] pair.
    rapidjson::Value encodeFormula(const WidthFormula& formula) {
        auto& alloc = m_doc.GetAllocator();
        rapidjson::Value terms(rapidjson::kArrayType);
        for (const auto& term : formula.terms) {
            if (term.kind == WidthTerm::kConstant) {
                terms.PushBack(rapidjson::Value(term.constant), alloc);
                continue;
            }
            rapidjson::Value pair(rapidjson::kArrayType);
            switch (term.kind) {
            case WidthTerm::kHeapIndex:
                pair.PushBack(rapidjson::Value("heap"), alloc);
                pair.PushBack(rapidjson::Value(rapidjson::StringRef(heapName(term.heap))), alloc);
                break;
            case WidthTerm::kTableIndex:
                pair.PushBack(rapidjson::Value("table"), alloc);
                pair.PushBack(encodeString(term.name), alloc);
                break;
            case WidthTerm::kCodedIndex:
                pair.PushBack(rapidjson::Value("coded"), alloc);
                pair.PushBack(encodeString(term.name), alloc);
                break;
            case WidthTerm::kConstant:
                break;
            }
            terms.PushBack(pair, alloc);
        }
        return terms;
    }

    rapidjson::Value encodePlan(const DecodePlan& plan) {
        auto& alloc = m_doc.GetAllocator();
        rapidjson::Value steps(rapidjson::kArrayType);
        for (const auto& step : plan.steps) {
            rapidjson::Value encoded(rapidjson::kObjectType);
            encoded.AddMember("field", encodeString(step.fieldName), alloc);
            encoded.AddMember("op", rapidjson::Value(rapidjson::StringRef(decodeOpName(step.op))), alloc);
            switch (step.op) {
            case DecodeStep::kUInt8:
            case DecodeStep::kUInt16:
            case DecodeStep::kUInt32:
                if (!step.flagType.empty()) {
                    encoded.AddMember("flags", encodeString(step.flagType), alloc);
                }
                break;
            case DecodeStep::kHeapIndex:
                encoded.AddMember("heap", rapidjson::Value(rapidjson::StringRef(heapName(step.heap))), alloc);
                break;
            case DecodeStep::kTableIndex:
            case DecodeStep::kRowRange:
                encoded.AddMember("table", encodeString(step.target), alloc);
                break;
            case DecodeStep::kCodedIndex:
                encoded.AddMember("scheme", encodeString(step.scheme), alloc);
                break;
            }
            steps.PushBack(encoded, alloc);
        }
        return steps;
    }
};

ArtifactDumpJSON::ArtifactDumpJSON(): m_impl(std::make_unique<ArtifactDumpJSON::Impl>()) {}

ArtifactDumpJSON::~ArtifactDumpJSON() {}

bool ArtifactDumpJSON::dump(const Artifacts& artifacts, bool prettyPrint) {
    return m_impl->dump(artifacts, prettyPrint);
}

std::string_view ArtifactDumpJSON::json() const {
    return m_impl->json();
}

} // namespace metalayout
