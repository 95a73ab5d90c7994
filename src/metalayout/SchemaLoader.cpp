#include "metalayout/SchemaLoader.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/SourceFile.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "spdlog/spdlog.h"

namespace metalayout {

namespace {

bool readString(const rapidjson::Value& object, const char* key, const std::string& context, ErrorReporter* er,
                std::string& out) {
    if (!object.HasMember(key) || !object[key].IsString()) {
        er->addMalformedSchemaFault(fmt::format("{} requires string key '{}'", context, key));
        return false;
    }
    out = std::string(object[key].GetString(), object[key].GetStringLength());
    return true;
}

bool readInt(const rapidjson::Value& object, const char* key, const std::string& context, ErrorReporter* er,
             int& out) {
    if (!object.HasMember(key) || !object[key].IsInt()) {
        er->addMalformedSchemaFault(fmt::format("{} requires integer key '{}'", context, key));
        return false;
    }
    out = object[key].GetInt();
    return true;
}

bool parseField(const rapidjson::Value& value, const std::string& tableName, size_t index, ErrorReporter* er,
                FieldDefinition& field) {
    auto context = fmt::format("field {} of table '{}'", index, tableName);
    if (!value.IsObject()) {
        er->addMalformedSchemaFault(fmt::format("{} is not an object", context));
        return false;
    }

    std::string name;
    std::string kind;
    if (!readString(value, "name", context, er, name) || !readString(value, "kind", context, er, kind)) {
        return false;
    }
    context = fmt::format("field '{}.{}'", tableName, name);

    if (kind == "uint") {
        int size = 0;
        if (!readInt(value, "size", context, er, size)) {
            return false;
        }
        std::string flags;
        if (value.HasMember("flags") && !readString(value, "flags", context, er, flags)) {
            return false;
        }
        field = FieldDefinition::makeFixedInt(name, size, flags);
    } else if (kind == "string") {
        field = FieldDefinition::makeHeapIndex(name, Heap::kString);
    } else if (kind == "blob") {
        field = FieldDefinition::makeHeapIndex(name, Heap::kBlob);
    } else if (kind == "guid") {
        field = FieldDefinition::makeHeapIndex(name, Heap::kGUID);
    } else if (kind == "index" || kind == "range") {
        std::string target;
        if (!readString(value, "table", context, er, target)) {
            return false;
        }
        field = kind == "index" ? FieldDefinition::makeTableRef(name, target)
                                : FieldDefinition::makeRowRange(name, target);
    } else if (kind == "coded") {
        std::string scheme;
        if (!readString(value, "scheme", context, er, scheme)) {
            return false;
        }
        field = FieldDefinition::makeCodedRef(name, scheme);
    } else {
        SPDLOG_WARN("{} has unknown kind '{}'", context, kind);
        field = FieldDefinition::makeUnsupported(name, kind);
    }
    return true;
}

bool parseTable(const rapidjson::Value& value, size_t index, ErrorReporter* er, TableDefinition& table) {
    auto context = fmt::format("table {}", index);
    if (!value.IsObject()) {
        er->addMalformedSchemaFault(fmt::format("{} is not an object", context));
        return false;
    }
    if (!readString(value, "name", context, er, table.name)) {
        return false;
    }
    context = fmt::format("table '{}'", table.name);
    if (!readInt(value, "code", context, er, table.code)) {
        return false;
    }
    table.visible = true;
    if (value.HasMember("visible")) {
        if (!value["visible"].IsBool()) {
            er->addMalformedSchemaFault(fmt::format("{} key 'visible' must be a boolean", context));
            return false;
        }
        table.visible = value["visible"].GetBool();
    }

    if (!value.HasMember("fields") || !value["fields"].IsArray()) {
        er->addMalformedSchemaFault(fmt::format("{} requires array key 'fields'", context));
        return false;
    }
    bool ok = true;
    const auto& fields = value["fields"];
    for (rapidjson::SizeType i = 0; i < fields.Size(); ++i) {
        FieldDefinition field;
        if (!parseField(fields[i], table.name, i, er, field)) {
            ok = false;
            continue;
        }
        table.fields.emplace_back(std::move(field));
    }
    return ok;
}

bool parseScheme(const rapidjson::Value& value, size_t index, ErrorReporter* er, CodeScheme& scheme) {
    auto context = fmt::format("scheme {}", index);
    if (!value.IsObject()) {
        er->addMalformedSchemaFault(fmt::format("{} is not an object", context));
        return false;
    }
    if (!readString(value, "name", context, er, scheme.name)) {
        return false;
    }
    context = fmt::format("scheme '{}'", scheme.name);
    if (!readInt(value, "tagBits", context, er, scheme.tagBits)) {
        return false;
    }
    if (!value.HasMember("tables") || !value["tables"].IsArray()) {
        er->addMalformedSchemaFault(fmt::format("{} requires array key 'tables'", context));
        return false;
    }
    const auto& tables = value["tables"];
    for (rapidjson::SizeType i = 0; i < tables.Size(); ++i) {
        if (!tables[i].IsString()) {
            er->addMalformedSchemaFault(fmt::format("{} table {} is not a string", context, i));
            return false;
        }
        scheme.tables.emplace_back(tables[i].GetString(), tables[i].GetStringLength());
    }
    return true;
}

} // namespace

SchemaLoader::SchemaLoader(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(std::move(errorReporter)) {}

bool SchemaLoader::loadFile(const std::string& path) {
    SourceFile sourceFile(path);
    if (!sourceFile.read(m_errorReporter)) {
        return false;
    }
    m_json = std::string(sourceFile.codeView());
    SPDLOG_INFO("Loading schema from {}", path);
    return parse();
}

bool SchemaLoader::loadString(std::string_view json) {
    m_json = std::string(json);
    return parse();
}

bool SchemaLoader::parse() {
    m_schema = Schema();
    m_schemes = SchemeSet();
    m_errorReporter->setCode(m_json.c_str());

    rapidjson::Document document;
    rapidjson::ParseResult parseResult = document.Parse(m_json.c_str());
    if (!parseResult) {
        auto line = m_errorReporter->getLineNumber(m_json.c_str() + parseResult.Offset());
        m_errorReporter->addMalformedSchemaFault(
            fmt::format("JSON parse error on line {}: {}", line, rapidjson::GetParseError_En(parseResult.Code())));
        return false;
    }
    if (!document.IsObject()) {
        m_errorReporter->addMalformedSchemaFault("Schema JSON is not a JSON object.");
        return false;
    }

    bool ok = true;
    if (document.HasMember("schemes")) {
        if (!document["schemes"].IsArray()) {
            m_errorReporter->addMalformedSchemaFault("Schema key 'schemes' must be an array.");
            return false;
        }
        const auto& schemes = document["schemes"];
        for (rapidjson::SizeType i = 0; i < schemes.Size(); ++i) {
            CodeScheme scheme;
            if (!parseScheme(schemes[i], i, m_errorReporter.get(), scheme)) {
                ok = false;
                continue;
            }
            m_schemes.schemes.emplace_back(std::move(scheme));
        }
    }

    if (!document.HasMember("tables") || !document["tables"].IsArray()) {
        m_errorReporter->addMalformedSchemaFault("Schema requires array key 'tables'.");
        return false;
    }
    const auto& tables = document["tables"];
    for (rapidjson::SizeType i = 0; i < tables.Size(); ++i) {
        TableDefinition table;
        if (!parseTable(tables[i], i, m_errorReporter.get(), table)) {
            ok = false;
            continue;
        }
        m_schema.tables.emplace_back(std::move(table));
    }

    if (ok) {
        SPDLOG_DEBUG("Loaded {} tables and {} schemes", m_schema.tables.size(), m_schemes.schemes.size());
    }
    return ok;
}

} // namespace metalayout
