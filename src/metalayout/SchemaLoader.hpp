#ifndef SRC_METALAYOUT_SCHEMA_LOADER_HPP_
#define SRC_METALAYOUT_SCHEMA_LOADER_HPP_

#include "metalayout/Schema.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace metalayout {

class ErrorReporter;

// Builds a Schema and its SchemeSet from a JSON description:
//
//   { "schemes": [ { "name": "TypeDefOrRef", "tagBits": 2, "tables": [ "TypeDef", "TypeRef", "TypeSpec" ] } ],
//     "tables": [ { "name": "Module", "code": 0, "visible": true,
//                   "fields": [ { "name": "Generation", "kind": "uint", "size": 2 },
//                               { "name": "Name", "kind": "string" } ] } ] }
//
// Field kinds are "uint" (with "size" and optional "flags"), "string", "blob", "guid", "index" and "range" (with
// "table"), and "coded" (with "scheme"). Any other kind loads as FieldDefinition::kUnsupported and is left for the
// Generator to reject. Only the structure is checked here; references are resolved by the Generator.
class SchemaLoader {
public:
    SchemaLoader() = delete;
    explicit SchemaLoader(std::shared_ptr<ErrorReporter> errorReporter);
    ~SchemaLoader() = default;

    bool loadFile(const std::string& path);
    bool loadString(std::string_view json);

    const Schema& schema() const { return m_schema; }
    const SchemeSet& schemes() const { return m_schemes; }

private:
    // Parses m_json, which must already hold the document text.
    bool parse();

    std::shared_ptr<ErrorReporter> m_errorReporter;
    // Kept alive so that the ErrorReporter can compute line numbers into it.
    std::string m_json;
    Schema m_schema;
    SchemeSet m_schemes;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_SCHEMA_LOADER_HPP_
