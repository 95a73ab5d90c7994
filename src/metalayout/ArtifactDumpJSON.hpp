#ifndef SRC_METALAYOUT_ARTIFACT_DUMP_JSON_HPP_
#define SRC_METALAYOUT_ARTIFACT_DUMP_JSON_HPP_

#include <memory>
#include <string_view>

namespace metalayout {

struct Artifacts;

// Serializes generated Artifacts to JSON for inspection and tooling. To avoid copying strings around this class wraps
// the string and provides access to it via the json() accessor.
class ArtifactDumpJSON {
public:
    ArtifactDumpJSON();
    ~ArtifactDumpJSON();

    bool dump(const Artifacts& artifacts, bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_ARTIFACT_DUMP_JSON_HPP_
