#ifndef SRC_METALAYOUT_HEADER_RENDERER_HPP_
#define SRC_METALAYOUT_HEADER_RENDERER_HPP_

#include <string>
#include <string_view>

namespace metalayout {

struct Artifacts;

// Renders Artifacts as a self-contained C++ header for a container reader. The header declares the table and coded
// scheme enums, a Layout struct of resolved index widths, the record width switch, a <Table>Row struct per table
// with a decode() template over the reader's cursor type, the coded dispatch switch, and the registry as a Tables
// struct template plus its initialization template. decode() only assigns the row once every read succeeded. The
// cursor type must provide uint8(), uint16(), uint32(), string(), blob(), guid(),
// index(Table), coded(Coded), range(Table, Table) and ok().
class HeaderRenderer {
public:
    HeaderRenderer() = delete;
    explicit HeaderRenderer(std::string namespaceName);
    ~HeaderRenderer() = default;

    // |outputPath| seeds the include guard only.
    std::string render(const Artifacts& artifacts, std::string_view outputPath) const;

private:
    std::string m_namespaceName;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_HEADER_RENDERER_HPP_
