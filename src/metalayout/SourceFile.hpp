#ifndef SRC_METALAYOUT_SOURCE_FILE_HPP_
#define SRC_METALAYOUT_SOURCE_FILE_HPP_

#include <memory>
#include <string>
#include <string_view>

namespace metalayout {

class ErrorReporter;

// A schema source file loaded into memory. Inserts a null character at the end of the loaded string, for ease of use
// when parsing and for ErrorReporter line numbers.
class SourceFile {
public:
    SourceFile() = delete;
    explicit SourceFile(std::string path);
    ~SourceFile() = default;

    bool read(std::shared_ptr<ErrorReporter> errorReporter);

    const std::string& path() const { return m_path; }
    const char* code() const { return m_code.get(); }
    // Includes the null terminator.
    size_t size() const { return m_codeSize; }
    // Excludes the null terminator.
    std::string_view codeView() const {
        return m_codeSize ? std::string_view(m_code.get(), m_codeSize - 1) : std::string_view();
    }

private:
    std::string m_path;
    size_t m_codeSize;
    std::unique_ptr<char[]> m_code;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_SOURCE_FILE_HPP_
