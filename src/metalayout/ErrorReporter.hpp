#ifndef SRC_METALAYOUT_ERROR_REPORTER_HPP_
#define SRC_METALAYOUT_ERROR_REPORTER_HPP_

#include <string>
#include <string_view>
#include <vector>

namespace metalayout {

// A single generation failure. Any recorded Fault means the generation run must not produce artifacts.
struct Fault {
    enum Kind {
        kDuplicateCode,
        kCodeOutOfRange,
        kDuplicateName,
        kUnresolvedReference,
        kUnsupportedKind,
        kMalformedSchema,
        kFile
    };

    Kind kind;
    std::string message;
};

const char* faultName(Fault::Kind kind);

class ErrorReporter {
public:
    // If suppress is true, will not print reported faults to log (useful for testing failures without
    // polluting the log)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    // Must be called before getLineNumber() can be called. |code| must be null-terminated and outlive this object,
    // or the next call to setCode().
    void setCode(const char* code);

    void addFault(Fault::Kind kind, const std::string& message);

    // Specific faults.

    // Two tables claim the same on-disk code.
    void addDuplicateCodeFault(std::string_view firstTable, std::string_view secondTable, int code);
    void addCodeOutOfRangeFault(std::string_view table, int code);
    void addDuplicateNameFault(std::string_view table);
    // |owner| is the table or scheme holding the reference, |what| describes the reference itself.
    void addUnresolvedReferenceFault(std::string_view owner, std::string_view what, std::string_view name);
    void addUnsupportedKindFault(std::string_view table, std::string_view field, std::string_view detail);
    void addMalformedSchemaFault(const std::string& message);
    // Fatal error, unable to locate a file under filePath.
    void addFileNotFoundError(const std::string& filePath);
    // Fatal error, unable to open file at filePath.
    void addFileOpenError(const std::string& filePath);
    // Fatal error, failed to read file at filePath.
    void addFileReadError(const std::string& filePath);
    // Fatal error, failed to write file at filePath.
    void addFileWriteError(const std::string& filePath);

    size_t getLineNumber(const char* location);
    size_t errorCount() const { return m_faults.size(); }
    bool ok() const { return m_faults.size() == 0; }
    bool hasFault(Fault::Kind kind) const;
    const std::vector<Fault>& faults() const { return m_faults; }

private:
    bool m_suppress;
    const char* m_code;
    std::vector<Fault> m_faults;
    std::vector<const char*> m_lineEndings;
};

} // namespace metalayout

#endif // SRC_METALAYOUT_ERROR_REPORTER_HPP_
