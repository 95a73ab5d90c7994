#include "metalayout/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace metalayout {

const char* faultName(Fault::Kind kind) {
    switch (kind) {
    case Fault::kDuplicateCode:
        return "DuplicateCodeFault";
    case Fault::kCodeOutOfRange:
        return "CodeOutOfRangeFault";
    case Fault::kDuplicateName:
        return "DuplicateNameFault";
    case Fault::kUnresolvedReference:
        return "UnresolvedReferenceFault";
    case Fault::kUnsupportedKind:
        return "UnsupportedKindFault";
    case Fault::kMalformedSchema:
        return "MalformedSchemaFault";
    case Fault::kFile:
        return "FileFault";
    }
    return "UnknownFault";
}

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress), m_code(nullptr) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::setCode(const char* code) {
    m_code = code;
    m_lineEndings.clear();
}

void ErrorReporter::addFault(Fault::Kind kind, const std::string& message) {
    if (!m_suppress) {
        spdlog::error("{}: {}", faultName(kind), message);
    }
    m_faults.emplace_back(Fault{kind, message});
}

void ErrorReporter::addDuplicateCodeFault(std::string_view firstTable, std::string_view secondTable, int code) {
    addFault(Fault::kDuplicateCode,
             fmt::format("tables '{}' and '{}' both declare code {}", firstTable, secondTable, code));
}

void ErrorReporter::addCodeOutOfRangeFault(std::string_view table, int code) {
    addFault(Fault::kCodeOutOfRange, fmt::format("table '{}' declares code {} outside of [0, 255]", table, code));
}

void ErrorReporter::addDuplicateNameFault(std::string_view table) {
    addFault(Fault::kDuplicateName, fmt::format("table name '{}' is declared more than once", table));
}

void ErrorReporter::addUnresolvedReferenceFault(std::string_view owner, std::string_view what, std::string_view name) {
    addFault(Fault::kUnresolvedReference, fmt::format("'{}' {} '{}' which does not exist", owner, what, name));
}

void ErrorReporter::addUnsupportedKindFault(std::string_view table, std::string_view field, std::string_view detail) {
    if (field.empty()) {
        addFault(Fault::kUnsupportedKind, fmt::format("table '{}': {}", table, detail));
    } else {
        addFault(Fault::kUnsupportedKind, fmt::format("field '{}.{}': {}", table, field, detail));
    }
}

void ErrorReporter::addMalformedSchemaFault(const std::string& message) {
    addFault(Fault::kMalformedSchema, message);
}

void ErrorReporter::addFileNotFoundError(const std::string& filePath) {
    addFault(Fault::kFile, fmt::format("file '{}' not found", filePath));
}

void ErrorReporter::addFileOpenError(const std::string& filePath) {
    addFault(Fault::kFile, fmt::format("file '{}' open error", filePath));
}

void ErrorReporter::addFileReadError(const std::string& filePath) {
    addFault(Fault::kFile, fmt::format("file '{}' read error", filePath));
}

void ErrorReporter::addFileWriteError(const std::string& filePath) {
    addFault(Fault::kFile, fmt::format("file '{}' write error", filePath));
}

size_t ErrorReporter::getLineNumber(const char* location) {
    // Lazily construct the line number map on first request for line number.
    if (!m_lineEndings.size()) {
        const char* code = m_code;
        m_lineEndings.emplace_back(code);
        while (*code != '\0') {
            if (*code == '\n') {
                m_lineEndings.emplace_back(code);
            }
            ++code;
        }
        m_lineEndings.emplace_back(code);
    }

    // Binary search on ranges to find line number.
    size_t start = 0;
    size_t end = m_lineEndings.size() - 1;
    while (start < end) {
        size_t middle = start + ((end - start) / 2);
        if (m_lineEndings[middle] < location) {
            if (m_lineEndings[middle + 1] >= location) {
                return middle + 1;
            }
            start = middle;
        } else {
            end = middle;
        }
    }

    return start + 1;
}

bool ErrorReporter::hasFault(Fault::Kind kind) const {
    for (const auto& fault : m_faults) {
        if (fault.kind == kind) {
            return true;
        }
    }
    return false;
}

} // namespace metalayout
