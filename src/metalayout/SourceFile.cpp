#include "metalayout/SourceFile.hpp"

#include "metalayout/ErrorReporter.hpp"
#include "metalayout/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <fstream>
#include <system_error>

namespace metalayout {

SourceFile::SourceFile(std::string path): m_path(std::move(path)), m_codeSize(0) { }

bool SourceFile::read(std::shared_ptr<ErrorReporter> errorReporter) {
    fs::path filePath(m_path);
    if (!fs::exists(filePath)) {
        errorReporter->addFileNotFoundError(m_path);
        return false;
    }

    // Directories and other non-regular files have no size.
    std::error_code error;
    auto fileSize = fs::file_size(filePath, error);
    if (error) {
        errorReporter->addFileReadError(m_path);
        return false;
    }

    // Make room for the null terminator.
    m_codeSize = fileSize + 1;
    m_code = std::make_unique<char[]>(m_codeSize);
    m_code[m_codeSize - 1] = '\0';
    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        errorReporter->addFileOpenError(m_path);
        return false;
    }
    inFile.read(m_code.get(), m_codeSize - 1);
    if (!inFile) {
        errorReporter->addFileReadError(m_path);
        return false;
    }

    SPDLOG_DEBUG("Read {} bytes from {}", m_codeSize - 1, m_path);
    return true;
}

} // namespace metalayout
