#include "posix_filesystem.h"

#include <string>
#include <sys/stat.h>

namespace infra {

PosixFile::PosixFile(std::FILE *file)
    : m_file(file) {
}

PosixFile::~PosixFile() {
    close();
}

bool PosixFile::available() {
    if (!m_file) {
        return false;
    }
    int next = std::fgetc(m_file);
    if (next == EOF) {
        return false;
    }
    std::ungetc(next, m_file);
    return true;
}

std::string PosixFile::readString() {
    std::string content;
    if (!m_file) {
        return content;
    }
    char buffer[512];
    std::size_t count = 0;
    while ((count = std::fread(buffer, 1, sizeof(buffer), m_file)) > 0) {
        content.append(buffer, count);
    }
    return content;
}

std::string PosixFile::readStringUntil(char delimiter) {
    std::string line;
    if (!m_file) {
        return line;
    }
    int c = 0;
    while ((c = std::fgetc(m_file)) != EOF) {
        if (static_cast<char>(c) == delimiter) {
            break;
        }
        line.push_back(static_cast<char>(c));
    }
    return line;
}

std::size_t PosixFile::readBytes(uint8_t *dest, std::size_t length) {
    if (!m_file || !dest || length == 0) {
        return 0;
    }
    return std::fread(dest, 1, length, m_file);
}

std::size_t PosixFile::write(const uint8_t *data, std::size_t length) {
    if (!m_file || !data || length == 0) {
        return 0;
    }
    return std::fwrite(data, 1, length, m_file);
}

void PosixFile::close() {
    if (m_file) {
        std::fclose(m_file);
        m_file = nullptr;
    }
}

bool PosixFileSystem::exists(const char *path) const {
    if (!path) {
        return false;
    }
    struct stat info;
    return ::stat(path, &info) == 0;
}

std::unique_ptr<IFile> PosixFileSystem::open(const char *path, const char *mode) {
    if (!path || !mode) {
        return nullptr;
    }
    // Always binary; WAV data must not be newline-translated.
    std::string fopenMode(mode);
    if (fopenMode.find('b') == std::string::npos) {
        fopenMode.push_back('b');
    }
    std::FILE *file = std::fopen(path, fopenMode.c_str());
    if (!file) {
        return nullptr;
    }
    return std::unique_ptr<IFile>(new PosixFile(file));
}

} // namespace infra
