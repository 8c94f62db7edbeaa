#ifndef INFRA_POSIX_FILESYSTEM_H
#define INFRA_POSIX_FILESYSTEM_H

#include "filesystem.h"
#include <cstdio>

namespace infra {

class PosixFile : public IFile {
public:
    explicit PosixFile(std::FILE *file);
    ~PosixFile() override;

    bool available() override;
    std::string readString() override;
    std::string readStringUntil(char delimiter) override;
    std::size_t readBytes(uint8_t *dest, std::size_t length) override;
    std::size_t write(const uint8_t *data, std::size_t length) override;
    void close() override;

    using IFile::write;

private:
    std::FILE *m_file;
};

class PosixFileSystem : public IFileSystem {
public:
    PosixFileSystem() = default;
    ~PosixFileSystem() override = default;

    bool exists(const char *path) const override;
    std::unique_ptr<IFile> open(const char *path, const char *mode) override;
};

} // namespace infra

#endif // INFRA_POSIX_FILESYSTEM_H
