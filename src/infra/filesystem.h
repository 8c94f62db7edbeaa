#ifndef INFRA_FILESYSTEM_H
#define INFRA_FILESYSTEM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace infra {

constexpr const char *kFileRead = "r";
constexpr const char *kFileWrite = "w";

class IFile {
public:
    virtual ~IFile() = default;

    virtual bool available() = 0;
    virtual std::string readString() = 0;
    virtual std::string readStringUntil(char delimiter) = 0;
    virtual std::size_t readBytes(uint8_t *dest, std::size_t length) = 0;
    virtual std::size_t write(const uint8_t *data, std::size_t length) = 0;
    virtual void close() = 0;

    std::size_t write(const std::string &text) {
        return write(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    }
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    virtual bool exists(const char *path) const = 0;
    virtual std::unique_ptr<IFile> open(const char *path, const char *mode) = 0;
};

} // namespace infra

#endif // INFRA_FILESYSTEM_H
