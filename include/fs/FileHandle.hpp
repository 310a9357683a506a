#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace cw::fs {

// Byte source for one file. read() and slice() must be safe to call from several worker threads at once.
class FileHandle {
public:
    virtual ~FileHandle() = default;

    [[nodiscard]] virtual uint64_t size() const = 0;

    // Copies up to len bytes at offset into buf and returns the count; 0 only at end of file.
    // Throws std::runtime_error when the file cannot be read.
    virtual size_t read(uint64_t offset, char* buf, size_t len) const = 0;

    // Bytes in [start, end). Throws std::out_of_range when the range is not inside the file.
    [[nodiscard]] std::string slice(uint64_t start, uint64_t end) const;

    [[nodiscard]] virtual std::string describe() const = 0;
};

class LocalFileHandle final : public FileHandle {
public:
    explicit LocalFileHandle(std::filesystem::path path);
    ~LocalFileHandle() override;

    LocalFileHandle(const LocalFileHandle&) = delete;
    LocalFileHandle& operator=(const LocalFileHandle&) = delete;

    [[nodiscard]] uint64_t size() const override { return size_; }
    size_t read(uint64_t offset, char* buf, size_t len) const override;
    [[nodiscard]] std::string describe() const override { return path_.string(); }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    uint64_t size_ = 0;
};

class MemoryFileHandle final : public FileHandle {
public:
    explicit MemoryFileHandle(std::string data, std::string label = "memory");

    // Zero-filled buffer is not allocated; bytes are synthesized on demand.
    static std::shared_ptr<MemoryFileHandle> sparse(uint64_t size, std::string label = "sparse");

    [[nodiscard]] uint64_t size() const override { return size_; }
    size_t read(uint64_t offset, char* buf, size_t len) const override;
    [[nodiscard]] std::string describe() const override { return label_; }

private:
    MemoryFileHandle(uint64_t size, std::string label);

    std::string data_;
    uint64_t size_ = 0;
    bool sparse_ = false;
    std::string label_;
};

}
