#include "fs/FileHandle.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/core.h>

using namespace cw::fs;

static void checkRange(const uint64_t start, const uint64_t end, const uint64_t size, const std::string& what) {
    if (start > end || end > size)
        throw std::out_of_range(fmt::format("slice [{}, {}) outside of {} ({} bytes)", start, end, what, size));
}

LocalFileHandle::LocalFileHandle(std::filesystem::path path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) throw std::runtime_error(fmt::format("open({}) failed: {}", path_.string(), std::strerror(errno)));

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        const int err = errno;
        ::close(fd_);
        throw std::runtime_error(fmt::format("fstat({}) failed: {}", path_.string(), std::strerror(err)));
    }
    size_ = static_cast<uint64_t>(st.st_size);
}

LocalFileHandle::~LocalFileHandle() {
    if (fd_ >= 0) ::close(fd_);
}

size_t LocalFileHandle::read(const uint64_t offset, char* buf, const size_t len) const {
    if (offset >= size_ || len == 0) return 0;
    for (;;) {
        const ssize_t n = ::pread(fd_, buf, len, static_cast<off_t>(offset));
        if (n >= 0) return static_cast<size_t>(n);
        if (errno != EINTR)
            throw std::runtime_error(fmt::format("pread({}) failed: {}", path_.string(), std::strerror(errno)));
    }
}

MemoryFileHandle::MemoryFileHandle(std::string data, std::string label)
    : data_(std::move(data)), size_(data_.size()), label_(std::move(label)) {}

MemoryFileHandle::MemoryFileHandle(const uint64_t size, std::string label)
    : size_(size), sparse_(true), label_(std::move(label)) {}

std::shared_ptr<MemoryFileHandle> MemoryFileHandle::sparse(const uint64_t size, std::string label) {
    return std::shared_ptr<MemoryFileHandle>(new MemoryFileHandle(size, std::move(label)));
}

size_t MemoryFileHandle::read(const uint64_t offset, char* buf, const size_t len) const {
    if (offset >= size_) return 0;
    const auto n = static_cast<size_t>(std::min<uint64_t>(len, size_ - offset));
    if (sparse_) std::memset(buf, 0, n);
    else std::memcpy(buf, data_.data() + offset, n);
    return n;
}

std::string FileHandle::slice(const uint64_t start, const uint64_t end) const {
    checkRange(start, end, size(), describe());

    std::string buf(end - start, '\0');
    size_t done = 0;
    while (done < buf.size()) {
        const auto n = read(start + done, buf.data() + done, buf.size() - done);
        if (n == 0) throw std::runtime_error(fmt::format("{} shrank while reading (offset {})", describe(), start + done));
        done += n;
    }
    return buf;
}
