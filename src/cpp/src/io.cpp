#include "ips/io.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

// POSIX
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ips {

namespace {

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

} // anonymous namespace

// ── SpanSource ───────────────────────────────────────────────────────────

size_t SpanSource::read(std::span<uint8_t> buf) {
    size_t n = std::min(buf.size(), data_.size() - pos_);
    if (n > 0) {
        std::memcpy(buf.data(), data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

// ── BufferTarget ─────────────────────────────────────────────────────────

void BufferTarget::write(std::span<const uint8_t> data) {
    if (data.empty()) return;
    uint64_t end = pos_ + data.size();
    if (end > buf_.size()) {
        buf_.resize(static_cast<size_t>(end), 0);
    }
    std::memcpy(buf_.data() + pos_, data.data(), data.size());
    pos_ = end;
}

void BufferTarget::truncate(uint64_t length) {
    if (length < buf_.size()) {
        buf_.resize(static_cast<size_t>(length));
    }
}

// ── FileHandle ───────────────────────────────────────────────────────────

FileHandle::FileHandle(const std::string& path, int flags)
    : fd_(::open(path.c_str(), flags)), path_(path) {
    if (fd_ < 0) throw_errno("open " + path);
}

FileHandle::~FileHandle() {
    if (fd_ >= 0) ::close(fd_);
}

// ── MappedFile ───────────────────────────────────────────────────────────

MappedFile::MappedFile(const std::string& path)
    : file_(path, O_RDONLY) {
    struct stat st;
    if (::fstat(file_.fd(), &st) < 0) throw_errno("stat " + path);
    size_ = static_cast<size_t>(st.st_size);
    if (size_ > 0) {
        void* p = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, file_.fd(), 0);
        if (p == MAP_FAILED) throw_errno("mmap " + path);
        data_ = static_cast<uint8_t*>(p);
    }
}

MappedFile::~MappedFile() {
    if (data_) ::munmap(data_, size_);
}

// ── FileSource ───────────────────────────────────────────────────────────

FileSource::FileSource(const std::string& path)
    : file_(path, O_RDONLY) {}

size_t FileSource::read(std::span<uint8_t> buf) {
    for (;;) {
        ssize_t n = ::read(file_.fd(), buf.data(), buf.size());
        if (n >= 0) return static_cast<size_t>(n);
        if (errno != EINTR) throw_errno("read " + file_.path());
    }
}

// ── FileTarget ───────────────────────────────────────────────────────────

FileTarget::FileTarget(const std::string& path)
    : file_(path, O_RDWR) {}

void FileTarget::seek(uint64_t offset) {
    if (::lseek(file_.fd(), static_cast<off_t>(offset), SEEK_SET) < 0) {
        throw_errno("seek " + file_.path());
    }
}

void FileTarget::write(std::span<const uint8_t> data) {
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::write(file_.fd(), data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno("write " + file_.path());
        }
        done += static_cast<size_t>(n);
    }
}

void FileTarget::truncate(uint64_t length) {
    uint64_t current = size();
    if (length >= current) return;
    if (::ftruncate(file_.fd(), static_cast<off_t>(length)) < 0) {
        throw_errno("truncate " + file_.path());
    }
}

uint64_t FileTarget::size() const {
    struct stat st;
    if (::fstat(file_.fd(), &st) < 0) throw_errno("stat " + file_.path());
    return static_cast<uint64_t>(st.st_size);
}

} // namespace ips
