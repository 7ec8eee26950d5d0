#pragma once

/// Byte sources and patch targets.
///
/// The codec only ever borrows a source or target for the duration of one
/// call. Sources are read sequentially; targets are positioned with absolute
/// seeks, written, and optionally clamped in size.

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ips {

/// Sequential input.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Read up to buf.size() bytes. Returns the number read; 0 means end of
    /// input. Throws std::system_error on I/O failure.
    virtual size_t read(std::span<uint8_t> buf) = 0;
};

/// Writable, randomly seekable output.
class Target {
public:
    virtual ~Target() = default;

    /// Position the next write at `offset` bytes from the start.
    virtual void seek(uint64_t offset) = 0;

    /// Write all of `data` at the current position and advance past it.
    virtual void write(std::span<const uint8_t> data) = 0;

    /// Shrink to at most `length` bytes. Never grows the target.
    virtual void truncate(uint64_t length) = 0;
};

// ── in-memory ────────────────────────────────────────────────────────────

class SpanSource : public ByteSource {
public:
    explicit SpanSource(std::span<const uint8_t> data) : data_(data) {}

    size_t read(std::span<uint8_t> buf) override;

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

/// Target backed by a caller-owned vector. Writing past the end extends the
/// vector, zero-filling any gap left by a seek beyond it.
class BufferTarget : public Target {
public:
    explicit BufferTarget(std::vector<uint8_t>& buf) : buf_(buf) {}

    void seek(uint64_t offset) override { pos_ = offset; }
    void write(std::span<const uint8_t> data) override;
    void truncate(uint64_t length) override;

    uint64_t position() const { return pos_; }

private:
    std::vector<uint8_t>& buf_;
    uint64_t pos_ = 0;
};

// ── POSIX files ──────────────────────────────────────────────────────────

/// RAII descriptor owner shared by the file source and target.
class FileHandle {
public:
    FileHandle(const std::string& path, int flags);
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }

private:
    int fd_ = -1;
    std::string path_;
};

/// Read-only memory map of a whole file, used to parse a patch in place.
class MappedFile {
public:
    /// Throws std::system_error if the file cannot be opened or mapped.
    explicit MappedFile(const std::string& path);
    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    std::span<const uint8_t> span() const { return {data_, size_}; }
    size_t size() const { return size_; }

private:
    FileHandle file_;
    uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

class FileSource : public ByteSource {
public:
    /// Opens `path` read-only. Throws std::system_error on failure.
    explicit FileSource(const std::string& path);

    size_t read(std::span<uint8_t> buf) override;

private:
    FileHandle file_;
};

class FileTarget : public Target {
public:
    /// Opens an existing `path` for reading and writing.
    /// Throws std::system_error on failure.
    explicit FileTarget(const std::string& path);

    void seek(uint64_t offset) override;
    void write(std::span<const uint8_t> data) override;
    void truncate(uint64_t length) override;

    /// Current size of the file in bytes.
    uint64_t size() const;

private:
    FileHandle file_;
};

} // namespace ips
