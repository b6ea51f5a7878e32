#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace layerpush {

/// Random-access byte source: "read n bytes at position p".
///
/// read_at() fills up to `n` bytes and returns how many were read; a short
/// count means end of data. I/O failures throw std::runtime_error. Calls may
/// come from several upload threads at once, so implementations must not keep
/// a shared cursor.
class ReaderAt {
public:
    virtual ~ReaderAt() = default;

    virtual size_t read_at(uint8_t* buf, size_t n, uint64_t offset) const = 0;

    /// Total size if known.
    virtual std::optional<uint64_t> size() const { return std::nullopt; }
};

/// Bytes held in memory.
class MemoryReaderAt : public ReaderAt {
public:
    explicit MemoryReaderAt(std::vector<uint8_t> data) : data_(std::move(data)) {}
    explicit MemoryReaderAt(const std::string& data) : data_(data.begin(), data.end()) {}

    size_t read_at(uint8_t* buf, size_t n, uint64_t offset) const override;
    std::optional<uint64_t> size() const override { return data_.size(); }

private:
    std::vector<uint8_t> data_;
};

/// A file opened read-only; reads use pread() so concurrent readers are safe.
class FileReaderAt : public ReaderAt {
public:
    /// Throws std::runtime_error if the file cannot be opened.
    explicit FileReaderAt(const std::filesystem::path& path);
    ~FileReaderAt() override;

    FileReaderAt(const FileReaderAt&) = delete;
    FileReaderAt& operator=(const FileReaderAt&) = delete;

    size_t read_at(uint8_t* buf, size_t n, uint64_t offset) const override;
    std::optional<uint64_t> size() const override { return size_; }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    uint64_t size_ = 0;
};

/// The window [offset, offset + length) of another source, read sequentially.
///
/// Holds a non-owning reference: the base must outlive the section.
class SectionReader {
public:
    SectionReader(const ReaderAt& base, uint64_t offset, uint64_t length)
        : base_(base), offset_(offset), length_(length) {}

    /// Read the next bytes of the window; returns 0 once the window is drained.
    /// Throws std::runtime_error if the base ends before the window does.
    size_t read(uint8_t* buf, size_t n);

    uint64_t length() const { return length_; }
    uint64_t remaining() const { return length_ - pos_; }

private:
    const ReaderAt& base_;
    uint64_t offset_;
    uint64_t length_;
    uint64_t pos_ = 0;
};

} // namespace layerpush
