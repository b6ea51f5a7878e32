#include "layerpush/io/reader_at.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace layerpush {

size_t MemoryReaderAt::read_at(uint8_t* buf, size_t n, uint64_t offset) const {
    if (offset >= data_.size()) return 0;
    size_t to_copy = std::min<uint64_t>(n, data_.size() - offset);
    std::memcpy(buf, data_.data() + offset, to_copy);
    return to_copy;
}

FileReaderAt::FileReaderAt(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::runtime_error("cannot open " + path.string() + ": " + strerror(errno));
    }

    struct stat st;
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("cannot stat " + path.string() + ": " + strerror(err));
    }
    size_ = static_cast<uint64_t>(st.st_size);
}

FileReaderAt::~FileReaderAt() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

size_t FileReaderAt::read_at(uint8_t* buf, size_t n, uint64_t offset) const {
    size_t total = 0;
    while (total < n) {
        ssize_t r = ::pread(fd_, buf + total, n - total, static_cast<off_t>(offset + total));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("read " + path_.string() + " at offset " +
                                     std::to_string(offset + total) + ": " + strerror(errno));
        }
        if (r == 0) break;  // EOF
        total += static_cast<size_t>(r);
    }
    return total;
}

size_t SectionReader::read(uint8_t* buf, size_t n) {
    if (pos_ >= length_) return 0;
    size_t want = std::min<uint64_t>(n, length_ - pos_);
    size_t got = base_.read_at(buf, want, offset_ + pos_);
    if (got == 0) {
        throw std::runtime_error("source ended at offset " + std::to_string(offset_ + pos_) +
                                 ", " + std::to_string(length_ - pos_) + " bytes short of the requested range");
    }
    pos_ += got;
    return got;
}

} // namespace layerpush
