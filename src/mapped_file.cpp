// sufidx/src/mapped_file.cpp
#include "sufidx/mapped_file.h"
#include "sufidx/errors.h"
#include "sufidx/format.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sufidx {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

} // namespace

// --------------------
// MappedRegion
// --------------------

MappedRegion::MappedRegion(const std::filesystem::path& path, MapMode mode)
    : path_(path), mode_(mode) {
    const int flags = (mode == MapMode::ReadWrite) ? O_RDWR : O_RDONLY;
    fd_ = ::open(path.c_str(), flags);
    if (fd_ < 0) {
        throw IndexException(ErrorCode::IoError, "cannot open " + path.string() + ": " + errno_text());
    }

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        const std::string err = errno_text();
        release();
        throw IndexException(ErrorCode::IoError, "cannot stat " + path.string() + ": " + err);
    }
    if (!S_ISREG(st.st_mode)) {
        release();
        throw IndexException(ErrorCode::IoError, "not a regular file: " + path.string());
    }

    bytes_ = (size_t)st.st_size;
    if (bytes_ == 0) return; // mmap of length 0 is EINVAL, an empty region is fine

    const int prot = (mode == MapMode::ReadWrite) ? (PROT_READ | PROT_WRITE) : PROT_READ;
    void* ptr = ::mmap(nullptr, bytes_, prot, MAP_SHARED, fd_, 0);
    if (ptr == MAP_FAILED) {
        const std::string err = errno_text();
        bytes_ = 0;
        release();
        throw IndexException(ErrorCode::IoError, "cannot mmap " + path.string() + ": " + err);
    }
    data_ = static_cast<unsigned char*>(ptr);
}

MappedRegion::~MappedRegion() {
    release();
}

MappedRegion::MappedRegion(MappedRegion&& other) noexcept
    : path_(std::move(other.path_)),
      data_(other.data_),
      bytes_(other.bytes_),
      fd_(other.fd_),
      mode_(other.mode_) {
    other.data_ = nullptr;
    other.bytes_ = 0;
    other.fd_ = -1;
}

MappedRegion& MappedRegion::operator=(MappedRegion&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        data_ = other.data_;
        bytes_ = other.bytes_;
        fd_ = other.fd_;
        mode_ = other.mode_;
        other.data_ = nullptr;
        other.bytes_ = 0;
        other.fd_ = -1;
    }
    return *this;
}

void MappedRegion::advise_random() {
    if (data_ && bytes_) ::madvise(data_, bytes_, MADV_RANDOM);
}

void MappedRegion::advise_sequential() {
    if (data_ && bytes_) ::madvise(data_, bytes_, MADV_SEQUENTIAL);
}

void MappedRegion::release() {
    if (data_) {
        ::munmap(data_, bytes_);
        data_ = nullptr;
    }
    bytes_ = 0;
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// --------------------
// MappedBytes
// --------------------

MappedBytes::MappedBytes(const std::filesystem::path& path, MapMode mode)
    : region_(path, mode) {}

unsigned char MappedBytes::get(size_t i) const {
    if (i >= region_.bytes()) {
        throw IndexException(ErrorCode::OutOfRange,
                             "byte offset " + std::to_string(i) + " out of range (size " +
                             std::to_string(region_.bytes()) + ") in " + region_.path().string());
    }
    return region_.data()[i];
}

void MappedBytes::set(size_t i, unsigned char v) {
    if (!region_.writable()) {
        throw IndexException(ErrorCode::ReadOnly, "text mapped read-only: " + region_.path().string());
    }
    if (i >= region_.bytes()) {
        throw IndexException(ErrorCode::OutOfRange,
                             "byte offset " + std::to_string(i) + " out of range (size " +
                             std::to_string(region_.bytes()) + ") in " + region_.path().string());
    }
    region_.data()[i] = v;
}

std::string_view MappedBytes::view(size_t pos, size_t len) const {
    const size_t n = region_.bytes();
    if (pos >= n) return std::string_view{};
    if (len > n - pos) len = n - pos;
    return std::string_view(reinterpret_cast<const char*>(region_.data()) + pos, len);
}

// --------------------
// MappedIntArray
// --------------------

MappedIntArray::MappedIntArray(const std::filesystem::path& path, MapMode mode)
    : region_(path, mode) {
    if (region_.bytes() % kElemSize != 0) {
        throw IndexException(ErrorCode::InvalidFormat,
                             "index size " + std::to_string(region_.bytes()) +
                             " is not a multiple of " + std::to_string(kElemSize) + ": " + path.string());
    }
    elems_ = reinterpret_cast<uint32_t*>(region_.data());
    size_ = region_.bytes() / kElemSize;
}

void MappedIntArray::check_index(size_t i) const {
    if (i >= size_) {
        throw IndexException(ErrorCode::OutOfRange,
                             "index position " + std::to_string(i) + " out of range (size " +
                             std::to_string(size_) + ") in " + region_.path().string());
    }
}

void MappedIntArray::check_writable() const {
    if (!region_.writable()) {
        throw IndexException(ErrorCode::ReadOnly, "index mapped read-only: " + region_.path().string());
    }
}

uint32_t MappedIntArray::get(size_t i) const {
    check_index(i);
    return elems_[i];
}

void MappedIntArray::set(size_t i, uint32_t v) {
    check_writable();
    check_index(i);
    elems_[i] = v;
}

void MappedIntArray::swap(size_t i, size_t j) {
    check_writable();
    check_index(i);
    check_index(j);
    std::swap(elems_[i], elems_[j]);
}

// --------------------
// IntArrayBuilder
// --------------------

IntArrayBuilder::IntArrayBuilder(const std::filesystem::path& path)
    : path_(path) {
    out_.open(path, std::ios::binary | std::ios::trunc);
    if (!out_) throw IndexException(ErrorCode::IoError, "cannot open for write: " + path.string());
}

IntArrayBuilder::~IntArrayBuilder() {
    if (!finished_ && out_.is_open()) out_.close();
}

void IntArrayBuilder::append(uint32_t value) {
    if (finished_) {
        throw IndexException(ErrorCode::InvalidArgs, "append after finish: " + path_.string());
    }
    // native byte order, same as MappedIntArray reads it back
    out_.write(reinterpret_cast<const char*>(&value), (std::streamsize)sizeof(value));
    if (!out_) throw IndexException(ErrorCode::IoError, "write failed: " + path_.string());
    ++count_;
}

void IntArrayBuilder::finish() {
    if (finished_) return;
    finished_ = true;
    out_.flush();
    if (!out_) throw IndexException(ErrorCode::IoError, "flush failed: " + path_.string());
    out_.close();
    if (out_.fail()) throw IndexException(ErrorCode::IoError, "close failed: " + path_.string());
}

} // namespace sufidx
