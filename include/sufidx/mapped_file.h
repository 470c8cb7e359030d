// sufidx/include/sufidx/mapped_file.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace sufidx {

enum class MapMode {
    ReadOnly,
    ReadWrite,
};

// Owns a file descriptor and a shared mapping of the whole file.
// A zero-length file is valid and maps nothing.
class MappedRegion {
public:
    MappedRegion() = default;
    MappedRegion(const std::filesystem::path& path, MapMode mode);
    ~MappedRegion();

    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;
    MappedRegion(MappedRegion&& other) noexcept;
    MappedRegion& operator=(MappedRegion&& other) noexcept;

    unsigned char* data() { return data_; }
    const unsigned char* data() const { return data_; }
    size_t bytes() const { return bytes_; }
    bool writable() const { return mode_ == MapMode::ReadWrite; }
    const std::filesystem::path& path() const { return path_; }

    void advise_random();
    void advise_sequential();

    // Unmaps and closes; safe to call more than once.
    void release();

private:
    std::filesystem::path path_;
    unsigned char* data_{nullptr};
    size_t bytes_{0};
    int fd_{-1};
    MapMode mode_{MapMode::ReadOnly};
};

// Text corpus viewed as a fixed-size array of bytes.
class MappedBytes {
public:
    explicit MappedBytes(const std::filesystem::path& path, MapMode mode = MapMode::ReadOnly);

    size_t size() const { return region_.bytes(); }
    bool empty() const { return region_.bytes() == 0; }

    unsigned char get(size_t i) const;
    void set(size_t i, unsigned char v);

    // Bytes [pos, pos+len) clipped to the end of the file.
    std::string_view view(size_t pos, size_t len) const;

    const unsigned char* data() const { return region_.data(); }
    MappedRegion& region() { return region_; }

private:
    MappedRegion region_;
};

// Index file viewed as a fixed-size array of 4-byte unsigned integers.
class MappedIntArray {
public:
    explicit MappedIntArray(const std::filesystem::path& path, MapMode mode = MapMode::ReadWrite);

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    uint32_t get(size_t i) const;
    void set(size_t i, uint32_t v);
    void swap(size_t i, size_t j);

    MappedRegion& region() { return region_; }

private:
    void check_index(size_t i) const;
    void check_writable() const;

    MappedRegion region_;
    uint32_t* elems_{nullptr};
    size_t size_{0};
};

// Append-only writer for the index format. Reading the result back needs a
// separate MappedIntArray opened after finish().
class IntArrayBuilder {
public:
    explicit IntArrayBuilder(const std::filesystem::path& path);
    ~IntArrayBuilder();

    IntArrayBuilder(const IntArrayBuilder&) = delete;
    IntArrayBuilder& operator=(const IntArrayBuilder&) = delete;

    void append(uint32_t value);
    uint64_t count() const { return count_; }

    // Flushes and closes; throws if any write failed.
    void finish();

private:
    std::filesystem::path path_;
    std::ofstream out_;
    uint64_t count_{0};
    bool finished_{false};
};

} // namespace sufidx
