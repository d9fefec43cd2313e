#pragma once

#include <cstddef>
#include <string>

namespace core {

// Byte source the sniffer reads from. One bounded read per file.
class RawFileSource {
public:
    virtual ~RawFileSource() = default;

    // At most max_bytes from the start of the file. Throws ReadError.
    virtual std::string read_prefix(std::size_t max_bytes) = 0;

    // Extension without the leading dot, as it appears in the name.
    virtual std::string extension() const = 0;

    virtual std::string path() const = 0;
};

// Backed by a file on disk.
class FsFileSource : public RawFileSource {
public:
    explicit FsFileSource(std::string path);

    std::string read_prefix(std::size_t max_bytes) override;
    std::string extension() const override;
    std::string path() const override { return path_; }

private:
    std::string path_;
};

// In-memory bytes; `fail_with` makes read_prefix() throw ReadError instead.
class MemoryFileSource : public RawFileSource {
public:
    MemoryFileSource(std::string path, std::string bytes, std::string fail_with = "");

    std::string read_prefix(std::size_t max_bytes) override;
    std::string extension() const override;
    std::string path() const override { return path_; }

    std::size_t reads() const { return reads_; }

private:
    std::string path_;
    std::string bytes_;
    std::string fail_with_;
    std::size_t reads_ = 0;
};

// "photo.JPG" -> "JPG", "archive.tar.gz" -> "gz", ".bashrc" -> "", "README" -> ""
std::string extension_of(const std::string& path);

} // namespace core
