#include "raw_file_source.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "detection_types.h"

namespace core {

std::string extension_of(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    return ext;
}

FsFileSource::FsFileSource(std::string path) : path_(std::move(path)) {}

std::string FsFileSource::extension() const {
    return extension_of(path_);
}

std::string FsFileSource::read_prefix(std::size_t max_bytes) {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw ReadError("cannot open " + path_ + ": " + std::strerror(errno));
    }

    // Size the buffer to the file, not the window; most files are small.
    std::size_t want = max_bytes;
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    if (!ec && size < want) want = (std::size_t)size;

    std::string out(want, '\0');
    in.read(out.data(), (std::streamsize)want);
    if (in.bad()) {
        throw ReadError("read failed for " + path_);
    }
    out.resize((std::size_t)in.gcount());
    return out;
}

MemoryFileSource::MemoryFileSource(std::string path, std::string bytes, std::string fail_with)
    : path_(std::move(path)), bytes_(std::move(bytes)), fail_with_(std::move(fail_with)) {}

std::string MemoryFileSource::extension() const {
    return extension_of(path_);
}

std::string MemoryFileSource::read_prefix(std::size_t max_bytes) {
    ++reads_;
    if (!fail_with_.empty()) throw ReadError(fail_with_);
    return bytes_.substr(0, max_bytes);
}

} // namespace core
