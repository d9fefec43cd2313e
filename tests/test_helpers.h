#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace testutil {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("extcheck_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::string& path, const std::string& bytes) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), (std::streamsize)bytes.size());
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline std::string bytes(std::initializer_list<int> b) {
    std::string s;
    for (int c : b) s.push_back((char)c);
    return s;
}

inline const std::string& png_bytes() {
    static const std::string png =
        std::string("\x89PNG\r\n\x1a\n", 8) + std::string("\x00\x00\x00\x0dIHDR", 8) + std::string(32, '\x01');
    return png;
}

// ZIP local file header for an uncompressed entry.
inline std::string zip_entry(const std::string& name, const std::string& data) {
    auto le16 = [](std::uint16_t v) { return bytes({v & 0xFF, (v >> 8) & 0xFF}); };
    auto le32 = [](std::uint32_t v) {
        return bytes({(int)(v & 0xFF), (int)((v >> 8) & 0xFF), (int)((v >> 16) & 0xFF), (int)((v >> 24) & 0xFF)});
    };
    std::string h("PK\x03\x04", 4);
    h += le16(20);                          // version needed
    h += le16(0);                           // flags
    h += le16(0);                           // method: stored
    h += le16(0) + le16(0);                 // time, date
    h += le32(0);                           // crc (not checked)
    h += le32((std::uint32_t)data.size());  // compressed size
    h += le32((std::uint32_t)data.size());  // uncompressed size
    h += le16((std::uint16_t)name.size());
    h += le16(0);                           // extra length
    return h + name + data;
}

// End-of-central-directory record (no comment). Its presence marks the
// archive as complete.
inline std::string zip_end() {
    return std::string("PK\x05\x06", 4) + std::string(18, '\0');
}

// ISO base media "ftyp" box with the given 4-character major brand.
inline std::string ftyp_box(const std::string& brand) {
    return std::string("\0\0\0\x18" "ftyp", 8) + brand + std::string("\0\0\0\0", 4) + brand +
           std::string("mif1");
}

} // namespace testutil
