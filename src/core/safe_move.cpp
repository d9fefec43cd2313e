#include "safe_move.h"

#include <filesystem>
#include <system_error>

#ifdef _WIN32
  #include <windows.h>
#else
  #include <cerrno>
  #include <cstring>
  #include <unistd.h>
#endif

namespace core {

namespace {

void set_err(std::string* err, std::string msg) {
    if (err) *err = std::move(msg);
}

#ifndef _WIN32
bool checked_rename(const std::string& from, const std::string& to, std::string* err) {
    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(to, ec))) {
        set_err(err, "target already exists: " + to);
        return false;
    }
    std::filesystem::rename(from, to, ec);
    if (ec) {
        set_err(err, ec.message());
        return false;
    }
    return true;
}
#endif

} // namespace

bool move_no_replace(const std::string& from, const std::string& to, std::string* err) {
#ifdef _WIN32
    std::filesystem::path f(from), t(to);
    if (!MoveFileExW(f.c_str(), t.c_str(), MOVEFILE_COPY_ALLOWED)) {
        DWORD code = GetLastError();
        if (code == ERROR_ALREADY_EXISTS || code == ERROR_FILE_EXISTS) {
            set_err(err, "target already exists: " + to);
        } else {
            set_err(err, std::system_category().message((int)code));
        }
        return false;
    }
    return true;
#else
    if (::link(from.c_str(), to.c_str()) != 0) {
        int e = errno;
        if (e == EEXIST) {
            set_err(err, "target already exists: " + to);
            return false;
        }
        if (e == EXDEV || e == EPERM || e == ENOTSUP || e == EMLINK || e == EOPNOTSUPP) {
            return checked_rename(from, to, err);
        }
        set_err(err, std::strerror(e));
        return false;
    }

    if (::unlink(from.c_str()) != 0) {
        int e = errno;
        // Both names point at the file now; drop the new one again.
        if (::unlink(to.c_str()) != 0) {
            set_err(err, std::string("unlink of source failed (") + std::strerror(e) +
                         "), file now also reachable as " + to);
            return false;
        }
        set_err(err, std::string("unlink of source failed: ") + std::strerror(e));
        return false;
    }
    return true;
#endif
}

} // namespace core
