#pragma once

#include <string>

namespace core {

// Moves `from` to `to` without ever replacing an existing `to`.
//
// The decision engine picks a free name, but another process can create it
// before the move happens. On POSIX the move is link() + unlink(): link()
// fails with EEXIST instead of overwriting. Filesystems without hard links fall
// back to an existence check followed by rename(), which leaves a small race
// window. On Windows MoveFileExW without MOVEFILE_REPLACE_EXISTING refuses
// existing targets.
//
// Returns false and fills *err on failure; `from` is left in place.
bool move_no_replace(const std::string& from, const std::string& to, std::string* err);

} // namespace core
