#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

struct ZipSubtype {
    std::string ext;
    std::string mime;
};

// Looks through the ZIP local file headers that fall inside `window` for a
// marker of a zip-based format:
//   - a stored "mimetype" entry (OpenDocument, EPUB)
//   - entries under word/, xl/ or ppt/ (Office Open XML)
//   - META-INF/MANIFEST.MF (Java archive)
// Returns nullopt when nothing in the window is conclusive; the caller keeps
// the generic "zip" result. Entries beyond the window are never seen.
std::optional<ZipSubtype> probe_zip_subtype(std::string_view window);

// True when the window holds the end-of-central-directory record, i.e. the
// whole archive was seen and probe_zip_subtype() had every entry to look at.
bool zip_window_is_complete(std::string_view window);

// The zip-based format named by a file extension ("DOCX", ".odt"), if any.
std::optional<ZipSubtype> zip_subtype_for_extension(std::string_view ext);

// Every extension probe_zip_subtype() can return.
std::vector<std::string> zip_subtype_extensions();

} // namespace core
