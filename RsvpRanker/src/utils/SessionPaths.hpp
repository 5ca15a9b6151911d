// utils/SessionPaths.hpp
// -----------------------------------------------------------------------------
// Session folder infrastructure
//
// Goal:
//   - Always write outputs under:
//       <RsvpRanker>/data/<session_id>/...
//   (even when executable is launched from out/build/... )
//   - One session per process run, named by local timestamp.
// -----------------------------------------------------------------------------

#pragma once
#include <filesystem>
#include <string>
#include <system_error>

namespace rsvp {
namespace sesspaths {

namespace fs = std::filesystem;

struct SessionPaths_S {
    fs::path project_root;
    std::string session_id;
    fs::path data_session_dir;
};

std::string ec_str(const std::error_code& ec);

// e.g. 2025-12-22_14-31-08
std::string make_session_id_timestamp();

// "project root" = nearest ancestor of start (inclusive) containing a data/ directory.
// Falls back to start itself when none is found within max_depth.
fs::path find_project_root(const fs::path& start, int max_depth = 12);

// Creates <root>/data/<timestamp>/ under the root found from start.
// Throws std::runtime_error if the directory cannot be created.
SessionPaths_S create_session(const fs::path& start);

inline fs::path data_file(const SessionPaths_S& sp, const std::string& filename) {
    return sp.data_session_dir / filename;
}

} // namespace sesspaths
} // namespace rsvp
