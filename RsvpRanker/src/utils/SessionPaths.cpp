#include "SessionPaths.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "Logger.hpp"

#define SESS_LOG(msg) LOG_ALWAYS("sesspaths: " << msg)

namespace rsvp {
namespace sesspaths {

std::string ec_str(const std::error_code& ec) {
    if (!ec) return "ok";
    std::ostringstream oss;
    oss << ec.value() << " (" << ec.category().name() << "): " << ec.message();
    return oss.str();
}

std::string make_session_id_timestamp() {
    using clock = std::chrono::system_clock;
    const std::time_t t = clock::to_time_t(clock::now());

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
    return oss.str();
}

fs::path find_project_root(const fs::path& start, int max_depth) {
    fs::path p = start;
    std::error_code ec;

    for (int i = 0; i < max_depth; ++i) {
        const fs::path data_dir = p / "data";
        if (fs::is_directory(data_dir, ec)) {
            SESS_LOG("find_project_root: FOUND root=" << p.string());
            return p;
        }
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }

    SESS_LOG("find_project_root: NOT FOUND (max_depth=" << max_depth
        << "), fallback=" << start.string());
    return start;
}

SessionPaths_S create_session(const fs::path& start) {
    SessionPaths_S sp{};
    sp.project_root = find_project_root(start);
    sp.session_id = make_session_id_timestamp();
    sp.data_session_dir = sp.project_root / "data" / sp.session_id;

    std::error_code ec;
    fs::create_directories(sp.data_session_dir, ec);
    SESS_LOG("create_session: data_session_dir=" << sp.data_session_dir.string() << " -> " << ec_str(ec));

    if (ec || !fs::is_directory(sp.data_session_dir, ec)) {
        throw std::runtime_error("create_session: failed to create " + sp.data_session_dir.string());
    }
    return sp;
}

} // namespace sesspaths
} // namespace rsvp
