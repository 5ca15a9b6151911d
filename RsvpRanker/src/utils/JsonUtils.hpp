#pragma once
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "Logger.hpp"
#include "Types.h"

// Small flat-JSON helpers for the http bodies we exchange with the page / requester.
// Keys are passed quoted, e.g. "\"flash_ms\"".
namespace JSON {

inline std::size_t skip_spaces(const std::string& body, std::size_t p) {
    while (p < body.size() && std::isspace(static_cast<unsigned char>(body[p]))) ++p;
    return p;
}

// position right after "key": (spaces skipped), npos if absent
inline std::size_t value_pos(const std::string& body, const char* key) {
    auto p = body.find(key);
    if (p == std::string::npos) return std::string::npos;
    p = body.find(':', p);
    if (p == std::string::npos) return std::string::npos;
    return skip_spaces(body, p + 1);
}

// reads a quoted string starting at body[p] == '"'; handles \" and \\ escapes
inline bool read_quoted(const std::string& body, std::size_t& p, std::string& out) {
    if (p >= body.size() || body[p] != '"') return false;
    out.clear();
    ++p;
    while (p < body.size()) {
        char c = body[p++];
        if (c == '"') return true;
        if (c == '\\' && p < body.size()) {
            char e = body[p++];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                default:  out.push_back(e);   break; // \" \\ \/
            }
            continue;
        }
        out.push_back(c);
    }
    return false; // unterminated
}

inline bool extract_json_string(const std::string& body, const char* key, std::string& out) {
    auto p = value_pos(body, key);
    if (p == std::string::npos) return false;
    return read_quoted(body, p, out);
}

inline bool extract_json_int(const std::string& body, const char* key, int& out) {
    auto p = value_pos(body, key);
    if (p == std::string::npos) return false;

    bool neg = false;
    if (p < body.size() && body[p] == '-') { neg = true; ++p; }
    // accumulate wide, reject anything an int can't hold
    long long val = 0;
    bool any = false;
    while (p < body.size() && std::isdigit(static_cast<unsigned char>(body[p]))) {
        val = val * 10 + (body[p] - '0');
        if (val > static_cast<long long>(std::numeric_limits<int>::max()) + 1) return false;
        any = true;
        ++p;
    }
    if (!any) return false;
    if (neg) val = -val;
    if (val < std::numeric_limits<int>::min() || val > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(val);
    return true;
}

inline bool extract_json_double(const std::string& body, const char* key, double& out) {
    auto p = value_pos(body, key);
    if (p == std::string::npos) return false;
    const char* start = body.c_str() + p;
    char* end = nullptr;
    double v = std::strtod(start, &end);
    if (end == start) return false;
    out = v;
    return true;
}

inline bool extract_json_int_array(const std::string& body, const char* key, std::vector<int>& out) {
    auto p = value_pos(body, key);
    if (p == std::string::npos || p >= body.size() || body[p] != '[') return false;
    out.clear();
    ++p;
    while (true) {
        p = skip_spaces(body, p);
        if (p >= body.size()) return false;
        if (body[p] == ']') return true;
        const char* start = body.c_str() + p;
        char* end = nullptr;
        errno = 0;
        long long v = std::strtoll(start, &end, 10);
        if (end == start || errno == ERANGE) return false;
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
        out.push_back(static_cast<int>(v));
        p += static_cast<std::size_t>(end - start);
        p = skip_spaces(body, p);
        if (p < body.size() && body[p] == ',') ++p;
    }
}

inline bool extract_json_string_array(const std::string& body, const char* key, std::vector<std::string>& out) {
    auto p = value_pos(body, key);
    if (p == std::string::npos || p >= body.size() || body[p] != '[') return false;
    out.clear();
    ++p;
    while (true) {
        p = skip_spaces(body, p);
        if (p >= body.size()) return false;
        if (body[p] == ']') return true;
        std::string s;
        if (!read_quoted(body, p, s)) return false;
        out.push_back(std::move(s));
        p = skip_spaces(body, p);
        if (p < body.size() && body[p] == ',') ++p;
    }
}

inline std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\t': out += "\\t";  break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

inline void json_extract_fail(const char* context, const char* field) {
    LOG_WARN("[JSON] extract failed | context=" << context << " field=" << field);
}

/*
POST /rank body:
{
  "option_ids": [3, 5, 9],
  "stimuli":    ["a.png", "b.png", "c.png"],   // optional, aligned with option_ids
  "preview_ms": 5000,                            // optional
  "flash_ms":   250,                             // optional
  "min_repeat": 3, "max_repeat": 7               // optional
}
Returns false (and leaves a reason in err) on anything structurally wrong.
Semantic checks (empty set, duplicates, timings, repeat limits) belong to the controller.
*/
inline bool parse_rank_request(const std::string& body, RankRequest_S& out, std::string& err) {
    std::vector<int> ids;
    if (!extract_json_int_array(body, "\"option_ids\"", ids)) {
        json_extract_fail("rank", "option_ids");
        err = "option_ids";
        return false;
    }
    std::vector<std::string> stimuli;
    const bool hasStimuli = extract_json_string_array(body, "\"stimuli\"", stimuli);
    if (hasStimuli && stimuli.size() != ids.size()) {
        err = "stimuli_size";
        return false;
    }

    out = RankRequest_S{};
    out.options.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        Option_S opt{};
        opt.id = ids[i];
        opt.stimulus = hasStimuli ? stimuli[i] : std::string{};
        out.options.push_back(std::move(opt));
    }

    // optional ints: absent keeps the default, present but not an int is an error
    int v = 0;
    auto read_opt = [&](const char* key, const char* name, bool& present) {
        present = value_pos(body, key) != std::string::npos;
        if (!present) return true;
        if (!extract_json_int(body, key, v)) { err = name; return false; }
        return true;
    };
    bool present = false;
    if (!read_opt("\"preview_ms\"", "preview_ms", present)) return false;
    if (present) out.timing.preview_ms = ms_T{ v };
    if (!read_opt("\"flash_ms\"", "flash_ms", present)) return false;
    if (present) out.timing.flash_ms = ms_T{ v };
    if (!read_opt("\"min_repeat\"", "min_repeat", present)) return false;
    if (present) {
        if (v < 0) { err = "min_repeat"; return false; }
        out.minRepeat = static_cast<std::size_t>(v);
    }
    if (!read_opt("\"max_repeat\"", "max_repeat", present)) return false;
    if (present) {
        if (v < 0) { err = "max_repeat"; return false; }
        out.maxRepeat = static_cast<std::size_t>(v);
    }
    return true;
}

inline std::string ranked_result_json(const RankOutcome_S& outcome, bool busy) {
    std::ostringstream oss;
    oss << "{"
        << "\"request_id\":" << outcome.requestId << ","
        << "\"status\":\""   << RankStatusToStr(outcome.status) << "\","
        << "\"attempts\":"   << outcome.attempts << ","
        << "\"busy\":"       << (busy ? "true" : "false") << ","
        << "\"option_ids\":[";
    for (std::size_t i = 0; i < outcome.result.optionIds.size(); ++i) {
        if (i) oss << ",";
        oss << outcome.result.optionIds[i];
    }
    oss << "],\"confidences\":[";
    for (std::size_t i = 0; i < outcome.result.confidences.size(); ++i) {
        if (i) oss << ",";
        oss << outcome.result.confidences[i];
    }
    oss << "]}";
    return oss.str();
}

}
