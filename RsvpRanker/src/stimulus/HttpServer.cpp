// httplib::request = everything that comes from the client (requester / page / classifier)
// httplib::response = everything that server writes back to client
// data exchanges are in json format

#include "HttpServer.hpp"
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include "TrialController.hpp"
#include "../utils/JsonUtils.hpp"

HttpServer_C::HttpServer_C(StateStore_s& stateStoreRef, BufferedSignalCollector_C* collector, int port)
    : stateStoreRef_(stateStoreRef), collector_(collector), port_(port) {
}

HttpServer_C::~HttpServer_C() {
    if (liveServer_ && is_running_.load(std::memory_order_acquire)) {
        liveServer_->stop();
    }
}

// ============= Helpers ============
static inline void set_cors_headers(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

static inline bool is_json_request(const httplib::Request& req) {
    return req.get_header_value("Content-Type").find("application/json") != std::string::npos;
}

static const char* display_mode_str(DisplayMode_E mode) {
    switch (mode) {
        case DisplayMode_Idle:    return "idle";
        case DisplayMode_Preview: return "preview";
        case DisplayMode_Flash:   return "flash";
        case DisplayMode_Result:  return "result";
        default:                  return "unknown";
    }
}

// Writes JSON string into httplib:response body with correct CORS header
void HttpServer_C::write_json(httplib::Response& res, std::string_view json_body, int status) const {
    set_cors_headers(res);
    res.set_content(std::string(json_body), "application/json");
    res.status = status;
}

void HttpServer_C::handle_options_and_set(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    set_cors_headers(res);
    res.status = 200;
}

// ============== Handlers ==================

void HttpServer_C::handle_get_state(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    // seq first: a page that sees seq N is guaranteed at least snapshot N
    const int seq = stateStoreRef_.g_ui_seq.load(std::memory_order_acquire);
    const DisplaySnapshot_s snap = stateStoreRef_.get_display();
    const bool busy = stateStoreRef_.g_rank_busy.load(std::memory_order_acquire);
    const bool simulated = stateStoreRef_.g_is_simulated.load(std::memory_order_acquire);

    std::ostringstream oss;
    oss << "{"
        << "\"seq\":"           << seq                                   << ","
        << "\"mode\":\""        << display_mode_str(snap.mode)           << "\","
        << "\"flash_index\":"   << snap.flash_index                      << ","
        << "\"option_id\":"     << snap.option_id                        << ","
        << "\"stimulus\":\""    << JSON::escape(snap.stimulus)           << "\","
        << "\"grid_cols\":"     << snap.grid_cols                        << ","
        << "\"preview\":[";
    for (std::size_t i = 0; i < snap.preview.size(); ++i) {
        if (i) oss << ",";
        oss << "{\"id\":" << snap.preview[i].id
            << ",\"stimulus\":\"" << JSON::escape(snap.preview[i].stimulus) << "\"}";
    }
    oss << "],"
        << "\"confidence\":"    << snap.confidence                       << ","
        << "\"banner\":\""      << JSON::escape(snap.banner)             << "\","
        << "\"busy\":"          << (busy ? "true" : "false")             << ","
        << "\"simulated\":"     << (simulated ? "true" : "false")
        << "}";

    write_json(res, oss.str());
}

void HttpServer_C::handle_get_result(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    const bool busy = stateStoreRef_.g_rank_busy.load(std::memory_order_acquire);
    const RankOutcome_S outcome = stateStoreRef_.get_last_outcome();
    write_json(res, JSON::ranked_result_json(outcome, busy));
}

void HttpServer_C::handle_post_rank(const httplib::Request& req, httplib::Response& res) {
    if (!is_json_request(req)) {
        write_json(res, "{\"ok\":false,\"error\":\"content_type\"}", 415);
        return;
    }

    RankRequest_S request{};
    std::string err;
    if (!JSON::parse_rank_request(req.body, request, err)) {
        write_json(res, "{\"ok\":false,\"error\":\"" + JSON::escape(err) + "\"}", 400);
        return;
    }
    if (TrialController_C::validate_request(request) == RequestStatus_Malformed) {
        write_json(res, "{\"ok\":false,\"error\":\"malformed\"}", 400);
        return;
    }

    const std::uint64_t id = stateStoreRef_.try_post_request(request);
    if (id == 0) {
        LOG_ALWAYS("HTTP /rank refused: a request is already in flight");
        write_json(res, "{\"ok\":false,\"error\":\"busy\"}", 409);
        return;
    }
    LOG_ALWAYS("HTTP /rank accepted request " << id << " (" << request.options.size() << " options)");
    write_json(res, "{\"ok\":true,\"request_id\":" + std::to_string(id) + "}", 202);
}

void HttpServer_C::handle_post_abort(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    const bool aborting = stateStoreRef_.request_abort();
    write_json(res, std::string("{\"ok\":true,\"aborting\":") + (aborting ? "true" : "false") + "}");
}

void HttpServer_C::handle_post_sample(const httplib::Request& req, httplib::Response& res) {
    if (!is_json_request(req)) {
        write_json(res, "{\"ok\":false,\"error\":\"content_type\"}", 415);
        return;
    }
    if (collector_ == nullptr) {
        write_json(res, "{\"ok\":false,\"error\":\"simulated\"}", 409);
        return;
    }

    double value = 0.0;
    if (!JSON::extract_json_double(req.body, "\"signal\"", value)) {
        JSON::json_extract_fail("sample", "signal");
        write_json(res, "{\"ok\":false,\"error\":\"signal\"}", 400);
        return;
    }
    double rankPos = 0.0;
    (void)JSON::extract_json_double(req.body, "\"rank_position\"", rankPos); // optional, defaults to 0

    bool stored = false;
    int flashIndex = 0;
    if (JSON::extract_json_int(req.body, "\"flash_index\"", flashIndex)) {
        if (flashIndex <= 0) {
            write_json(res, "{\"ok\":false,\"error\":\"flash_index\"}", 400);
            return;
        }
        stored = collector_->push_labeled_sample(FlashSample_S{ static_cast<std::size_t>(flashIndex), value, rankPos });
    } else {
        stored = collector_->push_sample(value, rankPos);
    }
    write_json(res, std::string("{\"ok\":true,\"stored\":") + (stored ? "true" : "false") + "}");
}

// ===================== Lifecycle ==========================
bool HttpServer_C::http_start_server() {
    logger::tlabel = "HTTP Server";
    if (is_running_.load(std::memory_order_acquire) || liveServer_) return false;

    liveServer_ = std::make_unique<httplib::Server>();

    // Route bindings
    liveServer_->Get("/state",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_state(rq, rs); });

    liveServer_->Get("/result",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_result(rq, rs); });

    liveServer_->Post("/rank",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_rank(rq, rs); });

    liveServer_->Post("/abort",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_abort(rq, rs); });

    liveServer_->Post("/sample",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_sample(rq, rs); });

    // CORS preflight for POSTs
    for (const char* path : { "/rank", "/abort", "/sample" }) {
        liveServer_->Options(path,
            [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_options_and_set(rq, rs); });
    }

    LOG_ALWAYS("HTTP Server successfully opened");
    return true;
}

bool HttpServer_C::http_listen_for_poll_requests() {
    logger::tlabel = "HTTP Server";
    if (!liveServer_) {
        LOG_ERR("HTTP server not initialized; cannot start listening");
        return false;
    }
    if (!liveServer_->bind_to_port("127.0.0.1", port_)) {
        LOG_ERR("HTTP bind failed on port " << port_);
        return false;
    }
    is_running_.store(true, std::memory_order_release);
    LOG_ALWAYS("HTTP listening on 127.0.0.1:" << port_);

    const bool ok = liveServer_->listen_after_bind();
    is_running_.store(false, std::memory_order_release);

    if (!ok) {
        LOG_ERR("HTTP listen failed on port " << port_);
    } else {
        LOG_ALWAYS("HTTP listen stopped successfully");
    }
    return ok;
}

bool HttpServer_C::http_close_server() {
    if (!liveServer_) return false;
    liveServer_->stop(); // breaks .listen()
    LOG_ALWAYS("HTTP Server successfully closed");
    return true;
}

bool HttpServer_C::wait_until_running(int timeoutMs) const {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (liveServer_ && is_running_.load(std::memory_order_acquire) && liveServer_->is_running()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}
