/*
HTTP SERVER : READER + request mailbox writer
- starts httplib::Server on 127.0.0.1, blocks inside listen() so it needs its own thread
- never touches the TrialController directly: it only reads/writes the StateStore
--> requester calls POST /rank to submit an option set (202 + request_id, or 409 while one is in flight)
--> requester polls GET /result until busy=false
--> requester calls POST /abort to cancel the live request
--> display page polls GET /state (seq changes -> redraw)
--> classifier calls POST /sample once per flash with its score (live builds only)
*/
#pragma once
#include <httplib.h>
#include <atomic>
#include <memory>
#include <string_view>
#include "../utils/Logger.hpp"
#include "../shared/StateStore.hpp"
#include "../acq/BufferedSignalCollector.h"

/*
GET /state:
{
  "seq": int,            // bumps on every published display state
  "mode": "idle"|"preview"|"flash"|"result",
  "flash_index": int,    // 1-based, 0 when not flashing
  "option_id": int,
  "stimulus": str,
  "grid_cols": int,
  "preview": [{"id":int,"stimulus":str}, ...],
  "confidence": double,
  "banner": str,
  "busy": bool,
  "simulated": bool
}

GET /result:
{ "request_id": int, "status": str, "attempts": int, "busy": bool,
  "option_ids": [int...], "confidences": [double...] }
*/

class HttpServer_C {
public: // API
    // collector may be nullptr (simulation builds): POST /sample then answers 409
    HttpServer_C(StateStore_s& stateStoreRef, BufferedSignalCollector_C* collector, int port = DEFAULT_HTTP_PORT);
    ~HttpServer_C();
    bool http_start_server(); // constructs httplib::server + routes
    bool http_listen_for_poll_requests(); // blocking .listen()
    bool http_close_server(); // calls server's stop hook so .listen() returns
    bool get_is_running() const { return is_running_.load(std::memory_order_acquire); }
    // blocks until listen() is up (tests); false on timeout
    bool wait_until_running(int timeoutMs) const;
private:
    StateStore_s& stateStoreRef_;
    BufferedSignalCollector_C* collector_;
    std::unique_ptr<httplib::Server> liveServer_;
    int port_;
    std::atomic<bool> is_running_{false};
    // Handlers
    void handle_get_state(const httplib::Request& req, httplib::Response& res);
    void handle_get_result(const httplib::Request& req, httplib::Response& res);
    void handle_post_rank(const httplib::Request& req, httplib::Response& res);
    void handle_post_abort(const httplib::Request& req, httplib::Response& res);
    void handle_post_sample(const httplib::Request& req, httplib::Response& res);
    void handle_options_and_set(const httplib::Request& req, httplib::Response& res); // CORS preflight
    void write_json(httplib::Response& res, std::string_view json_body, int status = 200) const;
}; // HttpServer_C
