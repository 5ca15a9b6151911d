#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "utils/Types.h"
#include "utils/Logger.hpp"
#include "utils/SessionPaths.hpp"
#include "utils/ResultLog.hpp"
#include "shared/StateStore.hpp"
#include "stimulus/HttpServer.hpp"
#include "stimulus/StateStoreRenderer.hpp"
#include "stimulus/TrialController.hpp"
#include "stimulus/RankService.hpp"
#include "acq/BufferedSignalCollector.h"

#ifdef SIGNAL_BACKEND_SIM
#include "acq/SyntheticSampleSource.h"
#endif

// Global "please stop" flag set by Ctrl+C (SIGINT) to shut down cleanly
static std::atomic<bool> g_stop{false};

void handle_sigint(int) {
    g_stop.store(true, std::memory_order_relaxed);
}

// positive integer from the environment, fallback otherwise
static int env_int_or(const char* name, int fallback) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return fallback;
    char* end = nullptr;
    const long parsed = std::strtol(v, &end, 10);
    if (end == v || *end != '\0' || parsed < 0 || parsed > 65535) {
        LOG_WARN("ignoring " << name << "=" << v << " (using " << fallback << ")");
        return fallback;
    }
    return static_cast<int>(parsed);
}

void rank_thread_fn(RankService_C& service) {
    logger::tlabel = "rank";
    try {
        LOG_ALWAYS("rank: start");
        service.run();
        LOG_ALWAYS("rank: exit");
    }
    catch (const std::exception& e) {
        LOG_ERR("rank: FATAL unhandled exception: " << e.what());
        g_stop.store(true, std::memory_order_relaxed);
    }
}

void http_thread_fn(HttpServer_C& http) {
    logger::tlabel = "http";
    try {
        LOG_ALWAYS("http: listen thread start");
        if (!http.http_listen_for_poll_requests()) { // blocks here
            g_stop.store(true, std::memory_order_relaxed);
        }
        LOG_ALWAYS("http: listen thread exit");
    }
    catch (const std::exception& e) {
        LOG_ERR("http: FATAL unhandled exception: " << e.what());
        g_stop.store(true, std::memory_order_relaxed);
    }
}

int main() {
    logger::init();
    logger::tlabel = "main";
    LOG_ALWAYS("start (VERBOSE=" << logger::verbose() << ")");

    const int port = env_int_or("RSVP_PORT", DEFAULT_HTTP_PORT);
    TrialController_C::controllerConfigs_S controllerCfg{};
    controllerCfg.maxRetries = static_cast<std::size_t>(env_int_or("RSVP_MAX_RETRIES", static_cast<int>(DEFAULT_MAX_RETRIES)));

    // csv of every scoring attempt; ranking still works without it
    std::optional<ResultLog_C> resultLog;
    try {
        const rsvp::sesspaths::SessionPaths_S sp = rsvp::sesspaths::create_session(std::filesystem::current_path());
        resultLog.emplace(rsvp::sesspaths::data_file(sp, "rank_results.csv"));
    }
    catch (const std::exception& e) {
        LOG_WARN("session folder unavailable, result log disabled: " << e.what());
    }

    // Shared singletons/objects
    StateStore_s stateStore;
    StateStoreRenderer_C renderer(stateStore);

#ifdef SIGNAL_BACKEND_SIM
    LOG_ALWAYS("PATH=SIMULATED");
    SyntheticSampleSource_C::synthConfigs_S synthCfg{};
    synthCfg.seed = static_cast<unsigned int>(std::chrono::steady_clock::now().time_since_epoch().count());
    SyntheticSampleSource_C synth(synthCfg);
    BufferedSignalCollector_C* liveCollector = nullptr;
    TrialController_C controller(&renderer, nullptr, &synth, controllerCfg);
#else
    LOG_ALWAYS("PATH=LIVE");
    BufferedSignalCollector_C collector;
    BufferedSignalCollector_C* liveCollector = &collector;
    TrialController_C controller(&renderer, &collector, nullptr, controllerCfg);
#endif

    if (resultLog) {
        controller.set_attempt_callback([&resultLog](std::uint64_t requestId, std::size_t attempt, const ScoreResult_S& scored) {
            if (!resultLog->append(requestId, attempt, scored)) {
                LOG_DBG("result row for request " << requestId << " not written");
            }
        });
    }

    RankService_C service(stateStore, controller);
    HttpServer_C server(stateStore, liveCollector, port);
    if (!server.http_start_server()) {
        LOG_ERR("failed to start http server");
        return 1;
    }

    // interrupt caused by SIGINT -> 'handle_sigint' acts like ISR (callback handle)
    std::signal(SIGINT, handle_sigint);

    std::thread http(http_thread_fn, std::ref(server));
    std::thread rank(rank_thread_fn, std::ref(service));

    // Poll the atomic flag g_stop; keep sleep tiny so Ctrl-C feels instant
    while (!g_stop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds{30});
    }

    // on system shutdown:
    server.http_close_server();
    service.stop();
    http.join();
    rank.join();
    LOG_ALWAYS("bye");
    return 0;
}
