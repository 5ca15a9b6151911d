#include "SelfTest.hpp"
#include "../src/utils/SessionPaths.hpp"
#include "../src/utils/ResultLog.hpp"
#include <chrono>
#include <fstream>
#include <string>
#include <vector>

/* TEST COMPONENTS:
- project root lookup walks up to the nearest data/ directory
- create_session makes data/<timestamp>/
- ResultLog writes nothing until the first row, then header + one row per attempt
All files live under a scratch dir in the system temp folder, removed at the end.
*/

namespace fs = std::filesystem;

static std::vector<std::string> read_lines(const fs::path& p) {
    std::vector<std::string> lines;
    std::ifstream in(p.string());
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

int main() {
    logger::init();
    logger::tlabel = "ResultLogSelfTest";
    LOG_ALWAYS("ResultLogSelfTest starting");

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path scratch = fs::temp_directory_path() / ("rsvp_result_log_" + std::to_string(stamp));
    const fs::path nested = scratch / "out" / "build";
    fs::create_directories(scratch / "data");
    fs::create_directories(nested);

    // (1) root lookup
    SELFTEST_REQUIRE(rsvp::sesspaths::find_project_root(nested) == scratch);
    SELFTEST_REQUIRE(rsvp::sesspaths::make_session_id_timestamp().size() == 19);

    // (2) session dir
    const rsvp::sesspaths::SessionPaths_S sp = rsvp::sesspaths::create_session(nested);
    SELFTEST_REQUIRE(sp.project_root == scratch);
    SELFTEST_REQUIRE(fs::is_directory(sp.data_session_dir));
    SELFTEST_REQUIRE(sp.data_session_dir.parent_path() == scratch / "data");

    // (3) csv
    const fs::path csvPath = rsvp::sesspaths::data_file(sp, "rank_results.csv");
    {
        ResultLog_C log(csvPath);
        SELFTEST_REQUIRE(!fs::exists(csvPath));

        ScoreResult_S rejected{};
        rejected.verdict = ScoreVerdict_Rejected;
        rejected.separation = 1.25;
        rejected.usedSamples = 9;
        rejected.ranked.optionIds = { 2, 1, 3 };
        rejected.ranked.confidences = { -1, 0.5, 0.5 };
        SELFTEST_REQUIRE(log.append(4, 1, rejected));

        ScoreResult_S accepted = rejected;
        accepted.verdict = ScoreVerdict_Accepted;
        SELFTEST_REQUIRE(log.append(4, 2, accepted));
        SELFTEST_REQUIRE(log.get_rows_written() == 2);
    }

    const std::vector<std::string> lines = read_lines(csvPath);
    SELFTEST_REQUIRE(lines.size() == 3);
    SELFTEST_REQUIRE(lines[0].rfind("request_id,attempt,verdict", 0) == 0);
    SELFTEST_REQUIRE(lines[1] == "4,1,rejected,1.25,9,0,2;1;3,-1;0.5;0.5");
    SELFTEST_REQUIRE(lines[2].rfind("4,2,accepted,", 0) == 0);

    // (4) unwritable path: append reports failure instead of throwing
    ResultLog_C broken(scratch / "missing_dir" / "x.csv");
    SELFTEST_REQUIRE(!broken.append(1, 1, ScoreResult_S{}));

    std::error_code ec;
    fs::remove_all(scratch, ec);

    SELFTEST_PASS("ResultLogSelfTest");
}
