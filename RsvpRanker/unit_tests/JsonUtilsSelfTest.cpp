#include "SelfTest.hpp"
#include "../src/utils/JsonUtils.hpp"
#include "../src/stimulus/TrialController.hpp"

/* TEST COMPONENTS:
- scalar + array extraction from flat bodies (spacing, negatives, escapes)
- POST /rank body parsing: defaults, overrides, stimuli alignment, structural errors
- /result body formatting
*/

static void test_scalars() {
    const std::string body = "{ \"a\" : -12, \"b\":3.5 ,\"name\":\"x\\\"y\", \"flag\": true }";
    int a = 0;
    double b = 0.0;
    std::string name;
    SELFTEST_REQUIRE(JSON::extract_json_int(body, "\"a\"", a) && a == -12);
    SELFTEST_REQUIRE(JSON::extract_json_double(body, "\"b\"", b) && b == 3.5);
    SELFTEST_REQUIRE(JSON::extract_json_string(body, "\"name\"", name) && name == "x\"y");
    SELFTEST_REQUIRE(!JSON::extract_json_int(body, "\"missing\"", a));
    SELFTEST_REQUIRE(!JSON::extract_json_int(body, "\"flag\"", a));
    SELFTEST_REQUIRE(JSON::extract_json_int("{\"n\":2147483647}", "\"n\"", a) && a == 2147483647);
    SELFTEST_REQUIRE(JSON::extract_json_int("{\"n\":-2147483648}", "\"n\"", a) && a == -2147483647 - 1);
    a = 5;
    SELFTEST_REQUIRE(!JSON::extract_json_int("{\"n\":2147483648}", "\"n\"", a) && a == 5);
    SELFTEST_REQUIRE(!JSON::extract_json_int("{\"n\":99999999999999999999}", "\"n\"", a) && a == 5);
    SELFTEST_REQUIRE(JSON::escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");
}

static void test_arrays() {
    std::vector<int> ids;
    SELFTEST_REQUIRE(JSON::extract_json_int_array("{\"ids\":[ 1, -2,3 ]}", "\"ids\"", ids));
    SELFTEST_REQUIRE(ids == std::vector<int>({ 1, -2, 3 }));
    SELFTEST_REQUIRE(JSON::extract_json_int_array("{\"ids\":[]}", "\"ids\"", ids) && ids.empty());
    SELFTEST_REQUIRE(!JSON::extract_json_int_array("{\"ids\":[1,2", "\"ids\"", ids));
    SELFTEST_REQUIRE(!JSON::extract_json_int_array("{\"ids\":[1,\"x\"]}", "\"ids\"", ids));
    SELFTEST_REQUIRE(!JSON::extract_json_int_array("{\"ids\":7}", "\"ids\"", ids));
    SELFTEST_REQUIRE(!JSON::extract_json_int_array("{\"ids\":[1,4294967297]}", "\"ids\"", ids));
    SELFTEST_REQUIRE(!JSON::extract_json_int_array("{\"ids\":[99999999999999999999999]}", "\"ids\"", ids));

    std::vector<std::string> names;
    SELFTEST_REQUIRE(JSON::extract_json_string_array("{\"s\":[\"a.png\", \"b,c.png\"]}", "\"s\"", names));
    SELFTEST_REQUIRE(names == std::vector<std::string>({ "a.png", "b,c.png" }));
}

static void test_parse_rank_request() {
    RankRequest_S req{};
    std::string err;

    SELFTEST_REQUIRE(JSON::parse_rank_request("{\"option_ids\":[4,5,6]}", req, err));
    SELFTEST_REQUIRE(req.options.size() == 3);
    SELFTEST_REQUIRE(req.options[1].id == 5 && req.options[1].stimulus.empty());
    SELFTEST_REQUIRE(req.timing.preview_ms == ms_T{ DEFAULT_PREVIEW_MS });
    SELFTEST_REQUIRE(req.timing.flash_ms == ms_T{ DEFAULT_FLASH_MS });
    SELFTEST_REQUIRE(req.minRepeat == DEFAULT_MIN_REPEAT && req.maxRepeat == DEFAULT_MAX_REPEAT);

    const std::string full =
        "{\"option_ids\":[1,2],\"stimuli\":[\"a.png\",\"b.png\"],"
        "\"preview_ms\":1000,\"flash_ms\":100,\"min_repeat\":2,\"max_repeat\":4}";
    SELFTEST_REQUIRE(JSON::parse_rank_request(full, req, err));
    SELFTEST_REQUIRE(req.options[0].stimulus == "a.png" && req.options[1].stimulus == "b.png");
    SELFTEST_REQUIRE(req.timing.preview_ms == ms_T{ 1000 } && req.timing.flash_ms == ms_T{ 100 });
    SELFTEST_REQUIRE(req.minRepeat == 2 && req.maxRepeat == 4);

    // empty list parses; the controller declines it
    SELFTEST_REQUIRE(JSON::parse_rank_request("{\"option_ids\":[]}", req, err));
    SELFTEST_REQUIRE(req.options.empty());

    SELFTEST_REQUIRE(!JSON::parse_rank_request("{\"ids\":[1]}", req, err) && err == "option_ids");
    SELFTEST_REQUIRE(!JSON::parse_rank_request("{\"option_ids\":[1,2],\"stimuli\":[\"a\"]}", req, err)
                     && err == "stimuli_size");
    SELFTEST_REQUIRE(!JSON::parse_rank_request("{\"option_ids\":[1],\"min_repeat\":-1}", req, err)
                     && err == "min_repeat");

    // a huge repeat count parses but the controller declines it
    SELFTEST_REQUIRE(JSON::parse_rank_request(
        "{\"option_ids\":[1,2,3],\"min_repeat\":2000000000,\"max_repeat\":2000000000}", req, err));
    SELFTEST_REQUIRE(TrialController_C::validate_request(req) == RequestStatus_Malformed);
    SELFTEST_REQUIRE(!JSON::parse_rank_request("{\"option_ids\":[1],\"max_repeat\":99999999999}", req, err)
                     && err == "max_repeat");
    SELFTEST_REQUIRE(!JSON::parse_rank_request("{\"option_ids\":[1],\"flash_ms\":\"fast\"}", req, err)
                     && err == "flash_ms");
}

static void test_result_json() {
    RankOutcome_S outcome{};
    outcome.requestId = 3;
    outcome.status = RankStatus_Succeeded;
    outcome.attempts = 2;
    outcome.result.optionIds = { 9, 8 };
    outcome.result.confidences = { -1.5, 0 };
    const std::string json = JSON::ranked_result_json(outcome, false);
    SELFTEST_REQUIRE(json.find("\"request_id\":3") != std::string::npos);
    SELFTEST_REQUIRE(json.find("\"status\":\"succeeded\"") != std::string::npos);
    SELFTEST_REQUIRE(json.find("\"busy\":false") != std::string::npos);
    SELFTEST_REQUIRE(json.find("\"option_ids\":[9,8]") != std::string::npos);
    SELFTEST_REQUIRE(json.find("\"confidences\":[-1.5,0]") != std::string::npos);
}

int main() {
    logger::init();
    logger::tlabel = "JsonUtilsSelfTest";
    LOG_ALWAYS("JsonUtilsSelfTest starting");

    test_scalars();
    test_arrays();
    test_parse_rank_request();
    test_result_json();

    SELFTEST_PASS("JsonUtilsSelfTest");
}
