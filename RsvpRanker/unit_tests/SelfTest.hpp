#pragma once
#include <cstdlib>
#include "../src/utils/Logger.hpp"

/* shared by the self-test executables:
- each test is its own main(), logs through LOG_ALWAYS
- first failed check logs file:line and exits 1 so ctest marks the test failed
*/
#define SELFTEST_REQUIRE(cond) do { \
  if (!(cond)) { \
    LOG_ERR("FAILED: " #cond " (" << __FILE__ << ":" << __LINE__ << ")"); \
    std::exit(1); \
  } \
} while(0)

#define SELFTEST_PASS(name) do { \
  LOG_ALWAYS(name << " passed"); \
  return 0; \
} while(0)
