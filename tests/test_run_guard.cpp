#include "core/errors.hpp"
#include "core/run_guard.hpp"

#include <gtest/gtest.h>
#include <new>
#include <system_error>

namespace {
constexpr int FAILURE = 1;
}

TEST(RunGuardTest, ReturnsBodyResult) {
  EXPECT_EQ(run_guarded(FAILURE, [] { return 0; }), 0);
  EXPECT_EQ(run_guarded(FAILURE, [] { return 2; }), 2);
}

TEST(RunGuardTest, AnalysisErrorBecomesFailureCode) {
  EXPECT_EQ(run_guarded(FAILURE,
                        []() -> int {
                          throw ConfigurationError("bad sensitivity");
                        }),
            FAILURE);
}

TEST(RunGuardTest, ThreadCreationFailureBecomesFailureCode) {
  EXPECT_EQ(run_guarded(FAILURE,
                        []() -> int {
                          throw std::system_error(
                              std::make_error_code(
                                  std::errc::resource_unavailable_try_again),
                              "thread");
                        }),
            FAILURE);
}

TEST(RunGuardTest, AllocationFailureBecomesFailureCode) {
  EXPECT_EQ(run_guarded(FAILURE, []() -> int { throw std::bad_alloc(); }),
            FAILURE);
}
