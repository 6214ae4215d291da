#pragma once

#include <surveyor/driver.h>

namespace surveyor {

constexpr int kExitSuccess = 0;
constexpr int kExitUsageError = 1;
constexpr int kExitNoRoots = 2;
constexpr int kExitVisitorFailure = 3;

int RunExitCode(const RunResult &result);

} // namespace surveyor
