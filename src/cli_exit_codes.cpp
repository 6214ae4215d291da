#include <surveyor/cli_exit_codes.h>

namespace surveyor {

int RunExitCode(const RunResult &result) {
  switch (result.outcome) {
  case RunOutcome::kCompleted:
  case RunOutcome::kStopped:
  case RunOutcome::kLimitReached:
    return kExitSuccess;
  case RunOutcome::kNoRoots:
    return kExitNoRoots;
  }
  return kExitUsageError;
}

} // namespace surveyor
