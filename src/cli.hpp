#pragma once

namespace sendmer {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitCancelled = 130;

// Parses argv, runs send or receive and returns the process exit code.
int run_cli(int argc, char* argv[]);

} // namespace sendmer
