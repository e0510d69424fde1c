#pragma once

namespace sweep::cli {

// Standard exit codes for CLI commands
// Named with SWEEP_ prefix to avoid conflict with system macros
constexpr int SWEEP_EXIT_SUCCESS = 0;
constexpr int SWEEP_EXIT_USER_ERROR = 1;     // Invalid arguments, declined prompts
constexpr int SWEEP_EXIT_NOT_FOUND = 2;      // Snapshot/application not found
constexpr int SWEEP_EXIT_IO_ERROR = 3;       // File/archive/storage errors
constexpr int SWEEP_EXIT_INTERNAL = 4;       // Internal/unexpected errors
constexpr int SWEEP_EXIT_PARTIAL = 5;        // Some entries could not be removed or copied

}  // namespace sweep::cli
