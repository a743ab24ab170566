#ifndef PROCESS_H
#define PROCESS_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Child Processes
// ============================================================================

struct ProcessResult {
	int exit_code   = {};
	std::string out = {};
};

namespace Process {

// Spawns argv[0] (searched on PATH), feeds input to its stdin while
// collecting its stdout, and waits for it to exit. stderr stays attached to
// the caller's terminal. Blocks without a timeout. A child killed by a signal
// reports 128 + signo. The child inherits the caller's signal dispositions.
[[nodiscard]] std::optional<ProcessResult> run(const std::vector<std::string>& argv,
                                               const std::string_view input);

// Runs a child with inherited stdio in the given working directory and waits
// for it.
[[nodiscard]] std::optional<int> run_attached(const std::vector<std::string>& argv,
                                              const std::string& cwd);

} // namespace Process

#endif
