#pragma once
#include <string>
#include <vector>

namespace procutil {

struct ProcResult {
    int exit_code = -1;   // -1 when the process could not be started
    std::string output;   // captured stdout
};

// Runs argv[0] (looked up on PATH) with the given arguments, no shell
// involved. stderr is discarded.
ProcResult run_capture_stdout(const std::vector<std::string>& argv);

}  // namespace procutil
