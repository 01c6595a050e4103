#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

struct ProcessResult {
    int exit_code = 0;
    std::string output;
};

// Runs argv[0] (PATH lookup) with `input` on stdin. stdout is captured when
// capture_output is set, otherwise discarded; stderr is always discarded.
// The child is killed once `timeout` elapses.
std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      std::string_view input,
                                                      bool capture_output,
                                                      std::chrono::milliseconds timeout);
