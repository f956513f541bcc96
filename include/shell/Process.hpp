#pragma once

#include <functional>
#include <string>
#include <vector>

namespace ds::shell {

struct Result {
    int exit_code = 0;
    std::vector<std::string> lines;  // stdout and stderr merged, line endings stripped

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

using Runner = std::function<Result(const std::vector<std::string>& argv)>;

// Runs argv[0] from PATH and blocks until it exits. Throws fs::OperationFailed
// if the process cannot be started.
Result run(const std::vector<std::string>& argv);

// Quotes one word for the device's POSIX shell.
std::string quote(const std::string& arg);

std::string join(const std::vector<std::string>& argv);

}
