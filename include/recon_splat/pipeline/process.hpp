#pragma once

#include <string>
#include <utility>
#include <vector>

namespace recon_splat::pipeline {

// One external tool invocation. env entries are added to (or replace
// entries of) the parent environment in the child only.
struct Command {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;
};

// Shell-quoted rendering for logs and dry runs
std::string format_command(const Command& cmd);

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /**
     * Run cmd to completion with inherited stdout/stderr and return its
     * exit code. Termination by signal N is reported as 128 + N, an
     * executable that cannot be found as 127. Throws PipelineError when
     * the child cannot be started at all.
     */
    virtual int launch(const Command& cmd) = 0;
};

// fork/execvp/waitpid
class PosixProcessLauncher : public ProcessLauncher {
public:
    int launch(const Command& cmd) override;
};

} // namespace recon_splat::pipeline
