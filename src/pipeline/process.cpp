#include "recon_splat/pipeline/process.hpp"
#include "recon_splat/core/errors.hpp"
#include "recon_splat/core/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace recon_splat::pipeline {

std::string format_command(const Command& cmd) {
    std::string out;
    for (const auto& kv : cmd.env) {
        out += kv.first + "=" + core::shell_quote(kv.second) + " ";
    }
    out += core::shell_quote(cmd.program);
    for (const auto& a : cmd.args) {
        out += " " + core::shell_quote(a);
    }
    return out;
}

int PosixProcessLauncher::launch(const Command& cmd) {
    if (cmd.program.empty()) {
        throw PipelineError("empty program name");
    }

    // argv must outlive the exec call; build it before forking
    std::vector<std::string> storage;
    storage.reserve(cmd.args.size() + 1);
    storage.push_back(cmd.program);
    storage.insert(storage.end(), cmd.args.begin(), cmd.args.end());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    // Keep our own output ordered before the child's
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw PipelineError("fork failed for " + cmd.program + ": " + std::strerror(errno));
    }

    if (pid == 0) {
        for (const auto& kv : cmd.env) {
            ::setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw PipelineError("waitpid failed for " + cmd.program + ": " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

} // namespace recon_splat::pipeline
