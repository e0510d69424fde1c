#include <sweep/privilege.hpp>

#include <cerrno>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sweep {

int run_process(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return -1;
    }

    // Build the pointer array before forking
    std::vector<const char*> argv_ptrs;
    argv_ptrs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        argv_ptrs.push_back(arg.c_str());
    }
    argv_ptrs.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        return -1;
    }

    if (pid == 0) {
        execvp(argv_ptrs[0], const_cast<char* const*>(argv_ptrs.data()));
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

SudoElevator::SudoElevator(std::shared_ptr<Logger> logger)
    : logger_(logger_or_null(std::move(logger))) {}

Result<void> SudoElevator::elevate_and_run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Empty command");
    }

    std::vector<std::string> command;
    if (geteuid() != 0) {
        command = {"sudo", "-n", "--"};
    }
    command.insert(command.end(), argv.begin(), argv.end());

    std::string printable;
    for (const auto& arg : command) {
        if (!printable.empty()) printable += ' ';
        printable += arg;
    }
    logger_->debug("Elevating: " + printable);

    int status = run_process(command);
    if (status != 0) {
        return Error(ErrorCode::ELEVATION_FAILED,
                     printable + " exited with status " + std::to_string(status));
    }
    return Ok();
}

}  // namespace sweep
