#pragma once

#include <sweep/result.hpp>
#include <sweep/util/logger.hpp>

#include <memory>
#include <string>
#include <vector>

namespace sweep {

/**
 * PrivilegeElevator - Runs a command with elevated privileges.
 *
 * Used as the last resort by forced removal ("rm -rf -- <path>") and by
 * snapshot copies of elevated categories ("cp -pP <src> <dst>"). How the
 * privileges are obtained is up to the implementation.
 */
class PrivilegeElevator {
public:
    virtual ~PrivilegeElevator() = default;

    /**
     * Run argv[0] with argv as its arguments and wait for it.
     *
     * @return ELEVATION_FAILED if the command could not be started or
     *         exited with a non-zero status
     */
    virtual Result<void> elevate_and_run(const std::vector<std::string>& argv) = 0;
};

/**
 * Elevates through "sudo -n" so a missing credential fails instead of
 * prompting. Runs the command directly when already root.
 */
class SudoElevator : public PrivilegeElevator {
public:
    explicit SudoElevator(std::shared_ptr<Logger> logger = nullptr);

    Result<void> elevate_and_run(const std::vector<std::string>& argv) override;

private:
    std::shared_ptr<Logger> logger_;
};

/**
 * fork/execvp/waitpid without a shell.
 *
 * @return Exit status of the child, or -1 if it could not be run
 */
int run_process(const std::vector<std::string>& argv);

}  // namespace sweep
