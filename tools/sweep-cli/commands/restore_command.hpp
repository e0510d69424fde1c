#pragma once

#include "command.hpp"

namespace sweep::cli {

/**
 * Copy a restore point back onto the live file system.
 */
class RestoreCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "restore"; }
    std::string description() const override {
        return "Restore files from a restore point";
    }

private:
    std::string snapshot_name_;
    bool yes_ = false;
};

}  // namespace sweep::cli
