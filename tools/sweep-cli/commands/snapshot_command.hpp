#pragma once

#include "command.hpp"

namespace sweep::cli {

/**
 * Create a restore point of the configured snapshot categories.
 */
class SnapshotCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "snapshot"; }
    std::string description() const override {
        return "Create a restore point";
    }

private:
    std::string snapshot_name_;
};

}  // namespace sweep::cli
