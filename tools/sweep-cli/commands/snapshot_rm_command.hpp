#pragma once

#include "command.hpp"

namespace sweep::cli {

/**
 * Delete a restore point archive.
 */
class SnapshotRmCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "snapshot-rm"; }
    std::string description() const override {
        return "Delete a restore point";
    }

private:
    std::string snapshot_name_;
    bool yes_ = false;
};

}  // namespace sweep::cli
