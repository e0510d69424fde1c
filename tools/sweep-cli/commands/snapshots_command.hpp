#pragma once

#include "command.hpp"

namespace sweep::cli {

/**
 * List restore points, newest first.
 */
class SnapshotsCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "snapshots"; }
    std::string description() const override {
        return "List restore points";
    }
};

}  // namespace sweep::cli
