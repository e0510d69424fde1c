#pragma once

#include "command.hpp"

namespace sweep::cli {

/**
 * Print the effective configuration or write the defaults.
 */
class ConfigCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "config"; }
    std::string description() const override {
        return "Show configuration";
    }

private:
    bool init_ = false;
};

}  // namespace sweep::cli
