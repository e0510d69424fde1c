#pragma once

#include "command.hpp"

namespace sweep::cli {

/**
 * Inspect and maintain the metadata cache.
 */
class CacheCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "cache"; }
    std::string description() const override {
        return "Show or maintain the metadata cache";
    }

private:
    bool sweep_ = false;
    bool clear_ = false;
};

}  // namespace sweep::cli
