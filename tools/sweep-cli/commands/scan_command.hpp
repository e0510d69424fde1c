#pragma once

#include "command.hpp"

namespace sweep::cli {

/**
 * List the entries that belong to an application without touching them.
 */
class ScanCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "scan"; }
    std::string description() const override {
        return "Find files belonging to an application";
    }

private:
    std::string app_name_;
    std::vector<std::string> roots_;
    bool no_cache_ = false;
};

}  // namespace sweep::cli
