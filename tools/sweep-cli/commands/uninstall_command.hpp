#pragma once

#include "command.hpp"

namespace sweep::cli {

/**
 * Find an application's files, snapshot them and remove them.
 */
class UninstallCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "uninstall"; }
    std::string description() const override {
        return "Remove an application and the files it left behind";
    }

private:
    std::vector<std::string> locate(CommandContext& ctx, const ExclusionEngine& exclusions,
                                    MetadataCache& cache);

    std::string app_name_;
    bool force_ = false;
    bool quick_ = false;
    bool no_snapshot_ = false;
    bool yes_ = false;
};

}  // namespace sweep::cli
