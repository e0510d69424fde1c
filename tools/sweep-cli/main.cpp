#include "commands/cache_command.hpp"
#include "commands/config_command.hpp"
#include "commands/restore_command.hpp"
#include "commands/scan_command.hpp"
#include "commands/snapshot_command.hpp"
#include "commands/snapshot_rm_command.hpp"
#include "commands/snapshots_command.hpp"
#include "commands/uninstall_command.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <vector>

using namespace sweep;
using namespace sweep::cli;

int main(int argc, char* argv[]) {
    CLI::App app{"sweep - find, back up and remove the files an application leaves behind"};
    app.require_subcommand(1);

    bool verbose = false;
    std::string config_option;
    app.add_flag("-v,--verbose", verbose, "Log progress and per-entry details");
    app.add_option("-c,--config", config_option, "Configuration file")
        ->type_name("<file>");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<ScanCommand>());
    commands.push_back(std::make_unique<UninstallCommand>());
    commands.push_back(std::make_unique<SnapshotCommand>());
    commands.push_back(std::make_unique<RestoreCommand>());
    commands.push_back(std::make_unique<SnapshotsCommand>());
    commands.push_back(std::make_unique<SnapshotRmCommand>());
    commands.push_back(std::make_unique<CacheCommand>());
    commands.push_back(std::make_unique<ConfigCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    CLI11_PARSE(app, argc, argv);

    auto logger = std::make_shared<ConsoleLogger>();
    logger->set_min_level(verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    CommandContext ctx;
    ctx.verbose = verbose;
    ctx.logger = logger;
    ctx.home = home_directory();
    ctx.config_path = config_option.empty() ? default_config_path() : expand_home(config_option);

    auto config = load_config(ctx.config_path);
    if (!config.ok()) {
        return report_error(config.error());
    }
    ctx.config = std::move(config.value());
    resolve_defaults(ctx.config, ctx.home);

    SudoElevator elevator(logger);
    TreeLockRegistry locks;
    ctx.elevator = &elevator;
    ctx.locks = &locks;

    for (auto& [sub, command] : subcommands) {
        if (sub->parsed()) {
            return command->execute(ctx);
        }
    }

    std::cerr << app.help();
    return SWEEP_EXIT_USER_ERROR;
}
