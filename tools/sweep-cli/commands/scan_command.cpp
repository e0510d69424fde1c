#include "scan_command.hpp"

namespace sweep::cli {

void ScanCommand::setup(CLI::App& app) {
    app.add_option("app", app_name_, "Application name")
        ->required()
        ->type_name("<name>");

    app.add_option("-r,--root", roots_, "Search root (repeatable, replaces configured roots)")
        ->type_name("<dir>");
    app.add_flag("--no-cache", no_cache_, "Do not read or update the metadata cache");
}

int ScanCommand::execute(CommandContext& ctx) {
    if (!roots_.empty()) {
        ctx.config.search_roots.clear();
        for (const auto& root : roots_) {
            ctx.config.search_roots.push_back(expand_home(root));
        }
    }

    auto exclusions = make_exclusions(ctx);
    auto cache = open_cache(ctx, !no_cache_);
    auto result = run_scan(ctx, app_name_, exclusions, cache.get());

    if (result.empty()) {
        std::cout << "No files found for " << app_name_ << ".\n";
        return SWEEP_EXIT_NOT_FOUND;
    }

    print_groups(result);

    const auto& stats = result.stats();
    if (ctx.verbose) {
        std::cout << stats.directories_visited << " directories visited, "
                  << stats.directories_pruned << " excluded, "
                  << stats.entry_errors << " unreadable\n";
    }
    return SWEEP_EXIT_SUCCESS;
}

}  // namespace sweep::cli
