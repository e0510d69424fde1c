#include "uninstall_command.hpp"

namespace sweep::cli {

void UninstallCommand::setup(CLI::App& app) {
    app.add_option("app", app_name_, "Application name")
        ->required()
        ->type_name("<name>");

    app.add_flag("-f,--force", force_, "Reset permissions and elevate when removal is denied");
    app.add_flag("-q,--quick", quick_, "Only check well-known locations");
    app.add_flag("--no-snapshot", no_snapshot_, "Skip the restore point");
    app.add_flag("-y,--yes", yes_, "Skip confirmation prompt");
}

std::vector<std::string> UninstallCommand::locate(CommandContext& ctx,
                                                  const ExclusionEngine& exclusions,
                                                  MetadataCache& cache) {
    if (!quick_) {
        auto result = run_scan(ctx, app_name_, exclusions, &cache);
        if (!result.empty()) {
            print_groups(result);
        }
        return result.paths();
    }

    QuickLocator locator(exclusions, std::make_shared<LocalFileSystem>(),
                         ctx.config.bundle_extension, "/", ctx.logger);
    auto found = locator.locate(app_name_, ctx.home);

    uint64_t total = 0;
    for (const auto& path : found) {
        uint64_t size = cache.size(path);
        total += size;
        std::cout << "  " << std::left << std::setw(12) << format_size(size) << path << "\n";
    }
    if (!found.empty()) {
        std::cout << "\n" << found.size() << " entries, " << format_size(total) << " total\n";
    }
    return found;
}

int UninstallCommand::execute(CommandContext& ctx) {
    auto exclusions = make_exclusions(ctx);
    auto cache = open_cache(ctx);

    auto candidates = locate(ctx, exclusions, *cache);
    if (candidates.empty()) {
        std::cout << "No files found for " << app_name_ << ".\n";
        return SWEEP_EXIT_NOT_FOUND;
    }

    if (!yes_ && !confirm("\nRemove these entries?")) {
        std::cout << "Cancelled.\n";
        return SWEEP_EXIT_SUCCESS;
    }

    RemovalOptions options;
    options.batch_size = ctx.config.removal_batch_size;
    options.max_workers = ctx.config.max_workers;
    options.snapshot_before = ctx.config.backup_enabled && !no_snapshot_;
    if (force_) {
        options.snapshot_name = "Before_Force_" + app_name_ + "_Uninstall";
    } else if (quick_) {
        options.snapshot_name = "Before_Quick_" + app_name_ + "_Uninstall";
    } else {
        options.snapshot_name = "Before_" + app_name_ + "_Uninstall";
    }

    SnapshotManager snapshots = make_snapshot_manager(ctx);
    RemovalOrchestrator orchestrator(std::make_shared<LocalFileSystem>(), options, ctx.logger,
                                     ctx.elevator, &snapshots, ctx.locks);

    auto report = orchestrator.remove(candidates,
                                      force_ ? RemovalMode::FORCED : RemovalMode::STANDARD);
    if (!report.ok()) {
        std::cerr << "Nothing was removed.\n";
        return report_error(report.error());
    }

    if (report->snapshot) {
        std::cout << "Restore point: " << report->snapshot->id << "\n";
    }
    for (const auto& failure : report->failures()) {
        std::cerr << "Failed: " << failure.path << ": " << failure.reason << "\n";
    }
    for (const auto& path : candidates) {
        auto invalidated = cache->invalidate(path);
        if (!invalidated.ok()) {
            ctx.logger->debug("Cache invalidation failed for " + path + ": " +
                              invalidated.error().to_string());
        }
    }

    std::cout << report->removed << " removed, " << report->skipped << " skipped, "
              << report->failed << " failed\n";
    if (report->failed > 0 && !force_) {
        std::cout << "Retry with --force to reset permissions and elevate.\n";
    }
    return report->failed > 0 ? SWEEP_EXIT_PARTIAL : SWEEP_EXIT_SUCCESS;
}

}  // namespace sweep::cli
