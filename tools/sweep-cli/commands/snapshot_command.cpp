#include "snapshot_command.hpp"

namespace sweep::cli {

void SnapshotCommand::setup(CLI::App& app) {
    app.add_option("name", snapshot_name_, "Restore point name")
        ->type_name("<name>");
}

int SnapshotCommand::execute(CommandContext& ctx) {
    SnapshotManager snapshots = make_snapshot_manager(ctx);

    std::cout << "Creating restore point in " << ctx.config.backup_location.string() << "...\n";
    auto report = snapshots.create_snapshot(snapshot_name_);
    if (!report.ok()) {
        return report_error(report.error());
    }

    const auto& copy = report->copy;
    std::cout << "Created " << report->snapshot.id << " ("
              << format_size(report->snapshot.archive_size) << ")\n";
    std::cout << copy.files << " files, " << copy.directories << " directories, "
              << copy.symlinks << " links, " << copy.skipped << " skipped, "
              << copy.failed << " failed\n";

    for (const auto& failure : copy.failures) {
        std::cerr << "Failed: " << failure.path << ": " << failure.reason << "\n";
    }
    return copy.failed > 0 ? SWEEP_EXIT_PARTIAL : SWEEP_EXIT_SUCCESS;
}

}  // namespace sweep::cli
