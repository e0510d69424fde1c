#include "restore_command.hpp"

namespace sweep::cli {

void RestoreCommand::setup(CLI::App& app) {
    app.add_option("snapshot", snapshot_name_, "Snapshot id, archive name or restore point name")
        ->required()
        ->type_name("<snapshot>");

    app.add_flag("-y,--yes", yes_, "Skip confirmation prompt");
}

int RestoreCommand::execute(CommandContext& ctx) {
    SnapshotManager snapshots = make_snapshot_manager(ctx);

    auto snapshot = snapshots.find_snapshot(snapshot_name_);
    if (!snapshot.ok()) {
        return report_error(snapshot.error());
    }

    if (!yes_ && !confirm("Overwrite live files with " + snapshot->id + "?")) {
        std::cout << "Cancelled.\n";
        return SWEEP_EXIT_SUCCESS;
    }

    auto report = snapshots.restore(snapshot->id);
    if (!report.ok()) {
        return report_error(report.error());
    }

    for (const auto& [category, root] : report->roots) {
        std::cout << "  " << std::left << std::setw(10) << category << root.string() << "\n";
    }

    const auto& copy = report->copy;
    std::cout << "Restored " << copy.files << " files, " << copy.directories
              << " directories, " << copy.symlinks << " links; " << copy.failed << " failed\n";
    for (const auto& failure : copy.failures) {
        std::cerr << "Failed: " << failure.path << ": " << failure.reason << "\n";
    }
    return copy.failed > 0 ? SWEEP_EXIT_PARTIAL : SWEEP_EXIT_SUCCESS;
}

}  // namespace sweep::cli
