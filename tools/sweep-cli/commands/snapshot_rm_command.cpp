#include "snapshot_rm_command.hpp"

namespace sweep::cli {

void SnapshotRmCommand::setup(CLI::App& app) {
    app.add_option("snapshot", snapshot_name_, "Snapshot id or restore point name")
        ->required()
        ->type_name("<snapshot>");

    app.add_flag("-y,--yes", yes_, "Skip confirmation prompt");
}

int SnapshotRmCommand::execute(CommandContext& ctx) {
    SnapshotManager snapshots = make_snapshot_manager(ctx);

    auto snapshot = snapshots.find_snapshot(snapshot_name_);
    if (!snapshot.ok()) {
        return report_error(snapshot.error());
    }

    if (!yes_ && !confirm("Delete restore point " + snapshot->id + "?")) {
        std::cout << "Cancelled.\n";
        return SWEEP_EXIT_SUCCESS;
    }

    auto result = snapshots.delete_snapshot(snapshot->id);
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "Deleted " << snapshot->id << "\n";
    return SWEEP_EXIT_SUCCESS;
}

}  // namespace sweep::cli
