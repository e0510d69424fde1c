#include "snapshots_command.hpp"

namespace sweep::cli {

void SnapshotsCommand::setup(CLI::App& /* app */) {
    // No options for snapshots command
}

int SnapshotsCommand::execute(CommandContext& ctx) {
    SnapshotManager snapshots = make_snapshot_manager(ctx);
    auto list = snapshots.list_snapshots();

    if (list.empty()) {
        std::cout << "No restore points found.\n";
        std::cout << "Use 'sweep-cli snapshot' to create one.\n";
        return SWEEP_EXIT_SUCCESS;
    }

    // Print header
    std::cout << std::left
              << std::setw(44) << "ID"
              << std::setw(18) << "CREATED"
              << "SIZE\n";
    std::cout << std::string(74, '-') << "\n";

    for (const auto& s : list) {
        std::cout << std::left
                  << std::setw(44) << truncate(s.id, 43)
                  << std::setw(18) << (s.timestamp.empty() ? "-" : s.timestamp)
                  << format_size(s.archive_size) << "\n";
    }

    std::cout << "\n" << list.size() << " restore point(s)\n";
    return SWEEP_EXIT_SUCCESS;
}

}  // namespace sweep::cli
