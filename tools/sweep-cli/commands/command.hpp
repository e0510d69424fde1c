#pragma once

#include "exit_codes.hpp"

#include <sweep/sweep.hpp>
#include <sweep/util/path_utils.hpp>
#include <CLI/CLI.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace sweep::cli {

/**
 * Context passed to command execution.
 * Holds the loaded configuration and the shared collaborators.
 */
struct CommandContext {
    SweepConfig config;
    std::filesystem::path config_path;
    std::filesystem::path home;
    bool verbose = false;
    std::shared_ptr<Logger> logger;
    PrivilegeElevator* elevator = nullptr;
    TreeLockRegistry* locks = nullptr;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with configuration and collaborators
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    /**
     * Get the command name (e.g., "scan", "restore").
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text.
     */
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Map an engine error onto an exit code.
 */
inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::NOT_FOUND:
            return SWEEP_EXIT_NOT_FOUND;
        case ErrorCode::INVALID_ARGUMENT:
            return SWEEP_EXIT_USER_ERROR;
        case ErrorCode::IO_ERROR:
        case ErrorCode::PERMISSION_DENIED:
        case ErrorCode::ARCHIVE_ERROR:
        case ErrorCode::MANIFEST_INVALID:
        case ErrorCode::CORRUPTION:
        case ErrorCode::ELEVATION_FAILED:
            return SWEEP_EXIT_IO_ERROR;
        default:
            return SWEEP_EXIT_INTERNAL;
    }
}

/**
 * Print an error and return its exit code.
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * Ask a yes/no question on stdin. Anything but y/Y declines.
 */
inline bool confirm(const std::string& question) {
    std::cout << question << " [y/N] ";
    std::string response;
    std::getline(std::cin, response);
    return response == "y" || response == "Y";
}

/**
 * Open the persistent metadata cache.
 * Falls back to an in-memory store, with a warning, when the journal
 * cannot be opened.
 */
inline std::unique_ptr<MetadataCache> open_cache(CommandContext& ctx, bool persistent = true) {
    std::shared_ptr<MetadataStore> store;
    if (persistent && !ctx.config.cache_path.empty()) {
        auto opened = MetadataStore::open(ctx.config.cache_path, ctx.logger);
        if (opened.ok()) {
            store = std::move(opened.value());
        } else {
            std::cerr << "Warning: cache disabled: " << opened.error().to_string() << "\n";
        }
    }
    if (!store) {
        store = MetadataStore::open_in_memory();
    }
    return std::make_unique<MetadataCache>(std::move(store), std::make_shared<LocalFileSystem>(),
                                           CacheOptions(), ctx.logger);
}

inline SnapshotManager make_snapshot_manager(CommandContext& ctx) {
    SnapshotOptions options;
    options.backup_dir = ctx.config.backup_location;
    options.categories = ctx.config.snapshot_categories;
    options.large_file_threshold = ctx.config.large_file_threshold;
    options.copy_workers = ctx.config.max_workers;
    return SnapshotManager(std::move(options), ctx.logger, ctx.elevator, ctx.locks);
}

/**
 * Compile the configured exclusions, reporting fragments that were skipped.
 */
inline ExclusionEngine make_exclusions(const CommandContext& ctx) {
    ExclusionEngine engine(ctx.config.excluded_locations);
    for (const auto& fragment : engine.rejected_fragments()) {
        std::cerr << "Warning: ignoring invalid exclusion '" << fragment << "'\n";
    }
    return engine;
}

/**
 * Full scan of the configured search roots for one application.
 */
inline ScanResult run_scan(const CommandContext& ctx,
                           const std::string& app_name,
                           const ExclusionEngine& exclusions,
                           MetadataCache* cache) {
    PathMatcher matcher(app_name, PatternTable(ctx.config.app_patterns),
                        ctx.config.bundle_extension);

    ScannerOptions options;
    options.max_workers = ctx.config.max_workers;
    ParallelScanner scanner(exclusions, std::make_shared<LocalFileSystem>(), options, ctx.logger);
    return scanner.scan(matcher, ctx.config.search_roots, cache);
}

/**
 * Print candidates grouped by parent directory.
 */
inline void print_groups(const ScanResult& result) {
    for (const auto& [parent, entries] : result.groups()) {
        std::cout << parent << "\n";
        for (const auto& candidate : entries) {
            std::cout << "  " << std::left << std::setw(10)
                      << match_tier_name(candidate.tier)
                      << std::setw(12) << format_size(candidate.size)
                      << fs::path(candidate.path).filename().string() << "\n";
        }
    }
    std::cout << "\n" << result.size() << " entr" << (result.size() == 1 ? "y" : "ies")
              << ", " << format_size(result.total_size()) << " total\n";
}

/**
 * Truncate a string for display, adding "..." if needed.
 */
inline std::string truncate(const std::string& s, size_t max_len) {
    if (max_len <= 3) return s.substr(0, max_len);
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

}  // namespace sweep::cli
