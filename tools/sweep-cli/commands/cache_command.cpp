#include "cache_command.hpp"

namespace sweep::cli {

void CacheCommand::setup(CLI::App& app) {
    auto* sweep_flag = app.add_flag("--sweep", sweep_, "Drop rows older than the retention window");
    app.add_flag("--clear", clear_, "Drop every row")->excludes(sweep_flag);
}

int CacheCommand::execute(CommandContext& ctx) {
    auto opened = MetadataStore::open(ctx.config.cache_path, ctx.logger);
    if (!opened.ok()) {
        return report_error(opened.error());
    }
    std::shared_ptr<MetadataStore> store = std::move(opened.value());
    if (store->recovered_from_corruption()) {
        std::cout << "Journal was damaged; unreadable records were dropped.\n";
    }

    MetadataCache cache(store, std::make_shared<LocalFileSystem>(), CacheOptions(), ctx.logger);

    if (clear_) {
        auto cleared = cache.clear();
        if (!cleared.ok()) {
            return report_error(cleared.error());
        }
        std::cout << "Cache cleared.\n";
        return SWEEP_EXIT_SUCCESS;
    }

    if (sweep_) {
        size_t removed = cache.sweep_expired();
        auto compacted = store->compact();
        if (!compacted.ok()) {
            return report_error(compacted.error());
        }
        std::cout << "Removed " << removed << " expired row(s).\n";
    }

    std::cout << "Journal:  " << store->path().string() << "\n";
    std::cout << "Entries:  " << cache.stats().entries << "\n";
    std::cout << "Dead:     " << store->dead_record_count() << "\n";
    return SWEEP_EXIT_SUCCESS;
}

}  // namespace sweep::cli
