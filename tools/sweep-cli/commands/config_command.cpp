#include "config_command.hpp"

namespace sweep::cli {

void ConfigCommand::setup(CLI::App& app) {
    app.add_flag("--init", init_, "Write the default configuration file");
}

int ConfigCommand::execute(CommandContext& ctx) {
    if (init_) {
        std::error_code ec;
        if (std::filesystem::exists(ctx.config_path, ec)) {
            std::cerr << "Error: " << ctx.config_path.string() << " already exists\n";
            return SWEEP_EXIT_USER_ERROR;
        }
        SweepConfig defaults = default_config();
        resolve_defaults(defaults, ctx.home);
        auto saved = save_config(defaults, ctx.config_path);
        if (!saved.ok()) {
            return report_error(saved.error());
        }
        std::cout << "Wrote " << ctx.config_path.string() << "\n";
        return SWEEP_EXIT_SUCCESS;
    }

    std::cout << "# " << ctx.config_path.string() << "\n";
    std::cout << config_to_json(ctx.config).dump(4) << "\n";
    return SWEEP_EXIT_SUCCESS;
}

}  // namespace sweep::cli
