#include "definitions.hpp"       // for error_inter
#include "headless_input.hpp"    // for HeadlessInput
#include "installer_config.hpp"  // for load_installer_config
#include "system_install.hpp"    // for install_base_system
#include "tui_input.hpp"         // for TuiInput

#include "cryptlvm/command_runner.hpp"
#include "cryptlvm/io_utils.hpp"
#include "cryptlvm/logger.hpp"
#include "cryptlvm/provision.hpp"

#include <chrono>       // for seconds
#include <memory>       // for unique_ptr
#include <regex>        // for regex_search
#include <string_view>  // for string_view

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for debug
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

using namespace std::string_view_literals;

namespace {

bool check_root() noexcept {
    return (cryptlvm::utils::exec("whoami") == "root"sv);
}

}  // namespace

int main() {
    const auto& tty = cryptlvm::utils::exec("tty");
    const std::regex tty_regex("/dev/tty[0-9]*");
    if (std::regex_search(tty, tty_regex)) {
        cryptlvm::utils::exec("setterm -blank 0 -powersave off");
    }

    // Check if installer has enough permissions.
    if (!check_root()) {
        error_inter("Installer must be launched with root privileges!\n");
        return 1;
    }

    // Initialize logger.
    auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("cryptlvm_logger", "/tmp/cryptlvm-install.log");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_every(std::chrono::seconds(5));

    cryptlvm::logger::set_logger(logger);

    auto config = installer::load_installer_config("settings.json"sv);
    if (!config) {
        error_inter("Failed to load settings.json: {}\n", config.error());
        spdlog::shutdown();
        return 1;
    }
    if (auto valid = installer::validate_headless_config(*config); !valid) {
        error_inter("{}\n", valid.error());
        spdlog::shutdown();
        return 1;
    }

    const bool headless_mode = config->headless_mode;
    spdlog::info("Running in {} mode!", headless_mode ? "HEADLESS" : "NORMAL");

    std::unique_ptr<cryptlvm::InputProvider> input{};
    if (headless_mode) {
        input = std::make_unique<installer::HeadlessInput>(*config);
    } else {
        input = std::make_unique<tui::TuiInput>();
    }

    cryptlvm::utils::SystemCommandRunner runner{};
    const auto& install_config = cryptlvm::collect_install_config(*input, runner, config->mountpoint);
    if (!install_config) {
        if (headless_mode) {
            error_inter("Invalid configuration in settings.json, nothing has been changed.\n");
            spdlog::shutdown();
            return 1;
        }
        info_inter("Installation cancelled, nothing has been changed.\n");
        spdlog::shutdown();
        return 0;
    }

    const auto& packages = config->packages;
    cryptlvm::ProvisionContext ctx{
        .runner              = runner,
        .input               = *input,
        .install_base_system = [&runner, &packages](std::string_view mountpoint) {
            return installer::install_base_system(runner, mountpoint, packages);
        },
    };
    if (cryptlvm::utils::is_dry_run()) {
        warning_inter("Dry run, no changes will be made to {}\n", install_config->device.path);
    }

    info_inter("Provisioning {}...\n", install_config->device.path);
    const auto& report = cryptlvm::run_provisioning(ctx, *install_config);
    if (!report) {
        spdlog::error("Provisioning failed: {}", report.error());
        error_inter("Provisioning failed: {}\n\n", report.error());
        output_inter("{}", installer::recovery_instructions(*install_config));
        spdlog::shutdown();
        return 1;
    }

    output_inter("{}", installer::completion_summary(*report));
    success_inter("Artix Linux installation completed successfully!\n");
    info_inter("You can now reboot into your new system. Log file: /tmp/cryptlvm-install.log\n");

    spdlog::shutdown();
}
