#include "cryptlvm/command_runner.hpp"
#include "cryptlvm/io_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace cryptlvm::utils {

auto SystemCommandRunner::run(std::string_view command) noexcept -> bool {
    return utils::exec_checked(command);
}

auto SystemCommandRunner::capture(std::string_view command) noexcept -> std::string {
    return utils::exec(command);
}

auto SystemCommandRunner::run_with_input(std::string_view command, std::string_view input) noexcept -> bool {
    return utils::exec_with_input(command, input);
}

auto chroot_checked(CommandRunner& runner, std::string_view mountpoint, std::string_view command) noexcept -> bool {
    const auto& chroot_cmd = fmt::format(FMT_COMPILE("artix-chroot '{}' {}"), mountpoint, command);
    spdlog::info("Running in chroot: '{}'", chroot_cmd);
    return runner.run(chroot_cmd);
}

}  // namespace cryptlvm::utils
