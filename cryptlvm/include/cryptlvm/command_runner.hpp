#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptlvm::utils {

/// @brief Seam between the provisioning logic and the external tools it drives.
class CommandRunner {
 public:
    CommandRunner() noexcept          = default;
    virtual ~CommandRunner() noexcept = default;

    CommandRunner(const CommandRunner&)     = delete;
    auto operator=(const CommandRunner&) = delete;

    /// @brief Run shell command.
    /// @return true if the command exited with status 0.
    virtual auto run(std::string_view command) noexcept -> bool = 0;

    /// @brief Run shell command and capture its stdout.
    /// @return The output without trailing newline, empty on failure.
    virtual auto capture(std::string_view command) noexcept -> std::string = 0;

    /// @brief Run shell command feeding input to its stdin.
    /// @return true if the command exited with status 0.
    virtual auto run_with_input(std::string_view command, std::string_view input) noexcept -> bool = 0;
};

// Runs commands on the live system
class SystemCommandRunner final : public CommandRunner {
 public:
    auto run(std::string_view command) noexcept -> bool override;
    auto capture(std::string_view command) noexcept -> std::string override;
    auto run_with_input(std::string_view command, std::string_view input) noexcept -> bool override;
};

// Run command inside of the target root via artix-chroot
auto chroot_checked(CommandRunner& runner, std::string_view mountpoint, std::string_view command) noexcept -> bool;

}  // namespace cryptlvm::utils

#endif  // COMMAND_RUNNER_HPP
