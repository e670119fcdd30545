#ifndef SYSTEM_INSTALL_HPP
#define SYSTEM_INSTALL_HPP

#include "cryptlvm/command_runner.hpp"
#include "cryptlvm/install_config.hpp"
#include "cryptlvm/provision.hpp"

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace installer {

// Generates basestrap command for the packages
auto gen_basestrap_command(std::string_view mountpoint, const std::vector<std::string>& packages) noexcept -> std::string;

/// @brief Install packages into the mounted target and generate its fstab.
/// @return true on success.
auto install_base_system(cryptlvm::utils::CommandRunner& runner, std::string_view mountpoint, const std::vector<std::string>& packages) noexcept -> bool;

// Layout of the finished installation
auto completion_summary(const cryptlvm::BootReport& report) noexcept -> std::string;

// How to get back into or tear down a half provisioned target
auto recovery_instructions(const cryptlvm::InstallConfig& config) noexcept -> std::string;

}  // namespace installer

#endif  // SYSTEM_INSTALL_HPP
