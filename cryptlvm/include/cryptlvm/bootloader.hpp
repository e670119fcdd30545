#ifndef BOOTLOADER_HPP
#define BOOTLOADER_HPP

#include "cryptlvm/command_runner.hpp"
#include "cryptlvm/install_config.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptlvm::bootloader {

// Settings of /etc/default/grub owned by the installer
struct GrubSettings final {
    // e.g GRUB_CMDLINE_LINUX_DEFAULT="cryptdevice=... root=UUID=... loglevel=3 quiet"
    std::string cmdline_linux_default{};
    // e.g GRUB_PRELOAD_MODULES="part_gpt part_msdos cryptodisk"
    std::string preload_modules{"part_gpt part_msdos"};
    // GRUB_ENABLE_CRYPTODISK=y or #GRUB_ENABLE_CRYPTODISK=y
    bool enable_cryptodisk{};

    constexpr bool operator==(const GrubSettings&) const = default;
};

// Only encrypted boot needs grub to unlock the container itself
auto make_grub_settings(const std::vector<std::string>& kernel_params, BootTopology topology) noexcept -> GrubSettings;

/// @brief Escape value to be placed between double quotes of a shell-sourced config.
/// Escapes backslash, double quote, dollar and backtick.
auto escape_config_value(std::string_view value) noexcept -> std::string;

/// @brief Rewrite managed settings of existing grub config, keeping every other line.
/// Settings which are not present get appended.
auto gen_grub_config(std::string_view current_config, const GrubSettings& settings) noexcept -> std::string;

// Stock /etc/default/grub used when the target has none
auto default_grub_config() noexcept -> std::string_view;

// Backs up and rewrites <root_mountpoint>/etc/default/grub
auto write_grub_config(const GrubSettings& settings, std::string_view root_mountpoint) noexcept -> bool;

// Probes firmware marker, falls back to legacy if it's missing
auto detect_firmware_mode(std::string_view efi_marker = kEfiMarker) noexcept -> FirmwareMode;

auto gen_grub_install_command(FirmwareMode firmware, std::string_view device) noexcept -> std::string;

/// @brief Installs grub into target and generates grub.cfg.
/// Under UEFI <root_mountpoint>/boot must be a mountpoint.
auto install_grub(utils::CommandRunner& runner, FirmwareMode firmware, std::string_view device, std::string_view root_mountpoint) noexcept -> std::expected<void, std::string>;

}  // namespace cryptlvm::bootloader

#endif  // BOOTLOADER_HPP
