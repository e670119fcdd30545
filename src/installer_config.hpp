#ifndef INSTALLER_CONFIG_HPP
#define INSTALLER_CONFIG_HPP

#include "cryptlvm/install_config.hpp"

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace installer {

/// Firmware selection from settings.json.
enum class FirmwareChoice : std::uint8_t {
    Auto,
    Uefi,
    Bios
};

/// Converts a string to BootTopology.
/// @param topology_str Either "encrypted" or "unencrypted".
/// @return The BootTopology or std::nullopt if invalid.
[[nodiscard]] auto boot_topology_from_string(std::string_view topology_str) noexcept
    -> std::optional<cryptlvm::BootTopology>;

/// Converts a string to FirmwareChoice.
[[nodiscard]] auto firmware_choice_from_string(std::string_view firmware_str) noexcept
    -> std::optional<FirmwareChoice>;

/// Packages installed into the target when settings.json names none.
[[nodiscard]] auto default_packages() noexcept -> std::vector<std::string>;

/// Main installer configuration.
struct InstallerConfig {
    bool headless_mode{false};

    // Target disk
    std::optional<std::string> device{};
    std::optional<cryptlvm::BootTopology> boot_topology{};
    std::optional<std::string> boot_size{};
    std::optional<std::string> swap_size{};
    bool secure_erase{false};

    // Encryption
    std::optional<std::string> passphrase{};

    // Boot
    FirmwareChoice firmware{FirmwareChoice::Auto};

    std::string mountpoint{cryptlvm::kDefaultMountpoint};
    std::vector<std::string> packages{};
};

/// Parses installer configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return InstallerConfig on success, or error string on failure.
[[nodiscard]] auto parse_installer_config(std::string_view json_content) noexcept
    -> std::expected<InstallerConfig, std::string>;

/// Loads and parses installer configuration from a file.
/// A missing file yields the default configuration.
[[nodiscard]] auto load_installer_config(std::string_view file_path) noexcept
    -> std::expected<InstallerConfig, std::string>;

/// Validates that all required fields are present for headless mode.
/// @param config The configuration to validate.
/// @return void on success, or error string describing missing fields.
[[nodiscard]] auto validate_headless_config(const InstallerConfig& config) noexcept
    -> std::expected<void, std::string>;

/// Returns default InstallerConfig with sensible defaults.
[[nodiscard]] auto get_default_config() noexcept -> InstallerConfig;

}  // namespace installer

#endif  // INSTALLER_CONFIG_HPP
