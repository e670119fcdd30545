#include "installer_config.hpp"

#include "cryptlvm/file_utils.hpp"

#include <expected>      // for expected, unexpected
#include <filesystem>    // for exists
#include <string_view>   // for string_view
#include <system_error>  // for error_code
#include <utility>       // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace installer {

auto boot_topology_from_string(std::string_view topology_str) noexcept
    -> std::optional<cryptlvm::BootTopology> {
    if (topology_str == "encrypted"sv) {
        return cryptlvm::BootTopology::EncryptedBoot;
    }
    if (topology_str == "unencrypted"sv) {
        return cryptlvm::BootTopology::UnencryptedBoot;
    }
    return std::nullopt;
}

auto firmware_choice_from_string(std::string_view firmware_str) noexcept
    -> std::optional<FirmwareChoice> {
    if (firmware_str == "auto"sv) {
        return FirmwareChoice::Auto;
    }
    if (firmware_str == "uefi"sv) {
        return FirmwareChoice::Uefi;
    }
    if (firmware_str == "bios"sv) {
        return FirmwareChoice::Bios;
    }
    return std::nullopt;
}

auto default_packages() noexcept -> std::vector<std::string> {
    return {"base", "base-devel", "linux", "linux-headers", "grub", "efibootmgr",
        "networkmanager", "networkmanager-runit", "elogind-runit", "elogind",
        "cryptsetup", "lvm2", "mkinitcpio", "vim", "glibc"};
}

auto get_default_config() noexcept -> InstallerConfig {
    return InstallerConfig{
        .headless_mode = false,
        .secure_erase  = false,
        .firmware      = FirmwareChoice::Auto,
        .mountpoint    = std::string{cryptlvm::kDefaultMountpoint},
        .packages      = default_packages(),
    };
}

auto parse_installer_config(std::string_view json_content) noexcept
    -> std::expected<InstallerConfig, std::string> {
    if (json_content.empty()) {
        return get_default_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_config();

    // Parse headless_mode (optional, default false)
    if (doc.HasMember("headless_mode")) {
        if (!doc["headless_mode"].IsBool()) {
            return std::unexpected("'headless_mode' must be a boolean");
        }
        config.headless_mode = doc["headless_mode"].GetBool();
    }

    // Parse device (optional, but required in headless mode)
    if (doc.HasMember("device")) {
        if (!doc["device"].IsString()) {
            return std::unexpected("'device' must be a string");
        }
        config.device = doc["device"].GetString();
    }

    // Parse boot_topology (optional, but required in headless mode)
    if (doc.HasMember("boot_topology")) {
        if (!doc["boot_topology"].IsString()) {
            return std::unexpected("'boot_topology' must be a string");
        }
        const auto& topology_str = std::string_view{doc["boot_topology"].GetString()};
        auto topology            = boot_topology_from_string(topology_str);
        if (!topology) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid boot topology '{}'. Valid values: encrypted, unencrypted"), topology_str));
        }
        config.boot_topology = *topology;
    }

    // Parse boot_size (optional, but required in headless mode)
    if (doc.HasMember("boot_size")) {
        if (!doc["boot_size"].IsString()) {
            return std::unexpected("'boot_size' must be a string");
        }
        config.boot_size = doc["boot_size"].GetString();
    }

    // Parse swap_size (optional, but required in headless mode)
    if (doc.HasMember("swap_size")) {
        if (!doc["swap_size"].IsString()) {
            return std::unexpected("'swap_size' must be a string");
        }
        config.swap_size = doc["swap_size"].GetString();
    }

    // Parse secure_erase (optional, default false)
    if (doc.HasMember("secure_erase")) {
        if (!doc["secure_erase"].IsBool()) {
            return std::unexpected("'secure_erase' must be a boolean");
        }
        config.secure_erase = doc["secure_erase"].GetBool();
    }

    // Parse passphrase (optional, but required in headless mode)
    if (doc.HasMember("passphrase")) {
        if (!doc["passphrase"].IsString()) {
            return std::unexpected("'passphrase' must be a string");
        }
        config.passphrase = doc["passphrase"].GetString();
    }

    // Parse firmware (optional, default auto)
    if (doc.HasMember("firmware")) {
        if (!doc["firmware"].IsString()) {
            return std::unexpected("'firmware' must be a string");
        }
        const auto& firmware_str = std::string_view{doc["firmware"].GetString()};
        auto firmware            = firmware_choice_from_string(firmware_str);
        if (!firmware) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid firmware '{}'. Valid values: auto, uefi, bios"), firmware_str));
        }
        config.firmware = *firmware;
    }

    // Parse mountpoint (optional, default /mnt)
    if (doc.HasMember("mountpoint")) {
        if (!doc["mountpoint"].IsString()) {
            return std::unexpected("'mountpoint' must be a string");
        }
        config.mountpoint = doc["mountpoint"].GetString();
        if (config.mountpoint.empty() || config.mountpoint.front() != '/') {
            return std::unexpected("'mountpoint' must be an absolute path");
        }
    }

    // Parse packages (optional, default base package list)
    if (doc.HasMember("packages")) {
        if (!doc["packages"].IsArray()) {
            return std::unexpected("'packages' must be an array");
        }

        std::vector<std::string> packages{};
        for (const auto& package_value : doc["packages"].GetArray()) {
            if (!package_value.IsString()) {
                return std::unexpected("Each package must be a string");
            }
            packages.emplace_back(package_value.GetString());
        }
        if (packages.empty()) {
            return std::unexpected("'packages' must not be empty");
        }
        config.packages = std::move(packages);
    }

    return config;
}

auto load_installer_config(std::string_view file_path) noexcept
    -> std::expected<InstallerConfig, std::string> {
    std::error_code err{};
    if (!fs::exists(file_path, err)) {
        return get_default_config();
    }

    const auto& file_content = cryptlvm::file_utils::read_whole_file(file_path);
    if (file_content.empty()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to read '{}'"), file_path));
    }
    return parse_installer_config(file_content);
}

auto validate_headless_config(const InstallerConfig& config) noexcept
    -> std::expected<void, std::string> {
    if (!config.headless_mode) {
        return {};
    }

    std::string missing_fields;
    if (!config.device) {
        missing_fields += "'device', ";
    }
    if (!config.boot_topology) {
        missing_fields += "'boot_topology', ";
    }
    if (!config.boot_size) {
        missing_fields += "'boot_size', ";
    }
    if (!config.swap_size) {
        missing_fields += "'swap_size', ";
    }
    if (!config.passphrase || config.passphrase->empty()) {
        missing_fields += "'passphrase', ";
    }

    if (!missing_fields.empty()) {
        missing_fields.resize(missing_fields.size() - 2);
        return std::unexpected(fmt::format(FMT_COMPILE("HEADLESS mode requires: {}"), missing_fields));
    }

    return {};
}

}  // namespace installer
