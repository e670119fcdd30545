#include "cryptlvm/bootloader.hpp"
#include "cryptlvm/file_utils.hpp"
#include "cryptlvm/io_utils.hpp"
#include "cryptlvm/mount_partitions.hpp"
#include "cryptlvm/string_utils.hpp"

#include <cstddef>  // for size_t

#include <array>       // for array
#include <filesystem>  // for exists

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

using namespace std::string_view_literals;

namespace {

// NOLINTNEXTLINE
static constexpr auto GRUB_DEFAULT_CONFIG = R"(# GRUB boot loader configuration

GRUB_DEFAULT=0
GRUB_TIMEOUT=5
GRUB_DISTRIBUTOR="Artix"
GRUB_CMDLINE_LINUX_DEFAULT="loglevel=3 quiet"
GRUB_CMDLINE_LINUX=""

# Preload both GPT and MBR modules so that they are not missed
GRUB_PRELOAD_MODULES="part_gpt part_msdos"

# Uncomment to enable booting from LUKS encrypted devices
#GRUB_ENABLE_CRYPTODISK=y

# Set to 'countdown' or 'hidden' to change timeout behavior,
# press ESC key to display menu.
GRUB_TIMEOUT_STYLE=menu

# Uncomment to use basic console
GRUB_TERMINAL_INPUT=console

# Uncomment to disable graphical terminal
#GRUB_TERMINAL_OUTPUT=console

# The resolution used on graphical terminal
# note that you can use only modes which your graphic card supports via VBE
# you can see them in real GRUB with the command `videoinfo'
GRUB_GFXMODE=auto

# Uncomment to allow the kernel use the same resolution used by grub
GRUB_GFXPAYLOAD_LINUX=keep

# Uncomment to disable generation of recovery mode menu entries
GRUB_DISABLE_RECOVERY=true
)"sv;

// indices into the seen flags
enum : std::size_t {
    cmdline_idx = 0,
    preload_idx,
    cryptodisk_idx,
    managed_count,
};

using SeenFlags = std::array<bool, managed_count>;

constexpr auto kCmdlineKey    = "GRUB_CMDLINE_LINUX_DEFAULT="sv;
constexpr auto kPreloadKey    = "GRUB_PRELOAD_MODULES="sv;
constexpr auto kCryptodiskKey = "GRUB_ENABLE_CRYPTODISK="sv;

auto parse_grub_line(const cryptlvm::bootloader::GrubSettings& settings, SeenFlags& seen, std::string_view line) noexcept -> std::string {
    using cryptlvm::bootloader::escape_config_value;

    auto setting = line;
    if (setting.starts_with("#GRUB_")) {
        // uncomment grub setting
        setting.remove_prefix(1);
    }

    if (setting.starts_with(kCmdlineKey)) {
        seen[cmdline_idx] = true;
        return fmt::format(FMT_COMPILE("{}\"{}\""), kCmdlineKey, escape_config_value(settings.cmdline_linux_default));
    }
    if (setting.starts_with(kPreloadKey)) {
        seen[preload_idx] = true;
        return fmt::format(FMT_COMPILE("{}\"{}\""), kPreloadKey, escape_config_value(settings.preload_modules));
    }
    if (setting.starts_with(kCryptodiskKey)) {
        seen[cryptodisk_idx] = true;
        return fmt::format(FMT_COMPILE("{}{}y"), settings.enable_cryptodisk ? ""sv : "#"sv, kCryptodiskKey);
    }
    return std::string{line.data(), line.size()};
}

}  // namespace

namespace cryptlvm::bootloader {

auto make_grub_settings(const std::vector<std::string>& kernel_params, BootTopology topology) noexcept -> GrubSettings {
    const bool is_encrypted_boot = (topology == BootTopology::EncryptedBoot);
    return GrubSettings{
        .cmdline_linux_default = utils::join(kernel_params, ' '),
        .preload_modules       = is_encrypted_boot ? "part_gpt part_msdos cryptodisk" : "part_gpt part_msdos",
        .enable_cryptodisk     = is_encrypted_boot,
    };
}

auto escape_config_value(std::string_view value) noexcept -> std::string {
    std::string result{};
    result.reserve(value.size());
    for (const char ch : value) {
        if (ch == '\\' || ch == '"' || ch == '$' || ch == '`') {
            result += '\\';
        }
        result += ch;
    }
    return result;
}

auto gen_grub_config(std::string_view current_config, const GrubSettings& settings) noexcept -> std::string {
    if (current_config.ends_with('\n')) {
        current_config.remove_suffix(1);
    }

    SeenFlags seen{};
    std::string result = current_config | ranges::views::split('\n')
        | ranges::views::transform([&](auto&& rng) {
              const auto line_size = static_cast<size_t>(ranges::distance(rng));
              auto&& line          = (line_size == 0) ? std::string_view{} : std::string_view(&*rng.begin(), line_size);
              return parse_grub_line(settings, seen, line);
          })
        | ranges::views::join('\n')
        | ranges::to<std::string>();
    result += '\n';

    // settings missing from the file
    if (!seen[cmdline_idx]) {
        result += fmt::format(FMT_COMPILE("{}\"{}\"\n"), kCmdlineKey, escape_config_value(settings.cmdline_linux_default));
    }
    if (!seen[preload_idx]) {
        result += fmt::format(FMT_COMPILE("{}\"{}\"\n"), kPreloadKey, escape_config_value(settings.preload_modules));
    }
    if (!seen[cryptodisk_idx]) {
        result += fmt::format(FMT_COMPILE("{}{}y\n"), settings.enable_cryptodisk ? ""sv : "#"sv, kCryptodiskKey);
    }
    return result;
}

auto default_grub_config() noexcept -> std::string_view {
    return GRUB_DEFAULT_CONFIG;
}

auto write_grub_config(const GrubSettings& settings, std::string_view root_mountpoint) noexcept -> bool {
    const auto& grub_config_path = fmt::format(FMT_COMPILE("{}/etc/default/grub"), root_mountpoint);

    std::error_code err{};
    std::string current_config{};
    const bool dry_run = utils::is_dry_run();
    if (std::filesystem::exists(grub_config_path, err)) {
        if (!dry_run && !file_utils::backup_file(grub_config_path)) {
            spdlog::error("Failed to backup {}", grub_config_path);
            return false;
        }
        current_config = file_utils::read_whole_file(grub_config_path);
    } else {
        spdlog::warn("{} does not exist, generating it from defaults", grub_config_path);
        current_config = std::string{GRUB_DEFAULT_CONFIG};
    }

    const auto& grub_config_content = bootloader::gen_grub_config(current_config, settings);
    if (dry_run) {
        spdlog::info("[DRY RUN] would write {}:\n{}", grub_config_path, grub_config_content);
        return true;
    }
    if (!file_utils::create_file_for_overwrite(grub_config_path, grub_config_content)) {
        spdlog::error("Failed to open grub config for writing {}", grub_config_path);
        return false;
    }
    return true;
}

auto detect_firmware_mode(std::string_view efi_marker) noexcept -> FirmwareMode {
    std::error_code err{};
    if (std::filesystem::exists(efi_marker, err)) {
        spdlog::info("Found {}, system is booted in UEFI mode", efi_marker);
        return FirmwareMode::Uefi;
    }
    spdlog::warn("{} is missing, assuming legacy BIOS mode", efi_marker);
    return FirmwareMode::Legacy;
}

auto gen_grub_install_command(FirmwareMode firmware, std::string_view device) noexcept -> std::string {
    if (firmware == FirmwareMode::Uefi) {
        return fmt::format(FMT_COMPILE("grub-install --target=x86_64-efi --efi-directory=/boot --bootloader-id={} --recheck"), kBootloaderId);
    }
    return fmt::format(FMT_COMPILE("grub-install --target=i386-pc --boot-directory=/boot --bootloader-id={} --recheck '{}'"), kBootloaderId, device);
}

auto install_grub(utils::CommandRunner& runner, FirmwareMode firmware, std::string_view device, std::string_view root_mountpoint) noexcept -> std::expected<void, std::string> {
    if (firmware == FirmwareMode::Uefi) {
        const auto& boot_dir = fmt::format(FMT_COMPILE("{}/boot"), root_mountpoint);
        if (!mount::is_mountpoint(runner, boot_dir)) {
            return std::unexpected("/boot is not mounted. Please mount your EFI system partition to /boot");
        }
    }

    // Install grub on the system
    const auto& grub_install_cmd = bootloader::gen_grub_install_command(firmware, device);
    if (!utils::chroot_checked(runner, root_mountpoint, grub_install_cmd)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to install grub on path {} with: {}"), root_mountpoint, grub_install_cmd));
    }

    // Generate grub configuration on the boot partition
    static constexpr auto grub_config_cmd = "grub-mkconfig -o /boot/grub/grub.cfg"sv;
    if (!utils::chroot_checked(runner, root_mountpoint, grub_config_cmd)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to generate grub on path {} with: {}"), root_mountpoint, grub_config_cmd));
    }
    return {};
}

}  // namespace cryptlvm::bootloader
