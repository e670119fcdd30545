#include "system_install.hpp"

#include "cryptlvm/device.hpp"
#include "cryptlvm/file_utils.hpp"
#include "cryptlvm/io_utils.hpp"
#include "cryptlvm/luks.hpp"
#include "cryptlvm/partitioning.hpp"
#include "cryptlvm/string_utils.hpp"

#include <algorithm>  // for find_if

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

auto volume_size(const cryptlvm::lvm::VolumeSet& volumes, std::string_view name) noexcept -> std::string {
    const auto& it = std::ranges::find_if(volumes, [name](auto&& volume) { return volume.name == name; });
    if (it == volumes.end()) {
        return {};
    }
    return it->size ? it->size->value : std::string{"remaining space"};
}

}  // namespace

namespace installer {

auto gen_basestrap_command(std::string_view mountpoint, const std::vector<std::string>& packages) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("basestrap '{}' {}"), mountpoint, cryptlvm::utils::join(packages, ' '));
}

auto install_base_system(cryptlvm::utils::CommandRunner& runner, std::string_view mountpoint, const std::vector<std::string>& packages) noexcept -> bool {
    spdlog::info("Installing base system into {}", mountpoint);
    if (!runner.run(gen_basestrap_command(mountpoint, packages))) {
        spdlog::error("Failed to install base system into {}", mountpoint);
        return false;
    }

    // nothing is mounted to generate entries from
    if (cryptlvm::utils::is_dry_run()) {
        spdlog::info("[DRY RUN] skipping fstab generation for {}", mountpoint);
        return true;
    }

    const auto& fstab_content = runner.capture(fmt::format(FMT_COMPILE("fstabgen -U '{}'"), mountpoint));
    if (fstab_content.empty()) {
        spdlog::error("fstabgen produced no entries for {}", mountpoint);
        return false;
    }

    const auto& fstab_path = fmt::format(FMT_COMPILE("{}/etc/fstab"), mountpoint);
    if (!cryptlvm::file_utils::create_file_for_overwrite(fstab_path, fmt::format(FMT_COMPILE("{}\n"), fstab_content))) {
        spdlog::error("Failed to write {}", fstab_path);
        return false;
    }
    spdlog::info("Created fstab file:\n{}", fstab_content);
    return true;
}

auto completion_summary(const cryptlvm::BootReport& report) noexcept -> std::string {
    const auto& state         = report.state;
    const auto& config        = state.config;
    const bool encrypted_boot = (config.topology == cryptlvm::BootTopology::EncryptedBoot);
    const auto& crypto_params = cryptlvm::crypto::kEncryptionParams;

    std::string boot_info{};
    if (encrypted_boot) {
        boot_info = fmt::format(FMT_COMPILE("{} ({}) - FAT32 (encrypted, inside LVM)"), cryptlvm::kBootVolume, volume_size(state.volumes, cryptlvm::kBootVolume));
    } else {
        boot_info = fmt::format(FMT_COMPILE("{} ({}) - FAT32 (unencrypted partition)"), state.boot_device, config.boot_size.value);
    }

    std::vector<std::string> lines{};
    lines.push_back(fmt::format(FMT_COMPILE("Disk: {}"), config.device.path));
    lines.push_back(fmt::format(FMT_COMPILE("Encryption: LUKS1 with {} on {}"), crypto_params.cipher, state.crypt_partition));
    lines.push_back(fmt::format(FMT_COMPILE("LVM Volume Group: {}"), cryptlvm::kVolumeGroup));
    lines.push_back("Volumes:"s);
    lines.push_back(fmt::format(FMT_COMPILE("  - Boot: {}"), boot_info));
    lines.push_back(fmt::format(FMT_COMPILE("  - {} ({})"), cryptlvm::kSwapVolume, volume_size(state.volumes, cryptlvm::kSwapVolume)));
    lines.push_back(fmt::format(FMT_COMPILE("  - {} ({}) - BTRFS"), cryptlvm::kRootVolume, volume_size(state.volumes, cryptlvm::kRootVolume)));
    lines.push_back(fmt::format(FMT_COMPILE("Bootloader: GRUB ({})"), cryptlvm::firmware_name(report.firmware)));
    lines.push_back(fmt::format(FMT_COMPILE("Kernel command line: {}"), report.kernel_cmdline));
    if (!encrypted_boot) {
        lines.push_back("Note: the boot partition is unencrypted, root and swap are fully encrypted."s);
    }
    return cryptlvm::utils::join(lines) + '\n';
}

auto recovery_instructions(const cryptlvm::InstallConfig& config) noexcept -> std::string {
    const auto& layout     = cryptlvm::disk::plan_partitions(config.topology, config.boot_size);
    const auto& lvm_index  = cryptlvm::disk::lvm_partition_index(layout);
    const auto& crypt_part = cryptlvm::disk::partition_path(config.device, lvm_index.value_or(1));
    const auto& mountpoint = config.mountpoint;

    std::vector<std::string> lines{};
    lines.push_back("To get back into the target:"s);
    lines.push_back(fmt::format(FMT_COMPILE("  cryptsetup open --type luks1 {} {}"), crypt_part, cryptlvm::kMappedName));
    lines.push_back(fmt::format(FMT_COMPILE("  vgchange -ay {}"), cryptlvm::kVolumeGroup));
    lines.push_back(fmt::format(FMT_COMPILE("  mount {} {}"), cryptlvm::disk::lv_path(cryptlvm::kVolumeGroup, cryptlvm::kRootVolume), mountpoint));
    if (config.topology == cryptlvm::BootTopology::EncryptedBoot) {
        lines.push_back(fmt::format(FMT_COMPILE("  mount {} {}/boot"), cryptlvm::disk::lv_path(cryptlvm::kVolumeGroup, cryptlvm::kBootVolume), mountpoint));
    } else {
        lines.push_back(fmt::format(FMT_COMPILE("  mount {} {}/boot"), cryptlvm::disk::partition_path(config.device, 1), mountpoint));
    }
    lines.push_back(fmt::format(FMT_COMPILE("  artix-chroot {}"), mountpoint));
    lines.push_back(""s);
    lines.push_back("To unmount and close everything:"s);
    lines.push_back(fmt::format(FMT_COMPILE("  umount -R {}"), mountpoint));
    lines.push_back("  swapoff -a"s);
    lines.push_back(fmt::format(FMT_COMPILE("  vgchange -an {}"), cryptlvm::kVolumeGroup));
    lines.push_back(fmt::format(FMT_COMPILE("  cryptsetup close {}"), cryptlvm::kMappedName));
    lines.push_back("  sync"s);
    return cryptlvm::utils::join(lines) + '\n';
}

}  // namespace installer
