#include "cryptlvm/provision.hpp"
#include "cryptlvm/device.hpp"
#include "cryptlvm/fs_format.hpp"
#include "cryptlvm/fs_utils.hpp"
#include "cryptlvm/initcpio.hpp"
#include "cryptlvm/io_utils.hpp"
#include "cryptlvm/luks.hpp"
#include "cryptlvm/mount_partitions.hpp"
#include "cryptlvm/size_spec.hpp"
#include "cryptlvm/swap.hpp"

#include <algorithm>  // for find_if

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr auto erase_strategy_name(cryptlvm::EraseStrategy strategy) noexcept -> std::string_view {
    return (strategy == cryptlvm::EraseStrategy::Secure) ? "secure (zeros + random keystream)"sv : "quick (head and tail)"sv;
}

// Passphrase must be typed twice, mismatches are rejected
auto request_passphrase(cryptlvm::InputProvider& input) noexcept -> std::optional<std::string> {
    while (true) {
        auto first = input.passphrase("Enter passphrase for the encrypted container"sv);
        if (!first) {
            return std::nullopt;
        }
        if (first->empty()) {
            input.report_invalid_input("Passphrase must not be empty"sv);
            continue;
        }

        auto second = input.passphrase("Verify passphrase"sv);
        if (!second) {
            return std::nullopt;
        }
        if (*first != *second) {
            input.report_invalid_input("Passphrases do not match"sv);
            continue;
        }
        return first;
    }
}

}  // namespace

namespace cryptlvm {

auto collect_install_config(InputProvider& input, utils::CommandRunner& runner, std::string_view mountpoint) noexcept -> std::optional<InstallConfig> {
    const auto& device_listing = runner.capture("lsblk -o NAME,SIZE,TYPE,MOUNTPOINT,MODEL"sv);

    std::optional<disk::DeviceSpec> device{};
    while (!device) {
        const auto& identifier = input.device_identifier(device_listing);
        if (!identifier) {
            return std::nullopt;
        }

        device = disk::make_device_spec(*identifier);
        if (!device) {
            input.report_invalid_input(fmt::format(FMT_COMPILE("'{}' is not a valid device name"), *identifier));
            continue;
        }
        if (!runner.run(fmt::format(FMT_COMPILE("test -b '{}'"), device->path))) {
            input.report_invalid_input(fmt::format(FMT_COMPILE("{} is not a block device"), device->path));
            device.reset();
        }
    }

    const auto& topology = input.boot_topology();
    if (!topology) {
        return std::nullopt;
    }

    InstallConfig config{
        .device     = std::move(*device),
        .topology   = *topology,
        .boot_size  = disk::normalize_size(input.boot_size(), kDefaultBootSize),
        .swap_size  = disk::normalize_size(input.swap_size(), kDefaultSwapSize),
        .erase      = input.erase_strategy(),
        .mountpoint = std::string{mountpoint},
    };

    if (!input.confirm_destruction(describe_install_config(config))) {
        spdlog::info("Operator declined destruction of {}", config.device.path);
        return std::nullopt;
    }
    return config;
}

auto describe_install_config(const InstallConfig& config) noexcept -> std::string {
    const auto& boot_location = (config.topology == BootTopology::EncryptedBoot)
        ? fmt::format(FMT_COMPILE("{}/{} (encrypted)"), kVolumeGroup, kBootVolume)
        : fmt::format(FMT_COMPILE("{} (unencrypted)"), disk::partition_path(config.device, 1));

    return fmt::format(FMT_COMPILE("Device:     {}\n"
                                   "Topology:   {}\n"
                                   "Boot:       {} on {}\n"
                                   "Swap:       {}\n"
                                   "Erase:      {}\n"
                                   "Mountpoint: {}\n"
                                   "\nALL DATA ON {} WILL BE DESTROYED!"),
        config.device.path, topology_name(config.topology), config.boot_size.value, boot_location,
        config.swap_size.value, erase_strategy_name(config.erase), config.mountpoint, config.device.path);
}

auto erase_device_stage(ProvisionContext& ctx, const InstallConfig& config) noexcept -> std::expected<ErasedDevice, std::string> {
    if (utils::is_dry_run()) {
        spdlog::info("[DRY RUN] skipping {} erase of {}", erase_strategy_name(config.erase), config.device.path);
        return ErasedDevice{TargetState{.config = config}};
    }

    spdlog::info("Erasing {} using {} strategy", config.device.path, erase_strategy_name(config.erase));

    auto summary = ctx.eraser(config.device.path, config.erase);
    if (!summary) {
        return std::unexpected(fmt::format(FMT_COMPILE("Erasure of {} failed: {}"), config.device.path, summary.error()));
    }
    if (summary->reached_end) {
        spdlog::warn("Reached end of {} during erasure", config.device.path);
    }
    return ErasedDevice{TargetState{.config = config, .erase_summary = *summary}};
}

auto partition_stage(ProvisionContext& ctx, ErasedDevice&& erased) noexcept -> std::expected<PartitionedDevice, std::string> {
    auto state         = std::move(erased).release();
    const auto& device = state.config.device;

    state.layout = disk::plan_partitions(state.config.topology, state.config.boot_size);
    if (auto applied = disk::apply_partition_layout(ctx.runner, device, state.layout, ctx.settle_attempts, ctx.settle_interval); !applied) {
        return std::unexpected(applied.error());
    }

    const auto& lvm_index = disk::lvm_partition_index(state.layout);
    if (!lvm_index) {
        return std::unexpected("Partition layout has no LVM partition");
    }
    state.crypt_partition = disk::partition_path(device, *lvm_index);
    return PartitionedDevice{std::move(state)};
}

auto encrypt_stage(ProvisionContext& ctx, PartitionedDevice&& partitioned) noexcept -> std::expected<OpenedContainer, std::string> {
    auto state = std::move(partitioned).release();

    crypto::check_cipher_available(ctx.runner, crypto::kEncryptionParams.cipher);
    crypto::log_cipher_benchmark(ctx.runner);

    const auto& luks_pass = request_passphrase(ctx.input);
    if (!luks_pass) {
        return std::unexpected(fmt::format(FMT_COMPILE("Passphrase entry aborted, {} left unformatted"), state.crypt_partition));
    }

    if (!crypto::luks1_format(ctx.runner, *luks_pass, state.crypt_partition)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to create encrypted container on {}"), state.crypt_partition));
    }
    if (!crypto::luks1_open(ctx.runner, *luks_pass, state.crypt_partition, kMappedName)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to open {}. Check the passphrase and run the installer again"), state.crypt_partition));
    }

    state.container_path = disk::mapper_path(kMappedName);
    if (!ctx.runner.run(fmt::format(FMT_COMPILE("test -b '{}'"), state.container_path))) {
        return std::unexpected(fmt::format(FMT_COMPILE("{} does not exist after opening the container"), state.container_path));
    }
    spdlog::info("Encrypted container opened at {}", state.container_path);
    return OpenedContainer{std::move(state)};
}

auto volume_stage(ProvisionContext& ctx, OpenedContainer&& container) noexcept -> std::expected<AllocatedVolumes, std::string> {
    auto state = std::move(container).release();

    if (!lvm::create_volume_group(ctx.runner, state.container_path, kVolumeGroup)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to create volume group {}"), kVolumeGroup));
    }

    state.volumes = lvm::plan_volumes(state.config.topology, state.config.boot_size, state.config.swap_size);
    if (auto allocated = lvm::allocate_volumes(ctx.runner, kVolumeGroup, state.volumes); !allocated) {
        return std::unexpected(allocated.error());
    }
    return AllocatedVolumes{std::move(state)};
}

auto filesystem_stage(ProvisionContext& ctx, AllocatedVolumes&& volumes) noexcept -> std::expected<MountedTree, std::string> {
    auto state = std::move(volumes).release();

    if (state.config.topology == BootTopology::EncryptedBoot) {
        state.boot_device = disk::lv_path(kVolumeGroup, kBootVolume);
    } else {
        const auto& boot_part = std::ranges::find_if(state.layout, [](auto&& part) { return part.role == disk::PartitionRole::Boot; });
        if (boot_part == state.layout.end()) {
            return std::unexpected("Partition layout has no boot partition");
        }
        state.boot_device = disk::partition_path(state.config.device, boot_part->index);
    }
    state.swap_device = disk::lv_path(kVolumeGroup, kSwapVolume);
    state.root_device = disk::lv_path(kVolumeGroup, kRootVolume);

    if (!fs::format_fat32(ctx.runner, state.boot_device, kBootLabel)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to format {}"), state.boot_device));
    }
    if (!swap::make_swap(ctx.runner, state.swap_device, kSwapLabel)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to format {}"), state.swap_device));
    }
    if (!fs::format_btrfs(ctx.runner, state.root_device, kRootLabel)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to format {}"), state.root_device));
    }

    const auto& mountpoint = state.config.mountpoint;
    if (!mount::make_directory(ctx.runner, mountpoint) || !mount::mount_partition(ctx.runner, state.root_device, mountpoint)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to mount {} at {}"), state.root_device, mountpoint));
    }

    const auto& boot_dir = fmt::format(FMT_COMPILE("{}/boot"), mountpoint);
    if (!mount::make_directory(ctx.runner, boot_dir) || !mount::mount_partition(ctx.runner, state.boot_device, boot_dir)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to mount {} at {}"), state.boot_device, boot_dir));
    }

    if (!swap::activate_swap(ctx.runner, state.swap_device)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to activate swap on {}"), state.swap_device));
    }
    spdlog::info("Mounted {} at {} and {} at {}", state.root_device, mountpoint, state.boot_device, boot_dir);
    return MountedTree{std::move(state)};
}

auto resolve_identifiers(ProvisionContext& ctx, const MountedTree& tree) noexcept -> std::expected<fs::IdentifierSet, std::string> {
    const auto& state = tree.state();

    fs::IdentifierSet identifiers{
        .crypt_uuid = fs::utils::get_device_uuid(ctx.runner, state.crypt_partition),
        .root_uuid  = fs::utils::get_device_uuid(ctx.runner, state.root_device),
    };
    if (identifiers.crypt_uuid.empty()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Cannot resolve UUID of {}"), state.crypt_partition));
    }
    if (identifiers.root_uuid.empty()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Cannot resolve UUID of {}"), state.root_device));
    }

    auto swap_uuid = fs::utils::get_device_uuid(ctx.runner, state.swap_device);
    if (swap_uuid.empty()) {
        spdlog::warn("Cannot resolve UUID of {}, resume from hibernation will not be configured", state.swap_device);
    } else {
        identifiers.swap_uuid = std::move(swap_uuid);
    }

    spdlog::info("crypt UUID: {}, root UUID: {}, swap UUID: {}", identifiers.crypt_uuid, identifiers.root_uuid, identifiers.swap_uuid.value_or("<none>"));
    return identifiers;
}

auto boot_stage(ProvisionContext& ctx, const MountedTree& tree, const fs::IdentifierSet& identifiers) noexcept -> std::expected<BootReport, std::string> {
    const auto& state      = tree.state();
    const auto& mountpoint = state.config.mountpoint;

    BootReport report{
        .state          = state,
        .identifiers    = identifiers,
        .kernel_cmdline = fs::gen_kernel_cmdline(identifiers, kMappedName),
        .grub           = bootloader::make_grub_settings(fs::get_kernel_params(identifiers, kMappedName), state.config.topology),
    };
    spdlog::info("Kernel command line: {}", report.kernel_cmdline);

    if (!bootloader::write_grub_config(report.grub, mountpoint)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to write {}/etc/default/grub"), mountpoint));
    }
    if (!initcpio::setup_encrypt_hooks(ctx.runner, mountpoint)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to configure {}/etc/mkinitcpio.conf"), mountpoint));
    }

    report.firmware = ctx.input.firmware_mode(bootloader::detect_firmware_mode(ctx.efi_marker));
    spdlog::info("Installing grub for {}", firmware_name(report.firmware));
    if (auto installed = bootloader::install_grub(ctx.runner, report.firmware, state.config.device.path, mountpoint); !installed) {
        return std::unexpected(installed.error());
    }
    return report;
}

auto run_provisioning(ProvisionContext& ctx, const InstallConfig& config) noexcept -> std::expected<BootReport, std::string> {
    auto erased = erase_device_stage(ctx, config);
    if (!erased) {
        return std::unexpected(erased.error());
    }
    auto partitioned = partition_stage(ctx, std::move(*erased));
    if (!partitioned) {
        return std::unexpected(partitioned.error());
    }
    auto container = encrypt_stage(ctx, std::move(*partitioned));
    if (!container) {
        return std::unexpected(container.error());
    }
    auto volumes = volume_stage(ctx, std::move(*container));
    if (!volumes) {
        return std::unexpected(volumes.error());
    }
    const auto& tree = filesystem_stage(ctx, std::move(*volumes));
    if (!tree) {
        return std::unexpected(tree.error());
    }

    if (ctx.install_base_system) {
        spdlog::info("Installing base system into {}", config.mountpoint);
        if (!ctx.install_base_system(config.mountpoint)) {
            return std::unexpected("Failed to install base system");
        }
    } else {
        spdlog::warn("No base system installer configured, skipping package installation");
    }

    const auto& identifiers = resolve_identifiers(ctx, *tree);
    if (!identifiers) {
        return std::unexpected(identifiers.error());
    }
    return boot_stage(ctx, *tree, *identifiers);
}

}  // namespace cryptlvm
