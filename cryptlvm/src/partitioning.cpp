#include "cryptlvm/partitioning.hpp"

#include <algorithm>  // for find_if
#include <thread>     // for sleep_for

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace cryptlvm::disk {

auto plan_partitions(BootTopology topology, const SizeSpec& boot_size) noexcept -> PartitionLayout {
    if (topology == BootTopology::EncryptedBoot) {
        return {
            PartitionDescriptor{.index = 1, .fs_hint = "btrfs", .role = PartitionRole::Lvm, .boot_flag = true, .lvm_flag = true, .start = "0%", .end = "100%"},
        };
    }
    return {
        PartitionDescriptor{.index = 1, .fs_hint = "fat32", .role = PartitionRole::Boot, .boot_flag = true, .lvm_flag = false, .start = "0%", .end = boot_size.value},
        PartitionDescriptor{.index = 2, .fs_hint = "ext4", .role = PartitionRole::Lvm, .boot_flag = false, .lvm_flag = true, .start = boot_size.value, .end = "100%"},
    };
}

auto lvm_partition_index(const PartitionLayout& layout) noexcept -> std::optional<std::uint32_t> {
    const auto& it = std::ranges::find_if(layout, [](auto&& part) { return part.role == PartitionRole::Lvm; });
    if (it == layout.end()) {
        return std::nullopt;
    }
    return it->index;
}

auto gen_parted_commands(const DeviceSpec& device, const PartitionLayout& layout) noexcept -> std::vector<std::string> {
    std::vector<std::string> commands{};
    commands.emplace_back(fmt::format(FMT_COMPILE("parted -s '{}' mklabel {}"), device.path, kPartitionTable));

    for (const auto& part : layout) {
        commands.emplace_back(fmt::format(FMT_COMPILE("parted -s -a optimal '{}' mkpart primary {} {} {}"), device.path, part.fs_hint, part.start, part.end));
        if (part.boot_flag) {
            commands.emplace_back(fmt::format(FMT_COMPILE("parted -s '{}' set {} boot on"), device.path, part.index));
        }
        if (part.lvm_flag) {
            commands.emplace_back(fmt::format(FMT_COMPILE("parted -s '{}' set {} lvm on"), device.path, part.index));
        }
    }
    return commands;
}

auto check_alignment(utils::CommandRunner& runner, const DeviceSpec& device, const PartitionLayout& layout) noexcept -> std::expected<void, std::string> {
    for (const auto& part : layout) {
        const auto& cmd = fmt::format(FMT_COMPILE("parted -s '{}' align-check optimal {}"), device.path, part.index);
        if (!runner.run(cmd)) {
            return std::unexpected(fmt::format(FMT_COMPILE("Partition {} is not optimally aligned"), partition_path(device, part.index)));
        }
        spdlog::info("Partition {} is optimally aligned", partition_path(device, part.index));
    }
    return {};
}

auto settle_partitions(utils::CommandRunner& runner, const DeviceSpec& device, const PartitionLayout& layout, std::uint32_t attempts, std::chrono::milliseconds interval) noexcept -> std::expected<void, std::string> {
    if (!runner.run(fmt::format(FMT_COMPILE("partprobe '{}'"), device.path))) {
        spdlog::warn("partprobe failed on {}", device.path);
    }
    if (!runner.run("sync"sv)) {
        return std::unexpected("Failed to flush the partition table to disk");
    }
    if (!runner.run("udevadm settle"sv)) {
        spdlog::warn("udevadm settle failed");
    }

    for (const auto& part : layout) {
        const auto& part_path = partition_path(device, part.index);
        const auto& probe_cmd = fmt::format(FMT_COMPILE("test -b '{}'"), part_path);

        bool appeared{};
        for (std::uint32_t attempt = 0; attempt < attempts; ++attempt) {
            if (runner.run(probe_cmd)) {
                appeared = true;
                break;
            }
            std::this_thread::sleep_for(interval);
        }
        if (!appeared) {
            return std::unexpected(fmt::format(FMT_COMPILE("Partition {} did not appear"), part_path));
        }
    }
    return {};
}

auto apply_partition_layout(utils::CommandRunner& runner, const DeviceSpec& device, const PartitionLayout& layout, std::uint32_t attempts, std::chrono::milliseconds interval) noexcept -> std::expected<void, std::string> {
    spdlog::info("Creating {} partition table on {}", kPartitionTable, device.path);
    for (const auto& cmd : gen_parted_commands(device, layout)) {
        if (!runner.run(cmd)) {
            return std::unexpected(fmt::format(FMT_COMPILE("Partitioning command failed: {}"), cmd));
        }
    }

    if (auto aligned = check_alignment(runner, device, layout); !aligned) {
        return aligned;
    }
    return settle_partitions(runner, device, layout, attempts, interval);
}

}  // namespace cryptlvm::disk
