#ifndef PARTITIONING_HPP
#define PARTITIONING_HPP

#include "cryptlvm/command_runner.hpp"
#include "cryptlvm/device.hpp"
#include "cryptlvm/install_config.hpp"
#include "cryptlvm/size_spec.hpp"

#include <cstdint>  // for uint8_t, uint32_t

#include <chrono>       // for milliseconds
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptlvm::disk {

enum class PartitionRole : std::uint8_t {
    // plain FAT32 /boot
    Boot,
    // holds the encrypted container
    Lvm,
};

struct PartitionDescriptor final {
    std::uint32_t index{};
    // e.g fat32
    std::string fs_hint{};
    PartitionRole role{PartitionRole::Lvm};
    bool boot_flag{};
    bool lvm_flag{};
    // parted positions, e.g 0%, 1G, 100%
    std::string start{};
    std::string end{};

    constexpr bool operator==(const PartitionDescriptor&) const = default;
};

using PartitionLayout = std::vector<PartitionDescriptor>;

/// @brief Plan partition layout for the boot topology.
/// @param topology The boot topology.
/// @param boot_size Size of the plain boot partition, ignored for encrypted boot.
/// @return Partitions ordered by index.
auto plan_partitions(BootTopology topology, const SizeSpec& boot_size) noexcept -> PartitionLayout;

// Index of the partition holding the encrypted container
auto lvm_partition_index(const PartitionLayout& layout) noexcept -> std::optional<std::uint32_t>;

// Generates parted commands creating the layout on device
auto gen_parted_commands(const DeviceSpec& device, const PartitionLayout& layout) noexcept -> std::vector<std::string>;

// Verifies that every partition of layout is optimally aligned
auto check_alignment(utils::CommandRunner& runner, const DeviceSpec& device, const PartitionLayout& layout) noexcept -> std::expected<void, std::string>;

/// @brief Ask the kernel to re-read the partition table and wait for partition nodes.
/// @param attempts How many times each node is probed.
/// @param interval Delay between probes.
auto settle_partitions(utils::CommandRunner& runner, const DeviceSpec& device, const PartitionLayout& layout, std::uint32_t attempts, std::chrono::milliseconds interval) noexcept -> std::expected<void, std::string>;

// Writes partition table, creates partitions and waits until they appear
auto apply_partition_layout(utils::CommandRunner& runner, const DeviceSpec& device, const PartitionLayout& layout, std::uint32_t attempts, std::chrono::milliseconds interval) noexcept -> std::expected<void, std::string>;

}  // namespace cryptlvm::disk

#endif  // PARTITIONING_HPP
