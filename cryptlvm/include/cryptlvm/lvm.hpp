#ifndef LVM_HPP
#define LVM_HPP

#include "cryptlvm/command_runner.hpp"
#include "cryptlvm/install_config.hpp"
#include "cryptlvm/size_spec.hpp"

#include <cstdint>  // for uint64_t

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptlvm::lvm {

struct LogicalVolume final {
    std::string name{};
    // nullopt claims 100% of the remaining free extents
    std::optional<disk::SizeSpec> size{};

    constexpr bool operator==(const LogicalVolume&) const = default;
};

// Ordered by allocation, the last volume takes the rest
using VolumeSet = std::vector<LogicalVolume>;

/// @brief Plan logical volumes for the boot topology.
/// @return volBoot (encrypted boot only), volSwap, volRoot.
auto plan_volumes(BootTopology topology, const disk::SizeSpec& boot_size, const disk::SizeSpec& swap_size) noexcept -> VolumeSet;

// Initializes physical volume on device and creates volume group on top of it
auto create_volume_group(utils::CommandRunner& runner, std::string_view pv_device, std::string_view volume_group) noexcept -> bool;

// Free space of volume group in bytes
auto query_vg_free(utils::CommandRunner& runner, std::string_view volume_group) noexcept -> std::optional<std::uint64_t>;

// Fails if fixed size volumes leave nothing for the last volume
auto check_allocation(const VolumeSet& volumes, std::uint64_t available) noexcept -> std::expected<void, std::string>;

auto gen_lvcreate_command(std::string_view volume_group, const LogicalVolume& volume) noexcept -> std::string;

// Creates contiguous logical volumes in order
auto allocate_volumes(utils::CommandRunner& runner, std::string_view volume_group, const VolumeSet& volumes) noexcept -> std::expected<void, std::string>;

}  // namespace cryptlvm::lvm

#endif  // LVM_HPP
