#include "cryptlvm/lvm.hpp"
#include "cryptlvm/io_utils.hpp"
#include "cryptlvm/string_utils.hpp"

#include <charconv>      // for from_chars
#include <limits>        // for numeric_limits
#include <system_error>  // for errc

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace cryptlvm::lvm {

auto plan_volumes(BootTopology topology, const disk::SizeSpec& boot_size, const disk::SizeSpec& swap_size) noexcept -> VolumeSet {
    VolumeSet volumes{};
    if (topology == BootTopology::EncryptedBoot) {
        volumes.emplace_back(LogicalVolume{.name = std::string{kBootVolume}, .size = boot_size});
    }
    volumes.emplace_back(LogicalVolume{.name = std::string{kSwapVolume}, .size = swap_size});
    volumes.emplace_back(LogicalVolume{.name = std::string{kRootVolume}, .size = std::nullopt});
    return volumes;
}

auto create_volume_group(utils::CommandRunner& runner, std::string_view pv_device, std::string_view volume_group) noexcept -> bool {
    if (!runner.run(fmt::format(FMT_COMPILE("pvcreate '{}'"), pv_device))) {
        spdlog::error("Failed to create physical volume on {}", pv_device);
        return false;
    }
    if (!runner.run(fmt::format(FMT_COMPILE("vgcreate {} '{}'"), volume_group, pv_device))) {
        spdlog::error("Failed to create volume group {} on {}", volume_group, pv_device);
        return false;
    }
    spdlog::info("Volume group {} created on {}", volume_group, pv_device);
    return true;
}

auto query_vg_free(utils::CommandRunner& runner, std::string_view volume_group) noexcept -> std::optional<std::uint64_t> {
    // the volume group was never created
    if (utils::is_dry_run()) {
        spdlog::info("[DRY RUN] assuming {} has unlimited free space", volume_group);
        return std::numeric_limits<std::uint64_t>::max();
    }

    const auto& output = runner.capture(fmt::format(FMT_COMPILE("vgs --noheadings --units b --nosuffix -o vg_free {}"), volume_group));
    const auto& value  = utils::trim(output);

    std::uint64_t free_bytes{};
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), free_bytes);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
        spdlog::error("Cannot parse free space of {}: '{}'", volume_group, output);
        return std::nullopt;
    }
    return free_bytes;
}

auto check_allocation(const VolumeSet& volumes, std::uint64_t available) noexcept -> std::expected<void, std::string> {
    std::uint64_t requested{};
    for (const auto& volume : volumes) {
        if (!volume.size) {
            continue;
        }
        const auto& bytes = disk::size_to_bytes(*volume.size);
        if (!bytes) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid size '{}' for {}"), volume.size->value, volume.name));
        }
        requested += *bytes;
    }

    if (requested >= available) {
        return std::unexpected(fmt::format(FMT_COMPILE("Not enough free space in volume group: requested {} bytes, available {} bytes"), requested, available));
    }
    return {};
}

auto gen_lvcreate_command(std::string_view volume_group, const LogicalVolume& volume) noexcept -> std::string {
    if (!volume.size) {
        return fmt::format(FMT_COMPILE("lvcreate --contiguous y --extents +100%FREE {} --name {}"), volume_group, volume.name);
    }
    return fmt::format(FMT_COMPILE("lvcreate --contiguous y --size {} {} --name {}"), volume.size->value, volume_group, volume.name);
}

auto allocate_volumes(utils::CommandRunner& runner, std::string_view volume_group, const VolumeSet& volumes) noexcept -> std::expected<void, std::string> {
    const auto& available = query_vg_free(runner, volume_group);
    if (!available) {
        return std::unexpected(fmt::format(FMT_COMPILE("Cannot determine free space of volume group {}"), volume_group));
    }
    if (auto fits = check_allocation(volumes, *available); !fits) {
        return fits;
    }

    for (const auto& volume : volumes) {
        if (!runner.run(gen_lvcreate_command(volume_group, volume))) {
            return std::unexpected(fmt::format(FMT_COMPILE("Failed to create logical volume {}"), volume.name));
        }
        spdlog::info("Created logical volume {}/{}", volume_group, volume.name);
    }

    const auto& listing = runner.capture("lvs");
    for (auto&& line : utils::make_split_view(listing)) {
        spdlog::info("{}", line);
    }
    return {};
}

}  // namespace cryptlvm::lvm
