#include "cryptlvm/fs_format.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace cryptlvm::fs {

auto gen_fat32_command(std::string_view device, std::string_view label) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("mkfs.fat -F32 -n {} '{}'"), label, device);
}

auto gen_btrfs_command(std::string_view device, std::string_view label) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("mkfs.btrfs -f -L {} '{}'"), label, device);
}

auto format_fat32(utils::CommandRunner& runner, std::string_view device, std::string_view label) noexcept -> bool {
    if (!runner.run(gen_fat32_command(device, label))) {
        spdlog::error("Failed to format {} as FAT32", device);
        return false;
    }
    spdlog::info("Formatted {} as FAT32 ({})", device, label);
    return true;
}

auto format_btrfs(utils::CommandRunner& runner, std::string_view device, std::string_view label) noexcept -> bool {
    if (!runner.run(gen_btrfs_command(device, label))) {
        spdlog::error("Failed to format {} as btrfs", device);
        return false;
    }
    spdlog::info("Formatted {} as btrfs ({})", device, label);
    return true;
}

}  // namespace cryptlvm::fs
