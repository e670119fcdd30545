#ifndef FS_FORMAT_HPP
#define FS_FORMAT_HPP

#include "cryptlvm/command_runner.hpp"

#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptlvm::fs {

auto gen_fat32_command(std::string_view device, std::string_view label) noexcept -> std::string;
auto gen_btrfs_command(std::string_view device, std::string_view label) noexcept -> std::string;

// Formats device as FAT32 with label
auto format_fat32(utils::CommandRunner& runner, std::string_view device, std::string_view label) noexcept -> bool;

// Formats device as btrfs with label, overwriting any existing filesystem
auto format_btrfs(utils::CommandRunner& runner, std::string_view device, std::string_view label) noexcept -> bool;

}  // namespace cryptlvm::fs

#endif  // FS_FORMAT_HPP
