#ifndef MOUNT_PARTITIONS_HPP
#define MOUNT_PARTITIONS_HPP

#include "cryptlvm/command_runner.hpp"

#include <string_view>  // for string_view

namespace cryptlvm::mount {

// Mount partition
auto mount_partition(utils::CommandRunner& runner, std::string_view partition, std::string_view mount_dir, std::string_view mount_opts = {}) noexcept -> bool;

// Create directory with parents
auto make_directory(utils::CommandRunner& runner, std::string_view dir) noexcept -> bool;

// Check that dir is a mountpoint
auto is_mountpoint(utils::CommandRunner& runner, std::string_view dir) noexcept -> bool;

}  // namespace cryptlvm::mount

#endif  // MOUNT_PARTITIONS_HPP
