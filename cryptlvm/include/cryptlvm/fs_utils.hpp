#ifndef FS_UTILS_HPP
#define FS_UTILS_HPP

#include "cryptlvm/command_runner.hpp"

#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptlvm::fs::utils {

// Reported for unformatted devices during a dry run
inline constexpr std::string_view kDryRunUuid{"00000000-0000-0000-0000-000000000000"};

// Get UUID of device/partition, empty if it has none
auto get_device_uuid(cryptlvm::utils::CommandRunner& runner, std::string_view device) noexcept -> std::string;

}  // namespace cryptlvm::fs::utils

#endif  // FS_UTILS_HPP
