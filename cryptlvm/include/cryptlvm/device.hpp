#ifndef DEVICE_HPP
#define DEVICE_HPP

#include <cstdint>  // for uint8_t, uint32_t

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptlvm::disk {

enum class NamingScheme : std::uint8_t {
    // sda -> sda1
    Standard,
    // nvme0n1 -> nvme0n1p1, mmcblk0 -> mmcblk0p1
    NvmeStyle,
};

struct DeviceSpec final {
    // e.g /dev/nvme0n1
    std::string path{};
    NamingScheme scheme{NamingScheme::Standard};

    constexpr bool operator==(const DeviceSpec&) const = default;
};

/// @brief Resolve a user supplied identifier ("sda", "/dev/nvme0n1").
/// @return nullopt when the identifier cannot name a disk.
[[nodiscard]] auto make_device_spec(std::string_view identifier) noexcept -> std::optional<DeviceSpec>;

/// @brief Detect partition naming scheme from the kernel device name.
[[nodiscard]] auto detect_naming_scheme(std::string_view device_name) noexcept -> NamingScheme;

/// @brief The only place partition paths are derived from a disk.
[[nodiscard]] auto partition_path(const DeviceSpec& device, std::uint32_t index) noexcept -> std::string;

// e.g /dev/mapper/lvm-system
[[nodiscard]] auto mapper_path(std::string_view mapped_name) noexcept -> std::string;

// e.g /dev/lvmSystem/volRoot
[[nodiscard]] auto lv_path(std::string_view volume_group, std::string_view logical_volume) noexcept -> std::string;

}  // namespace cryptlvm::disk

#endif  // DEVICE_HPP
