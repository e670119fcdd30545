#ifndef INSTALL_CONFIG_HPP
#define INSTALL_CONFIG_HPP

#include "cryptlvm/device.hpp"
#include "cryptlvm/size_spec.hpp"

#include <cstdint>  // for uint8_t

#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptlvm {

enum class BootTopology : std::uint8_t {
    // single partition, /boot lives inside of the encrypted volume group
    EncryptedBoot,
    // plain FAT32 boot partition followed by the encrypted partition
    UnencryptedBoot,
};

enum class EraseStrategy : std::uint8_t {
    Quick,
    Secure,
};

enum class FirmwareMode : std::uint8_t {
    Uefi,
    Legacy,
};

/// @brief Answers of the operator, validated once and then only read.
struct InstallConfig final {
    disk::DeviceSpec device{};
    BootTopology topology{BootTopology::EncryptedBoot};
    disk::SizeSpec boot_size{};
    disk::SizeSpec swap_size{};
    EraseStrategy erase{EraseStrategy::Quick};
    std::string mountpoint{"/mnt"};
};

inline constexpr std::string_view kMappedName{"lvm-system"};
inline constexpr std::string_view kVolumeGroup{"lvmSystem"};
inline constexpr std::string_view kBootVolume{"volBoot"};
inline constexpr std::string_view kSwapVolume{"volSwap"};
inline constexpr std::string_view kRootVolume{"volRoot"};
inline constexpr std::string_view kBootLabel{"BOOT"};
inline constexpr std::string_view kSwapLabel{"SWAP"};
inline constexpr std::string_view kRootLabel{"ROOT"};
inline constexpr std::string_view kPartitionTable{"msdos"};
inline constexpr std::string_view kEfiMarker{"/sys/firmware/efi/efivars"};
inline constexpr std::string_view kBootloaderId{"artix"};
inline constexpr std::string_view kDefaultBootSize{"1G"};
inline constexpr std::string_view kDefaultSwapSize{"8G"};
inline constexpr std::string_view kDefaultMountpoint{"/mnt"};

constexpr auto topology_name(BootTopology topology) noexcept -> std::string_view {
    return (topology == BootTopology::EncryptedBoot) ? std::string_view{"encrypted boot"} : std::string_view{"unencrypted boot"};
}

constexpr auto firmware_name(FirmwareMode mode) noexcept -> std::string_view {
    return (mode == FirmwareMode::Uefi) ? std::string_view{"UEFI"} : std::string_view{"BIOS"};
}

}  // namespace cryptlvm

#endif  // INSTALL_CONFIG_HPP
