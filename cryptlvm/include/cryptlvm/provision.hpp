#ifndef PROVISION_HPP
#define PROVISION_HPP

#include "cryptlvm/bootloader.hpp"
#include "cryptlvm/command_runner.hpp"
#include "cryptlvm/erase.hpp"
#include "cryptlvm/input_provider.hpp"
#include "cryptlvm/install_config.hpp"
#include "cryptlvm/kernel_params.hpp"
#include "cryptlvm/lvm.hpp"
#include "cryptlvm/partitioning.hpp"

#include <cstdint>  // for uint32_t

#include <chrono>       // for milliseconds
#include <expected>     // for expected
#include <functional>   // for function
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move

namespace cryptlvm {

using EraseFunction = std::function<std::expected<disk::EraseSummary, std::string>(std::string_view, EraseStrategy)>;

inline auto default_eraser(std::string_view device_path, EraseStrategy strategy) noexcept -> std::expected<disk::EraseSummary, std::string> {
    return disk::erase_device(device_path, strategy);
}

// Collaborators of the provisioning stages
struct ProvisionContext final {
    utils::CommandRunner& runner;
    InputProvider& input;
    EraseFunction eraser{&default_eraser};
    // Copies the base system into the mountpoint, nothing is installed if empty
    std::function<bool(std::string_view)> install_base_system{};
    std::uint32_t settle_attempts{50};
    std::chrono::milliseconds settle_interval{100};
    std::string efi_marker{kEfiMarker};
};

// Everything known about the target so far
struct TargetState final {
    InstallConfig config{};
    disk::EraseSummary erase_summary{};
    disk::PartitionLayout layout{};
    // e.g /dev/nvme0n1p1
    std::string crypt_partition{};
    // e.g /dev/mapper/lvm-system
    std::string container_path{};
    lvm::VolumeSet volumes{};
    std::string boot_device{};
    std::string swap_device{};
    std::string root_device{};
};

class ErasedDevice;
class PartitionedDevice;
class OpenedContainer;
class AllocatedVolumes;
class MountedTree;

// Result of the last stage
struct BootReport final {
    TargetState state{};
    fs::IdentifierSet identifiers{};
    std::string kernel_cmdline{};
    bootloader::GrubSettings grub{};
    FirmwareMode firmware{FirmwareMode::Legacy};
};

/// @brief Ask the operator for every decision, re-prompting on invalid input.
/// @return nullopt if the operator backed out, nothing has been touched yet.
auto collect_install_config(InputProvider& input, utils::CommandRunner& runner, std::string_view mountpoint = kDefaultMountpoint) noexcept -> std::optional<InstallConfig>;

// Human readable summary shown before destruction
auto describe_install_config(const InstallConfig& config) noexcept -> std::string;

auto erase_device_stage(ProvisionContext& ctx, const InstallConfig& config) noexcept -> std::expected<ErasedDevice, std::string>;
auto partition_stage(ProvisionContext& ctx, ErasedDevice&& erased) noexcept -> std::expected<PartitionedDevice, std::string>;
auto encrypt_stage(ProvisionContext& ctx, PartitionedDevice&& partitioned) noexcept -> std::expected<OpenedContainer, std::string>;
auto volume_stage(ProvisionContext& ctx, OpenedContainer&& container) noexcept -> std::expected<AllocatedVolumes, std::string>;
auto filesystem_stage(ProvisionContext& ctx, AllocatedVolumes&& volumes) noexcept -> std::expected<MountedTree, std::string>;
auto resolve_identifiers(ProvisionContext& ctx, const MountedTree& tree) noexcept -> std::expected<fs::IdentifierSet, std::string>;
auto boot_stage(ProvisionContext& ctx, const MountedTree& tree, const fs::IdentifierSet& identifiers) noexcept -> std::expected<BootReport, std::string>;

/// @brief Run every stage in order, stopping at the first failure.
/// Nothing is rolled back on failure.
auto run_provisioning(ProvisionContext& ctx, const InstallConfig& config) noexcept -> std::expected<BootReport, std::string>;

// Stage results can only be produced by the stage that precedes them

class ErasedDevice final {
 public:
    [[nodiscard]] auto state() const noexcept -> const TargetState& { return m_state; }
    [[nodiscard]] auto release() && noexcept -> TargetState { return std::move(m_state); }

 private:
    explicit ErasedDevice(TargetState&& state) noexcept
      : m_state(std::move(state)) { }
    friend auto erase_device_stage(ProvisionContext& ctx, const InstallConfig& config) noexcept -> std::expected<ErasedDevice, std::string>;

    TargetState m_state;
};

class PartitionedDevice final {
 public:
    [[nodiscard]] auto state() const noexcept -> const TargetState& { return m_state; }
    [[nodiscard]] auto release() && noexcept -> TargetState { return std::move(m_state); }

 private:
    explicit PartitionedDevice(TargetState&& state) noexcept
      : m_state(std::move(state)) { }
    friend auto partition_stage(ProvisionContext& ctx, ErasedDevice&& erased) noexcept -> std::expected<PartitionedDevice, std::string>;

    TargetState m_state;
};

class OpenedContainer final {
 public:
    [[nodiscard]] auto state() const noexcept -> const TargetState& { return m_state; }
    [[nodiscard]] auto release() && noexcept -> TargetState { return std::move(m_state); }

 private:
    explicit OpenedContainer(TargetState&& state) noexcept
      : m_state(std::move(state)) { }
    friend auto encrypt_stage(ProvisionContext& ctx, PartitionedDevice&& partitioned) noexcept -> std::expected<OpenedContainer, std::string>;

    TargetState m_state;
};

class AllocatedVolumes final {
 public:
    [[nodiscard]] auto state() const noexcept -> const TargetState& { return m_state; }
    [[nodiscard]] auto release() && noexcept -> TargetState { return std::move(m_state); }

 private:
    explicit AllocatedVolumes(TargetState&& state) noexcept
      : m_state(std::move(state)) { }
    friend auto volume_stage(ProvisionContext& ctx, OpenedContainer&& container) noexcept -> std::expected<AllocatedVolumes, std::string>;

    TargetState m_state;
};

class MountedTree final {
 public:
    [[nodiscard]] auto state() const noexcept -> const TargetState& { return m_state; }
    [[nodiscard]] auto release() && noexcept -> TargetState { return std::move(m_state); }

 private:
    explicit MountedTree(TargetState&& state) noexcept
      : m_state(std::move(state)) { }
    friend auto filesystem_stage(ProvisionContext& ctx, AllocatedVolumes&& volumes) noexcept -> std::expected<MountedTree, std::string>;

    TargetState m_state;
};

}  // namespace cryptlvm

#endif  // PROVISION_HPP
