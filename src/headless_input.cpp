#include "headless_input.hpp"
#include "definitions.hpp"  // for info_inter, error_inter

#include <utility>  // for move

#include <spdlog/spdlog.h>

namespace installer {

HeadlessInput::HeadlessInput(InstallerConfig config) noexcept
  : m_config(std::move(config)) { }

auto HeadlessInput::device_identifier(std::string_view device_listing) noexcept -> std::optional<std::string> {
    // second request means the configured device was rejected
    if (m_device_requests++ > 0 || !m_config.device) {
        return std::nullopt;
    }
    spdlog::debug("Available block devices:\n{}", device_listing);
    return m_config.device;
}

void HeadlessInput::report_invalid_input(std::string_view message) noexcept {
    spdlog::error("{}", message);
    error_inter("{}\n", message);
}

auto HeadlessInput::boot_topology() noexcept -> std::optional<cryptlvm::BootTopology> {
    return m_config.boot_topology;
}

auto HeadlessInput::boot_size() noexcept -> std::string {
    return m_config.boot_size.value_or(std::string{cryptlvm::kDefaultBootSize});
}

auto HeadlessInput::swap_size() noexcept -> std::string {
    return m_config.swap_size.value_or(std::string{cryptlvm::kDefaultSwapSize});
}

auto HeadlessInput::erase_strategy() noexcept -> cryptlvm::EraseStrategy {
    return m_config.secure_erase ? cryptlvm::EraseStrategy::Secure : cryptlvm::EraseStrategy::Quick;
}

auto HeadlessInput::confirm_destruction(std::string_view summary) noexcept -> bool {
    info_inter("{}\n", summary);
    spdlog::info("{}", summary);
    return true;
}

// Entry and verification both get the configured passphrase.
// Any further request means it was rejected.
auto HeadlessInput::passphrase(std::string_view prompt) noexcept -> std::optional<std::string> {
    if (m_passphrase_requests++ > 1 || !m_config.passphrase) {
        return std::nullopt;
    }
    spdlog::debug("{} (taken from settings)", prompt);
    return m_config.passphrase;
}

auto HeadlessInput::firmware_mode(cryptlvm::FirmwareMode detected) noexcept -> cryptlvm::FirmwareMode {
    switch (m_config.firmware) {
    case FirmwareChoice::Uefi:
        return cryptlvm::FirmwareMode::Uefi;
    case FirmwareChoice::Bios:
        return cryptlvm::FirmwareMode::Legacy;
    case FirmwareChoice::Auto:
        break;
    }
    return detected;
}

}  // namespace installer
