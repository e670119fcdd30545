#ifndef HEADLESS_INPUT_HPP
#define HEADLESS_INPUT_HPP

#include "installer_config.hpp"

#include "cryptlvm/input_provider.hpp"

#include <cstdint>      // for uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace installer {

// Answers every question from settings.json.
// An answer that gets rejected is not asked again, the run is aborted instead.
class HeadlessInput final : public cryptlvm::InputProvider {
 public:
    explicit HeadlessInput(InstallerConfig config) noexcept;

    auto device_identifier(std::string_view device_listing) noexcept -> std::optional<std::string> override;
    void report_invalid_input(std::string_view message) noexcept override;
    auto boot_topology() noexcept -> std::optional<cryptlvm::BootTopology> override;
    auto boot_size() noexcept -> std::string override;
    auto swap_size() noexcept -> std::string override;
    auto erase_strategy() noexcept -> cryptlvm::EraseStrategy override;
    auto confirm_destruction(std::string_view summary) noexcept -> bool override;
    auto passphrase(std::string_view prompt) noexcept -> std::optional<std::string> override;
    auto firmware_mode(cryptlvm::FirmwareMode detected) noexcept -> cryptlvm::FirmwareMode override;

 private:
    InstallerConfig m_config;
    std::uint32_t m_device_requests{};
    std::uint32_t m_passphrase_requests{};
};

}  // namespace installer

#endif  // HEADLESS_INPUT_HPP
