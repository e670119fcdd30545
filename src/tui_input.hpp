#ifndef TUI_INPUT_HPP
#define TUI_INPUT_HPP

#include "cryptlvm/input_provider.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace tui {

// Asks the operator through full-screen dialogs
class TuiInput final : public cryptlvm::InputProvider {
 public:
    auto device_identifier(std::string_view device_listing) noexcept -> std::optional<std::string> override;
    void report_invalid_input(std::string_view message) noexcept override;
    auto boot_topology() noexcept -> std::optional<cryptlvm::BootTopology> override;
    auto boot_size() noexcept -> std::string override;
    auto swap_size() noexcept -> std::string override;
    auto erase_strategy() noexcept -> cryptlvm::EraseStrategy override;
    auto confirm_destruction(std::string_view summary) noexcept -> bool override;
    auto passphrase(std::string_view prompt) noexcept -> std::optional<std::string> override;
    auto firmware_mode(cryptlvm::FirmwareMode detected) noexcept -> cryptlvm::FirmwareMode override;
};

}  // namespace tui

#endif  // TUI_INPUT_HPP
