#ifndef INPUT_PROVIDER_HPP
#define INPUT_PROVIDER_HPP

#include "cryptlvm/install_config.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptlvm {

/// @brief Source of every operator decision the provisioning needs.
///
/// Implemented by the interactive and headless frontends and by tests.
/// Each call blocks until the answer is available.
class InputProvider {
 public:
    InputProvider() noexcept          = default;
    virtual ~InputProvider() noexcept = default;

    InputProvider(const InputProvider&)  = delete;
    auto operator=(const InputProvider&) = delete;

    /// @brief Ask for the target disk.
    /// @param device_listing Output of lsblk to show to the operator.
    /// @return nullopt if the operator gave up.
    virtual auto device_identifier(std::string_view device_listing) noexcept -> std::optional<std::string> = 0;

    // Tell the operator why the previous answer was rejected
    virtual void report_invalid_input(std::string_view message) noexcept = 0;

    // nullopt if the operator gave up
    virtual auto boot_topology() noexcept -> std::optional<BootTopology> = 0;

    // Raw answers, normalized by the caller
    virtual auto boot_size() noexcept -> std::string = 0;
    virtual auto swap_size() noexcept -> std::string = 0;

    virtual auto erase_strategy() noexcept -> EraseStrategy = 0;

    // Last chance to back out before the disk is destroyed
    virtual auto confirm_destruction(std::string_view summary) noexcept -> bool = 0;

    /// @brief Ask for the LUKS passphrase.
    /// @param prompt Either the entry or the verification prompt.
    /// @return nullopt if entry was aborted.
    virtual auto passphrase(std::string_view prompt) noexcept -> std::optional<std::string> = 0;

    // Confirm or override the detected firmware mode
    virtual auto firmware_mode(FirmwareMode detected) noexcept -> FirmwareMode = 0;
};

}  // namespace cryptlvm

#endif  // INPUT_PROVIDER_HPP
