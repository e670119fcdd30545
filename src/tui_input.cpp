#include "tui_input.hpp"
#include "widgets.hpp"

#include <cstdint>  // for int32_t
#include <vector>   // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

/* clang-format off */
#include <ftxui/component/component.hpp>           // for Renderer, Button
#include <ftxui/component/screen_interactive.hpp>  // for Component, ScreenI...
#include <ftxui/dom/elements.hpp>                  // for operator|, size
/* clang-format on */

using namespace ftxui;

using namespace std::string_view_literals;

namespace tui {

auto TuiInput::device_identifier(std::string_view device_listing) noexcept -> std::optional<std::string> {
    std::string device{};
    const auto& content = fmt::format(FMT_COMPILE("\nAvailable block devices:\n\n{}\n\nEnter the disk to install to (e.g. sda or nvme0n1).\n"), device_listing);
    if (!detail::inputbox_widget(device, content, size(HEIGHT, GREATER_THAN, 4))) {
        return std::nullopt;
    }
    return device;
}

void TuiInput::report_invalid_input(std::string_view message) noexcept {
    detail::msgbox_widget(fmt::format(FMT_COMPILE("\n{}\n"), message));
}

auto TuiInput::boot_topology() noexcept -> std::optional<cryptlvm::BootTopology> {
    const std::vector<std::string> menu_entries = {
        "Encrypted boot    /boot inside of the encrypted volume group",
        "Unencrypted boot  separate FAT32 /boot partition",
    };
    auto screen = ScreenInteractive::Fullscreen();
    std::int32_t selected{};
    bool success{};
    auto ok_callback = [&] {
        success = true;
        screen.ExitLoopClosure()();
    };
    static constexpr auto topology_body = "\nChoose the boot layout.\n\nEncrypted boot requires GRUB to unlock the disk\nbefore the kernel is loaded.\n"sv;
    detail::menu_widget(menu_entries, ok_callback, &selected, &screen, topology_body);

    /* clang-format off */
    if (!success) { return std::nullopt; }
    /* clang-format on */
    return (selected == 0) ? cryptlvm::BootTopology::EncryptedBoot : cryptlvm::BootTopology::UnencryptedBoot;
}

auto TuiInput::boot_size() noexcept -> std::string {
    std::string boot_size{cryptlvm::kDefaultBootSize};
    static constexpr auto boot_size_body = "\nEnter the size of the boot volume (e.g. 512M, 1G).\n"sv;
    if (!detail::inputbox_widget(boot_size, boot_size_body, size(HEIGHT, GREATER_THAN, 1))) {
        return std::string{cryptlvm::kDefaultBootSize};
    }
    return boot_size;
}

auto TuiInput::swap_size() noexcept -> std::string {
    std::string swap_size{cryptlvm::kDefaultSwapSize};
    static constexpr auto swap_size_body = "\nEnter the size of the swap volume (e.g. 4G, 8G).\nThe root volume takes the rest of the disk.\n"sv;
    if (!detail::inputbox_widget(swap_size, swap_size_body, size(HEIGHT, GREATER_THAN, 1))) {
        return std::string{cryptlvm::kDefaultSwapSize};
    }
    return swap_size;
}

auto TuiInput::erase_strategy() noexcept -> cryptlvm::EraseStrategy {
    static constexpr auto erase_body = "\nSecurely erase the whole disk?\n\nThis writes random data over the entire disk and may take hours.\nChoosing 'No' only wipes the start and the end of the disk.\n"sv;
    const auto& secure = detail::yesno_widget(erase_body, size(HEIGHT, LESS_THAN, 15) | size(WIDTH, LESS_THAN, 75));
    return secure ? cryptlvm::EraseStrategy::Secure : cryptlvm::EraseStrategy::Quick;
}

auto TuiInput::confirm_destruction(std::string_view summary) noexcept -> bool {
    const auto& content = fmt::format(FMT_COMPILE("\n{}\n\nContinue?\n"), summary);
    return detail::yesno_widget(content, size(HEIGHT, LESS_THAN, 25) | size(WIDTH, LESS_THAN, 80));
}

auto TuiInput::passphrase(std::string_view prompt) noexcept -> std::optional<std::string> {
    std::string pass{};
    const auto& content = fmt::format(FMT_COMPILE("\n{}\n"), prompt);
    if (!detail::inputbox_widget(pass, content, size(HEIGHT, GREATER_THAN, 1), true)) {
        return std::nullopt;
    }
    return pass;
}

auto TuiInput::firmware_mode(cryptlvm::FirmwareMode detected) noexcept -> cryptlvm::FirmwareMode {
    const std::vector<std::string> menu_entries = {
        "UEFI",
        "BIOS",
    };
    auto screen = ScreenInteractive::Fullscreen();
    std::int32_t selected{(detected == cryptlvm::FirmwareMode::Uefi) ? 0 : 1};
    std::int32_t chosen{selected};
    auto ok_callback = [&] {
        chosen = selected;
        screen.ExitLoopClosure()();
    };
    const auto& firmware_body = fmt::format(FMT_COMPILE("\nDetected firmware: {}\n\nChoose the GRUB target.\n"), cryptlvm::firmware_name(detected));
    detail::menu_widget(menu_entries, ok_callback, &selected, &screen, firmware_body);

    return (chosen == 0) ? cryptlvm::FirmwareMode::Uefi : cryptlvm::FirmwareMode::Legacy;
}

}  // namespace tui
