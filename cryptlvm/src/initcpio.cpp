#include "cryptlvm/initcpio.hpp"
#include "cryptlvm/file_utils.hpp"
#include "cryptlvm/io_utils.hpp"
#include "cryptlvm/string_utils.hpp"

#include <algorithm>  // for find
#include <cstdint>    // for int64_t
#include <ranges>     // for ranges::*

#include <fmt/compile.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr auto modify_initcpio_line(std::string_view line, std::string_view modules, std::string_view files, std::string_view hooks) noexcept -> std::string {
    if (line.starts_with("MODULES"sv)) {
        return fmt::format(FMT_COMPILE("MODULES=({})"), modules);
    } else if (line.starts_with("FILES"sv)) {
        return fmt::format(FMT_COMPILE("FILES=({})"), files);
    } else if (line.starts_with("HOOKS"sv)) {
        return fmt::format(FMT_COMPILE("HOOKS=({})"), hooks);
    }
    return std::string{line.data(), line.size()};
}

auto modify_initcpio_fields(std::string_view file_content, std::string_view modules, std::string_view files, std::string_view hooks) noexcept -> std::string {
    return file_content | std::ranges::views::split('\n')
        | std::ranges::views::transform([&](auto&& rng) {
              const auto line_size = static_cast<size_t>(std::ranges::distance(rng));
              auto&& line          = (line_size == 0) ? std::string_view{} : std::string_view(&*rng.begin(), line_size);
              return modify_initcpio_line(line, modules, files, hooks);
          })
        | std::ranges::views::join_with('\n')
        | std::ranges::to<std::string>();
}

}  // namespace

namespace cryptlvm::detail {

bool Initcpio::write() const noexcept {
    auto&& file_content = file_utils::read_whole_file(m_file_path);
    if (file_content.empty()) {
        spdlog::error("[INITCPIO] '{}' error occurred!", m_file_path);
        return false;
    }
    const auto& formatted_modules = utils::join(modules, ' ');
    const auto& formatted_files   = utils::join(files, ' ');
    const auto& formatted_hooks   = utils::join(hooks, ' ');

    auto result = modify_initcpio_fields(file_content, formatted_modules, formatted_files, formatted_hooks);
    return file_utils::create_file_for_overwrite(m_file_path, result);
}

bool Initcpio::parse_file() noexcept {
    auto&& file_content = file_utils::read_whole_file(m_file_path);
    if (file_content.empty()) {
        spdlog::error("[INITCPIO] '{}' error occurred!", m_file_path);
        return false;
    }

    const auto& parse_line = [](std::string_view line) -> std::vector<std::string> {
        auto&& open_bracket_pos = line.find('(');
        auto&& close_bracket    = std::ranges::find(line, ')');
        if (open_bracket_pos == std::string_view::npos || close_bracket == line.end()) {
            return {};
        }
        const auto length = std::ranges::distance(line.begin() + static_cast<std::int64_t>(open_bracket_pos), close_bracket - 1);
        if (length < 0) {
            return {};
        }

        auto&& input_data = line.substr(open_bracket_pos + 1, static_cast<std::size_t>(length));
        return input_data | std::ranges::views::split(' ')
            | std::ranges::views::filter([](auto&& entry) { return !std::ranges::empty(entry); })
            | std::ranges::to<std::vector<std::string>>();
    };

    auto&& file_content_lines = utils::make_split_view(file_content);
    for (auto&& line : file_content_lines) {
        if (line.starts_with("MODULES"sv)) {
            modules = parse_line(line);
        } else if (line.starts_with("FILES"sv)) {
            files = parse_line(line);
        } else if (line.starts_with("HOOKS"sv)) {
            hooks = parse_line(line);
        }
    }

    return true;
}

}  // namespace cryptlvm::detail

namespace cryptlvm::initcpio {

auto encrypt_hooks() noexcept -> std::vector<std::string> {
    return {"base", "udev", "autodetect", "modconf", "block", "encrypt", "keyboard", "keymap", "consolefont", "lvm2", "filesystems", "fsck"};
}

auto setup_encrypt_hooks(utils::CommandRunner& runner, std::string_view mountpoint) noexcept -> bool {
    const auto& initcpio_filename = fmt::format(FMT_COMPILE("{}/etc/mkinitcpio.conf"), mountpoint);
    if (utils::is_dry_run()) {
        spdlog::info("[DRY RUN] would set HOOKS in {} to ({})", initcpio_filename, utils::join(initcpio::encrypt_hooks(), ' '));
        return utils::chroot_checked(runner, mountpoint, "mkinitcpio -P"sv);
    }
    if (!file_utils::backup_file(initcpio_filename)) {
        spdlog::error("Failed to backup {}", initcpio_filename);
        return false;
    }

    auto initcpio = detail::Initcpio{initcpio_filename};
    if (!initcpio.set_hooks(initcpio::encrypt_hooks())) {
        spdlog::error("Failed to set hooks in {}", initcpio_filename);
        return false;
    }
    spdlog::info("Set HOOKS in {} to ({})", initcpio_filename, utils::join(initcpio.hooks, ' '));

    if (!utils::chroot_checked(runner, mountpoint, "mkinitcpio -P"sv)) {
        spdlog::error("Failed to regenerate initramfs");
        return false;
    }
    return true;
}

}  // namespace cryptlvm::initcpio
