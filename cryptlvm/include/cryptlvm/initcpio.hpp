#ifndef INITCPIO_HPP
#define INITCPIO_HPP

#include "cryptlvm/command_runner.hpp"

#include <algorithm>    // for contains
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptlvm::detail {

class Initcpio final {
 public:
    explicit Initcpio(std::string_view file_path) noexcept
      : m_file_path(file_path) { }

    bool parse_file() noexcept;

    inline bool append_hook(std::string&& hook) noexcept {
        /* clang-format off */
        if (!this->parse_file()) { return false; }
        if (std::ranges::contains(hooks, hook)) { return false; }
        /* clang-format on */

        hooks.emplace_back(std::move(hook));
        return this->write();
    }
    inline bool set_hooks(std::vector<std::string>&& new_hooks) noexcept {
        /* clang-format off */
        if (!this->parse_file()) { return false; }
        /* clang-format on */

        hooks = std::move(new_hooks);
        return this->write();
    }

    bool write() const noexcept;

    std::vector<std::string> modules{};
    std::vector<std::string> files{};
    std::vector<std::string> hooks{};

 private:
    std::string m_file_path{};
};

}  // namespace cryptlvm::detail

namespace cryptlvm::initcpio {

// Hooks needed to unlock the container and activate the volume group at boot
auto encrypt_hooks() noexcept -> std::vector<std::string>;

/// @brief Backup <mountpoint>/etc/mkinitcpio.conf, set encrypt hooks
/// and regenerate initramfs inside of the target.
auto setup_encrypt_hooks(utils::CommandRunner& runner, std::string_view mountpoint) noexcept -> bool;

}  // namespace cryptlvm::initcpio

#endif  // INITCPIO_HPP
