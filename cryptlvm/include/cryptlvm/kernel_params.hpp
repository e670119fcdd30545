#ifndef KERNEL_PARAMS_HPP
#define KERNEL_PARAMS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptlvm::fs {

// Persistent identifiers resolved after formatting
struct IdentifierSet final {
    // UUID of the LUKS partition
    std::string crypt_uuid{};
    std::string root_uuid{};
    // without it no resume= is emitted
    std::optional<std::string> swap_uuid{};

    constexpr bool operator==(const IdentifierSet&) const = default;
};

/// @brief Get kernel params for booting from the encrypted volume group.
/// @param identifiers The resolved identifiers.
/// @param mapped_name Name under which the container is opened at boot.
/// @return cryptdevice=, root=, loglevel=3, quiet, [resume=], net.ifnames=0 in that order.
auto get_kernel_params(const IdentifierSet& identifiers, std::string_view mapped_name) noexcept -> std::vector<std::string>;

// Kernel params joined by space
auto gen_kernel_cmdline(const IdentifierSet& identifiers, std::string_view mapped_name) noexcept -> std::string;

}  // namespace cryptlvm::fs

#endif  // KERNEL_PARAMS_HPP
