#include "cryptlvm/kernel_params.hpp"
#include "cryptlvm/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

namespace cryptlvm::fs {

auto get_kernel_params(const IdentifierSet& identifiers, std::string_view mapped_name) noexcept -> std::vector<std::string> {
    std::vector<std::string> kernel_params{};
    kernel_params.emplace_back(fmt::format(FMT_COMPILE("cryptdevice=UUID={}:{}:allow-discards"), identifiers.crypt_uuid, mapped_name));
    kernel_params.emplace_back(fmt::format(FMT_COMPILE("root=UUID={}"), identifiers.root_uuid));
    kernel_params.emplace_back("loglevel=3");
    kernel_params.emplace_back("quiet");
    if (identifiers.swap_uuid) {
        kernel_params.emplace_back(fmt::format(FMT_COMPILE("resume=UUID={}"), *identifiers.swap_uuid));
    }
    kernel_params.emplace_back("net.ifnames=0");
    return kernel_params;
}

auto gen_kernel_cmdline(const IdentifierSet& identifiers, std::string_view mapped_name) noexcept -> std::string {
    return cryptlvm::utils::join(fs::get_kernel_params(identifiers, mapped_name), ' ');
}

}  // namespace cryptlvm::fs
