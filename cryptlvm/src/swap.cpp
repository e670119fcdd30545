#include "cryptlvm/swap.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace cryptlvm::swap {

auto make_swap(utils::CommandRunner& runner, std::string_view device, std::string_view label) noexcept -> bool {
    const auto& mkswap_cmd = fmt::format(FMT_COMPILE("mkswap -L {} '{}'"), label, device);
    if (!runner.run(mkswap_cmd)) {
        spdlog::error("Failed to make swap on {}", device);
        return false;
    }
    return true;
}

auto activate_swap(utils::CommandRunner& runner, std::string_view device) noexcept -> bool {
    const auto& swapon_cmd = fmt::format(FMT_COMPILE("swapon '{}'"), device);
    if (!runner.run(swapon_cmd)) {
        spdlog::error("Failed to swapon {}", device);
        return false;
    }
    return true;
}

}  // namespace cryptlvm::swap
