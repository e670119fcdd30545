#include "cryptlvm/fs_utils.hpp"
#include "cryptlvm/io_utils.hpp"
#include "cryptlvm/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace cryptlvm::fs::utils {

auto get_device_uuid(cryptlvm::utils::CommandRunner& runner, std::string_view device) noexcept -> std::string {
    const auto& output = runner.capture(fmt::format(FMT_COMPILE("blkid -s UUID -o value '{}'"), device));
    const auto& uuid   = cryptlvm::utils::trim(output);
    if (uuid.empty() && cryptlvm::utils::is_dry_run()) {
        spdlog::info("[DRY RUN] {} was never formatted, using placeholder UUID", device);
        return std::string{kDryRunUuid};
    }
    return std::string{uuid};
}

}  // namespace cryptlvm::fs::utils
