#include "cryptlvm/mount_partitions.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace cryptlvm::mount {

auto mount_partition(utils::CommandRunner& runner, std::string_view partition, std::string_view mount_dir, std::string_view mount_opts) noexcept -> bool {
    if (!mount_opts.empty()) {
        return runner.run(fmt::format(FMT_COMPILE("mount -o {} '{}' '{}'"), mount_opts, partition, mount_dir));
    }
    return runner.run(fmt::format(FMT_COMPILE("mount '{}' '{}'"), partition, mount_dir));
}

auto make_directory(utils::CommandRunner& runner, std::string_view dir) noexcept -> bool {
    if (!runner.run(fmt::format(FMT_COMPILE("mkdir -p '{}'"), dir))) {
        spdlog::error("Failed to create directory {}", dir);
        return false;
    }
    return true;
}

auto is_mountpoint(utils::CommandRunner& runner, std::string_view dir) noexcept -> bool {
    return runner.run(fmt::format(FMT_COMPILE("mountpoint -q '{}'"), dir));
}

}  // namespace cryptlvm::mount
