#include "cryptlvm/io_utils.hpp"

#include <sys/wait.h>  // for WEXITSTATUS, WIFEXITED

#include <cstdint>  // for int32_t
#include <cstdio>   // for feof, fgets, fwrite, pclose, popen
#include <cstdlib>  // for getenv, system

#include <array>   // for array
#include <memory>  // for unique_ptr

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr auto is_success_status(std::int32_t status) noexcept -> bool {
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

auto should_log_commands() noexcept -> bool {
    return cryptlvm::utils::safe_getenv("CRYPTLVM_LOG_EXEC_CMDS") == "1"sv && spdlog::default_logger_raw() != nullptr;
}

}  // namespace

namespace cryptlvm::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto is_dry_run() noexcept -> bool {
    return safe_getenv("CRYPTLVM_DRY_RUN") == "1"sv;
}

auto exec(std::string_view command) noexcept -> std::string {
    if (should_log_commands()) {
        spdlog::debug("[exec] cmd := '{}'", command);
    }

    const std::string command_str{command};
    const std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command_str.c_str(), "r"), pclose);
    if (!pipe) {
        spdlog::error("popen failed! '{}'", command);
        return {};
    }

    std::string result{};
    std::array<char, 128> buffer{};
    while (!feof(pipe.get())) {
        if (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
            result += buffer.data();
        }
    }

    if (result.ends_with('\n')) {
        result.pop_back();
    }

    return result;
}

auto exec_checked(std::string_view command) noexcept -> bool {
    if (should_log_commands()) {
        spdlog::debug("[exec_checked] cmd := '{}'", command);
    }
    if (is_dry_run()) {
        spdlog::info("[DRY RUN] {}", command);
        return true;
    }

    const std::string command_str{command};
    return is_success_status(std::system(command_str.c_str()));
}

auto exec_with_input(std::string_view command, std::string_view input) noexcept -> bool {
    if (should_log_commands()) {
        // input is never logged, it may carry a passphrase
        spdlog::debug("[exec_with_input] cmd := '{}'", command);
    }
    if (is_dry_run()) {
        spdlog::info("[DRY RUN] {}", command);
        return true;
    }

    const std::string command_str{command};
    auto* pipe = popen(command_str.c_str(), "w");
    if (pipe == nullptr) {
        spdlog::error("popen failed! '{}'", command);
        return false;
    }

    const auto written = std::fwrite(input.data(), sizeof(char), input.size(), pipe);
    if (written != input.size()) {
        spdlog::error("[exec_with_input] short write to '{}'", command);
    }
    const auto status = pclose(pipe);
    return written == input.size() && is_success_status(status);
}

}  // namespace cryptlvm::utils
