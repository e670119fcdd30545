#include "cryptlvm/luks.hpp"
#include "cryptlvm/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace cryptlvm::crypto {

auto gen_luks1_format_command(const EncryptionParams& params, std::string_view partition) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("cryptsetup -q --verbose --type luks1 --cipher {} --key-size {} --hash {} --iter-time {}{}{} luksFormat '{}'"),
        params.cipher, params.key_size, params.hash, params.iter_time_ms,
        params.use_random ? " --use-random"sv : ""sv,
        params.verify_passphrase ? " --verify-passphrase"sv : ""sv,
        partition);
}

auto check_cipher_available(utils::CommandRunner& runner, std::string_view cipher_name) noexcept -> bool {
    // e.g serpent-xts-plain64 -> serpent
    const auto& cipher_family = cipher_name.substr(0, cipher_name.find('-'));
    if (runner.run(fmt::format(FMT_COMPILE("grep -q {} /proc/crypto"), cipher_family))) {
        return true;
    }

    spdlog::warn("Cipher '{}' is not available in the running kernel, luksFormat may fail", cipher_family);
    const auto& available = runner.capture("grep '^name' /proc/crypto | sort -u"sv);
    for (auto&& line : utils::make_split_view(available)) {
        spdlog::warn("available: {}", utils::trim(line));
    }
    return false;
}

void log_cipher_benchmark(utils::CommandRunner& runner) noexcept {
    const auto& benchmark = runner.capture("cryptsetup benchmark 2>/dev/null"sv);
    if (benchmark.empty()) {
        spdlog::warn("cryptsetup benchmark produced no output");
        return;
    }
    for (auto&& line : utils::make_split_view(benchmark)) {
        spdlog::debug("benchmark: {}", line);
    }
}

auto luks1_format(utils::CommandRunner& runner, std::string_view luks_pass, std::string_view partition, const EncryptionParams& params) noexcept -> bool {
    spdlog::info("Formatting {} as LUKS1 container ({}, {} bits, {})", partition, params.cipher, params.key_size, params.hash);
    if (!runner.run_with_input(gen_luks1_format_command(params, partition), luks_pass)) {
        spdlog::error("Failed to format {} as LUKS1 container", partition);
        return false;
    }
    return true;
}

auto luks1_open(utils::CommandRunner& runner, std::string_view luks_pass, std::string_view partition, std::string_view luks_name) noexcept -> bool {
    const auto& cmd = fmt::format(FMT_COMPILE("cryptsetup open --type luks1 '{}' {}"), partition, luks_name);
    if (!runner.run_with_input(cmd, luks_pass)) {
        spdlog::error("Failed to open {} as {}. Wrong passphrase?", partition, luks_name);
        return false;
    }
    return true;
}

}  // namespace cryptlvm::crypto
