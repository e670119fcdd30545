#ifndef LUKS_HPP
#define LUKS_HPP

#include "cryptlvm/command_runner.hpp"

#include <cstdint>  // for uint32_t

#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptlvm::crypto {

struct EncryptionParams final {
    std::string_view cipher{"serpent-xts-plain64"};
    std::uint32_t key_size{512};
    std::string_view hash{"sha512"};
    std::uint32_t iter_time_ms{10000};
    // --use-random
    bool use_random{true};
    // --verify-passphrase
    bool verify_passphrase{true};
};

inline constexpr EncryptionParams kEncryptionParams{};

// Generates cryptsetup luksFormat command, passphrase is read from stdin
auto gen_luks1_format_command(const EncryptionParams& params, std::string_view partition) noexcept -> std::string;

// Checks /proc/crypto for the cipher, lists available ciphers if it's missing
auto check_cipher_available(utils::CommandRunner& runner, std::string_view cipher_name) noexcept -> bool;

// Logs output of cryptsetup benchmark
void log_cipher_benchmark(utils::CommandRunner& runner) noexcept;

auto luks1_format(utils::CommandRunner& runner, std::string_view luks_pass, std::string_view partition, const EncryptionParams& params = kEncryptionParams) noexcept -> bool;
auto luks1_open(utils::CommandRunner& runner, std::string_view luks_pass, std::string_view partition, std::string_view luks_name) noexcept -> bool;

}  // namespace cryptlvm::crypto

#endif  // LUKS_HPP
