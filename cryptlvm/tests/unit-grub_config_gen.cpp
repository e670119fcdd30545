#include "doctest_compatibility.h"

#include "cryptlvm/bootloader.hpp"
#include "cryptlvm/file_utils.hpp"
#include "cryptlvm/kernel_params.hpp"
#include "cryptlvm/logger.hpp"

#include "recording_runner.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

static constexpr auto GRUB_TEST = R"(# GRUB boot loader configuration

GRUB_DEFAULT=0
GRUB_TIMEOUT=5
GRUB_DISTRIBUTOR="Artix"
GRUB_CMDLINE_LINUX_DEFAULT="loglevel=3 quiet"
GRUB_CMDLINE_LINUX=""

# Preload both GPT and MBR modules so that they are not missed
GRUB_PRELOAD_MODULES="part_gpt part_msdos"

# Uncomment to enable booting from LUKS encrypted devices
#GRUB_ENABLE_CRYPTODISK=y

GRUB_DISABLE_RECOVERY=true
)"sv;

static constexpr auto GRUB_ENCRYPTED_TEST = R"(# GRUB boot loader configuration

GRUB_DEFAULT=0
GRUB_TIMEOUT=5
GRUB_DISTRIBUTOR="Artix"
GRUB_CMDLINE_LINUX_DEFAULT="cryptdevice=UUID=1234:lvm-system:allow-discards root=UUID=5678 loglevel=3 quiet net.ifnames=0"
GRUB_CMDLINE_LINUX=""

# Preload both GPT and MBR modules so that they are not missed
GRUB_PRELOAD_MODULES="part_gpt part_msdos cryptodisk"

# Uncomment to enable booting from LUKS encrypted devices
GRUB_ENABLE_CRYPTODISK=y

GRUB_DISABLE_RECOVERY=true
)"sv;

static constexpr auto GRUB_UNENCRYPTED_TEST = R"(# GRUB boot loader configuration

GRUB_DEFAULT=0
GRUB_TIMEOUT=5
GRUB_DISTRIBUTOR="Artix"
GRUB_CMDLINE_LINUX_DEFAULT="cryptdevice=UUID=1234:lvm-system:allow-discards root=UUID=5678 loglevel=3 quiet net.ifnames=0"
GRUB_CMDLINE_LINUX=""

# Preload both GPT and MBR modules so that they are not missed
GRUB_PRELOAD_MODULES="part_gpt part_msdos"

# Uncomment to enable booting from LUKS encrypted devices
#GRUB_ENABLE_CRYPTODISK=y

GRUB_DISABLE_RECOVERY=true
)"sv;

TEST_CASE("grub config gen test")
{
  auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
    // noop
  });
  auto logger = std::make_shared<spdlog::logger>("default", callback_sink);
  cryptlvm::logger::set_logger(logger);

  using namespace cryptlvm;  // NOLINT

  const cryptlvm::fs::IdentifierSet identifiers{.crypt_uuid = "1234", .root_uuid = "5678"};
  const auto kernel_params = cryptlvm::fs::get_kernel_params(identifiers, kMappedName);

  SECTION("encrypted boot enables cryptodisk")
  {
    const auto settings = bootloader::make_grub_settings(kernel_params, BootTopology::EncryptedBoot);
    REQUIRE(settings.enable_cryptodisk);
    REQUIRE_EQ(settings.preload_modules, "part_gpt part_msdos cryptodisk");
    REQUIRE_EQ(bootloader::gen_grub_config(GRUB_TEST, settings), GRUB_ENCRYPTED_TEST);
  }
  SECTION("unencrypted boot leaves cryptodisk disabled")
  {
    const auto settings = bootloader::make_grub_settings(kernel_params, BootTopology::UnencryptedBoot);
    REQUIRE_FALSE(settings.enable_cryptodisk);
    REQUIRE_EQ(settings.preload_modules, "part_gpt part_msdos");
    REQUIRE_EQ(bootloader::gen_grub_config(GRUB_TEST, settings), GRUB_UNENCRYPTED_TEST);
  }
  SECTION("encrypted boot config is disabled again for unencrypted boot")
  {
    const auto settings = bootloader::make_grub_settings(kernel_params, BootTopology::UnencryptedBoot);
    REQUIRE_EQ(bootloader::gen_grub_config(GRUB_ENCRYPTED_TEST, settings), GRUB_UNENCRYPTED_TEST);
  }
  SECTION("regeneration is idempotent")
  {
    const auto settings = bootloader::make_grub_settings(kernel_params, BootTopology::EncryptedBoot);
    const auto first    = bootloader::gen_grub_config(GRUB_TEST, settings);
    REQUIRE_EQ(bootloader::gen_grub_config(first, settings), first);
  }
  SECTION("missing settings are appended")
  {
    const auto settings = bootloader::make_grub_settings(kernel_params, BootTopology::EncryptedBoot);
    const auto result   = bootloader::gen_grub_config("GRUB_TIMEOUT=5\n"sv, settings);
    REQUIRE_EQ(result,
        "GRUB_TIMEOUT=5\n"
        "GRUB_CMDLINE_LINUX_DEFAULT=\"cryptdevice=UUID=1234:lvm-system:allow-discards root=UUID=5678 loglevel=3 quiet net.ifnames=0\"\n"
        "GRUB_PRELOAD_MODULES=\"part_gpt part_msdos cryptodisk\"\n"
        "GRUB_ENABLE_CRYPTODISK=y\n"s);
  }
  SECTION("reserved characters are escaped")
  {
    REQUIRE_EQ(bootloader::escape_config_value(R"(a"b$c`d\e)"sv), R"(a\"b\$c\`d\\e)");
    REQUIRE_EQ(bootloader::escape_config_value("plain-uuid-1234"sv), "plain-uuid-1234");

    const cryptlvm::fs::IdentifierSet odd_ids{.crypt_uuid = "ab$cd", .root_uuid = "ef\"gh"};
    const auto settings = bootloader::make_grub_settings(cryptlvm::fs::get_kernel_params(odd_ids, kMappedName), BootTopology::EncryptedBoot);
    const auto result   = bootloader::gen_grub_config("GRUB_CMDLINE_LINUX_DEFAULT=\"\"\n"sv, settings);

    const auto line = result.substr(0, result.find('\n'));
    REQUIRE_EQ(line, R"(GRUB_CMDLINE_LINUX_DEFAULT="cryptdevice=UUID=ab\$cd:lvm-system:allow-discards root=UUID=ef\"gh loglevel=3 quiet net.ifnames=0")");
  }
  SECTION("write config backs up existing file")
  {
    const auto mountpoint = std::filesystem::temp_directory_path() / "cryptlvm-grub-test";
    std::filesystem::remove_all(mountpoint);
    std::filesystem::create_directories(mountpoint / "etc/default");
    const auto grub_path = (mountpoint / "etc/default/grub").string();
    REQUIRE(file_utils::create_file_for_overwrite(grub_path, GRUB_TEST));

    const auto settings = bootloader::make_grub_settings(kernel_params, BootTopology::EncryptedBoot);
    REQUIRE(bootloader::write_grub_config(settings, mountpoint.string()));
    REQUIRE_EQ(file_utils::read_whole_file(grub_path), GRUB_ENCRYPTED_TEST);
    REQUIRE_EQ(file_utils::read_whole_file(grub_path + ".backup"), GRUB_TEST);
    std::filesystem::remove_all(mountpoint);
  }
  SECTION("missing config is generated from defaults")
  {
    const auto mountpoint = std::filesystem::temp_directory_path() / "cryptlvm-grub-missing-test";
    std::filesystem::remove_all(mountpoint);
    std::filesystem::create_directories(mountpoint / "etc/default");

    const auto settings = bootloader::make_grub_settings(kernel_params, BootTopology::EncryptedBoot);
    REQUIRE(bootloader::write_grub_config(settings, mountpoint.string()));

    const auto content = file_utils::read_whole_file((mountpoint / "etc/default/grub").string());
    REQUIRE(content.find("GRUB_DISTRIBUTOR=\"Artix\"") != std::string::npos);
    REQUIRE(content.find("\nGRUB_ENABLE_CRYPTODISK=y\n") != std::string::npos);
    REQUIRE_FALSE(std::filesystem::exists(mountpoint / "etc/default/grub.backup"));
    std::filesystem::remove_all(mountpoint);
  }
}

TEST_CASE("grub install test")
{
  auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
    // noop
  });
  auto logger = std::make_shared<spdlog::logger>("default", callback_sink);
  cryptlvm::logger::set_logger(logger);

  using namespace cryptlvm;  // NOLINT

  SECTION("install commands")
  {
    REQUIRE_EQ(bootloader::gen_grub_install_command(FirmwareMode::Uefi, "/dev/vda"sv),
        "grub-install --target=x86_64-efi --efi-directory=/boot --bootloader-id=artix --recheck");
    REQUIRE_EQ(bootloader::gen_grub_install_command(FirmwareMode::Legacy, "/dev/vda"sv),
        "grub-install --target=i386-pc --boot-directory=/boot --bootloader-id=artix --recheck '/dev/vda'");
  }
  SECTION("uefi requires mounted boot")
  {
    test::RecordingRunner runner{};
    runner.failing.emplace_back("mountpoint -q");

    const auto result = bootloader::install_grub(runner, FirmwareMode::Uefi, "/dev/vda"sv, "/mnt"sv);
    REQUIRE_FALSE(result.has_value());
    REQUIRE_EQ(result.error(), "/boot is not mounted. Please mount your EFI system partition to /boot");
    REQUIRE_EQ(runner.count_of("grub-install"), 0);
  }
  SECTION("legacy installs into the disk")
  {
    test::RecordingRunner runner{};
    REQUIRE(bootloader::install_grub(runner, FirmwareMode::Legacy, "/dev/vda"sv, "/mnt"sv).has_value());
    REQUIRE_EQ(runner.count_of("mountpoint -q"), 0);
    REQUIRE(runner.ran("artix-chroot '/mnt' grub-install --target=i386-pc --boot-directory=/boot --bootloader-id=artix --recheck '/dev/vda'"));
    REQUIRE(runner.ran("artix-chroot '/mnt' grub-mkconfig -o /boot/grub/grub.cfg"));
  }
  SECTION("firmware detection")
  {
    REQUIRE_EQ(bootloader::detect_firmware_mode("/tmp"sv), FirmwareMode::Uefi);
    REQUIRE_EQ(bootloader::detect_firmware_mode("/tmp/cryptlvm-no-efivars"sv), FirmwareMode::Legacy);
  }
}
