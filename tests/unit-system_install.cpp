#include "doctest_compatibility.h"

#include "recording_runner.hpp"
#include "system_install.hpp"

#include "cryptlvm/file_utils.hpp"
#include "cryptlvm/lvm.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

auto make_config(cryptlvm::BootTopology topology) -> cryptlvm::InstallConfig {
    return cryptlvm::InstallConfig{
        .device     = {.path = "/dev/nvme0n1"s, .scheme = cryptlvm::disk::NamingScheme::NvmeStyle},
        .topology   = topology,
        .boot_size  = {.value = "1G"s},
        .swap_size  = {.value = "8G"s},
        .erase      = cryptlvm::EraseStrategy::Quick,
        .mountpoint = "/mnt"s,
    };
}

auto make_report(cryptlvm::BootTopology topology) -> cryptlvm::BootReport {
    cryptlvm::BootReport report{};
    report.state.config          = make_config(topology);
    report.state.volumes         = cryptlvm::lvm::plan_volumes(topology, report.state.config.boot_size, report.state.config.swap_size);
    report.state.crypt_partition = (topology == cryptlvm::BootTopology::EncryptedBoot) ? "/dev/nvme0n1p1"s : "/dev/nvme0n1p2"s;
    report.state.boot_device     = (topology == cryptlvm::BootTopology::EncryptedBoot) ? "/dev/lvmSystem/volBoot"s : "/dev/nvme0n1p1"s;
    report.kernel_cmdline        = "cryptdevice=UUID=aaaa:lvm-system:allow-discards root=UUID=bbbb loglevel=3 quiet net.ifnames=0"s;
    report.firmware              = cryptlvm::FirmwareMode::Uefi;
    return report;
}

}  // namespace

TEST_CASE("base system installation")
{
  auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
    // noop
  });
  auto logger = std::make_shared<spdlog::logger>("default", callback_sink);
  spdlog::set_default_logger(logger);

  const auto& mountpoint = fs::temp_directory_path() / "cryptlvm-system-install-test";
  std::error_code err{};
  fs::remove_all(mountpoint, err);
  fs::create_directories(mountpoint / "etc", err);
  const std::vector<std::string> packages{"base", "linux", "grub"};

  SECTION("basestrap command")
  {
    REQUIRE_EQ(installer::gen_basestrap_command("/mnt"sv, packages), "basestrap '/mnt' base linux grub"sv);
    REQUIRE_EQ(installer::gen_basestrap_command("/mnt/new root"sv, packages), "basestrap '/mnt/new root' base linux grub"sv);
  }
  SECTION("fstab is written into the target")
  {
    test::RecordingRunner runner{};
    runner.outputs.emplace_back("fstabgen -U", "UUID=bbbb / btrfs rw,relatime 0 1");

    REQUIRE(installer::install_base_system(runner, mountpoint.native(), packages));
    REQUIRE_EQ(runner.commands.size(), 2);
    REQUIRE(runner.commands[0].starts_with("basestrap "));
    REQUIRE_EQ(runner.commands[1], "fstabgen -U '"s + mountpoint.native() + "'"s);

    const auto& fstab = cryptlvm::file_utils::read_whole_file((mountpoint / "etc/fstab").native());
    REQUIRE_EQ(fstab, "UUID=bbbb / btrfs rw,relatime 0 1\n"sv);
  }
  SECTION("failed basestrap stops before fstab")
  {
    test::RecordingRunner runner{};
    runner.failing.emplace_back("basestrap");

    REQUIRE_FALSE(installer::install_base_system(runner, mountpoint.native(), packages));
    REQUIRE_EQ(runner.count_of("fstabgen"), 0);
    REQUIRE_FALSE(fs::exists(mountpoint / "etc/fstab"));
  }
  SECTION("dry run does not write fstab")
  {
    test::RecordingRunner runner{};
    ::setenv("CRYPTLVM_DRY_RUN", "1", 1);
    const bool installed = installer::install_base_system(runner, mountpoint.native(), packages);
    ::unsetenv("CRYPTLVM_DRY_RUN");

    REQUIRE(installed);
    REQUIRE_EQ(runner.count_of("basestrap"), 1);
    REQUIRE_EQ(runner.count_of("fstabgen"), 0);
    REQUIRE_FALSE(fs::exists(mountpoint / "etc/fstab"));
  }
  SECTION("empty fstab is an error")
  {
    test::RecordingRunner runner{};

    REQUIRE_FALSE(installer::install_base_system(runner, mountpoint.native(), packages));
    REQUIRE_FALSE(fs::exists(mountpoint / "etc/fstab"));
  }

  fs::remove_all(mountpoint, err);
}

TEST_CASE("completion summary")
{
  SECTION("encrypted boot")
  {
    const auto& summary = installer::completion_summary(make_report(cryptlvm::BootTopology::EncryptedBoot));
    REQUIRE(summary.contains("Disk: /dev/nvme0n1\n"sv));
    REQUIRE(summary.contains("Encryption: LUKS1 with serpent-xts-plain64 on /dev/nvme0n1p1\n"sv));
    REQUIRE(summary.contains("LVM Volume Group: lvmSystem\n"sv));
    REQUIRE(summary.contains("  - Boot: volBoot (1G) - FAT32 (encrypted, inside LVM)\n"sv));
    REQUIRE(summary.contains("  - volSwap (8G)\n"sv));
    REQUIRE(summary.contains("  - volRoot (remaining space) - BTRFS\n"sv));
    REQUIRE(summary.contains("Bootloader: GRUB (UEFI)\n"sv));
    REQUIRE_FALSE(summary.contains("unencrypted"sv));
  }
  SECTION("unencrypted boot")
  {
    const auto& summary = installer::completion_summary(make_report(cryptlvm::BootTopology::UnencryptedBoot));
    REQUIRE(summary.contains("on /dev/nvme0n1p2\n"sv));
    REQUIRE(summary.contains("  - Boot: /dev/nvme0n1p1 (1G) - FAT32 (unencrypted partition)\n"sv));
    REQUIRE(summary.contains("Note: the boot partition is unencrypted"sv));
  }
}

TEST_CASE("recovery instructions")
{
  SECTION("encrypted boot")
  {
    const auto& text = installer::recovery_instructions(make_config(cryptlvm::BootTopology::EncryptedBoot));
    REQUIRE(text.contains("  cryptsetup open --type luks1 /dev/nvme0n1p1 lvm-system\n"sv));
    REQUIRE(text.contains("  vgchange -ay lvmSystem\n"sv));
    REQUIRE(text.contains("  mount /dev/lvmSystem/volRoot /mnt\n"sv));
    REQUIRE(text.contains("  mount /dev/lvmSystem/volBoot /mnt/boot\n"sv));
    REQUIRE(text.contains("  artix-chroot /mnt\n"sv));
  }
  SECTION("unencrypted boot")
  {
    const auto& text = installer::recovery_instructions(make_config(cryptlvm::BootTopology::UnencryptedBoot));
    REQUIRE(text.contains("  cryptsetup open --type luks1 /dev/nvme0n1p2 lvm-system\n"sv));
    REQUIRE(text.contains("  mount /dev/nvme0n1p1 /mnt/boot\n"sv));
  }
  SECTION("teardown order")
  {
    const auto& text    = installer::recovery_instructions(make_config(cryptlvm::BootTopology::EncryptedBoot));
    const auto umount   = text.find("umount -R /mnt");
    const auto swapoff  = text.find("swapoff -a");
    const auto vgchange = text.find("vgchange -an lvmSystem");
    const auto close    = text.find("cryptsetup close lvm-system");
    const auto sync_pos = text.rfind("sync");
    REQUIRE_NE(umount, std::string::npos);
    REQUIRE_LT(umount, swapoff);
    REQUIRE_LT(swapoff, vgchange);
    REQUIRE_LT(vgchange, close);
    REQUIRE_LT(close, sync_pos);
  }
}
