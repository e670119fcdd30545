#include "doctest_compatibility.h"

#include "recording_runner.hpp"

#include "cryptlvm/logger.hpp"
#include "cryptlvm/partitioning.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

TEST_CASE("partitioning gen test")
{
  auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
    // noop
  });
  auto logger = std::make_shared<spdlog::logger>("default", callback_sink);
  cryptlvm::logger::set_logger(logger);

  using namespace cryptlvm::disk;  // NOLINT
  using cryptlvm::BootTopology;

  const auto device = *make_device_spec("nvme0n1"sv);

  SECTION("encrypted boot has one partition")
  {
    const auto layout = plan_partitions(BootTopology::EncryptedBoot, SizeSpec{.value = "1G"});
    REQUIRE_EQ(layout.size(), 1);
    REQUIRE_EQ(layout[0].index, 1);
    REQUIRE_EQ(layout[0].role, PartitionRole::Lvm);
    REQUIRE_EQ(layout[0].fs_hint, "btrfs");
    REQUIRE(layout[0].boot_flag);
    REQUIRE(layout[0].lvm_flag);
    REQUIRE_EQ(layout[0].start, "0%");
    REQUIRE_EQ(layout[0].end, "100%");
    REQUIRE_EQ(lvm_partition_index(layout), 1);
  }
  SECTION("unencrypted boot has two partitions")
  {
    const auto layout = plan_partitions(BootTopology::UnencryptedBoot, SizeSpec{.value = "512M"});
    REQUIRE_EQ(layout.size(), 2);
    REQUIRE_EQ(layout[0].role, PartitionRole::Boot);
    REQUIRE_EQ(layout[0].fs_hint, "fat32");
    REQUIRE(layout[0].boot_flag);
    REQUIRE_FALSE(layout[0].lvm_flag);
    REQUIRE_EQ(layout[0].end, "512M");
    REQUIRE_EQ(layout[1].role, PartitionRole::Lvm);
    REQUIRE_EQ(layout[1].fs_hint, "ext4");
    REQUIRE_FALSE(layout[1].boot_flag);
    REQUIRE(layout[1].lvm_flag);
    REQUIRE_EQ(layout[1].start, "512M");
    REQUIRE_EQ(layout[1].end, "100%");
    REQUIRE_EQ(lvm_partition_index(layout), 2);
  }
  SECTION("parted commands")
  {
    const auto layout   = plan_partitions(BootTopology::UnencryptedBoot, SizeSpec{.value = "1G"});
    const auto commands = gen_parted_commands(device, layout);

    const std::vector<std::string> expected{
        "parted -s '/dev/nvme0n1' mklabel msdos",
        "parted -s -a optimal '/dev/nvme0n1' mkpart primary fat32 0% 1G",
        "parted -s '/dev/nvme0n1' set 1 boot on",
        "parted -s -a optimal '/dev/nvme0n1' mkpart primary ext4 1G 100%",
        "parted -s '/dev/nvme0n1' set 2 lvm on",
    };
    REQUIRE_EQ(commands, expected);
  }
  SECTION("apply layout checks alignment and waits for nodes")
  {
    test::RecordingRunner runner{};
    const auto layout = plan_partitions(BootTopology::EncryptedBoot, SizeSpec{.value = "1G"});

    const auto result = apply_partition_layout(runner, device, layout, 3, std::chrono::milliseconds{0});
    REQUIRE(result.has_value());
    REQUIRE(runner.ran("parted -s '/dev/nvme0n1' align-check optimal 1"));
    REQUIRE(runner.ran("partprobe '/dev/nvme0n1'"));
    REQUIRE(runner.ran("sync"));
    REQUIRE(runner.ran("test -b '/dev/nvme0n1p1'"));
    REQUIRE(*runner.index_of("align-check") < *runner.index_of("partprobe"));
    REQUIRE(*runner.index_of("partprobe") < *runner.index_of("test -b"));
  }
  SECTION("misaligned partition is fatal")
  {
    test::RecordingRunner runner{};
    runner.failing.emplace_back("align-check");
    const auto layout = plan_partitions(BootTopology::EncryptedBoot, SizeSpec{.value = "1G"});

    const auto result = apply_partition_layout(runner, device, layout, 3, std::chrono::milliseconds{0});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("/dev/nvme0n1p1") != std::string::npos);
    REQUIRE_FALSE(runner.index_of("partprobe").has_value());
  }
  SECTION("partition node never appears")
  {
    test::RecordingRunner runner{};
    runner.failing.emplace_back("test -b");
    const auto layout = plan_partitions(BootTopology::EncryptedBoot, SizeSpec{.value = "1G"});

    const auto result = settle_partitions(runner, device, layout, 4, std::chrono::milliseconds{0});
    REQUIRE_FALSE(result.has_value());
    REQUIRE_EQ(runner.count_of("test -b '/dev/nvme0n1p1'"), 4);
  }
}
