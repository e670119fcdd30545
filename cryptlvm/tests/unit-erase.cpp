#include "doctest_compatibility.h"

#include "cryptlvm/erase.hpp"
#include "cryptlvm/file_utils.hpp"
#include "cryptlvm/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <string>
#include <string_view>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

namespace {

auto all_equal(std::string_view data, char value) noexcept -> bool {
  return std::ranges::all_of(data, [value](char ch) { return ch == value; });
}

// Writes through until limit, then fails with err
auto failing_writer(off_t limit, int err) -> cryptlvm::disk::WriteFunction {
  return [limit, err](int fd, const void* buf, std::size_t count, off_t offset) -> ssize_t {
    if (offset >= limit) {
      errno = err;
      return -1;
    }
    return ::pwrite(fd, buf, count, offset);
  };
}

}  // namespace

TEST_CASE("erase test")
{
  auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
    // noop
  });
  auto logger = std::make_shared<spdlog::logger>("default", callback_sink);
  cryptlvm::logger::set_logger(logger);

  using namespace cryptlvm;  // NOLINT

  static constexpr std::string_view filename{"/tmp/cryptlvm-erase-test.img"};
  static constexpr std::size_t file_size = 64 * 1024;

  const cryptlvm::disk::EraseOptions options{
      .quick_span        = 4096,
      .zero_span         = 8192,
      .zero_block_size   = 1024,
      .random_block_size = 4096,
  };

  SECTION("quick erase wipes head and tail")
  {
    REQUIRE(file_utils::create_file_for_overwrite(filename, std::string(file_size, '\xAA')));

    const auto summary = disk::erase_device(filename, EraseStrategy::Quick, options);
    REQUIRE(summary.has_value());
    REQUIRE_EQ(summary->device_size, file_size);
    REQUIRE_EQ(summary->bytes_written, 2 * 4096);
    REQUIRE_FALSE(summary->reached_end);

    const auto content = file_utils::read_whole_file(filename);
    const std::string_view view{content};
    REQUIRE_EQ(content.size(), file_size);
    REQUIRE(all_equal(view.substr(0, 4096), '\0'));
    REQUIRE(all_equal(view.substr(4096, file_size - 2 * 4096), '\xAA'));
    REQUIRE(all_equal(view.substr(file_size - 4096), '\0'));
    std::filesystem::remove(filename);
  }
  SECTION("secure erase overwrites the whole device")
  {
    REQUIRE(file_utils::create_file_for_overwrite(filename, std::string(file_size, '\xAA')));

    const auto summary = disk::erase_device(filename, EraseStrategy::Secure, options);
    REQUIRE(summary.has_value());
    REQUIRE_EQ(summary->bytes_written, file_size);

    const auto content = file_utils::read_whole_file(filename);
    const std::string_view view{content};
    REQUIRE_EQ(content.size(), file_size);
    REQUIRE(all_equal(view.substr(0, 8192), '\0'));

    // keystream must not leave the old pattern nor zeros behind
    const auto random_part = view.substr(8192);
    REQUIRE_FALSE(all_equal(random_part, '\0'));
    REQUIRE_LT(std::ranges::count(random_part, '\xAA'), static_cast<std::ptrdiff_t>(random_part.size() / 16));
    std::filesystem::remove(filename);
  }
  SECTION("writes never extend a small file")
  {
    REQUIRE(file_utils::create_file_for_overwrite(filename, std::string(1000, '\xAA')));

    const auto quick = disk::erase_device(filename, EraseStrategy::Quick, options);
    REQUIRE(quick.has_value());
    REQUIRE_EQ(quick->bytes_written, 2000);
    REQUIRE_EQ(std::filesystem::file_size(filename), 1000);

    const auto secure = disk::erase_device(filename, EraseStrategy::Secure, options);
    REQUIRE(secure.has_value());
    REQUIRE_EQ(secure->bytes_written, 1000);
    REQUIRE_EQ(std::filesystem::file_size(filename), 1000);
    REQUIRE(all_equal(file_utils::read_whole_file(filename), '\0'));
    std::filesystem::remove(filename);
  }
  SECTION("missing device is fatal")
  {
    const auto summary = disk::erase_device("/tmp/cryptlvm-does-not-exist.img", EraseStrategy::Quick, options);
    REQUIRE_FALSE(summary.has_value());
  }
  SECTION("directory is not a device")
  {
    const auto summary = disk::erase_device("/tmp", EraseStrategy::Quick, options);
    REQUIRE_FALSE(summary.has_value());
  }
  SECTION("end of device stops the pass")
  {
    REQUIRE(file_utils::create_file_for_overwrite(filename, std::string(file_size, '\xAA')));
    auto short_device     = options;
    short_device.write_at = failing_writer(4096, ENOSPC);

    const auto summary = disk::erase_device(filename, EraseStrategy::Secure, short_device);
    REQUIRE(summary.has_value());
    REQUIRE(summary->reached_end);
    REQUIRE_EQ(summary->bytes_written, 4096);

    // pass 2 is not attempted after the device ran out
    const auto content = file_utils::read_whole_file(filename);
    const std::string_view view{content};
    REQUIRE(all_equal(view.substr(0, 4096), '\0'));
    REQUIRE(all_equal(view.substr(4096), '\xAA'));
    std::filesystem::remove(filename);
  }
  SECTION("write error is fatal")
  {
    REQUIRE(file_utils::create_file_for_overwrite(filename, std::string(file_size, '\xAA')));
    auto broken_device     = options;
    broken_device.write_at = failing_writer(2048, EIO);

    const auto summary = disk::erase_device(filename, EraseStrategy::Quick, broken_device);
    REQUIRE_FALSE(summary.has_value());
    REQUIRE(summary.error().find("Head wipe") != std::string::npos);
    REQUIRE(summary.error().find("Write failed at offset 2048") != std::string::npos);
    std::filesystem::remove(filename);
  }
}
