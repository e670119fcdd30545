#include "doctest_compatibility.h"

#include "cryptlvm/kernel_params.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

TEST_CASE("kernel params test")
{
  using namespace cryptlvm;  // NOLINT

  const fs::IdentifierSet identifiers{
      .crypt_uuid = "6a8f2e1c-0b7d-4c3a-9e5f-1d2c3b4a5e6f",
      .root_uuid  = "c0ffee00-1111-2222-3333-444455556666",
      .swap_uuid  = "deadbeef-aaaa-bbbb-cccc-ddddeeeeffff",
  };

  SECTION("fixed order with resume")
  {
    const std::vector<std::string> expected{
        "cryptdevice=UUID=6a8f2e1c-0b7d-4c3a-9e5f-1d2c3b4a5e6f:lvm-system:allow-discards",
        "root=UUID=c0ffee00-1111-2222-3333-444455556666",
        "loglevel=3",
        "quiet",
        "resume=UUID=deadbeef-aaaa-bbbb-cccc-ddddeeeeffff",
        "net.ifnames=0",
    };
    REQUIRE_EQ(fs::get_kernel_params(identifiers, "lvm-system"sv), expected);
  }
  SECTION("missing swap omits resume")
  {
    auto without_swap      = identifiers;
    without_swap.swap_uuid = std::nullopt;
    REQUIRE_EQ(fs::gen_kernel_cmdline(without_swap, "lvm-system"sv),
        "cryptdevice=UUID=6a8f2e1c-0b7d-4c3a-9e5f-1d2c3b4a5e6f:lvm-system:allow-discards root=UUID=c0ffee00-1111-2222-3333-444455556666 loglevel=3 quiet net.ifnames=0");
  }
  SECTION("regeneration is idempotent")
  {
    const auto first  = fs::gen_kernel_cmdline(identifiers, "lvm-system"sv);
    const auto second = fs::gen_kernel_cmdline(identifiers, "lvm-system"sv);
    REQUIRE_EQ(first, second);
  }
}
