#include "doctest_compatibility.h"

#include "cryptlvm/string_utils.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

TEST_CASE("Split test")
{
  SECTION("empty string view")
  {
    static constexpr auto input = ""sv;
    const auto tokens = cryptlvm::utils::make_multiline_view(input, ',');
    REQUIRE_EQ(tokens.size(), 0);
  }
  SECTION("single delim string view")
  {
    static constexpr auto input = ","sv;
    const auto tokens = cryptlvm::utils::make_multiline_view(input, ',');
    REQUIRE_EQ(tokens.size(), 0);
  }
  SECTION("short string view")
  {
    static constexpr auto input = "1,22,333"sv;
    const auto tokens = cryptlvm::utils::make_multiline_view(input, ',');
    REQUIRE_EQ(input.data(), tokens[0].data());
    REQUIRE_EQ(tokens.size(), 3);
    REQUIRE_EQ(tokens[0], "1");
    REQUIRE_EQ(tokens[1], "22");
    REQUIRE_EQ(tokens[2], "333");
  }
  SECTION("lsblk output")
  {
    static constexpr auto input = "NAME SIZE TYPE\nvda 20G disk\n\nvda1 1G part\n"sv;
    const auto lines = cryptlvm::utils::make_multiline(input);
    REQUIRE_EQ(lines.size(), 3);
    REQUIRE_EQ(lines[0], "NAME SIZE TYPE");
    REQUIRE_EQ(lines[1], "vda 20G disk");
    REQUIRE_EQ(lines[2], "vda1 1G part");
  }
}

TEST_CASE("join test")
{
  SECTION("empty vector")
  {
    const std::vector<std::string> input{};
    const auto joined_str = cryptlvm::utils::join(input, ',');
    REQUIRE_EQ(joined_str.empty(), true);
  }
  SECTION("single delim")
  {
    const std::vector<std::string> input{","};
    const auto joined_str = cryptlvm::utils::join(input, ',');
    REQUIRE_EQ(joined_str.size(), 1);
    REQUIRE_EQ(joined_str, ",");
  }
  SECTION("short vector")
  {
    const std::vector<std::string> input{"1", "22", "333"};
    const auto joined_str = cryptlvm::utils::join(input, ',');
    REQUIRE_EQ(joined_str.size(), 8);
    REQUIRE_EQ(joined_str, "1,22,333");
  }
  SECTION("empty lines are kept")
  {
    const std::vector<std::string> input{"", "HOOKS=(base)", "", ""};
    const auto joined_str = cryptlvm::utils::join(input);
    REQUIRE_EQ(joined_str, "\nHOOKS=(base)\n\n");
  }
}

TEST_CASE("trim test")
{
  SECTION("empty string view")
  {
    static constexpr auto input = ""sv;
    const auto trimmed_str = cryptlvm::utils::trim(input);
    REQUIRE_EQ(trimmed_str.size(), 0);
    REQUIRE_EQ(trimmed_str, input);
  }
  SECTION("only chars to trim")
  {
    static constexpr auto input = "\n\t \t\v\f"sv;
    const auto trimmed_str = cryptlvm::utils::trim(input);
    REQUIRE_EQ(trimmed_str.size(), 0);
    REQUIRE_EQ(trimmed_str, ""sv);
  }
  SECTION("blkid output")
  {
    static constexpr auto input = "  1b0e4a2c-7d1f-4c55-9f1e-2a3b4c5d6e7f\n"sv;
    const auto trimmed_str = cryptlvm::utils::trim(input);
    REQUIRE_EQ(trimmed_str, "1b0e4a2c-7d1f-4c55-9f1e-2a3b4c5d6e7f"sv);
  }
}
