#include "cryptlvm/string_utils.hpp"

namespace cryptlvm::utils {

auto make_multiline(std::string_view str, char delim) noexcept -> std::vector<std::string> {
    std::vector<std::string> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto make_multiline_view(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto join(const std::vector<std::string>& lines, char delim) noexcept -> std::string {
    return lines | std::ranges::views::join_with(delim) | std::ranges::to<std::string>();
}

auto trim(std::string_view str) noexcept -> std::string_view {
    static constexpr std::string_view whitespace{" \t\n\r\f\v"};

    const auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

}  // namespace cryptlvm::utils
