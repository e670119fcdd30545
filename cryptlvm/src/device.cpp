#include "cryptlvm/device.hpp"
#include "cryptlvm/string_utils.hpp"

#include <algorithm>  // for any_of
#include <cctype>     // for isdigit, isspace

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace cryptlvm::disk {

auto detect_naming_scheme(std::string_view device_name) noexcept -> NamingScheme {
    if (const auto slash_pos = device_name.rfind('/'); slash_pos != std::string_view::npos) {
        device_name.remove_prefix(slash_pos + 1);
    }
    // the kernel inserts 'p' between disk name and partition number
    // whenever the disk name itself ends with a digit
    if (!device_name.empty() && std::isdigit(static_cast<unsigned char>(device_name.back())) != 0) {
        return NamingScheme::NvmeStyle;
    }
    return NamingScheme::Standard;
}

auto make_device_spec(std::string_view identifier) noexcept -> std::optional<DeviceSpec> {
    identifier = utils::trim(identifier);
    if (identifier.empty() || identifier.ends_with('/')) {
        return std::nullopt;
    }
    if (std::ranges::any_of(identifier, [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; })) {
        return std::nullopt;
    }

    auto path = identifier.starts_with("/dev/"sv) ? std::string{identifier} : fmt::format(FMT_COMPILE("/dev/{}"), identifier);
    if (path == "/dev/"sv) {
        return std::nullopt;
    }

    const auto scheme = detect_naming_scheme(path);
    return DeviceSpec{.path = std::move(path), .scheme = scheme};
}

auto partition_path(const DeviceSpec& device, std::uint32_t index) noexcept -> std::string {
    if (device.scheme == NamingScheme::NvmeStyle) {
        return fmt::format(FMT_COMPILE("{}p{}"), device.path, index);
    }
    return fmt::format(FMT_COMPILE("{}{}"), device.path, index);
}

auto mapper_path(std::string_view mapped_name) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("/dev/mapper/{}"), mapped_name);
}

auto lv_path(std::string_view volume_group, std::string_view logical_volume) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("/dev/{}/{}"), volume_group, logical_volume);
}

}  // namespace cryptlvm::disk
