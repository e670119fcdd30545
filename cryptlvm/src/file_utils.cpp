#include "cryptlvm/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose
#include <cstring>  // for strerror

#include <filesystem>  // for copy_file
#include <fstream>     // for ofstream

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace cryptlvm::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string {
    const std::string path{filepath};

    // Use std::fopen because it's faster than std::ifstream
    auto* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    std::fseek(file, 0u, SEEK_END);
    const auto size = static_cast<std::size_t>(std::ftell(file));
    std::fseek(file, 0u, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    return buf;
}

auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool {
    std::ofstream file{std::string{filepath}, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        spdlog::error("[CREATE_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    return file.good();
}

auto backup_file(std::string_view filepath, std::string_view suffix) noexcept -> bool {
    const fs::path source{filepath};
    const fs::path target{fmt::format(FMT_COMPILE("{}{}"), filepath, suffix)};

    std::error_code err{};
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, err);
    if (err) {
        spdlog::error("[BACKUP_FILE] '{}' -> '{}' failed: {}", source.string(), target.string(), err.message());
        return false;
    }
    return true;
}

}  // namespace cryptlvm::file_utils
