#ifndef ERASE_HPP
#define ERASE_HPP

#include "cryptlvm/install_config.hpp"

#include <cstddef>  // for size_t
#include <cstdint>  // for uint64_t

#include <expected>     // for expected
#include <functional>   // for function
#include <string>       // for string
#include <string_view>  // for string_view

#include <sys/types.h>  // for ssize_t, off_t

namespace cryptlvm::disk {

// pwrite(2) signature, errno is set on failure
using WriteFunction = std::function<ssize_t(int fd, const void* buf, std::size_t count, off_t offset)>;

struct EraseOptions final {
    // quick: zeroed bytes at the head and at the tail of device
    std::uint64_t quick_span{10ULL * 1024 * 1024};
    // secure pass 1: zeroed bytes at the head of device
    std::uint64_t zero_span{100ULL * 1024 * 1024};
    std::size_t zero_block_size{4096};
    // secure pass 2: keystream block size
    std::size_t random_block_size{64ULL * 1024};
    // ::pwrite if empty
    WriteFunction write_at{};
};

struct EraseSummary final {
    std::uint64_t device_size{};
    std::uint64_t bytes_written{};
    // write failed with ENOSPC before the expected end
    bool reached_end{};
};

/// @brief Destroy previous signatures on device.
///
/// Quick wipes the head and the tail of device with zeros.
/// Secure writes zeros to the head, then AES-256-CTR keystream with
/// throwaway key over the rest of device.
/// Running out of space is tolerated, every other write error is fatal.
/// @param device_path Block device or regular file.
auto erase_device(std::string_view device_path, EraseStrategy strategy, const EraseOptions& options = {}) noexcept -> std::expected<EraseSummary, std::string>;

}  // namespace cryptlvm::disk

#endif  // ERASE_HPP
