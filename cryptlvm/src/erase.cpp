#include "cryptlvm/erase.hpp"

#include <cerrno>   // for errno, ENOSPC, EINTR
#include <cstring>  // for strerror

#include <algorithm>   // for min
#include <array>       // for array
#include <functional>  // for function
#include <memory>      // for unique_ptr
#include <span>        // for span
#include <vector>      // for vector

#include <fcntl.h>      // for open, O_WRONLY, O_CLOEXEC
#include <linux/fs.h>   // for BLKGETSIZE64
#include <sys/ioctl.h>  // for ioctl
#include <sys/stat.h>   // for fstat, S_ISBLK, S_ISREG
#include <unistd.h>     // for pwrite, fsync, close

#include <openssl/crypto.h>  // for OPENSSL_cleanse
#include <openssl/evp.h>     // for EVP_*
#include <openssl/rand.h>    // for RAND_bytes

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace {

class ScopedFd final {
 public:
    explicit ScopedFd(const std::string& path) noexcept
      : m_fd(::open(path.c_str(), O_WRONLY | O_CLOEXEC)) { }
    ~ScopedFd() noexcept {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }

    ScopedFd(const ScopedFd&)            = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    [[nodiscard]] bool is_open() const noexcept { return m_fd >= 0; }
    [[nodiscard]] int get() const noexcept { return m_fd; }

 private:
    int m_fd{-1};
};

// Produces AES-256-CTR keystream, key and iv live only as long as the object
class Keystream final {
 public:
    Keystream() noexcept = default;
    ~Keystream() noexcept {
        OPENSSL_cleanse(m_key.data(), m_key.size());
        OPENSSL_cleanse(m_iv.data(), m_iv.size());
    }

    Keystream(const Keystream&)            = delete;
    Keystream& operator=(const Keystream&) = delete;

    auto init() noexcept -> bool {
        if (!m_ctx) {
            return false;
        }
        if (RAND_bytes(m_key.data(), static_cast<int>(m_key.size())) != 1
            || RAND_bytes(m_iv.data(), static_cast<int>(m_iv.size())) != 1) {
            spdlog::error("RAND_bytes failed to provide a key");
            return false;
        }
        return EVP_EncryptInit_ex(m_ctx.get(), EVP_aes_256_ctr(), nullptr, m_key.data(), m_iv.data()) == 1;
    }

    // encrypting zeros gives the raw keystream
    auto fill(std::span<unsigned char> out) noexcept -> bool {
        std::ranges::fill(out, static_cast<unsigned char>(0));
        int out_len{};
        return EVP_EncryptUpdate(m_ctx.get(), out.data(), &out_len, out.data(), static_cast<int>(out.size())) == 1
            && static_cast<std::size_t>(out_len) == out.size();
    }

 private:
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> m_ctx{EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
    std::array<unsigned char, 32> m_key{};
    std::array<unsigned char, 16> m_iv{};
};

enum class WriteStatus {
    Done,
    NoSpace,
    Failed,
};

struct SpanWriter final {
    int fd{};
    const cryptlvm::disk::WriteFunction& write_at;
    std::uint64_t device_size{};
    std::uint64_t bytes_written{};
    std::string error{};

    // Writes [offset, offset + length) clamped to the device size.
    // fill_block refills the buffer before each write.
    template <typename F>
    auto write(std::uint64_t offset, std::uint64_t length, std::vector<unsigned char>& buffer, F&& fill_block) noexcept -> WriteStatus {
        const auto end = std::min(device_size, offset + length);
        while (offset < end) {
            const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), end - offset));
            if (!fill_block(std::span{buffer.data(), chunk})) {
                error = "Failed to generate random data";
                return WriteStatus::Failed;
            }

            std::size_t done{};
            while (done < chunk) {
                const auto ret = write_at(fd, buffer.data() + done, chunk - done, static_cast<off_t>(offset + done));
                if (ret < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    if (errno == ENOSPC) {
                        bytes_written += done;
                        return WriteStatus::NoSpace;
                    }
                    error = fmt::format(FMT_COMPILE("Write failed at offset {}: {}"), offset + done, std::strerror(errno));
                    return WriteStatus::Failed;
                }
                if (ret == 0) {
                    bytes_written += done;
                    return WriteStatus::NoSpace;
                }
                done += static_cast<std::size_t>(ret);
            }
            bytes_written += chunk;
            offset += chunk;
        }
        return WriteStatus::Done;
    }
};

auto query_device_size(int fd) noexcept -> std::expected<std::uint64_t, std::string> {
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("fstat failed: {}"), std::strerror(errno)));
    }
    if (S_ISREG(st.st_mode)) {
        return static_cast<std::uint64_t>(st.st_size);
    }
    if (!S_ISBLK(st.st_mode)) {
        return std::unexpected("not a block device");
    }

    std::uint64_t size{};
    if (::ioctl(fd, BLKGETSIZE64, &size) != 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("BLKGETSIZE64 failed: {}"), std::strerror(errno)));
    }
    return size;
}

auto sync_device(int fd, std::string_view device_path) noexcept -> std::expected<void, std::string> {
    if (::fsync(fd) != 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to sync {}: {}"), device_path, std::strerror(errno)));
    }
    return {};
}

constexpr auto zero_fill = [](std::span<unsigned char> block) noexcept {
    std::ranges::fill(block, static_cast<unsigned char>(0));
    return true;
};

}  // namespace

namespace cryptlvm::disk {

auto erase_device(std::string_view device_path, EraseStrategy strategy, const EraseOptions& options) noexcept -> std::expected<EraseSummary, std::string> {
    const ScopedFd fd{std::string{device_path}};
    if (!fd.is_open()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Cannot open {} for writing: {}"), device_path, std::strerror(errno)));
    }

    auto device_size = query_device_size(fd.get());
    if (!device_size) {
        return std::unexpected(fmt::format(FMT_COMPILE("Cannot determine size of {}: {}"), device_path, device_size.error()));
    }

    const WriteFunction write_at = options.write_at ? options.write_at : WriteFunction{&::pwrite};
    SpanWriter writer{.fd = fd.get(), .write_at = write_at, .device_size = *device_size};
    EraseSummary summary{.device_size = *device_size};

    const auto finish_pass = [&](WriteStatus status, std::string_view pass_name) -> std::expected<void, std::string> {
        if (status == WriteStatus::Failed) {
            return std::unexpected(fmt::format(FMT_COMPILE("{} on {}: {}"), pass_name, device_path, writer.error));
        }
        if (status == WriteStatus::NoSpace) {
            spdlog::warn("{}: reached end of {}, continuing", pass_name, device_path);
            summary.reached_end = true;
        }
        return sync_device(fd.get(), device_path);
    };

    if (strategy == EraseStrategy::Quick) {
        spdlog::info("Quick erase of {} ({} bytes)", device_path, *device_size);
        std::vector<unsigned char> buffer(options.zero_block_size);

        const auto head_status = writer.write(0, options.quick_span, buffer, zero_fill);
        if (auto synced = finish_pass(head_status, "Head wipe"); !synced) {
            return std::unexpected(synced.error());
        }

        const auto tail_offset = (*device_size > options.quick_span) ? *device_size - options.quick_span : 0;
        const auto tail_status = writer.write(tail_offset, options.quick_span, buffer, zero_fill);
        if (auto synced = finish_pass(tail_status, "Tail wipe"); !synced) {
            return std::unexpected(synced.error());
        }

        summary.bytes_written = writer.bytes_written;
        return summary;
    }

    spdlog::info("Secure erase of {} ({} bytes), pass 1: zeros", device_path, *device_size);
    std::vector<unsigned char> zero_buffer(options.zero_block_size);
    const auto zero_status = writer.write(0, options.zero_span, zero_buffer, zero_fill);
    if (auto synced = finish_pass(zero_status, "Pass 1"); !synced) {
        return std::unexpected(synced.error());
    }

    if (zero_status == WriteStatus::Done && *device_size > options.zero_span) {
        spdlog::info("Secure erase of {}, pass 2: random keystream", device_path);
        Keystream keystream{};
        if (!keystream.init()) {
            return std::unexpected("Failed to initialize AES-256-CTR keystream");
        }

        std::vector<unsigned char> random_buffer(options.random_block_size);
        const auto random_status = writer.write(options.zero_span, *device_size - options.zero_span, random_buffer,
            [&keystream](std::span<unsigned char> block) { return keystream.fill(block); });
        OPENSSL_cleanse(random_buffer.data(), random_buffer.size());
        if (auto synced = finish_pass(random_status, "Pass 2"); !synced) {
            return std::unexpected(synced.error());
        }
    }

    summary.bytes_written = writer.bytes_written;
    spdlog::info("Erase of {} finished, {} bytes written", device_path, summary.bytes_written);
    return summary;
}

}  // namespace cryptlvm::disk
