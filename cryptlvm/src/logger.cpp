#include "cryptlvm/logger.hpp"

#include <utility>  // for move

#include <spdlog/spdlog.h>

namespace cryptlvm::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

}  // namespace cryptlvm::logger
