#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptlvm::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

// CRYPTLVM_DRY_RUN=1: state-changing commands and file writes are logged and skipped
auto is_dry_run() noexcept -> bool;

// Runs command through the shell and returns captured stdout,
// without the trailing newline.
auto exec(std::string_view command) noexcept -> std::string;

// Runs command through the shell attached to the current terminal.
// Returns true if the command exited with status 0.
auto exec_checked(std::string_view command) noexcept -> bool;

// Runs command through the shell, writing input to its stdin.
// Returns true if the command exited with status 0.
auto exec_with_input(std::string_view command, std::string_view input) noexcept -> bool;

}  // namespace cryptlvm::utils

#endif  // IO_UTILS_HPP
