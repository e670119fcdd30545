#ifndef SWAP_HPP
#define SWAP_HPP

#include "cryptlvm/command_runner.hpp"

#include <string_view>  // for string_view

namespace cryptlvm::swap {

// Writes swap signature with label on device
auto make_swap(utils::CommandRunner& runner, std::string_view device, std::string_view label) noexcept -> bool;

// Activates swap on device
auto activate_swap(utils::CommandRunner& runner, std::string_view device) noexcept -> bool;

}  // namespace cryptlvm::swap

#endif  // SWAP_HPP
