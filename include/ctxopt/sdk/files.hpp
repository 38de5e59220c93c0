#pragma once

#include <string>
#include <string_view>

#include "ctxopt/core/error.hpp"
#include "ctxopt/sdk/host.hpp"
#include "ctxopt/sdk/types.hpp"

namespace ctxopt::sdk {

auto files_read(const Host& host, std::string_view path) -> Result<std::string>;

auto files_exists(const Host& host, std::string_view path) -> bool;

/// Array of relative paths, at most kMaxFiles.
auto files_glob(const Host& host, std::string_view pattern) -> Result<json>;

/// Reads a file and parses it with the language its extension implies.
auto files_read_structure(const Host& host, std::string_view path) -> Result<json>;

} // namespace ctxopt::sdk
