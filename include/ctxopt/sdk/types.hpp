#pragma once

#include <nlohmann/json.hpp>

namespace ctxopt::sdk {

/// SDK results keep the key order they are built with, which is the order
/// scripts see when they enumerate or print them.
using json = nlohmann::ordered_json;

} // namespace ctxopt::sdk
