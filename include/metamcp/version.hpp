#pragma once
#include <string_view>

namespace metamcp {

constexpr std::string_view LIBRARY_VERSION     = "1.0.0";
constexpr std::string_view SERVER_NAME         = "meta-analysis-mvp";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace metamcp
