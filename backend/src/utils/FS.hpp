#pragma once

#include <filesystem>
#include <optional>

namespace kc::utils
{

std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path> appdata_root();

} // namespace kc::utils
