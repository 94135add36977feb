#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kc::crypto
{

std::string sha256_hex(std::span<std::uint8_t const> data);
std::optional<std::string> sha256_file_hex(std::filesystem::path const &path);

// Returns "sha256//<base64>" over the certificate's SubjectPublicKeyInfo,
// the form libcurl accepts for CURLOPT_PINNEDPUBLICKEY.
std::optional<std::string> public_key_pin_from_pem(std::string_view pem);

} // namespace kc::crypto
