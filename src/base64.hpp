#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

std::string encodeBase64(const std::byte* data, size_t size);

// RFC 4648 Section 5, without padding (RFC 7515 Section 2)
std::string encodeBase64Url(const std::byte* data, size_t size);
std::string encodeBase64Url(std::string_view data);

std::optional<std::string> decodeBase64Url(std::string_view str);

// Raw digest bytes
std::string sha256(std::string_view data);
