#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

std::string errnoToString(int err);
std::optional<std::string> readFile(const std::string& path);
// Writes to a temporary file next to path and renames it, so readers never see a partial file
bool writeFile(const std::string& path, std::string_view contents, bool privateFile = false);
// Creates the parent directories of path
bool prepareDirectories(const std::string& path);

