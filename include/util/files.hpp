#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace usync::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& absPath, const std::vector<uint8_t>& data);

// Creates every missing parent directory of path; no-op when there is none
void ensureParentDirs(const std::filesystem::path& path);

std::string bytesToSize(uintmax_t bytes);

}
