#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace Crypto {
    std::string ComputeSHA256(const std::vector<char>& bytes);
    std::string ComputeFileSHA256(const std::filesystem::path& path);
    std::string RandomHex(size_t bytes);
}
