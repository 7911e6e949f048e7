#include "WeightsProvider.h"

#include <filesystem>
#include <system_error>

std::optional<WeightsHandle> DirectoryWeightsProvider::acquire(const std::string& modelId) const {
    if (cacheDir_.empty() || modelId.empty()) return std::nullopt;
    if (modelId.find("..") != std::string::npos) return std::nullopt;

    std::error_code ec;
    const std::filesystem::path candidate = std::filesystem::path(cacheDir_) / modelId;
    if (!std::filesystem::is_regular_file(candidate, ec) || ec) return std::nullopt;
    return WeightsHandle{modelId, candidate.string()};
}
