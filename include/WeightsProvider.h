#pragma once
#include <optional>
#include <string>

struct WeightsHandle {
    std::string modelId;
    std::string path;
};

// Resolves pretrained weights for foundation-model candidates. Absence is not an error.
class WeightsProvider {
public:
    virtual ~WeightsProvider() = default;
    virtual std::optional<WeightsHandle> acquire(const std::string& modelId) const = 0;
};

// Looks up <cacheDir>/<modelId>; never downloads.
class DirectoryWeightsProvider : public WeightsProvider {
public:
    explicit DirectoryWeightsProvider(std::string cacheDir) : cacheDir_(std::move(cacheDir)) {}
    std::optional<WeightsHandle> acquire(const std::string& modelId) const override;

private:
    std::string cacheDir_;
};
