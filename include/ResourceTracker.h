#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct ResourceSnapshot {
    int cpus = 1;
    int gpus = 0;
    size_t gpuMemoryBytes = 0;  // per device, 0 = unknown
    size_t memoryBytes = 0;     // 0 = unknown
};

struct ResourceOverrides {
    int numCpus = 0;        // 0 = detect
    int numGpus = -1;       // -1 = detect
    size_t gpuMemoryMb = 0;
};

/**
 * Reads CPU/GPU/memory limits from a filesystem root. Every path is resolved below the
 * root so tests can point it at a fake /proc and /sys tree.
 */
class ResourceProbe {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    explicit ResourceProbe(std::string rootPath = "/", EnvLookup env = {});

    /**
     * @brief Detects the resource snapshot; overrides win over detection.
     * @post cpus >= 1 and gpus >= 0. Never throws on unreadable files.
     */
    ResourceSnapshot probe(const ResourceOverrides& overrides = {}) const;

    int detectCpus() const;
    int detectGpus() const;
    size_t detectMemoryBytes() const;

    // Quota/period from cgroup v2 cpu.max or v1 cfs files; nullopt when unlimited or absent.
    std::optional<double> cgroupCpuLimit() const;

private:
    std::string path(const std::string& relative) const;
    std::optional<std::string> readFirstLine(const std::string& relative) const;

    std::string root_;
    EnvLookup env_;
};

/**
 * Per-fit clock and cached resource view. The snapshot is taken once at construction and
 * never re-queried.
 */
class ResourceTracker {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    ResourceTracker(double budgetSeconds, ResourceSnapshot snapshot, NowFn now = {});

    // Seconds left against the original budget, never negative.
    double remainingTime() const;
    double elapsed() const;
    double budgetSeconds() const noexcept { return budgetSeconds_; }
    const ResourceSnapshot& availableParallelism() const noexcept { return snapshot_; }
    Clock::time_point budgetEnd() const noexcept { return end_; }
    Clock::time_point now() const { return now_(); }

private:
    double budgetSeconds_;
    ResourceSnapshot snapshot_;
    NowFn now_;
    Clock::time_point start_;
    Clock::time_point end_;
};

// One lease per physical GPU. Leases release on destruction.
class GpuSlotPool {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(GpuSlotPool* pool, int device) : pool_(pool), device_(device) {}
        ~Lease() { reset(); }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        int device() const noexcept { return device_; }
        bool held() const noexcept { return pool_ != nullptr; }
        void reset() noexcept;

    private:
        GpuSlotPool* pool_ = nullptr;
        int device_ = -1;
    };

    explicit GpuSlotPool(int gpuCount);

    /**
     * @brief Waits for a free device until the deadline.
     * @post Returns std::nullopt on timeout or when the pool has no devices.
     */
    std::optional<Lease> acquireUntil(std::chrono::steady_clock::time_point deadline);

    int capacity() const noexcept { return static_cast<int>(busy_.size()); }
    int available() const;

private:
    void release(int device) noexcept;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<bool> busy_;
};
