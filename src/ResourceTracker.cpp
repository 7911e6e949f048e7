#include "ResourceTracker.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <thread>
#ifdef __linux__
#include <sched.h>
#endif

namespace {
std::optional<long long> parseLongLong(const std::string& token) {
    try {
        size_t pos = 0;
        const long long v = std::stoll(token, &pos);
        if (pos != token.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int affinityCpuCount() {
#ifdef __linux__
    cpu_set_t set;
    CPU_ZERO(&set);
    if (sched_getaffinity(0, sizeof(set), &set) == 0) {
        const int count = CPU_COUNT(&set);
        if (count > 0) return count;
    }
#endif
    return 0;
}

std::optional<std::string> processEnv(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}
} // namespace

ResourceProbe::ResourceProbe(std::string rootPath, EnvLookup env)
    : root_(std::move(rootPath)), env_(env ? std::move(env) : EnvLookup(processEnv)) {
    if (root_.empty()) root_ = "/";
}

std::string ResourceProbe::path(const std::string& relative) const {
    return (std::filesystem::path(root_) / relative).string();
}

std::optional<std::string> ResourceProbe::readFirstLine(const std::string& relative) const {
    std::ifstream in(path(relative));
    if (!in) return std::nullopt;
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    return CommonUtils::trim(line);
}

std::optional<double> ResourceProbe::cgroupCpuLimit() const {
    if (auto v2 = readFirstLine("sys/fs/cgroup/cpu.max")) {
        std::istringstream is(*v2);
        std::string quota;
        std::string period;
        is >> quota >> period;
        if (quota == "max") return std::nullopt;
        const auto q = parseLongLong(quota);
        const auto p = period.empty() ? std::optional<long long>(100000) : parseLongLong(period);
        if (q && p && *q > 0 && *p > 0) return static_cast<double>(*q) / static_cast<double>(*p);
        return std::nullopt;
    }

    const auto quota = readFirstLine("sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    const auto period = readFirstLine("sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (!quota || !period) return std::nullopt;
    const auto q = parseLongLong(*quota);
    const auto p = parseLongLong(*period);
    if (!q || !p || *q <= 0 || *p <= 0) return std::nullopt;
    return static_cast<double>(*q) / static_cast<double>(*p);
}

int ResourceProbe::detectCpus() const {
    int cpus = static_cast<int>(std::thread::hardware_concurrency());
    const int affinity = affinityCpuCount();
    if (affinity > 0) cpus = cpus > 0 ? std::min(cpus, affinity) : affinity;

    if (const auto limit = cgroupCpuLimit()) {
        const int quotaCpus = std::max(1, static_cast<int>(std::floor(*limit)));
        cpus = cpus > 0 ? std::min(cpus, quotaCpus) : quotaCpus;
    }
    return std::max(1, cpus);
}

int ResourceProbe::detectGpus() const {
    if (const auto visible = env_("CUDA_VISIBLE_DEVICES")) {
        const std::string value = CommonUtils::toLower(CommonUtils::trim(*visible));
        if (value.empty() || value == "-1" || value == "none" || value == "nodevfiles") return 0;
        return static_cast<int>(CommonUtils::splitList(value).size());
    }

    std::error_code ec;
    const std::filesystem::path gpuDir(path("proc/driver/nvidia/gpus"));
    if (!std::filesystem::is_directory(gpuDir, ec) || ec) return 0;
    int count = 0;
    for (std::filesystem::directory_iterator it(gpuDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) ++count;
    }
    return count;
}

size_t ResourceProbe::detectMemoryBytes() const {
    const auto parseLimit = [](const std::optional<std::string>& line) -> size_t {
        if (!line || *line == "max") return 0;
        const auto v = parseLongLong(*line);
        // cgroup v1 reports "unlimited" as a page-aligned huge number.
        if (!v || *v <= 0 || *v >= (1LL << 60)) return 0;
        return static_cast<size_t>(*v);
    };
    size_t cgroup = parseLimit(readFirstLine("sys/fs/cgroup/memory.max"));
    if (cgroup == 0) cgroup = parseLimit(readFirstLine("sys/fs/cgroup/memory/memory.limit_in_bytes"));

    size_t available = 0;
    std::ifstream meminfo(path("proc/meminfo"));
    std::string line;
    while (meminfo && std::getline(meminfo, line)) {
        if (line.rfind("MemAvailable:", 0) != 0) continue;
        std::istringstream is(line.substr(13));
        long long kb = 0;
        if (is >> kb && kb > 0) available = static_cast<size_t>(kb) * 1024;
        break;
    }

    if (cgroup > 0 && available > 0) return std::min(cgroup, available);
    return cgroup > 0 ? cgroup : available;
}

ResourceSnapshot ResourceProbe::probe(const ResourceOverrides& overrides) const {
    ResourceSnapshot snap;
    snap.cpus = overrides.numCpus > 0 ? overrides.numCpus : detectCpus();
    snap.gpus = overrides.numGpus >= 0 ? overrides.numGpus : detectGpus();
    snap.gpuMemoryBytes = overrides.gpuMemoryMb * 1024 * 1024;
    snap.memoryBytes = detectMemoryBytes();
    return snap;
}

ResourceTracker::ResourceTracker(double budgetSeconds, ResourceSnapshot snapshot, NowFn now)
    : budgetSeconds_(std::max(0.0, budgetSeconds)),
      snapshot_(snapshot),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {
    snapshot_.cpus = std::max(1, snapshot_.cpus);
    snapshot_.gpus = std::max(0, snapshot_.gpus);
    start_ = now_();
    end_ = start_ + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(budgetSeconds_));
}

double ResourceTracker::elapsed() const {
    return std::chrono::duration<double>(now_() - start_).count();
}

double ResourceTracker::remainingTime() const {
    return std::max(0.0, budgetSeconds_ - elapsed());
}

GpuSlotPool::GpuSlotPool(int gpuCount) : busy_(static_cast<size_t>(std::max(0, gpuCount)), false) {}

GpuSlotPool::Lease::Lease(Lease&& other) noexcept : pool_(other.pool_), device_(other.device_) {
    other.pool_ = nullptr;
    other.device_ = -1;
}

GpuSlotPool::Lease& GpuSlotPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        reset();
        pool_ = other.pool_;
        device_ = other.device_;
        other.pool_ = nullptr;
        other.device_ = -1;
    }
    return *this;
}

void GpuSlotPool::Lease::reset() noexcept {
    if (pool_ != nullptr) pool_->release(device_);
    pool_ = nullptr;
    device_ = -1;
}

std::optional<GpuSlotPool::Lease> GpuSlotPool::acquireUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (busy_.empty()) return std::nullopt;
    auto freeSlot = [this] { return std::find(busy_.begin(), busy_.end(), false) != busy_.end(); };
    if (!cv_.wait_until(lock, deadline, freeSlot)) return std::nullopt;
    const auto it = std::find(busy_.begin(), busy_.end(), false);
    *it = true;
    return Lease(this, static_cast<int>(std::distance(busy_.begin(), it)));
}

int GpuSlotPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count(busy_.begin(), busy_.end(), false));
}

void GpuSlotPool::release(int device) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (device >= 0 && static_cast<size_t>(device) < busy_.size()) busy_[static_cast<size_t>(device)] = false;
    }
    cv_.notify_one();
}
