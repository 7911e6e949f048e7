#include <catch2/catch.hpp>

#include "ResourceTracker.h"
#include "TestData.h"

#include <memory>
#include <thread>

using TestData::TempDir;

namespace {
ResourceProbe::EnvLookup noEnv() {
    return [](const std::string&) -> std::optional<std::string> { return std::nullopt; };
}

ResourceProbe::EnvLookup cudaVisible(const std::string& value) {
    return [value](const std::string& key) -> std::optional<std::string> {
        if (key == "CUDA_VISIBLE_DEVICES") return value;
        return std::nullopt;
    };
}
} // namespace

TEST_CASE("cgroup v2 cpu quota caps the detected cpu count", "[resources]") {
    TempDir root;
    root.write("sys/fs/cgroup/cpu.max", "200000 100000\n");
    const ResourceProbe probe(root.path().string(), noEnv());

    REQUIRE(probe.cgroupCpuLimit().has_value());
    CHECK(*probe.cgroupCpuLimit() == Approx(2.0));
    const int cpus = probe.detectCpus();
    CHECK(cpus >= 1);
    CHECK(cpus <= 2);
}

TEST_CASE("unlimited cgroup quota is not a limit", "[resources]") {
    TempDir root;
    root.write("sys/fs/cgroup/cpu.max", "max 100000\n");
    const ResourceProbe probe(root.path().string(), noEnv());
    CHECK_FALSE(probe.cgroupCpuLimit().has_value());
    CHECK(probe.detectCpus() >= 1);
}

TEST_CASE("cgroup v1 cfs quota is honoured", "[resources]") {
    TempDir root;
    root.write("sys/fs/cgroup/cpu/cpu.cfs_quota_us", "50000\n");
    root.write("sys/fs/cgroup/cpu/cpu.cfs_period_us", "100000\n");
    const ResourceProbe probe(root.path().string(), noEnv());

    REQUIRE(probe.cgroupCpuLimit().has_value());
    CHECK(*probe.cgroupCpuLimit() == Approx(0.5));
    CHECK(probe.detectCpus() == 1);

    TempDir unlimited;
    unlimited.write("sys/fs/cgroup/cpu/cpu.cfs_quota_us", "-1\n");
    unlimited.write("sys/fs/cgroup/cpu/cpu.cfs_period_us", "100000\n");
    CHECK_FALSE(ResourceProbe(unlimited.path().string(), noEnv()).cgroupCpuLimit().has_value());
}

TEST_CASE("missing cgroup files fall back to the host count", "[resources]") {
    TempDir root;
    const ResourceProbe probe(root.path().string(), noEnv());
    CHECK_FALSE(probe.cgroupCpuLimit().has_value());
    CHECK(probe.detectCpus() >= 1);
    CHECK(probe.detectMemoryBytes() == 0);
}

TEST_CASE("CUDA_VISIBLE_DEVICES decides the gpu count when set", "[resources]") {
    TempDir root;
    root.mkdir("proc/driver/nvidia/gpus/0000:01:00.0");
    CHECK(ResourceProbe(root.path().string(), cudaVisible("0,1")).detectGpus() == 2);
    CHECK(ResourceProbe(root.path().string(), cudaVisible("")).detectGpus() == 0);
    CHECK(ResourceProbe(root.path().string(), cudaVisible("-1")).detectGpus() == 0);
    CHECK(ResourceProbe(root.path().string(), cudaVisible("NoDevFiles")).detectGpus() == 0);
}

TEST_CASE("driver directories are counted without the environment variable", "[resources]") {
    TempDir root;
    root.mkdir("proc/driver/nvidia/gpus/0000:01:00.0");
    root.mkdir("proc/driver/nvidia/gpus/0000:02:00.0");
    CHECK(ResourceProbe(root.path().string(), noEnv()).detectGpus() == 2);

    TempDir bare;
    CHECK(ResourceProbe(bare.path().string(), noEnv()).detectGpus() == 0);
}

TEST_CASE("memory is the smaller of the cgroup limit and MemAvailable", "[resources]") {
    TempDir root;
    root.write("sys/fs/cgroup/memory.max", "1073741824\n");
    root.write("proc/meminfo", "MemTotal:       8388608 kB\nMemAvailable:   2097152 kB\n");
    CHECK(ResourceProbe(root.path().string(), noEnv()).detectMemoryBytes() == 1073741824ULL);

    TempDir unlimited;
    unlimited.write("sys/fs/cgroup/memory.max", "max\n");
    unlimited.write("proc/meminfo", "MemAvailable:   1048576 kB\n");
    CHECK(ResourceProbe(unlimited.path().string(), noEnv()).detectMemoryBytes() == 1073741824ULL);

    TempDir v1;
    v1.write("sys/fs/cgroup/memory/memory.limit_in_bytes", "536870912\n");
    CHECK(ResourceProbe(v1.path().string(), noEnv()).detectMemoryBytes() == 536870912ULL);
}

TEST_CASE("overrides win over detection", "[resources]") {
    TempDir root;
    root.write("sys/fs/cgroup/cpu.max", "100000 100000\n");
    const ResourceProbe probe(root.path().string(), cudaVisible("0,1,2,3"));

    ResourceOverrides overrides;
    overrides.numCpus = 3;
    overrides.numGpus = 0;
    overrides.gpuMemoryMb = 16;
    const ResourceSnapshot snap = probe.probe(overrides);
    CHECK(snap.cpus == 3);
    CHECK(snap.gpus == 0);
    CHECK(snap.gpuMemoryBytes == 16u * 1024u * 1024u);

    const ResourceSnapshot detected = probe.probe();
    CHECK(detected.cpus == 1);
    CHECK(detected.gpus == 4);
}

TEST_CASE("tracker measures time against the original budget", "[resources]") {
    const auto t0 = ResourceTracker::Clock::now();
    auto offset = std::make_shared<double>(0.0);
    ResourceTracker::NowFn now = [t0, offset] {
        return t0 + std::chrono::duration_cast<ResourceTracker::Clock::duration>(std::chrono::duration<double>(*offset));
    };

    ResourceSnapshot snap;
    snap.cpus = 0;
    snap.gpus = -2;
    const ResourceTracker tracker(10.0, snap, now);
    CHECK(tracker.availableParallelism().cpus == 1);
    CHECK(tracker.availableParallelism().gpus == 0);
    CHECK(tracker.remainingTime() == Approx(10.0));

    *offset = 4.0;
    CHECK(tracker.elapsed() == Approx(4.0));
    CHECK(tracker.remainingTime() == Approx(6.0));

    *offset = 12.0;
    CHECK(tracker.remainingTime() == 0.0);
    CHECK(tracker.budgetEnd() == t0 + std::chrono::seconds(10));
}

TEST_CASE("gpu slots are exclusive until released", "[resources]") {
    GpuSlotPool pool(2);
    CHECK(pool.capacity() == 2);

    const auto soon = [] { return std::chrono::steady_clock::now() + std::chrono::milliseconds(20); };
    auto first = pool.acquireUntil(soon());
    auto second = pool.acquireUntil(soon());
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->device() != second->device());
    CHECK(pool.available() == 0);
    CHECK_FALSE(pool.acquireUntil(soon()).has_value());

    const int freed = first->device();
    first->reset();
    CHECK(pool.available() == 1);
    auto third = pool.acquireUntil(soon());
    REQUIRE(third.has_value());
    CHECK(third->device() == freed);

    GpuSlotPool::Lease moved = std::move(*third);
    CHECK(moved.held());
    CHECK_FALSE(third->held());
}

TEST_CASE("an empty gpu pool never grants a lease", "[resources]") {
    GpuSlotPool pool(0);
    CHECK(pool.capacity() == 0);
    CHECK_FALSE(pool.acquireUntil(std::chrono::steady_clock::now() + std::chrono::seconds(5)).has_value());
}

TEST_CASE("a waiting acquirer wakes when a lease is released", "[resources]") {
    GpuSlotPool pool(1);
    auto held = pool.acquireUntil(std::chrono::steady_clock::now() + std::chrono::milliseconds(20));
    REQUIRE(held.has_value());

    bool acquired = false;
    std::thread waiter([&] {
        auto lease = pool.acquireUntil(std::chrono::steady_clock::now() + std::chrono::seconds(5));
        acquired = lease.has_value();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    held->reset();
    waiter.join();
    CHECK(acquired);
    CHECK(pool.available() == 1);
}
