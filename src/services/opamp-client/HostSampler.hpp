#pragma once

#include "Messages.hpp"

#include <cstdint>
#include <string>

struct HostSample {
    uint64_t timeUnixNano = 0;
    // Busy share of all CPU time since the previous sample, 0..1.
    double cpuUsage = 0.0;
    // Used memory in percent of MemTotal.
    double memoryUsage = 0.0;
};

std::string DetectOsName();
std::string DetectKernelVersion();
std::string DetectHostname();

// Reads host facts for the demo agent's description and health reports.
// The /proc root is configurable for tests.
class HostSampler {
public:
    explicit HostSampler(std::string procRoot = "/proc");

    AgentDescription Describe(const std::string& serviceName, const std::string& serviceVersion) const;

    HostSample Sample();

    // Healthy unless memory use crosses `memoryLimitPercent`. The host
    // appears as the "host" component.
    ComponentHealth SampleHealth(uint64_t startTimeUnixNano, double memoryLimitPercent = 95.0);

private:
    bool ReadCpuTimes(unsigned long long& idle, unsigned long long& total) const;
    bool ReadMemInfo(unsigned long long& totalKb, unsigned long long& availableKb) const;

    std::string procRoot_;
    unsigned long long prevIdle_ = 0;
    unsigned long long prevTotal_ = 0;
};

uint64_t NowUnixNano();
