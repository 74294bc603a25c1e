#include "HostSampler.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/utsname.h>
#include <unistd.h>
#endif

std::string DetectOsName() {
#ifdef _WIN32
    return "windows";
#elif __APPLE__
    return "darwin";
#else
    return "linux";
#endif
}

std::string DetectKernelVersion() {
#ifdef _WIN32
    return "windows";
#else
    struct utsname info;
    if (uname(&info) == 0) {
        return info.release;
    }
    return {};
#endif
}

std::string DetectHostname() {
    char hostnameBuffer[256] = {};
#ifdef _WIN32
    DWORD hostnameSize = static_cast<DWORD>(sizeof(hostnameBuffer));
    if (GetComputerNameA(hostnameBuffer, &hostnameSize) != 0) {
        return hostnameBuffer;
    }
#else
    if (gethostname(hostnameBuffer, sizeof(hostnameBuffer)) == 0) {
        return hostnameBuffer;
    }
#endif
    return "unknown-host";
}

uint64_t NowUnixNano() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

HostSampler::HostSampler(std::string procRoot)
    : procRoot_(std::move(procRoot)) {}

AgentDescription HostSampler::Describe(const std::string& serviceName, const std::string& serviceVersion) const {
    AgentDescription description;
    description.identifyingAttributes = {
        {"service.name", AttributeValue::String(serviceName)},
        {"service.version", AttributeValue::String(serviceVersion)}
    };
    description.nonIdentifyingAttributes = {
        {"os.type", AttributeValue::String(DetectOsName())},
        {"os.version", AttributeValue::String(DetectKernelVersion())},
        {"host.name", AttributeValue::String(DetectHostname())}
    };
    return description;
}

HostSample HostSampler::Sample() {
    HostSample sample;
    sample.timeUnixNano = NowUnixNano();

    unsigned long long idle = 0;
    unsigned long long total = 0;
    if (ReadCpuTimes(idle, total) && total > 0) {
        if (prevTotal_ > 0 && total > prevTotal_ && idle >= prevIdle_) {
            const unsigned long long idleDelta = idle - prevIdle_;
            const unsigned long long totalDelta = total - prevTotal_;
            sample.cpuUsage = 1.0 - static_cast<double>(idleDelta) / static_cast<double>(totalDelta);
        }

        prevIdle_ = idle;
        prevTotal_ = total;
    }

    unsigned long long totalKb = 0;
    unsigned long long availableKb = 0;
    if (ReadMemInfo(totalKb, availableKb) && totalKb > 0) {
        const unsigned long long usedKb = totalKb > availableKb ? (totalKb - availableKb) : 0;
        sample.memoryUsage = (static_cast<double>(usedKb) / static_cast<double>(totalKb)) * 100.0;
    }

    return sample;
}

ComponentHealth HostSampler::SampleHealth(uint64_t startTimeUnixNano, double memoryLimitPercent) {
    const HostSample sample = Sample();

    char status[64];
    std::snprintf(status, sizeof(status), "cpu %.1f%% mem %.1f%%", sample.cpuUsage * 100.0, sample.memoryUsage);

    ComponentHealth host;
    host.healthy = sample.memoryUsage < memoryLimitPercent;
    host.startTimeUnixNano = startTimeUnixNano;
    host.status = status;
    host.statusTimeUnixNano = sample.timeUnixNano;
    if (!host.healthy) {
        host.lastError = "memory use above limit";
    }

    ComponentHealth agent;
    agent.healthy = host.healthy;
    agent.startTimeUnixNano = startTimeUnixNano;
    agent.status = host.healthy ? "running" : "degraded";
    agent.statusTimeUnixNano = sample.timeUnixNano;
    agent.lastError = host.lastError;
    agent.componentHealthMap["host"] = host;
    return agent;
}

bool HostSampler::ReadCpuTimes(unsigned long long& idle, unsigned long long& total) const {
    std::ifstream statFile(procRoot_ + "/stat");
    if (!statFile.is_open()) {
        return false;
    }

    std::string line;
    if (!std::getline(statFile, line)) {
        return false;
    }

    std::istringstream iss(line);
    std::string label;
    iss >> label;
    if (label != "cpu") {
        return false;
    }

    unsigned long long user = 0;
    unsigned long long nice = 0;
    unsigned long long system = 0;
    unsigned long long idleVal = 0;
    unsigned long long iowait = 0;
    unsigned long long irq = 0;
    unsigned long long softirq = 0;
    unsigned long long steal = 0;

    iss >> user >> nice >> system >> idleVal >> iowait >> irq >> softirq >> steal;

    // guest time is already counted in user and nice.
    idle = idleVal + iowait;
    total = user + nice + system + idleVal + iowait + irq + softirq + steal;
    return true;
}

bool HostSampler::ReadMemInfo(unsigned long long& totalKb, unsigned long long& availableKb) const {
    std::ifstream memFile(procRoot_ + "/meminfo");
    if (!memFile.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(memFile, line)) {
        std::istringstream iss(line);
        std::string key;
        unsigned long long value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }

        if (key == "MemTotal:") {
            totalKb = value;
        } else if (key == "MemAvailable:") {
            availableKb = value;
        }

        if (totalKb > 0 && availableKb > 0) {
            return true;
        }
    }

    return totalKb > 0 && availableKb > 0;
}
