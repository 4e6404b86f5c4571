// Host probes on Linux with no link-time third-party deps.
// Uses: uname(), /proc/cpuinfo, and optional runtime NVML (dlopen) for
// NVIDIA GPU names and the driver version.
//
// Notes:
// - Without an NVIDIA driver (no libnvidia-ml.so.1) the GPU list is empty.
// - /proc/cpuinfo "vendor_id" is the raw CPUID vendor string ("GenuineIntel",
//   "AuthenticAMD", ...). It is passed through untouched; classification
//   happens in auto_detect.

#include "vkplatform.hpp"
#include "../log.hpp"

#if defined(__linux__)

#include <dlfcn.h>
#include <fstream>
#include <string>
#include <sys/utsname.h>
#include <type_traits>
#include <vector>

namespace {

const logger::Logger g_log{"probe.linux"};

static inline std::string trim(std::string s) {
    auto notspace = [](unsigned char c){ return c != ' ' && c != '\t' && c != '\n' && c != '\r'; };
    while (!s.empty() && !notspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && !notspace((unsigned char)s.back())) s.pop_back();
    return s;
}

// First processor record only; every core reports the same vendor/brand.
static CpuFacts read_cpuinfo(const char* path) {
    CpuFacts out;

    std::ifstream f(path);
    if (!f) {
        g_log.warn("cannot open {}", path);
        return out;
    }

    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) {
            if (!out.vendor_id_raw.empty() || !out.brand_raw.empty()) break;
            continue;
        }
        auto pos = line.find(':');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));

        if (key == "vendor_id" && out.vendor_id_raw.empty()) {
            out.vendor_id_raw = val;
        } else if (key == "model name" && out.brand_raw.empty()) {
            out.brand_raw = val;
        }
    }
    return out;
}

// ------------ Optional NVML via dlopen ------------
//
// NVML API we use:
// - nvmlInit_v2 / nvmlShutdown
// - nvmlSystemGetDriverVersion
// - nvmlDeviceGetCount_v2
// - nvmlDeviceGetHandleByIndex_v2
// - nvmlDeviceGetName
//
// If any are missing, NVML is treated as unavailable.

using nvmlReturn_t = int;
static constexpr nvmlReturn_t NVML_SUCCESS = 0;
using nvmlDevice_t = struct nvmlDevice_st*;

// NVML_DEVICE_NAME_V2_BUFFER_SIZE / NVML_SYSTEM_DRIVER_VERSION_BUFFER_SIZE
static constexpr unsigned int kNvmlNameBufferSize = 96;
static constexpr unsigned int kNvmlDriverBufferSize = 80;

struct NvmlApi {
    void* handle = nullptr;

    nvmlReturn_t (*nvmlInit_v2)() = nullptr;
    nvmlReturn_t (*nvmlShutdown)() = nullptr;
    nvmlReturn_t (*nvmlSystemGetDriverVersion)(char*, unsigned int) = nullptr;
    nvmlReturn_t (*nvmlDeviceGetCount_v2)(unsigned int*) = nullptr;
    nvmlReturn_t (*nvmlDeviceGetHandleByIndex_v2)(unsigned int, nvmlDevice_t*) = nullptr;
    nvmlReturn_t (*nvmlDeviceGetName)(nvmlDevice_t, char*, unsigned int) = nullptr;

    bool ok() const {
        return handle &&
               nvmlInit_v2 && nvmlShutdown && nvmlSystemGetDriverVersion &&
               nvmlDeviceGetCount_v2 && nvmlDeviceGetHandleByIndex_v2 &&
               nvmlDeviceGetName;
    }
};

static NvmlApi try_load_nvml() {
    NvmlApi api{};

    api.handle = dlopen("libnvidia-ml.so.1", RTLD_LAZY);
    if (!api.handle) return api;

    auto load = [&](auto& fn, const char* name) {
        fn = reinterpret_cast<std::remove_reference_t<decltype(fn)>>(dlsym(api.handle, name));
    };

    load(api.nvmlInit_v2, "nvmlInit_v2");
    load(api.nvmlShutdown, "nvmlShutdown");
    load(api.nvmlSystemGetDriverVersion, "nvmlSystemGetDriverVersion");
    load(api.nvmlDeviceGetCount_v2, "nvmlDeviceGetCount_v2");
    load(api.nvmlDeviceGetHandleByIndex_v2, "nvmlDeviceGetHandleByIndex_v2");
    load(api.nvmlDeviceGetName, "nvmlDeviceGetName");

    if (!api.ok()) {
        dlclose(api.handle);
        api.handle = nullptr;
    }
    return api;
}

static void unload_nvml(NvmlApi& api) {
    if (api.handle) dlclose(api.handle);
    api = NvmlApi{};
}

static std::vector<GpuFacts> query_nvidia_gpus_nvml_best_effort() {
    std::vector<GpuFacts> out;

    NvmlApi api = try_load_nvml();
    if (!api.ok()) {
        g_log.debug("NVML not available, reporting no GPUs");
        return out;
    }

    if (api.nvmlInit_v2() != NVML_SUCCESS) {
        g_log.warn("nvmlInit_v2 failed, reporting no GPUs");
        unload_nvml(api);
        return out;
    }

    char driver[kNvmlDriverBufferSize] = {};
    std::string driver_version;
    if (api.nvmlSystemGetDriverVersion(driver, kNvmlDriverBufferSize) == NVML_SUCCESS) {
        driver_version = driver;
    }

    // Index order is NVML's enumeration order, i.e. the discovery order.
    unsigned int count = 0;
    if (api.nvmlDeviceGetCount_v2(&count) == NVML_SUCCESS) {
        for (unsigned int i = 0; i < count; i++) {
            nvmlDevice_t dev = nullptr;
            if (api.nvmlDeviceGetHandleByIndex_v2(i, &dev) != NVML_SUCCESS || !dev) continue;
            char name[kNvmlNameBufferSize] = {};
            if (api.nvmlDeviceGetName(dev, name, kNvmlNameBufferSize) != NVML_SUCCESS) continue;
            out.push_back(GpuFacts{name, driver_version});
        }
    }

    api.nvmlShutdown();
    unload_nvml(api);
    return out;
}

} // namespace

std::string probe_os_name_platform() {
    struct utsname info{};
    if (uname(&info) != 0) {
        g_log.warn("uname() failed");
        return {};
    }
    return info.sysname;
}

std::vector<GpuFacts> probe_gpus_platform() {
    return query_nvidia_gpus_nvml_best_effort();
}

CpuFacts probe_cpu_platform() {
    return read_cpuinfo("/proc/cpuinfo");
}

#endif
