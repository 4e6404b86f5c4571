#include "vkplatform.hpp"
#include "../log.hpp"

#if defined(__APPLE__) && defined(__MACH__)

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#include <sys/sysctl.h>
#include <sys/utsname.h>

namespace {

const logger::Logger g_log{"probe.mac"};

static constexpr uint32_t kNvidiaVendorId = 0x10de;

static bool sysctl_string(const char* name, std::string& out) {
    size_t len = 0;
    if (sysctlbyname(name, nullptr, &len, nullptr, 0) != 0 || len == 0) return false;
    std::vector<char> buf(len);
    if (sysctlbyname(name, buf.data(), &len, nullptr, 0) != 0) return false;
    out.assign(buf.data(), strnlen(buf.data(), len));
    return true;
}

static bool cfdata_to_u64(CFDataRef data, uint64_t& out) {
    if (!data) return false;
    CFIndex len = CFDataGetLength(data);
    if (len == 4) {
        uint32_t v = 0;
        std::memcpy(&v, CFDataGetBytePtr(data), 4);
        out = v;
        return true;
    }
    if (len == 8) {
        uint64_t v = 0;
        std::memcpy(&v, CFDataGetBytePtr(data), 8);
        out = v;
        return true;
    }
    return false;
}

// "model" is a NUL-terminated byte string in the registry.
static std::string cfdata_to_string(CFDataRef data) {
    if (!data) return {};
    auto bytes = reinterpret_cast<const char*>(CFDataGetBytePtr(data));
    CFIndex len = CFDataGetLength(data);
    return std::string(bytes, strnlen(bytes, static_cast<size_t>(len)));
}

static bool is_gpu_class(uint32_t class_code) {
    return (class_code & 0xFF0000u) == 0x030000u;
}

static std::vector<GpuFacts> enumerate_nvidia_gpus_iokit() {
    std::vector<GpuFacts> out;

    CFMutableDictionaryRef match = IOServiceMatching("IOPCIDevice");
    if (!match) return out;

    io_iterator_t iter = 0;
    if (IOServiceGetMatchingServices(kIOMasterPortDefault, match, &iter) != KERN_SUCCESS) {
        g_log.warn("IOServiceGetMatchingServices failed");
        return out;
    }

    io_registry_entry_t entry = 0;
    while ((entry = IOIteratorNext(iter))) {
        CFDataRef class_code_data = (CFDataRef)IORegistryEntryCreateCFProperty(
            entry, CFSTR("class-code"), kCFAllocatorDefault, 0);
        uint64_t class_code_u64 = 0;
        bool is_gpu = cfdata_to_u64(class_code_data, class_code_u64) &&
                      is_gpu_class(static_cast<uint32_t>(class_code_u64));
        if (class_code_data) CFRelease(class_code_data);

        CFDataRef vendor_data = (CFDataRef)IORegistryEntryCreateCFProperty(
            entry, CFSTR("vendor-id"), kCFAllocatorDefault, 0);
        uint64_t vendor_u64 = 0;
        bool is_nvidia = cfdata_to_u64(vendor_data, vendor_u64) &&
                         static_cast<uint32_t>(vendor_u64) == kNvidiaVendorId;
        if (vendor_data) CFRelease(vendor_data);

        if (is_gpu && is_nvidia) {
            CFDataRef model_data = (CFDataRef)IORegistryEntryCreateCFProperty(
                entry, CFSTR("model"), kCFAllocatorDefault, 0);
            GpuFacts g{};
            g.name = cfdata_to_string(model_data);
            g.driver_version = "N/A";  // no NVIDIA web driver query on macOS
            if (model_data) CFRelease(model_data);
            out.push_back(g);
        }

        IOObjectRelease(entry);
    }

    IOObjectRelease(iter);
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
    return enumerate_nvidia_gpus_iokit();
}

CpuFacts probe_cpu_platform() {
    CpuFacts cpu{};
    // Apple Silicon has no machdep.cpu.vendor; the empty vendor is rejected later.
    if (!sysctl_string("machdep.cpu.vendor", cpu.vendor_id_raw)) {
        g_log.debug("machdep.cpu.vendor not available");
    }
    if (!sysctl_string("machdep.cpu.brand_string", cpu.brand_raw)) {
        g_log.debug("machdep.cpu.brand_string not available");
    }
    return cpu;
}

#endif
