#include "vkplatform.hpp"
#include "log.hpp"

#include <initializer_list>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace {

const logger::Logger g_log{"detect"};

constexpr const char* kCpuDriverVersion = "N/A";

const std::vector<HardwareInformation>& empty_hardware_list() {
    static const std::vector<HardwareInformation> empty;
    return empty;
}

} // namespace

const char* operating_system_name(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::Linux: return "Linux";
        case OperatingSystem::Darwin: return "Darwin";
        case OperatingSystem::Windows: return "Windows";
    }
    return "Unknown";
}

const char* hardware_type_name(HardwareType type) {
    switch (type) {
        case HardwareType::CPU: return "CPU";
        case HardwareType::GPU: return "GPU";
    }
    return "Unknown";
}

const char* hardware_vendor_name(HardwareVendor vendor) {
    switch (vendor) {
        case HardwareVendor::GenuineIntel: return "GenuineIntel";
        case HardwareVendor::Nvidia: return "Nvidia";
    }
    return "Unknown";
}

const char* vulkan_backend_name(VulkanBackend backend) {
    switch (backend) {
        case VulkanBackend::MoltenVK: return "MoltenVK";
        case VulkanBackend::SwiftShader: return "SwiftShader";
        case VulkanBackend::Vulkan: return "Vulkan";
    }
    return "Unknown";
}

std::optional<OperatingSystem> operating_system_from_name(std::string_view name) {
    for (auto os : {OperatingSystem::Linux, OperatingSystem::Darwin, OperatingSystem::Windows}) {
        if (name == operating_system_name(os)) return os;
    }
    return std::nullopt;
}

std::optional<HardwareType> hardware_type_from_name(std::string_view name) {
    for (auto type : {HardwareType::CPU, HardwareType::GPU}) {
        if (name == hardware_type_name(type)) return type;
    }
    return std::nullopt;
}

std::optional<HardwareVendor> hardware_vendor_from_name(std::string_view name) {
    for (auto vendor : {HardwareVendor::GenuineIntel, HardwareVendor::Nvidia}) {
        if (name == hardware_vendor_name(vendor)) return vendor;
    }
    return std::nullopt;
}

std::optional<VulkanBackend> vulkan_backend_from_name(std::string_view name) {
    for (auto backend : {VulkanBackend::MoltenVK, VulkanBackend::SwiftShader, VulkanBackend::Vulkan}) {
        if (name == vulkan_backend_name(backend)) return backend;
    }
    return std::nullopt;
}

std::optional<HardwareVendor> cpu_vendor_from_name(std::string_view name) {
    if (name == hardware_vendor_name(HardwareVendor::GenuineIntel)) return HardwareVendor::GenuineIntel;
    return std::nullopt;
}

const char* platform_errc_name(PlatformErrc code) {
    switch (code) {
        case PlatformErrc::UnrecognizedOperatingSystem: return "UnrecognizedOperatingSystem";
        case PlatformErrc::UnrecognizedVendor: return "UnrecognizedVendor";
        case PlatformErrc::NoHardwareDetected: return "NoHardwareDetected";
    }
    return "Unknown";
}

PlatformError::PlatformError(PlatformErrc code, const std::string& what)
    : std::runtime_error(std::string(platform_errc_name(code)) + ": " + what), code_(code) {}

bool operator==(const HardwareInformation& a, const HardwareInformation& b) {
    return a.hardware_type == b.hardware_type &&
           a.hardware_vendor == b.hardware_vendor &&
           a.hardware_model == b.hardware_model &&
           a.driver_version == b.driver_version;
}

bool operator!=(const HardwareInformation& a, const HardwareInformation& b) {
    return !(a == b);
}

ExecutionPlatform::ExecutionPlatform(VulkanBackend backend, OperatingSystem os, HardwareMap hardware)
    : vulkan_backend_(backend), operating_system_(os), available_hardware_(std::move(hardware)) {}

const std::vector<HardwareInformation>& ExecutionPlatform::hardware(HardwareType type) const {
    auto it = available_hardware_.find(type);
    if (it == available_hardware_.end()) return empty_hardware_list();
    return it->second;
}

const HardwareInformation& ExecutionPlatform::get_active_hardware() const {
    const auto& gpus = hardware(HardwareType::GPU);
    if (!gpus.empty()) return gpus.front();
    const auto& cpus = hardware(HardwareType::CPU);
    if (!cpus.empty()) return cpus.front();
    throw PlatformError(PlatformErrc::NoHardwareDetected, "platform has neither a GPU nor a CPU entry");
}

std::string to_string(const ExecutionPlatform& platform) {
    return fmt::format("{}/{}/{}",
                       operating_system_name(platform.operating_system()),
                       hardware_vendor_name(platform.get_active_hardware().hardware_vendor),
                       vulkan_backend_name(platform.vulkan_backend()));
}

std::string to_string(const HardwareInformation& info) {
    return fmt::format("{}/{}/{}/{}",
                       hardware_type_name(info.hardware_type),
                       hardware_vendor_name(info.hardware_vendor),
                       info.hardware_model,
                       info.driver_version);
}

std::ostream& operator<<(std::ostream& os, const ExecutionPlatform& platform) {
    return os << to_string(platform);
}

std::string format_summary(const ExecutionPlatform& platform) {
    const auto& gpus = platform.hardware(HardwareType::GPU);
    const auto& cpus = platform.hardware(HardwareType::CPU);

    std::string gpu_list;
    for (const auto& gpu : gpus) {
        if (!gpu_list.empty()) gpu_list += ", ";
        gpu_list += to_string(gpu);
    }

    std::string out;
    out += fmt::format("Detected OS     -> {}\n", operating_system_name(platform.operating_system()));
    out += fmt::format("Detected GPUs   -> [{}]\n", gpu_list);
    out += fmt::format("Detected CPU    -> {}\n", cpus.empty() ? std::string("none") : cpus.front().hardware_model);
    out += fmt::format("Vulkan backend  -> {}\n", vulkan_backend_name(platform.vulkan_backend()));
    if (!gpus.empty()) {
        out += fmt::format("Shaders will most likely be executed on {}\n", gpus.front().hardware_model);
    } else {
        out += "No GPU detected, shaders will be executed on CPU\n";
    }
    return out;
}

std::string host_probes::Os::system_name() {
    return probe_os_name_platform();
}

std::vector<GpuFacts> host_probes::Gpu::gpus() {
    return probe_gpus_platform();
}

CpuFacts host_probes::Cpu::cpu() {
    return probe_cpu_platform();
}

ExecutionPlatform auto_detect(IOsProbe& os_probe, IGpuProbe& gpu_probe, ICpuProbe& cpu_probe) {
    // 1) Operating system (exact match)
    const std::string os_name = os_probe.system_name();
    const auto os = operating_system_from_name(os_name);
    if (!os) {
        throw PlatformError(PlatformErrc::UnrecognizedOperatingSystem,
                            fmt::format("'{}' is not one of Linux, Darwin, Windows", os_name));
    }
    g_log.debug("operating system: {}", operating_system_name(*os));

    HardwareMap hardware;

    // 2) GPUs: only discrete NVIDIA parts are modelled; none is fine.
    auto& gpu_list = hardware[HardwareType::GPU];
    for (auto& gpu : gpu_probe.gpus()) {
        HardwareInformation info{HardwareType::GPU, HardwareVendor::Nvidia,
                                 std::move(gpu.name), std::move(gpu.driver_version)};
        g_log.debug("gpu[{}]: {}", gpu_list.size(), to_string(info));
        gpu_list.push_back(std::move(info));
    }

    // 3) Exactly one CPU; CPUs have no driver.
    CpuFacts cpu = cpu_probe.cpu();
    const auto vendor = cpu_vendor_from_name(cpu.vendor_id_raw);
    if (!vendor) {
        throw PlatformError(PlatformErrc::UnrecognizedVendor,
                            fmt::format("cpu vendor '{}' is not a known cpu vendor", cpu.vendor_id_raw));
    }
    HardwareInformation cpu_info{HardwareType::CPU, *vendor, std::move(cpu.brand_raw), kCpuDriverVersion};
    g_log.debug("cpu: {}", to_string(cpu_info));
    hardware[HardwareType::CPU] = {std::move(cpu_info)};

    // 4) Backend: default, then override on a matching OS. Windows has no
    // rule of its own and keeps the default.
    VulkanBackend backend = VulkanBackend::Vulkan;
    if (*os == OperatingSystem::Darwin) {
        backend = VulkanBackend::MoltenVK;
    } else if (*os == OperatingSystem::Linux) {
        backend = VulkanBackend::Vulkan;
    }
    g_log.debug("vulkan backend: {}", vulkan_backend_name(backend));

    return ExecutionPlatform(backend, *os, std::move(hardware));
}

ExecutionPlatform auto_detect() {
    host_probes::Os os;
    host_probes::Gpu gpu;
    host_probes::Cpu cpu;
    return auto_detect(os, gpu, cpu);
}

ExecutionPlatform apply_backend_override(const ExecutionPlatform& platform,
                                         std::optional<VulkanBackend> backend) {
    if (!backend) return platform;
    g_log.info("backend overridden: {} -> {}",
               vulkan_backend_name(platform.vulkan_backend()),
               vulkan_backend_name(*backend));
    return ExecutionPlatform(*backend, platform.operating_system(), platform.available_hardware());
}

int write_report(IOsProbe& os_probe, IGpuProbe& gpu_probe, ICpuProbe& cpu_probe,
                 const ReportOptions& options, std::ostream& out) {
    std::optional<VulkanBackend> backend_override;
    if (options.backend_name) {
        backend_override = vulkan_backend_from_name(*options.backend_name);
        if (!backend_override) {
            g_log.error("unknown backend '{}' (MoltenVK, SwiftShader, Vulkan)", *options.backend_name);
            return 1;
        }
    }

    try {
        const ExecutionPlatform platform =
            apply_backend_override(auto_detect(os_probe, gpu_probe, cpu_probe), backend_override);
        if (options.id_only) {
            out << platform << "\n";
        } else {
            out << format_summary(platform);
        }
    } catch (const PlatformError& e) {
        g_log.error("{}", e.what());
        return 1;
    }
    return 0;
}
