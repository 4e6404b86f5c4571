#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

enum class OperatingSystem {
    Linux,
    Darwin,
    Windows
};

enum class HardwareType {
    CPU,
    GPU
};

// Closed set: unknown vendor strings are rejected, never defaulted.
enum class HardwareVendor {
    GenuineIntel,
    Nvidia
};

enum class VulkanBackend {
    MoltenVK,     // Vulkan over Metal (macOS)
    SwiftShader,  // CPU rasterizer, only selectable by override
    Vulkan        // native loader + ICD
};

const char* operating_system_name(OperatingSystem os);
const char* hardware_type_name(HardwareType type);
const char* hardware_vendor_name(HardwareVendor vendor);
const char* vulkan_backend_name(VulkanBackend backend);

// Exact, case-sensitive lookups by canonical name.
std::optional<OperatingSystem> operating_system_from_name(std::string_view name);
std::optional<HardwareType> hardware_type_from_name(std::string_view name);
std::optional<HardwareVendor> hardware_vendor_from_name(std::string_view name);
std::optional<VulkanBackend> vulkan_backend_from_name(std::string_view name);

// CPUID vendor strings only; GPU-only vendors such as Nvidia are rejected.
std::optional<HardwareVendor> cpu_vendor_from_name(std::string_view name);

enum class PlatformErrc {
    UnrecognizedOperatingSystem,
    UnrecognizedVendor,
    NoHardwareDetected
};

const char* platform_errc_name(PlatformErrc code);

class PlatformError : public std::runtime_error {
public:
    PlatformError(PlatformErrc code, const std::string& what);

    PlatformErrc code() const noexcept { return code_; }

private:
    PlatformErrc code_;
};

// No defaults for type and vendor: every record names both explicitly.
struct HardwareInformation {
    HardwareType hardware_type;
    HardwareVendor hardware_vendor;
    std::string hardware_model;
    std::string driver_version;
};

bool operator==(const HardwareInformation& a, const HardwareInformation& b);
bool operator!=(const HardwareInformation& a, const HardwareInformation& b);

using HardwareMap = std::map<HardwareType, std::vector<HardwareInformation>>;

// Value type describing where shaders will run. Never mutated after
// construction; lists keep probe discovery order (index 0 = primary).
class ExecutionPlatform {
public:
    ExecutionPlatform(VulkanBackend backend, OperatingSystem os, HardwareMap hardware);

    VulkanBackend vulkan_backend() const { return vulkan_backend_; }
    OperatingSystem operating_system() const { return operating_system_; }
    const HardwareMap& available_hardware() const { return available_hardware_; }

    // Empty list for a type that was never populated.
    const std::vector<HardwareInformation>& hardware(HardwareType type) const;

    // First GPU if any, else first CPU. Throws NoHardwareDetected if both are empty.
    const HardwareInformation& get_active_hardware() const;

private:
    VulkanBackend vulkan_backend_;
    OperatingSystem operating_system_;
    HardwareMap available_hardware_;
};

// "{os}/{active vendor}/{backend}", e.g. "Darwin/Nvidia/MoltenVK".
std::string to_string(const ExecutionPlatform& platform);
std::string to_string(const HardwareInformation& info);
std::ostream& operator<<(std::ostream& os, const ExecutionPlatform& platform);

// Multi-line report for terminals.
std::string format_summary(const ExecutionPlatform& platform);

// ---------------------------------------------------------------------------
// Probe collaborators. Detection only consumes these; the host versions live
// in src/platforms/ and tests inject fakes.

struct GpuFacts {
    std::string name;
    std::string driver_version;
};

struct CpuFacts {
    std::string vendor_id_raw;  // e.g. "GenuineIntel"
    std::string brand_raw;      // e.g. "Intel(R) Xeon(R) ..."
};

struct IOsProbe {
    virtual ~IOsProbe() = default;
    virtual std::string system_name() = 0;
};

struct IGpuProbe {
    virtual ~IGpuProbe() = default;
    virtual std::vector<GpuFacts> gpus() = 0;
};

struct ICpuProbe {
    virtual ~ICpuProbe() = default;
    virtual CpuFacts cpu() = 0;
};

namespace host_probes {

struct Os : IOsProbe {
    std::string system_name() override;
};

struct Gpu : IGpuProbe {
    std::vector<GpuFacts> gpus() override;
};

struct Cpu : ICpuProbe {
    CpuFacts cpu() override;
};

} // namespace host_probes

// Implemented once per platform (src/platforms/*.cpp). Best effort: missing
// data comes back empty, never as an error.
std::string probe_os_name_platform();
std::vector<GpuFacts> probe_gpus_platform();
CpuFacts probe_cpu_platform();

ExecutionPlatform auto_detect(IOsProbe& os_probe, IGpuProbe& gpu_probe, ICpuProbe& cpu_probe);

// Simple public API: detect using the host probes.
ExecutionPlatform auto_detect();

// Same hardware and OS, different backend. No override returns a copy.
ExecutionPlatform apply_backend_override(const ExecutionPlatform& platform,
                                         std::optional<VulkanBackend> backend);

struct ReportOptions {
    bool id_only = false;                     // print os/vendor/backend only
    std::optional<std::string> backend_name;  // must name a VulkanBackend
};

// Detects, applies the override and writes the report to `out`. Returns the
// process exit code: 0 on success, 1 on an unknown backend or a PlatformError.
int write_report(IOsProbe& os_probe, IGpuProbe& gpu_probe, ICpuProbe& cpu_probe,
                 const ReportOptions& options, std::ostream& out);
