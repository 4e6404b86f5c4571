#include "vkplatform.hpp"
#include "log.hpp"

#include <atomic>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

namespace {

struct FakeOs : IOsProbe {
    std::string name;
    explicit FakeOs(std::string n) : name(std::move(n)) {}
    std::string system_name() override { return name; }
};

struct FakeGpu : IGpuProbe {
    std::vector<GpuFacts> list;
    explicit FakeGpu(std::vector<GpuFacts> l = {}) : list(std::move(l)) {}
    std::vector<GpuFacts> gpus() override { return list; }
};

struct FakeCpu : ICpuProbe {
    CpuFacts facts;
    explicit FakeCpu(CpuFacts f) : facts(std::move(f)) {}
    CpuFacts cpu() override { return facts; }
};

CpuFacts intel(const std::string& brand = "Intel Core i7") {
    return CpuFacts{"GenuineIntel", brand};
}

ExecutionPlatform detect(const std::string& os_name,
                         std::vector<GpuFacts> gpus = {},
                         CpuFacts cpu = intel()) {
    FakeOs os(os_name);
    FakeGpu gpu(std::move(gpus));
    FakeCpu c(std::move(cpu));
    return auto_detect(os, gpu, c);
}

template <typename Fn>
PlatformErrc error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const PlatformError& e) {
        return e.code();
    }
    FAIL("expected PlatformError");
    return PlatformErrc::NoHardwareDetected;
}

} // namespace

TEST_CASE("Backend is inferred from the operating system") {
    REQUIRE(detect("Darwin").vulkan_backend() == VulkanBackend::MoltenVK);
    REQUIRE(detect("Linux").vulkan_backend() == VulkanBackend::Vulkan);
    // No Windows rule: the initial default is kept.
    REQUIRE(detect("Windows").vulkan_backend() == VulkanBackend::Vulkan);
}

TEST_CASE("Operating system is matched exactly") {
    REQUIRE(detect("Darwin").operating_system() == OperatingSystem::Darwin);
    REQUIRE(detect("Windows").operating_system() == OperatingSystem::Windows);

    for (const char* name : {"linux", "FreeBSD", "", "Linux "}) {
        REQUIRE(error_code_of([&] { detect(name); }) == PlatformErrc::UnrecognizedOperatingSystem);
    }
}

TEST_CASE("Unknown CPU vendors fail fast") {
    for (const char* vendor : {"AuthenticAMD", "genuineintel", "Apple", "", "Nvidia", "Nvidia "}) {
        REQUIRE(error_code_of([&] { detect("Linux", {}, CpuFacts{vendor, "Some CPU"}); }) ==
                PlatformErrc::UnrecognizedVendor);
    }
}

TEST_CASE("Only CPU vendors classify a CPU") {
    REQUIRE(cpu_vendor_from_name("GenuineIntel") == HardwareVendor::GenuineIntel);
    // Nvidia is a known vendor, but not one a CPU can report.
    REQUIRE(hardware_vendor_from_name("Nvidia") == HardwareVendor::Nvidia);
    REQUIRE_FALSE(cpu_vendor_from_name("Nvidia").has_value());
    REQUIRE_FALSE(cpu_vendor_from_name("AuthenticAMD").has_value());
}

TEST_CASE("Vendor errors abort detection even with GPUs present") {
    std::vector<GpuFacts> gpus{{"NVIDIA GeForce RTX 4090", "550.54"}};
    REQUIRE(error_code_of([&] { detect("Linux", gpus, CpuFacts{"AuthenticAMD", "Ryzen"}); }) ==
            PlatformErrc::UnrecognizedVendor);
}

TEST_CASE("CPU entry is unique and has no driver") {
    ExecutionPlatform p = detect("Linux", {{"NVIDIA A100", "535.104"}}, intel("Intel Xeon Gold"));

    const auto& cpus = p.hardware(HardwareType::CPU);
    REQUIRE(cpus.size() == 1);
    REQUIRE(cpus[0].hardware_type == HardwareType::CPU);
    REQUIRE(cpus[0].hardware_vendor == HardwareVendor::GenuineIntel);
    REQUIRE(cpus[0].hardware_model == "Intel Xeon Gold");
    REQUIRE(cpus[0].driver_version == "N/A");
}

TEST_CASE("GPUs are recorded as Nvidia in probe order") {
    ExecutionPlatform p = detect("Linux", {
        {"NVIDIA GeForce RTX 3090", "535.54"},
        {"NVIDIA Tesla T4", "535.54"},
    });

    const auto& gpus = p.hardware(HardwareType::GPU);
    REQUIRE(gpus.size() == 2);
    REQUIRE(gpus[0].hardware_model == "NVIDIA GeForce RTX 3090");
    REQUIRE(gpus[1].hardware_model == "NVIDIA Tesla T4");
    for (const auto& gpu : gpus) {
        REQUIRE(gpu.hardware_type == HardwareType::GPU);
        REQUIRE(gpu.hardware_vendor == HardwareVendor::Nvidia);
        REQUIRE(gpu.driver_version == "535.54");
    }
}

TEST_CASE("Active hardware prefers the first GPU") {
    ExecutionPlatform p = detect("Linux", {
        {"NVIDIA GeForce RTX 3090", "535.54"},
        {"NVIDIA Tesla T4", "535.54"},
    });

    const HardwareInformation& active = p.get_active_hardware();
    REQUIRE(active == p.hardware(HardwareType::GPU).front());
    REQUIRE(active.hardware_model == "NVIDIA GeForce RTX 3090");
}

TEST_CASE("Active hardware falls back to the CPU") {
    ExecutionPlatform p = detect("Windows", {}, intel("Intel Core i5"));

    REQUIRE(p.hardware(HardwareType::GPU).empty());
    REQUIRE(p.get_active_hardware() == p.hardware(HardwareType::CPU).front());
    REQUIRE(p.get_active_hardware().hardware_type == HardwareType::CPU);
}

TEST_CASE("Active hardware is the GPU even without a CPU entry") {
    HardwareMap hw;
    hw[HardwareType::GPU] = {{HardwareType::GPU, HardwareVendor::Nvidia, "NVIDIA L4", "550.1"}};
    ExecutionPlatform p(VulkanBackend::Vulkan, OperatingSystem::Linux, hw);

    REQUIRE(p.get_active_hardware().hardware_model == "NVIDIA L4");
}

TEST_CASE("Empty platform reports no hardware") {
    ExecutionPlatform empty(VulkanBackend::Vulkan, OperatingSystem::Linux, {});
    REQUIRE(empty.hardware(HardwareType::CPU).empty());
    REQUIRE(error_code_of([&] { (void)empty.get_active_hardware(); }) == PlatformErrc::NoHardwareDetected);

    HardwareMap keys_only;
    keys_only[HardwareType::CPU];
    keys_only[HardwareType::GPU];
    ExecutionPlatform hollow(VulkanBackend::MoltenVK, OperatingSystem::Darwin, keys_only);
    REQUIRE(error_code_of([&] { (void)to_string(hollow); }) == PlatformErrc::NoHardwareDetected);
}

TEST_CASE("Explicit backend at construction is kept") {
    HardwareMap hw;
    hw[HardwareType::CPU] = {{HardwareType::CPU, HardwareVendor::GenuineIntel, "Intel Core i9", "N/A"}};
    ExecutionPlatform p(VulkanBackend::SwiftShader, OperatingSystem::Darwin, hw);

    REQUIRE(p.vulkan_backend() == VulkanBackend::SwiftShader);
    REQUIRE(to_string(p) == "Darwin/GenuineIntel/SwiftShader");
}

TEST_CASE("Canonical string is os/vendor/backend") {
    ExecutionPlatform p = detect("Darwin", {{"Apple M2", "N/A"}});
    REQUIRE(to_string(p) == "Darwin/Nvidia/MoltenVK");

    std::ostringstream ss;
    ss << p;
    REQUIRE(ss.str() == "Darwin/Nvidia/MoltenVK");

    REQUIRE(to_string(detect("Linux")) == "Linux/GenuineIntel/Vulkan");
}

TEST_CASE("Darwin workstation with one GPU") {
    ExecutionPlatform p = detect("Darwin", {{"Apple M2", "N/A"}}, CpuFacts{"GenuineIntel", "Intel Core i9"});

    REQUIRE(p.vulkan_backend() == VulkanBackend::MoltenVK);
    const HardwareInformation expected{HardwareType::GPU, HardwareVendor::Nvidia, "Apple M2", "N/A"};
    REQUIRE(p.get_active_hardware() == expected);
}

TEST_CASE("Linux server without a GPU") {
    ExecutionPlatform p = detect("Linux", {}, CpuFacts{"GenuineIntel", "Intel Xeon"});

    REQUIRE(p.vulkan_backend() == VulkanBackend::Vulkan);
    const HardwareInformation expected{HardwareType::CPU, HardwareVendor::GenuineIntel, "Intel Xeon", "N/A"};
    REQUIRE(p.get_active_hardware() == expected);
}

TEST_CASE("Summary names the executing device") {
    SECTION("with a GPU") {
        ExecutionPlatform p = detect("Linux", {{"NVIDIA GeForce RTX 3080", "535.54"}}, intel("Intel Core i9"));
        REQUIRE(format_summary(p) ==
                "Detected OS     -> Linux\n"
                "Detected GPUs   -> [GPU/Nvidia/NVIDIA GeForce RTX 3080/535.54]\n"
                "Detected CPU    -> Intel Core i9\n"
                "Vulkan backend  -> Vulkan\n"
                "Shaders will most likely be executed on NVIDIA GeForce RTX 3080\n");
    }

    SECTION("without a GPU") {
        ExecutionPlatform p = detect("Darwin", {}, intel("Intel Core i7"));
        REQUIRE(format_summary(p) ==
                "Detected OS     -> Darwin\n"
                "Detected GPUs   -> []\n"
                "Detected CPU    -> Intel Core i7\n"
                "Vulkan backend  -> MoltenVK\n"
                "No GPU detected, shaders will be executed on CPU\n");
    }
}

TEST_CASE("Enumeration names are stable") {
    REQUIRE(std::string(operating_system_name(OperatingSystem::Linux)) == "Linux");
    REQUIRE(std::string(operating_system_name(OperatingSystem::Darwin)) == "Darwin");
    REQUIRE(std::string(operating_system_name(OperatingSystem::Windows)) == "Windows");
    REQUIRE(std::string(hardware_type_name(HardwareType::CPU)) == "CPU");
    REQUIRE(std::string(hardware_type_name(HardwareType::GPU)) == "GPU");
    REQUIRE(std::string(hardware_vendor_name(HardwareVendor::GenuineIntel)) == "GenuineIntel");
    REQUIRE(std::string(hardware_vendor_name(HardwareVendor::Nvidia)) == "Nvidia");
    REQUIRE(std::string(vulkan_backend_name(VulkanBackend::MoltenVK)) == "MoltenVK");
    REQUIRE(std::string(vulkan_backend_name(VulkanBackend::SwiftShader)) == "SwiftShader");
    REQUIRE(std::string(vulkan_backend_name(VulkanBackend::Vulkan)) == "Vulkan");
}

TEST_CASE("Name lookups are exact") {
    REQUIRE(vulkan_backend_from_name("SwiftShader") == VulkanBackend::SwiftShader);
    REQUIRE(hardware_type_from_name("GPU") == HardwareType::GPU);
    REQUIRE(hardware_vendor_from_name("Nvidia") == HardwareVendor::Nvidia);
    REQUIRE_FALSE(vulkan_backend_from_name("vulkan").has_value());
    REQUIRE_FALSE(hardware_type_from_name("TPU").has_value());
    REQUIRE_FALSE(operating_system_from_name("Darwin\n").has_value());
}

TEST_CASE("Errors carry their kind in the message") {
    try {
        detect("Linux", {}, CpuFacts{"AuthenticAMD", "Ryzen 9"});
        FAIL("expected PlatformError");
    } catch (const PlatformError& e) {
        const std::string what = e.what();
        REQUIRE(what.find("UnrecognizedVendor") != std::string::npos);
        REQUIRE(what.find("AuthenticAMD") != std::string::npos);
    }
}

TEST_CASE("Backend override keeps OS and hardware") {
    ExecutionPlatform detected = detect("Linux", {{"NVIDIA Tesla T4", "535.54"}}, intel("Intel Xeon"));

    ExecutionPlatform same = apply_backend_override(detected, std::nullopt);
    REQUIRE(same.vulkan_backend() == VulkanBackend::Vulkan);

    ExecutionPlatform swapped = apply_backend_override(detected, VulkanBackend::SwiftShader);
    REQUIRE(swapped.vulkan_backend() == VulkanBackend::SwiftShader);
    REQUIRE(swapped.operating_system() == OperatingSystem::Linux);
    REQUIRE((swapped.available_hardware() == detected.available_hardware()));
    REQUIRE(to_string(swapped) == "Linux/Nvidia/SwiftShader");
    // The source value is untouched.
    REQUIRE(detected.vulkan_backend() == VulkanBackend::Vulkan);
}

TEST_CASE("Report writes the id or the summary") {
    FakeOs os("Darwin");
    std::vector<GpuFacts> gpus{{"NVIDIA GeForce GTX 1080", "N/A"}};
    FakeGpu gpu(gpus);
    FakeCpu cpu(intel("Intel Core i9"));

    SECTION("id only") {
        ReportOptions options;
        options.id_only = true;
        std::ostringstream out;
        REQUIRE(write_report(os, gpu, cpu, options, out) == 0);
        REQUIRE(out.str() == "Darwin/Nvidia/MoltenVK\n");
    }

    SECTION("id with a backend override") {
        ReportOptions options;
        options.id_only = true;
        options.backend_name = "Vulkan";
        std::ostringstream out;
        REQUIRE(write_report(os, gpu, cpu, options, out) == 0);
        REQUIRE(out.str() == "Darwin/Nvidia/Vulkan\n");
    }

    SECTION("summary with a backend override") {
        ReportOptions options;
        options.backend_name = "SwiftShader";
        std::ostringstream out;
        REQUIRE(write_report(os, gpu, cpu, options, out) == 0);
        REQUIRE(out.str().find("Vulkan backend  -> SwiftShader\n") != std::string::npos);
        REQUIRE(out.str().find("Shaders will most likely be executed on NVIDIA GeForce GTX 1080\n") != std::string::npos);
    }
}

TEST_CASE("Report fails on an unknown backend name") {
    for (const char* name : {"vulkan", "Metal", "", "MoltenVK "}) {
        REQUIRE_FALSE(vulkan_backend_from_name(name).has_value());

        FakeOs os("Linux");
        FakeGpu gpu;
        FakeCpu cpu(intel());
        ReportOptions options;
        options.backend_name = name;
        std::ostringstream out;
        REQUIRE(write_report(os, gpu, cpu, options, out) == 1);
        REQUIRE(out.str().empty());
    }
}

TEST_CASE("Report fails on detection errors") {
    SECTION("unknown operating system") {
        FakeOs os("Haiku");
        FakeGpu gpu;
        FakeCpu cpu(intel());
        std::ostringstream out;
        REQUIRE(write_report(os, gpu, cpu, ReportOptions{}, out) == 1);
        REQUIRE(out.str().empty());
    }

    SECTION("unknown cpu vendor") {
        FakeOs os("Linux");
        FakeGpu gpu;
        FakeCpu cpu(CpuFacts{"Nvidia", "Fake CPU"});
        ReportOptions options;
        options.id_only = true;
        std::ostringstream out;
        REQUIRE(write_report(os, gpu, cpu, options, out) == 1);
        REQUIRE(out.str().empty());
    }
}

TEST_CASE("Logger level can change while detecting") {
    const logger::Level saved = logger::min_level();
    std::atomic<bool> done{false};

    std::thread toggler([&] {
        while (!done.load()) {
            logger::set_min_level(logger::Level::Error);
            logger::set_min_level(logger::Level::Warn);
        }
    });
    for (int i = 0; i < 200; ++i) {
        REQUIRE(to_string(detect("Linux")) == "Linux/GenuineIntel/Vulkan");
    }
    done.store(true);
    toggler.join();

    logger::set_min_level(saved);
}

TEST_CASE("Logger level gates output") {
    const logger::Level saved = logger::min_level();

    logger::set_min_level(logger::Level::Warn);
    REQUIRE_FALSE(logger::enabled(logger::Level::Debug));
    REQUIRE_FALSE(logger::enabled(logger::Level::Info));
    REQUIRE(logger::enabled(logger::Level::Warn));
    REQUIRE(logger::enabled(logger::Level::Error));

    // Debug logging during detection must not change the result.
    logger::set_min_level(logger::Level::Debug);
    REQUIRE(to_string(detect("Darwin", {{"NVIDIA Quadro", "N/A"}})) == "Darwin/Nvidia/MoltenVK");

    logger::set_min_level(saved);
}

#if defined(__linux__)
TEST_CASE("Linux host probes report the running system") {
    host_probes::Os os;
    REQUIRE(os.system_name() == "Linux");

    // Only the shape is checked: vendor and GPU presence depend on the machine.
    host_probes::Gpu gpu;
    for (const auto& g : gpu.gpus()) {
        REQUIRE_FALSE(g.name.empty());
    }
}
#endif

#if defined(__APPLE__) && defined(__MACH__)
TEST_CASE("macOS host probes report the running system") {
    host_probes::Os os;
    REQUIRE(os.system_name() == "Darwin");
}
#endif

#if defined(_WIN32)
TEST_CASE("Windows host probes report the running system") {
    host_probes::Os os;
    REQUIRE(os.system_name() == "Windows");

    host_probes::Cpu cpu;
    REQUIRE_FALSE(cpu.cpu().vendor_id_raw.empty());

    // Adapter enumeration stops cleanly on any DXGI failure.
    host_probes::Gpu gpu;
    for (const auto& g : gpu.gpus()) {
        REQUIRE_FALSE(g.name.empty());
    }
}
#endif
