#include "vkplatform.hpp"
#include "log.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

namespace {

const logger::Logger g_log{"cli"};

void print_hwfacts() {
    host_probes::Os os;
    host_probes::Gpu gpu;
    host_probes::Cpu cpu;

    std::cout << "os=" << os.system_name() << "\n";
    const auto gpus = gpu.gpus();
    std::cout << "gpu_count=" << gpus.size() << "\n";
    for (std::size_t i = 0; i < gpus.size(); ++i) {
        std::cout << "gpu" << i << ".name=" << gpus[i].name << "\n";
        std::cout << "gpu" << i << ".driver_version=" << gpus[i].driver_version << "\n";
    }
    const CpuFacts facts = cpu.cpu();
    std::cout << "cpu.vendor_id_raw=" << facts.vendor_id_raw << "\n";
    std::cout << "cpu.brand_raw=" << facts.brand_raw << "\n";
}

} // namespace

int main(int argc, char** argv) {
    bool want_id = false;
    bool want_help = false;
    bool want_version = false;
    bool want_hwfacts = false;
    std::optional<std::string> backend_name;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--id") {
            want_id = true;
        } else if (arg == "--hwfacts") {
            want_hwfacts = true;
        } else if (arg == "--backend") {
            if (i + 1 >= argc) {
                g_log.error("--backend requires a value (MoltenVK, SwiftShader, Vulkan)");
                return 1;
            }
            backend_name = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            logger::set_min_level(logger::Level::Debug);
        } else if (arg == "--help" || arg == "-h") {
            want_help = true;
        } else if (arg == "--version") {
            want_version = true;
        } else {
            g_log.error("unknown argument '{}', see --help", arg);
            return 1;
        }
    }

    if (want_help) {
        std::cout << "Usage: vkplatform [--id] [--hwfacts] [--backend NAME] [--verbose]\n"
                     "  Prints which Vulkan backend and device will run shaders.\n"
                     "  --id             Print only os/vendor/backend.\n"
                     "  --hwfacts        Print raw probe facts.\n"
                     "  --backend NAME   Override the inferred backend.\n"
                     "  -v, --verbose    Debug logging on stderr.\n"
                     "  --version        Show version.\n"
                     "  -h, --help       Show this help.\n";
        return 0;
    }

    if (want_version) {
        std::cout << "vkplatform " << VKPLATFORM_VERSION << "\n";
        return 0;
    }

    if (want_hwfacts) {
        print_hwfacts();
        if (!want_id) return 0;
        std::cout << "\n";
    }

    ReportOptions options;
    options.id_only = want_id;
    options.backend_name = backend_name;

    host_probes::Os os;
    host_probes::Gpu gpu;
    host_probes::Cpu cpu;
    return write_report(os, gpu, cpu, options, std::cout);
}
