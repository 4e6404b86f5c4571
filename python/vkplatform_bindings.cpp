#include "vkplatform.hpp"

#include <pybind11/pybind11.h>

namespace py = pybind11;

PYBIND11_MODULE(_vkplatform, m) {
    m.doc() = "Vulkan execution platform detection (native extension)";

    py::register_exception<PlatformError>(m, "PlatformError", PyExc_RuntimeError);

    m.def("auto_detect_id", []() {
        return to_string(auto_detect());
    }, "Return the detected platform as 'os/vendor/backend' (e.g., 'Linux/Nvidia/Vulkan').");

    m.def("auto_detect_summary", []() {
        return format_summary(auto_detect());
    }, "Return a multi-line, human-readable summary of the detected platform.");

    m.def("active_hardware", []() {
        ExecutionPlatform platform = auto_detect();
        const HardwareInformation& hw = platform.get_active_hardware();
        py::dict d;
        d["hardware_type"] = hardware_type_name(hw.hardware_type);
        d["hardware_vendor"] = hardware_vendor_name(hw.hardware_vendor);
        d["hardware_model"] = hw.hardware_model;
        d["driver_version"] = hw.driver_version;
        return d;
    }, "Return a dictionary describing the device that will execute shaders.");

    m.def("detect_hw_facts", []() {
        host_probes::Os os;
        host_probes::Gpu gpu;
        host_probes::Cpu cpu;

        py::list gpus;
        for (const auto& g : gpu.gpus()) {
            py::dict entry;
            entry["name"] = g.name;
            entry["driver_version"] = g.driver_version;
            gpus.append(entry);
        }
        const CpuFacts facts = cpu.cpu();

        py::dict d;
        d["os"] = os.system_name();
        d["gpus"] = gpus;
        d["cpu_vendor_id_raw"] = facts.vendor_id_raw;
        d["cpu_brand_raw"] = facts.brand_raw;
        return d;
    }, "Return a dictionary containing the raw facts reported by the host probes.");

#ifdef VKPLATFORM_VERSION
    m.attr("__version__") = VKPLATFORM_VERSION;
#else
    m.attr("__version__") = "0.0.0";
#endif
}
