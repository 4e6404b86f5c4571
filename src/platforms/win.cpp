#include "vkplatform.hpp"
#include "../log.hpp"

#if defined(_WIN32)

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <intrin.h>
#include <windows.h>
#include <dxgi.h>

#include <fmt/format.h>

namespace {

const logger::Logger g_log{"probe.win"};

static constexpr UINT kNvidiaVendorId = 0x10de;

static std::string narrow(const wchar_t* wide) {
    int len = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 1) return {};
    std::string out(static_cast<size_t>(len - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, -1, out.data(), len, nullptr, nullptr);
    return out;
}

static std::string trim(std::string s) {
    while (!s.empty() && s.front() == ' ') s.erase(s.begin());
    while (!s.empty() && (s.back() == ' ' || s.back() == '\0')) s.pop_back();
    return s;
}

// Leaf 0: vendor id in EBX, EDX, ECX order.
static std::string cpuid_vendor() {
    std::array<int, 4> regs{};
    __cpuid(regs.data(), 0);
    char vendor[13] = {};
    std::memcpy(vendor + 0, &regs[1], 4);
    std::memcpy(vendor + 4, &regs[3], 4);
    std::memcpy(vendor + 8, &regs[2], 4);
    return vendor;
}

// Leaves 0x80000002..0x80000004: 48-byte brand string.
static std::string cpuid_brand() {
    std::array<int, 4> regs{};
    __cpuid(regs.data(), 0x80000000);
    if (static_cast<unsigned int>(regs[0]) < 0x80000004u) return {};

    char brand[49] = {};
    for (int i = 0; i < 3; ++i) {
        __cpuid(regs.data(), 0x80000002 + i);
        std::memcpy(brand + i * 16, regs.data(), 16);
    }
    return trim(brand);
}

// UMD version as a.b.c.d, e.g. "31.0.15.3623".
static std::string umd_driver_version(IDXGIAdapter1* adapter) {
    LARGE_INTEGER umd{};
    if (FAILED(adapter->CheckInterfaceSupport(__uuidof(IDXGIDevice), &umd))) return {};
    const auto v = static_cast<uint64_t>(umd.QuadPart);
    return fmt::format("{}.{}.{}.{}", (v >> 48) & 0xFFFF, (v >> 32) & 0xFFFF, (v >> 16) & 0xFFFF, v & 0xFFFF);
}

static std::vector<GpuFacts> enumerate_nvidia_gpus_dxgi() {
    std::vector<GpuFacts> out;

    IDXGIFactory1* factory = nullptr;
    if (FAILED(CreateDXGIFactory1(__uuidof(IDXGIFactory1), reinterpret_cast<void**>(&factory)))) {
        g_log.warn("CreateDXGIFactory1 failed, reporting no GPUs");
        return out;
    }

    for (UINT i = 0; ; ++i) {
        IDXGIAdapter1* adapter = nullptr;
        // DXGI_ERROR_NOT_FOUND ends the enumeration; any other failure leaves no adapter.
        const HRESULT hr = factory->EnumAdapters1(i, &adapter);
        if (FAILED(hr) || !adapter) {
            if (hr != DXGI_ERROR_NOT_FOUND) g_log.warn("EnumAdapters1({}) failed: 0x{:08x}", i, static_cast<unsigned long>(hr));
            break;
        }

        DXGI_ADAPTER_DESC1 desc{};
        if (SUCCEEDED(adapter->GetDesc1(&desc))) {
            if ((desc.Flags & DXGI_ADAPTER_FLAG_SOFTWARE) == 0 && desc.VendorId == kNvidiaVendorId) {
                GpuFacts g{};
                g.name = narrow(desc.Description);
                g.driver_version = umd_driver_version(adapter);
                out.push_back(g);
            }
        }

        adapter->Release();
    }

    factory->Release();
    return out;
}

} // namespace

std::string probe_os_name_platform() {
    return "Windows";
}

std::vector<GpuFacts> probe_gpus_platform() {
    return enumerate_nvidia_gpus_dxgi();
}

CpuFacts probe_cpu_platform() {
    CpuFacts cpu{};
    cpu.vendor_id_raw = cpuid_vendor();
    cpu.brand_raw = cpuid_brand();
    return cpu;
}

#endif
