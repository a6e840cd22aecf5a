#include "core/ids.hpp"
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <random>

namespace conclave::core {

std::string make_id(const std::string& prefix) {
    // Random per-process base plus a counter; unique until 2^48 ids are issued.
    static const uint64_t base = [] {
        std::random_device rd;
        std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
        return gen() & 0xffffff000000ULL;
    }();
    static std::atomic<uint64_t> counter{0};

    uint64_t value = (base + counter.fetch_add(1, std::memory_order_relaxed)) & 0xffffffffffffULL;
    char hex[13];
    std::snprintf(hex, sizeof(hex), "%012llx", static_cast<unsigned long long>(value));
    return prefix + "_" + hex;
}

} // namespace conclave::core
