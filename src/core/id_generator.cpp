/**
 * @file id_generator.cpp
 * @brief Random-prefix + sequence identifier generation.
 */

#include "core/id_generator.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <random>

namespace telemetry_hub {

namespace {

uint64_t process_prefix() {
    static const uint64_t prefix = [] {
        std::random_device rd;
        std::mt19937_64 rng{(static_cast<uint64_t>(rd()) << 32) ^ rd()};
        return rng();
    }();
    return prefix;
}

std::atomic<uint64_t> g_sequence{0};

}  // namespace

std::string generate_id() {
    uint64_t seq = g_sequence.fetch_add(1, std::memory_order_relaxed);

    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(process_prefix()),
                  static_cast<unsigned long long>(seq));
    return std::string(buf, 32);
}

}  // namespace telemetry_hub
