/**
 * @file id_generator.hpp
 * @brief Process-unique opaque identifiers for spans and tasks.
 */

#pragma once

#include <string>

namespace telemetry_hub {

/**
 * @brief Generate a 32-character lowercase hex identifier.
 *
 * The first 16 characters are a random prefix drawn once per process, the
 * last 16 an atomic sequence number. Two calls in the same process never
 * return the same id.
 */
std::string generate_id();

}  // namespace telemetry_hub
