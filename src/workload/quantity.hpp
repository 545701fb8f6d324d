/**
 * @file quantity.hpp
 * @brief Resource quantity parsing ("500m", "2", "128Mi", "1G").
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace cluster_gate {

/**
 * @brief CPU quantity to millicores.
 *
 * "250m" → 250, "2" → 2000, "0.5" → 500. JSON numbers are read as cores.
 */
Result<uint64_t> cpu_millis_from_json(const nlohmann::json& quantity);
Result<uint64_t> parse_cpu_millis(std::string_view text);

/**
 * @brief Memory quantity to bytes.
 *
 * Binary suffixes Ki Mi Gi Ti Pi, decimal suffixes k K M G T P, or a bare
 * byte count. JSON numbers are read as bytes.
 */
Result<uint64_t> memory_bytes_from_json(const nlohmann::json& quantity);
Result<uint64_t> parse_memory_bytes(std::string_view text);

/// "1500m" style rendering used in log lines.
[[nodiscard]] std::string format_cpu_millis(uint64_t millis);
/// "128Mi" style rendering used in log lines.
[[nodiscard]] std::string format_memory_bytes(uint64_t bytes);

}  // namespace cluster_gate
