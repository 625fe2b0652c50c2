#pragma once

#include <surge/core/types.h>

#include <spdlog/fmt/fmt.h>
#include <random>
#include <string>

namespace surge::core {

/**
 * Identifier of the form prefix-<epoch ms>-<6 hex digits>. Ids made by one
 * process sort by creation time, which `surge status` listings rely on.
 */
inline std::string generateId(const std::string& prefix = "run") {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> suffix(0, 0xFFFFFF);
    return fmt::format("{}-{}-{:06x}", prefix, epochMillis(), suffix(rng));
}

} // namespace surge::core
