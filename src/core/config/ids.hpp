#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace simlab::core::config {

    // 128 random bits as 32 hex characters. Every call seeds its own engine
    // from std::random_device, so concurrent callers share no state.
    inline std::string generate_unique_hex() {
        std::random_device rd;
        std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        std::mt19937_64 gen(seed);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (int i = 0; i < 2; ++i) {
            ss << std::setw(16) << static_cast<std::uint64_t>(gen());
        }
        return ss.str();
    }

    // Short session identifier, e.g. "ask-3f09a2c1"
    inline std::string generate_session_id(const std::string& prefix = "ask") {
        return prefix + "-" + generate_unique_hex().substr(0, 8);
    }

} // namespace simlab::core::config
