#include "fmp/core/id.hpp"

#include "fmp/core/hash.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace fmp {

std::string generate_id(std::size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::vector<std::uint8_t> raw(bytes);
    for (auto& b : raw) {
        b = static_cast<std::uint8_t>(rng());
    }
    return crypto::to_hex(raw.data(), raw.size());
}

} // namespace fmp
