#include "tokengen.hpp"
#include "errors.hpp"
#include <iomanip>
#include <sstream>

namespace tokengen {

namespace {

uint64_t resolve_seed(uint64_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

} // namespace

Strategy parse_strategy(const std::string &name) {
    if (name == "uuid" || name == "random-unique") {
        return Strategy::Uuid;
    }
    if (name == "sequential" || name == "sequential-counter") {
        return Strategy::Sequential;
    }
    throw errors::ConfigurationError("Invalid token_method: " + name +
                                     " (expected uuid or sequential)");
}

const char *to_string(Strategy strategy) {
    switch (strategy) {
    case Strategy::Uuid:
        return "uuid";
    case Strategy::Sequential:
        return "sequential";
    }
    return "unknown";
}

Generator::Generator(Strategy strategy, uint64_t seed)
    : strategy_(strategy), rng_(resolve_seed(seed)) {}

std::string Generator::random_uuid() {
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t ab = dis(rng_);
    uint64_t cd = dis(rng_);

    // Version 4, variant 10xx
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (ab >> 32) << '-';
    oss << std::setw(4) << ((ab >> 16) & 0xFFFF) << '-';
    oss << std::setw(4) << (ab & 0xFFFF) << '-';
    oss << std::setw(4) << (cd >> 48) << '-';
    oss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string Generator::generate(const mapping::Mapping &mapping) {
    switch (strategy_) {
    case Strategy::Uuid: {
        std::string token = random_uuid();
        while (mapping.contains_token(token)) {
            token = random_uuid();
        }
        return token;
    }
    case Strategy::Sequential: {
        // Linear probe, bounded by the number of distinct values
        uint64_t next_id = 1;
        while (mapping.contains_token(std::to_string(next_id))) {
            ++next_id;
        }
        return std::to_string(next_id);
    }
    }
    throw errors::ConfigurationError("Unhandled token strategy");
}

std::string token_for(const std::string &value,
                      const mapping::Mapping &mapping, Generator &generator,
                      bool *minted) {
    if (const std::string *existing = mapping.find_token(value)) {
        if (minted) *minted = false;
        return *existing;
    }
    if (minted) *minted = true;
    return generator.generate(mapping);
}

} // namespace tokengen
