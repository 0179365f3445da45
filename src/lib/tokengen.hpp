#pragma once

#include "mapping.hpp"
#include <cstdint>
#include <random>
#include <string>

namespace tokengen {

enum class Strategy {
    Uuid,       // random version-4 UUID, redrawn on collision
    Sequential, // smallest positive integer not yet used as a token
};

// "uuid"/"random-unique" or "sequential"/"sequential-counter"; throws
// errors::ConfigurationError for anything else
Strategy parse_strategy(const std::string &name);
const char *to_string(Strategy strategy);

class Generator {
  public:
    // seed 0 draws a non-deterministic seed from std::random_device
    explicit Generator(Strategy strategy, uint64_t seed = 0);

    // Mints a token that is not a key of mapping. Does not insert it.
    std::string generate(const mapping::Mapping &mapping);

    Strategy strategy() const { return strategy_; }

  private:
    std::string random_uuid();

    Strategy strategy_;
    std::mt19937_64 rng_;
};

// The token already assigned to value, or a freshly generated one. The
// caller inserts a new pair into the mapping; minted is set to true when
// the token was generated.
std::string token_for(const std::string &value,
                      const mapping::Mapping &mapping, Generator &generator,
                      bool *minted = nullptr);

} // namespace tokengen
