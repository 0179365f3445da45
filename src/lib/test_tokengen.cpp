#include "errors.hpp"
#include "mapping.hpp"
#include "tokengen.hpp"
#include <cassert>
#include <cctype>
#include <set>
#include <string>

namespace {

bool looks_like_uuid_v4(const std::string &token) {
    if (token.size() != 36) return false;
    for (size_t i = 0; i < token.size(); ++i) {
        char c = token[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c)) ||
                   std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return token[14] == '4' &&
           std::string("89ab").find(token[19]) != std::string::npos;
}

} // namespace

int main() {
    // Test 1: Strategy names
    {
        assert(tokengen::parse_strategy("uuid") == tokengen::Strategy::Uuid);
        assert(tokengen::parse_strategy("random-unique") ==
               tokengen::Strategy::Uuid);
        assert(tokengen::parse_strategy("sequential") ==
               tokengen::Strategy::Sequential);
        assert(tokengen::parse_strategy("sequential-counter") ==
               tokengen::Strategy::Sequential);
        assert(std::string(tokengen::to_string(
                   tokengen::Strategy::Sequential)) == "sequential");

        bool thrown = false;
        try {
            tokengen::parse_strategy("md5");
        } catch (const errors::ConfigurationError &) {
            thrown = true;
        }
        assert(thrown);
    }

    // Test 2: Sequential tokens count up from 1 and fill gaps
    {
        tokengen::Generator gen(tokengen::Strategy::Sequential);
        mapping::Mapping m;
        assert(gen.generate(m) == "1");

        m.insert("1", "a");
        m.insert("2", "b");
        assert(gen.generate(m) == "3");

        mapping::Mapping gapped;
        gapped.insert("1", "a");
        gapped.insert("3", "c");
        assert(gen.generate(gapped) == "2");

        // Non-numeric tokens do not get in the way
        mapping::Mapping mixed;
        mixed.insert("abc", "x");
        assert(gen.generate(mixed) == "1");
    }

    // Test 3: The n-th distinct value gets "n"
    {
        tokengen::Generator gen(tokengen::Strategy::Sequential);
        mapping::Mapping m;
        const char *values[] = {"v1", "v2", "v1", "v3", "v2", "v4"};
        for (const char *value : values) {
            bool minted = false;
            std::string token = tokengen::token_for(value, m, gen, &minted);
            if (minted) m.insert(token, value);
        }
        assert(m.size() == 4);
        assert(*m.find_token("v1") == "1");
        assert(*m.find_token("v2") == "2");
        assert(*m.find_token("v3") == "3");
        assert(*m.find_token("v4") == "4");
    }

    // Test 4: Uuid token format and uniqueness
    {
        tokengen::Generator gen(tokengen::Strategy::Uuid);
        mapping::Mapping m;
        std::set<std::string> seen;
        for (int i = 0; i < 1000; ++i) {
            std::string value = "value-" + std::to_string(i);
            std::string token = tokengen::token_for(value, m, gen);
            assert(looks_like_uuid_v4(token));
            assert(seen.insert(token).second);
            m.insert(token, value);
        }
        assert(m.size() == 1000);
    }

    // Test 5: Seeded generators repeat, and skip pre-loaded tokens
    {
        mapping::Mapping empty;
        tokengen::Generator first(tokengen::Strategy::Uuid, 1234);
        tokengen::Generator second(tokengen::Strategy::Uuid, 1234);
        std::string token = first.generate(empty);
        assert(second.generate(empty) == token);

        mapping::Mapping preloaded;
        preloaded.insert(token, "already here");
        tokengen::Generator third(tokengen::Strategy::Uuid, 1234);
        std::string fresh = third.generate(preloaded);
        assert(fresh != token);
        assert(looks_like_uuid_v4(fresh));
    }

    // Test 6: Existing assignments are returned without generating
    {
        tokengen::Generator gen(tokengen::Strategy::Sequential);
        mapping::Mapping m;
        m.insert("42", "known");

        bool minted = true;
        assert(tokengen::token_for("known", m, gen, &minted) == "42");
        assert(!minted);

        assert(tokengen::token_for("new", m, gen, &minted) == "1");
        assert(minted);
    }

    return 0;
}
