/**
 * expression_mapper.cpp — Implementation
 */

#include "expression_mapper.hpp"

#include <algorithm>
#include <initializer_list>

#include <absl/strings/ascii.h>

namespace therapy_lens {

namespace {

std::string canonical_category(const std::string& name) {
    std::string key = absl::AsciiStrToLower(name);
    key.erase(std::remove_if(key.begin(), key.end(),
                             [](unsigned char c) { return absl::ascii_isspace(c); }),
              key.end());
    return key;
}

float strongest(const std::map<std::string, float>& categories,
                std::initializer_list<const char*> names) {
    float best = 0.0f;
    for (const char* name : names) {
        auto it = categories.find(name);
        if (it != categories.end()) {
            best = std::max(best, it->second);
        }
    }
    return best;
}

} // namespace

std::map<std::string, float> blendshapes_to_expressions(
    const std::map<std::string, float>& blendshapes
) {
    std::map<std::string, float> categories;
    for (const auto& [name, score] : blendshapes) {
        categories[canonical_category(name)] = score;
    }

    std::map<std::string, float> expressions;
    expressions["happy"]     = strongest(categories, {"mouthsmileleft", "mouthsmileright"});
    expressions["sad"]       = strongest(categories, {"mouthfrownleft", "mouthfrownright"});
    expressions["surprised"] = strongest(categories, {"jawopen", "eyewideleft", "eyewideright"});
    expressions["angry"]     = strongest(categories, {"browdownleft", "browdownright"});
    return expressions;
}

} // namespace therapy_lens
