/// @file PropertyKey.cpp
/// @brief Parsing and rendering of dotted property keys

#include "porephase/util/PropertyKey.hpp"
#include "porephase/util/Exceptions.hpp"

#include <vector>

namespace PorePhase {

const char* toString(Constants::ElementKind element) {
    return Constants::kElementNames[static_cast<int>(element)];
}

Constants::ElementKind parseElementKind(const std::string& name) {
    for (int i = 0; i < Constants::kNumElementKinds; ++i) {
        if (name == Constants::kElementNames[i]) {
            return static_cast<Constants::ElementKind>(i);
        }
    }
    throw InvalidKeyError(name);
}

PropertyKey PropertyKey::parse(const std::string& key) {
    std::vector<std::string> segments;
    std::string::size_type start = 0;
    while (true) {
        std::string::size_type dot = key.find('.', start);
        segments.push_back(key.substr(start, dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    if (segments.size() < 2) {
        throw InvalidKeyError(key);
    }
    for (const auto& s : segments) {
        if (s.empty()) {
            throw InvalidKeyError(key);
        }
    }

    PropertyKey result;
    try {
        result.element = parseElementKind(segments.front());
    }
    catch (const InvalidKeyError&) {
        throw InvalidKeyError(key);
    }

    std::size_t nProperty = segments.size() - 1;
    if (segments.size() >= 3) {
        result.qualifier = segments.back();
        nProperty = segments.size() - 2;
    }
    result.property = segments[1];
    for (std::size_t i = 2; i <= nProperty; ++i) {
        result.property += "." + segments[i];
    }
    return result;
}

std::string PropertyKey::str() const {
    std::string s = std::string(toString(element)) + "." + property;
    if (!qualifier.empty()) {
        s += "." + qualifier;
    }
    return s;
}

} // namespace PorePhase
