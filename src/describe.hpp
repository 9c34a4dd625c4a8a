#pragma once

/**
 * Human-readable representations for pretty-debug output.
 *
 * Anything that can be written to a std::ostream can be described. JSON
 * values are pretty-printed and vectors are listed element by element; add
 * an operator<< for your own types to make them printable.
 */

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace stderrx {

template <typename T>
std::string describe(const T& value);

template <typename T>
std::string describe(const std::vector<T>& values);

inline std::string describe(const std::string& value) {
    return value;
}

inline std::string describe(const char* value) {
    return value ? value : "(null)";
}

inline std::string describe(bool value) {
    return value ? "true" : "false";
}

inline std::string describe(const nlohmann::json& value) {
    return value.dump(2);
}

template <typename T>
std::string describe(const std::vector<T>& values) {
    std::string result = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) result += ", ";
        result += describe(values[i]);
    }
    return result + "]";
}

template <typename T>
std::string describe(const T& value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace stderrx
