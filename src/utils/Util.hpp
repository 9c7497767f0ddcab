#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace pyrunner {

// Visitor built from lambdas, for std::visit
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// ===== String Utils =====

inline std::string trim(std::string s) {
    auto start = s.find_first_not_of(" \t\n\r");
    auto end = s.find_last_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template<typename Iterable>
std::string join(const Iterable& items, const std::string& delim = ",") {
    std::ostringstream oss;
    bool first = true;
    for (const auto& item : items) {
        if (!first) oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

// Keeps empty fields; "a;;b" yields {"a", "", "b"}
inline std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::string item;
    std::istringstream iss(s);
    while (std::getline(iss, item, delim)) {
        result.push_back(item);
    }
    return result;
}

inline bool parseBool(const std::string& value, bool fallback) {
    std::string v = toLower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return fallback;
}

} // namespace pyrunner
