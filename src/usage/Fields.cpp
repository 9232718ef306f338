#include "usage/Fields.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace pw::usage::fields {

uint64_t toCount(const nlohmann::json& value) {
    if (value.is_number_unsigned()) return value.get<uint64_t>();

    if (value.is_number_integer()) {
        const auto v = value.get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }

    if (value.is_number_float()) {
        const auto v = value.get<double>();
        if (!std::isfinite(v) || v <= 0.0) return 0;
        if (v >= static_cast<double>(std::numeric_limits<uint64_t>::max())) return std::numeric_limits<uint64_t>::max();
        return static_cast<uint64_t>(v);
    }

    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        auto first = s.data();
        const auto last = s.data() + s.size();
        while (first != last && (*first == ' ' || *first == '\t')) ++first;
        if (first != last && *first == '+') ++first;

        uint64_t out = 0;
        const auto [ptr, ec] = std::from_chars(first, last, out);
        if (ec != std::errc{} || ptr == first) return 0;
        for (auto p = ptr; p != last; ++p)
            if (*p != ' ' && *p != '\t') return 0;
        return out;
    }

    return 0;
}

std::vector<const nlohmann::json*> listOrMapValues(const nlohmann::json& obj, const char* key) {
    std::vector<const nlohmann::json*> out;
    if (!obj.is_object()) return out;

    const auto it = obj.find(key);
    if (it == obj.end() || !(it->is_array() || it->is_object())) return out;

    out.reserve(it->size());
    for (const auto& v : *it) out.push_back(&v);
    return out;
}

}
