#include "courier/util.hpp"

#include <sodium/utils.h>

#include <cstdio>
#include <ctime>
#include <stdexcept>

#include "internal.hpp"

namespace courier {

void sodium_zero_buffer(void* ptr, size_t size) {
    if (ptr)
        sodium_memzero(ptr, size);
}

std::string to_iso8601(sys_ms t) {
    auto ms = epoch_ms(t);
    auto secs = static_cast<std::time_t>(ms / 1000);
    auto frac = static_cast<int>(ms % 1000);
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(
            buf,
            sizeof(buf),
            "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
            tm.tm_year + 1900,
            tm.tm_mon + 1,
            tm.tm_mday,
            tm.tm_hour,
            tm.tm_min,
            tm.tm_sec,
            frac);
    return buf;
}

sys_ms from_iso8601(std::string_view s) {
    std::string str{s};
    std::tm tm{};
    int end = 0;
    int n = std::sscanf(
            str.c_str(),
            "%4d-%2d-%2dT%2d:%2d:%2d%n",
            &tm.tm_year,
            &tm.tm_mon,
            &tm.tm_mday,
            &tm.tm_hour,
            &tm.tm_min,
            &tm.tm_sec,
            &end);
    if (n != 6)
        throw std::invalid_argument{"Invalid ISO-8601 timestamp: " + str};

    // Fractional seconds may have any number of digits; precision past milliseconds is dropped.
    auto rest = s.substr(static_cast<size_t>(end));
    int64_t frac = 0;
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        size_t digits = 0;
        int64_t scale = 100;
        while (digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '9') {
            frac += (rest[digits] - '0') * scale;
            scale /= 10;
            digits++;
        }
        if (digits == 0)
            throw std::invalid_argument{"Invalid ISO-8601 timestamp: " + str};
        rest.remove_prefix(digits);
    }
    if (rest != "Z")
        throw std::invalid_argument{"Invalid ISO-8601 timestamp: " + str};

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    auto secs = timegm(&tm);
    return from_epoch_ms(static_cast<int64_t>(secs) * 1000 + frac);
}

ustring bytes_from_json(const nlohmann::json& j, std::string_view field) {
    auto it = j.find(std::string{field});
    if (it == j.end() || !it->is_array())
        throw std::invalid_argument{"Missing or invalid byte array '" + std::string{field} + "'"};
    ustring out;
    out.reserve(it->size());
    for (const auto& v : *it) {
        if (!v.is_number_integer())
            throw std::invalid_argument{"Invalid byte in '" + std::string{field} + "'"};
        auto b = v.get<int64_t>();
        if (b < 0 || b > 255)
            throw std::invalid_argument{"Byte value out of range in '" + std::string{field} + "'"};
        out.push_back(static_cast<unsigned char>(b));
    }
    return out;
}

}  // namespace courier
