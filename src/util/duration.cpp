#include "util/duration.hpp"
#include "errors/Error.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

using namespace std::chrono;

namespace lsm::util {

static constexpr int64_t kDay = 24 * 3600;

static int64_t parseCount(const std::string_view digits, const std::string& input) {
    if (digits.empty() || !std::ranges::all_of(digits, [](const unsigned char c) { return std::isdigit(c); }))
        throw InvalidArgumentError("invalid duration: " + input);

    int64_t n = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
        throw InvalidArgumentError("invalid duration: " + input);
    return n;
}

static int64_t checkedMul(const int64_t n, const int64_t unit, const std::string& input) {
    if (n > std::numeric_limits<int64_t>::max() / unit)
        throw InvalidArgumentError("duration out of range: " + input);
    return n * unit;
}

static std::optional<int64_t> calendarUnit(std::string_view& s) {
    if (s.ends_with("mo")) { s.remove_suffix(2); return 30 * kDay; }
    if (s.ends_with('d')) { s.remove_suffix(1); return kDay; }
    if (s.ends_with('w')) { s.remove_suffix(1); return 7 * kDay; }
    if (s.ends_with('y')) { s.remove_suffix(1); return 365 * kDay; }
    return std::nullopt;
}

// h/m/s/ms/us/ns component with an optional fraction, in nanoseconds
static std::optional<int64_t> clockUnit(std::string_view& s) {
    static constexpr std::pair<std::string_view, int64_t> units[] = {
        {"ns", 1}, {"us", 1'000}, {"µs", 1'000}, {"ms", 1'000'000},
        {"h", 3'600'000'000'000}, {"m", 60'000'000'000}, {"s", 1'000'000'000},
    };
    for (const auto& [suffix, ns] : units) {
        if (s.starts_with(suffix)) {
            s.remove_prefix(suffix.size());
            return ns;
        }
    }
    return std::nullopt;
}

seconds parseDuration(const std::string& input) {
    std::string lowered(input);
    std::ranges::transform(lowered, lowered.begin(), [](const unsigned char c) { return std::tolower(c); });

    std::string_view s(lowered);
    if (s.size() < 2) throw InvalidArgumentError("invalid duration: " + input);

    if (const auto unit = calendarUnit(s))
        return seconds(checkedMul(parseCount(s, input), *unit, input));

    const auto isDigit = [](const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    int64_t totalNs = 0;
    while (!s.empty()) {
        size_t whole = 0;
        while (whole < s.size() && isDigit(s[whole])) ++whole;
        const auto intPart = s.substr(0, whole);
        s.remove_prefix(whole);

        std::string_view fracPart;
        if (!s.empty() && s.front() == '.') {
            s.remove_prefix(1);
            size_t n = 0;
            while (n < s.size() && isDigit(s[n])) ++n;
            fracPart = s.substr(0, n);
            s.remove_prefix(n);
        }
        if (intPart.empty() && fracPart.empty()) throw InvalidArgumentError("invalid duration: " + input);

        const auto unit = clockUnit(s);
        if (!unit) throw InvalidArgumentError("invalid duration unit in: " + input);

        int64_t part = intPart.empty() ? 0 : checkedMul(parseCount(intPart, input), *unit, input);

        // fraction digits beyond nanosecond resolution are dropped
        int64_t scale = *unit;
        for (const char c : fracPart) {
            if (scale < 10) break;
            scale /= 10;
            const int64_t add = (c - '0') * scale;
            if (part > std::numeric_limits<int64_t>::max() - add)
                throw InvalidArgumentError("duration out of range: " + input);
            part += add;
        }

        if (totalNs > std::numeric_limits<int64_t>::max() - part)
            throw InvalidArgumentError("duration out of range: " + input);
        totalNs += part;
    }
    return duration_cast<seconds>(nanoseconds(totalNs));
}

std::string formatRemaining(const seconds d) {
    const auto total = d.count();
    if (const auto days = total / kDay; days > 0) return std::to_string(days) + " days";
    if (const auto hours = total / 3600; hours > 0) return std::to_string(hours) + " hours";
    return std::to_string(total / 60) + " minutes";
}

std::string formatClock(const seconds d) {
    auto total = d.count();
    std::string out;
    if (total < 0) {
        out.push_back('-');
        total = -total;
    }
    const auto h = total / 3600, m = total % 3600 / 60, s = total % 60;
    if (h > 0) out += std::to_string(h) + "h";
    if (h > 0 || m > 0) out += std::to_string(m) + "m";
    out += std::to_string(s) + "s";
    return out;
}

}
