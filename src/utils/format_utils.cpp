#include "castbridge/utils/format_utils.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace castbridge::utils {

namespace {
    std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    std::optional<double> parse_number(const std::string& text) {
        if (text.empty()) return std::nullopt;
        // strtod accepts "inf", "nan", hex and leading blanks; only plain decimals are allowed here
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') {
                return std::nullopt;
            }
        }
        if (std::count(text.begin(), text.end(), '.') > 1) return std::nullopt;

        std::istringstream iss(text);
        double value = 0.0;
        iss >> value;
        if (iss.fail()) return std::nullopt;
        return value;
    }

    std::optional<int> parse_int(const std::string& text) {
        int value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }
}

std::string format_duration(double seconds) {
    int total_seconds = static_cast<int>(std::max(seconds, 0.0));
    int hours = total_seconds / 3600;
    int minutes = (total_seconds % 3600) / 60;
    int secs = total_seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ":" << std::setfill('0') << std::setw(2) << minutes
            << ":" << std::setw(2) << secs;
    } else {
        oss << minutes << ":" << std::setfill('0') << std::setw(2) << secs;
    }
    return oss.str();
}

std::optional<double> parse_seek_target(const std::string& input, double current, double duration) {
    std::string text = trim(input);
    if (text.empty()) return std::nullopt;

    std::optional<double> target;

    if (text.front() == '+' || text.front() == '-') {
        auto delta = parse_number(text.substr(1));
        if (!delta) return std::nullopt;
        target = text.front() == '+' ? current + *delta : current - *delta;
    } else if (text.find(':') != std::string::npos) {
        std::vector<std::string> parts;
        std::istringstream iss(text);
        std::string part;
        while (std::getline(iss, part, ':')) {
            parts.push_back(part);
        }
        if (text.back() == ':' || parts.size() < 2 || parts.size() > 3) return std::nullopt;

        double total = 0.0;
        for (const auto& p : parts) {
            auto value = parse_int(p);
            if (!value || *value < 0) return std::nullopt;
            total = total * 60.0 + *value;
        }
        target = total;
    } else {
        target = parse_number(text);
    }

    if (!target) return std::nullopt;

    double result = std::max(*target, 0.0);
    if (duration > 0.0) {
        result = std::min(result, duration);
    }
    return result;
}

std::string format_bytes(unsigned long long bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    }
    return oss.str();
}

} // namespace castbridge::utils
