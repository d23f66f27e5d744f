#include "GasLogReader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

static inline std::string trim(std::string s) {
    auto issp = [](unsigned char c){ return std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [&](unsigned char c){return !issp(c);} ));
    s.erase(std::find_if(s.rbegin(), s.rend(), [&](unsigned char c){return !issp(c);}).base(), s.end());
    return s;
}

static std::string unquote(std::string s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

static bool split_csv(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::stringstream ss(line);
    std::string tok;
    while (std::getline(ss, tok, ',')) out.push_back(unquote(trim(tok)));
    return !out.empty();
}

static std::optional<double> to_number(const std::string& tok) {
    if (tok.empty()) return std::nullopt;
    try {
        std::size_t used = 0;
        double v = std::stod(tok, &used);
        if (used != tok.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::exception&) { return std::nullopt; }
}

// Days since 1970-01-01 for a proleptic Gregorian date.
static long long days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

bool is_skippable_line(const std::string& line) {
    const std::string t = trim(line);
    return t.empty() || t[0] == '#';
}

std::optional<double> parse_local_time(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    double s = 0.0;
    char sep = 0;
    const std::string t = trim(text);
    if (std::sscanf(t.c_str(), "%d-%d-%d%c%d:%d:%lf", &y, &mo, &d, &sep, &h, &mi, &s) != 7) {
        return std::nullopt;
    }
    if (sep != ' ' && sep != 'T') return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h < 0 || h > 23 ||
        mi < 0 || mi > 59 || s < 0.0 || s >= 61.0) {
        return std::nullopt;
    }

    const long long days = days_from_civil(y, static_cast<unsigned>(mo),
                                           static_cast<unsigned>(d));
    return static_cast<double>(days) * 86400.0 + h * 3600.0 + mi * 60.0 + s;
}

std::optional<GasSample> parse_gas_log_row(const std::string& line) {
    std::vector<std::string> toks;
    if (!split_csv(line, toks) || toks.size() < 3) return std::nullopt;

    auto ts  = to_number(toks[0]);
    auto co2 = to_number(toks[2]);
    if (!ts || !co2) return std::nullopt;

    GasSample g;
    g.timestamp_s       = *ts;
    g.local_time        = toks[1];
    g.concentration_ppm = *co2;
    return g;
}

std::optional<GasLog> read_gas_log_csv(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) return std::nullopt;

    GasLog log;
    bool header_seen = false;
    std::string line;
    while (std::getline(in, line)) {
        if (is_skippable_line(line)) continue;
        if (!header_seen) { header_seen = true; continue; }

        auto g = parse_gas_log_row(line);
        if (!g) { ++log.dropped_rows; continue; }
        log.samples.push_back(*g);
    }

    // Sort by local time only if every row has one we understand.
    std::vector<double> keys;
    keys.reserve(log.samples.size());
    for (const auto& g : log.samples) {
        auto k = parse_local_time(g.local_time);
        if (!k) { keys.clear(); break; }
        keys.push_back(*k);
    }

    if (!log.samples.empty() && keys.size() == log.samples.size()) {
        std::vector<std::size_t> order(log.samples.size());
        for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
        std::stable_sort(order.begin(), order.end(),
                         [&](std::size_t a, std::size_t b) { return keys[a] < keys[b]; });

        std::vector<GasSample> sorted;
        sorted.reserve(order.size());
        for (std::size_t idx : order) sorted.push_back(std::move(log.samples[idx]));
        log.samples = std::move(sorted);
        log.sorted_by_local_time = true;
    }
    return log;
}
