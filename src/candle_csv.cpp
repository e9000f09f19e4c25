#include "candle_csv.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ta {

namespace {

constexpr std::size_t FIELD_COUNT = 6;

std::string trim(const std::string& s) {
    std::size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first]))) {
        ++first;
    }
    std::size_t last = s.size();
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) {
        --last;
    }
    return s.substr(first, last - first);
}

bool looks_numeric(const std::string& field) {
    return !field.empty() &&
           (std::isdigit(static_cast<unsigned char>(field[0])) || field[0] == '-' ||
            field[0] == '+' || field[0] == '.');
}

double to_double(const std::string& field, const char* name) {
    std::size_t used = 0;
    double value = std::stod(field, &used);
    if (used != field.size()) {
        throw std::invalid_argument(std::string("trailing characters in ") + name);
    }
    return value;
}

} // namespace

std::optional<Candle> parse_candle_line(const std::string& raw) {
    const std::string line = trim(raw);
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }

    if (fields.empty() || !looks_numeric(fields[0])) {
        return std::nullopt; // header
    }
    if (fields.size() < FIELD_COUNT) {
        throw std::invalid_argument("expected 6 fields, got " +
                                    std::to_string(fields.size()));
    }

    // stoull wraps a negative value instead of rejecting it
    if (fields[0][0] == '-') {
        throw std::invalid_argument("negative time");
    }

    Candle candle;
    std::size_t used = 0;
    candle.time = std::stoull(fields[0], &used);
    if (used != fields[0].size()) {
        throw std::invalid_argument("trailing characters in time");
    }
    candle.open = to_double(fields[1], "open");
    candle.high = to_double(fields[2], "high");
    candle.low = to_double(fields[3], "low");
    candle.close = to_double(fields[4], "close");
    candle.volume = to_double(fields[5], "volume");
    return candle;
}

CandleSeries read_candles_csv(std::istream& in) {
    CandleSeries series;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        try {
            auto candle = parse_candle_line(line);
            if (candle) {
                series.push_back(*candle);
            }
        } catch (const std::exception& ex) {
            std::cerr << "failed to parse line " << line_no << ": " << line
                      << " error: " << ex.what() << "\n";
        }
    }

    return normalize_series(std::move(series));
}

CandleSeries load_candles_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open input file: " + path);
    }
    return read_candles_csv(file);
}

} // namespace ta
