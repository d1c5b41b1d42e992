#include "backtest/DataHistory.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>
#include "common/Exceptions.h"
#include "common/Logger.h"

namespace gridpilot {
namespace backtest {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

} // namespace

std::optional<Timestamp> DataHistory::parseTimestamp(const std::string& text) {
    const std::string s = trim(text);
    if (s.empty()) {
        return std::nullopt;
    }

    const bool all_digits = std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (all_digits) {
        try {
            return static_cast<Timestamp>(std::stoll(s));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    const int parsed = std::sscanf(s.c_str(), "%d-%d-%d%*[ T]%d:%d:%d",
                                   &year, &month, &day, &hour, &minute, &second);
    if (parsed != 3 && parsed != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return static_cast<Timestamp>(timegm(&tm)) * 1000LL;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        throw DataFetchError("Failed to load OHLCV data from file: " + file_path);
    }

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header or malformed row.
            continue;
        }

        const auto timestamp = parseTimestamp(row[0]);
        if (!timestamp) {
            LOG_WARN("Unparsable timestamp in row: {}", line);
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = *timestamp;
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              const std::string& start_date,
                                              const std::string& end_date) {
    const auto start = start_date.empty() ? std::nullopt : parseTimestamp(start_date);
    const auto end = end_date.empty() ? std::nullopt : parseTimestamp(end_date);

    if (!start_date.empty() && !start) {
        LOG_WARN("Ignoring unparsable start date: {}", start_date);
    }
    if (!end_date.empty() && !end) {
        LOG_WARN("Ignoring unparsable end date: {}", end_date);
    }

    std::vector<Candle> filtered;
    filtered.reserve(candles.size());
    for (const auto& candle : candles) {
        if (start && candle.timestamp < *start) continue;
        if (end && candle.timestamp > *end) continue;
        filtered.push_back(candle);
    }

    LOG_DEBUG("Filtered {} of {} candles to [{}, {}]",
              filtered.size(), candles.size(), start_date, end_date);
    return filtered;
}

} // namespace backtest
} // namespace gridpilot
