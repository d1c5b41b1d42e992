#include "backtest/DataHistory.h"

#include "common/Exceptions.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using gridpilot::Candle;
using gridpilot::DataFetchError;
using gridpilot::backtest::DataHistory;

int main() {
    {
        assert(*DataHistory::parseTimestamp("2024-01-01") == 1704067200000LL);
        assert(*DataHistory::parseTimestamp("2024-01-01 01:00:00") == 1704070800000LL);
        assert(*DataHistory::parseTimestamp("2024-01-01T01:00:00Z") == 1704070800000LL);
        assert(*DataHistory::parseTimestamp("1704067200000") == 1704067200000LL);
        assert(!DataHistory::parseTimestamp("yesterday"));
        assert(!DataHistory::parseTimestamp("2024-13-01"));
        assert(!DataHistory::parseTimestamp(""));
    }

    const auto path = std::filesystem::temp_directory_path() / "gridpilot_data_history_test.csv";
    {
        std::ofstream out(path);
        out << "\xEF\xBB\xBFtimestamp,open,high,low,close,volume\n";
        out << "2024-01-01 02:00:00,102,103,101,102.5,7\n";
        out << "\"1704067200000\",100,101,99,100.5,5\n";
        out << "2024-01-01 01:00:00,101,102,100,101.5,6\n";
        out << "2024-01-01 03:00:00,oops,1,1,1,1\n";
        out << "short,row\n";
    }

    {
        const auto candles = DataHistory::loadCSV(path.string());
        assert(candles.size() == 3);
        assert(candles[0].timestamp == 1704067200000LL);
        assert(candles[0].close == 100.5);
        assert(candles[1].close == 101.5);
        assert(candles[2].high == 103.0);

        const auto window = DataHistory::filterByDate(candles, "2024-01-01T01:00:00Z", "2024-01-01T01:30:00Z");
        assert(window.size() == 1);
        assert(window[0].close == 101.5);

        assert(DataHistory::filterByDate(candles, "", "").size() == 3);
        assert(DataHistory::filterByDate(candles, "2025-01-01", "").empty());
    }
    std::filesystem::remove(path);

    {
        const auto sample = DataHistory::loadCSV("data/SOL_USDT_1h_sample.csv");
        assert(sample.size() == 96);
        for (std::size_t i = 1; i < sample.size(); ++i) {
            assert(sample[i - 1].timestamp < sample[i].timestamp);
        }
    }

    {
        bool missing = false;
        try {
            DataHistory::loadCSV("data/does_not_exist.csv");
        } catch (const DataFetchError&) {
            missing = true;
        }
        assert(missing);
    }

    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
