#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace gridpilot {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file, sorted by timestamp.
    // Expected format: timestamp,open,high,low,close,volume
    // The timestamp cell is unix milliseconds or an ISO date
    // ("2024-01-01", "2024-01-01 00:00:00", "2024-01-01T00:00:00Z").
    // Throws DataFetchError when the file cannot be opened.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Keep candles inside [start_date, end_date]; empty bounds are open
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            const std::string& start_date,
                                            const std::string& end_date);

    // Unix milliseconds (UTC) for an epoch or ISO date string, nullopt if unparsable
    static std::optional<Timestamp> parseTimestamp(const std::string& text);
};

} // namespace backtest
} // namespace gridpilot
