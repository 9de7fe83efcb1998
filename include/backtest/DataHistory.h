#pragma once

#include <istream>
#include <string>
#include <vector>
#include <map>
#include "common/Types.h"
#include "common/PriceTable.h"

namespace quantsim {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file with a header row.
    // Columns (any case, any order): a datetime column (`datetime`, the first
    // column containing "date", or `timestamp`), open, high, low, close, volume.
    // Unreadable or empty file -> empty result.
    // Throws ValidationError listing the missing OHLCV columns.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Same CSV layout fetched over libcurl (http, https, file URLs).
    // Transport failure or an HTTP error status -> empty result.
    static std::vector<Candle> loadCSVFromUrl(const std::string& url);

    // Load candles from a JSON array of objects
    // ({timestamp|t, open|o, high|h, low|l, close|c, volume|v})
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Local CSV, then URL, then JSON; a source that fails or yields nothing
    // falls through. Empty arguments are skipped.
    // Throws ValidationError when no source yields data.
    static std::vector<Candle> load(const std::string& symbol,
                                    const std::string& csv_path,
                                    const std::string& url = "",
                                    const std::string& json_path = "");

    // Inclusive date range; an empty bound is open
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            const std::string& start_date,
                                            const std::string& end_date);

    static Series toPriceSeries(const std::vector<Candle>& candles, const std::string& name = "close");

    // Inner join on timestamps; fields open/high/low/close/volume per symbol
    static PriceTable buildPriceTable(const std::map<std::string, std::vector<Candle>>& candles_by_symbol);

private:
    static std::vector<Candle> parseCSV(std::istream& input, const std::string& source);
    static void sortAndDeduplicate(std::vector<Candle>& candles);
};

} // namespace backtest
} // namespace quantsim
