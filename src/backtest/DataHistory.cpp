#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <limits>
#include <set>
#include <stdexcept>
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "network/HttpClient.h"

namespace quantsim {
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

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitRow(const std::string& line) {
    std::stringstream ss(line);
    std::string cell;
    std::vector<std::string> row;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

int findDateColumn(const std::vector<std::string>& header) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == "datetime") return static_cast<int>(i);
    }
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i].find("date") != std::string::npos) return static_cast<int>(i);
    }
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == "timestamp") return static_cast<int>(i);
    }
    return -1;
}

double parseNumber(const std::string& cell) {
    size_t consumed = 0;
    const double v = std::stod(cell, &consumed);
    if (consumed != cell.size() || !std::isfinite(v)) {
        throw std::invalid_argument("not a number: " + cell);
    }
    return v;
}

template <typename T>
bool readField(const nlohmann::json& item, const char* key, const char* short_key, T& out) {
    if (item.contains(key) && !item[key].is_null()) {
        out = item[key].get<T>();
        return true;
    }
    if (item.contains(short_key) && !item[short_key].is_null()) {
        out = item[short_key].get<T>();
        return true;
    }
    return false;
}
}

void DataHistory::sortAndDeduplicate(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
    auto last = std::unique(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp == b.timestamp;
    });
    if (last != candles.end()) {
        LOG_WARN("Dropped {} candles with duplicate timestamps", std::distance(last, candles.end()));
        candles.erase(last, candles.end());
    }
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return {};
    }
    return parseCSV(file, file_path);
}

std::vector<Candle> DataHistory::loadCSVFromUrl(const std::string& url) {
    network::HttpResponse response;
    try {
        network::HttpClient client;
        response = client.get(url);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Failed to fetch CSV from {}: {}", url, e.what());
        return {};
    }

    if (response.status_code >= 400) {
        LOG_ERROR("Failed to fetch CSV from {}: HTTP {}", url, response.status_code);
        return {};
    }

    std::istringstream body(response.body);
    return parseCSV(body, url);
}

std::vector<Candle> DataHistory::parseCSV(std::istream& input, const std::string& source) {
    std::vector<Candle> candles;
    std::string line;
    if (!std::getline(input, line)) {
        LOG_WARN("CSV source is empty: {}", source);
        return candles;
    }

    std::vector<std::string> header = splitRow(line);
    for (auto& name : header) {
        name = toLower(name);
    }

    const int date_col = findDateColumn(header);
    if (date_col < 0) {
        throw ValidationError("CSV must include a datetime column: " + source);
    }

    const std::vector<std::string> required{"open", "high", "low", "close", "volume"};
    std::vector<int> field_col;
    std::vector<std::string> missing;
    for (const auto& field : required) {
        auto it = std::find(header.begin(), header.end(), field);
        if (it == header.end()) {
            missing.push_back(field);
            field_col.push_back(-1);
        } else {
            field_col.push_back(static_cast<int>(std::distance(header.begin(), it)));
        }
    }
    if (!missing.empty()) {
        throw ValidationError("Missing required OHLCV columns: " + joinNames(missing));
    }

    const size_t max_col = static_cast<size_t>(
        std::max(date_col, *std::max_element(field_col.begin(), field_col.end())));

    size_t dropped = 0;
    while (std::getline(input, line)) {
        if (trim(line).empty()) continue;

        const auto row = splitRow(line);
        if (row.size() <= max_col) {
            ++dropped;
            continue;
        }

        const auto ts = utils::TimeUtils::parse(row[static_cast<size_t>(date_col)]);
        if (!ts) {
            ++dropped;
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = *ts;
            candle.open = parseNumber(row[static_cast<size_t>(field_col[0])]);
            candle.high = parseNumber(row[static_cast<size_t>(field_col[1])]);
            candle.low = parseNumber(row[static_cast<size_t>(field_col[2])]);
            candle.close = parseNumber(row[static_cast<size_t>(field_col[3])]);
            candle.volume = parseNumber(row[static_cast<size_t>(field_col[4])]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            ++dropped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    if (dropped > 0) {
        LOG_WARN("Dropped {} incomplete rows from {}", dropped, source);
    }
    sortAndDeduplicate(candles);

    LOG_INFO("Loaded {} candles from {}", candles.size(), source);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        for (const auto& item : j) {
            Candle candle;
            long long ts = 0;
            const bool complete =
                readField(item, "timestamp", "t", ts) &&
                readField(item, "open", "o", candle.open) &&
                readField(item, "high", "h", candle.high) &&
                readField(item, "low", "l", candle.low) &&
                readField(item, "close", "c", candle.close) &&
                readField(item, "volume", "v", candle.volume);
            if (!complete) {
                continue;
            }
            candle.timestamp = utils::TimeUtils::toMsTimestamp(ts);
            candles.push_back(candle);
        }
        sortAndDeduplicate(candles);

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& symbol,
                                      const std::string& csv_path,
                                      const std::string& url,
                                      const std::string& json_path) {
    std::string last_error;

    if (!csv_path.empty()) {
        try {
            auto candles = loadCSV(csv_path);
            if (!candles.empty()) {
                return candles;
            }
        } catch (const ValidationError& e) {
            last_error = e.what();
            LOG_WARN("CSV source rejected for {}: {}", symbol, e.what());
        }
    }

    if (!url.empty()) {
        try {
            auto candles = loadCSVFromUrl(url);
            if (!candles.empty()) {
                return candles;
            }
        } catch (const ValidationError& e) {
            last_error = e.what();
            LOG_WARN("URL source rejected for {}: {}", symbol, e.what());
        }
    }

    if (!json_path.empty()) {
        auto candles = loadJSON(json_path);
        if (!candles.empty()) {
            return candles;
        }
    }

    std::string message = "could not fetch data for " + symbol + " from any provided source";
    if (!last_error.empty()) {
        message += " (" + last_error + ")";
    }
    throw ValidationError(message);
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              const std::string& start_date,
                                              const std::string& end_date) {
    long long start_ts = std::numeric_limits<long long>::min();
    long long end_ts = std::numeric_limits<long long>::max();

    if (!start_date.empty()) {
        const auto parsed = utils::TimeUtils::parse(start_date);
        if (!parsed) throw ValidationError("invalid start date: " + start_date);
        start_ts = *parsed;
    }
    if (!end_date.empty()) {
        const auto parsed = utils::TimeUtils::parse(end_date);
        if (!parsed) throw ValidationError("invalid end date: " + end_date);
        end_ts = *parsed;
        // a bare date covers the whole day
        if (end_date.size() == 10) {
            end_ts += utils::TimeUtils::MS_PER_DAY - 1;
        }
    }

    std::vector<Candle> out;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(out), [&](const Candle& c) {
        return c.timestamp >= start_ts && c.timestamp <= end_ts;
    });
    return out;
}

Series DataHistory::toPriceSeries(const std::vector<Candle>& candles, const std::string& name) {
    Series series;
    series.name = name;
    series.index.reserve(candles.size());
    series.values.reserve(candles.size());
    for (const auto& c : candles) {
        series.index.push_back(c.timestamp);
        series.values.push_back(c.close);
    }
    return series;
}

PriceTable DataHistory::buildPriceTable(const std::map<std::string, std::vector<Candle>>& candles_by_symbol) {
    if (candles_by_symbol.empty()) {
        return PriceTable();
    }

    // Timestamps present for every symbol; repeats within one symbol count once
    std::map<long long, size_t> seen;
    for (const auto& kv : candles_by_symbol) {
        std::set<long long> own;
        for (const auto& c : kv.second) {
            own.insert(c.timestamp);
        }
        for (long long ts : own) {
            ++seen[ts];
        }
    }
    Timeline shared;
    for (const auto& kv : seen) {
        if (kv.second == candles_by_symbol.size()) {
            shared.push_back(kv.first);
        }
    }

    PriceTable table(shared);
    for (const auto& kv : candles_by_symbol) {
        std::map<long long, const Candle*> by_ts;
        for (const auto& c : kv.second) {
            by_ts[c.timestamp] = &c;
        }
        std::vector<double> open, high, low, close, volume;
        for (long long ts : shared) {
            const Candle* c = by_ts.at(ts);
            open.push_back(c->open);
            high.push_back(c->high);
            low.push_back(c->low);
            close.push_back(c->close);
            volume.push_back(c->volume);
        }
        table.addColumn(kv.first, "open", std::move(open));
        table.addColumn(kv.first, "high", std::move(high));
        table.addColumn(kv.first, "low", std::move(low));
        table.addColumn(kv.first, "close", std::move(close));
        table.addColumn(kv.first, "volume", std::move(volume));
    }

    LOG_INFO("Built price table: {} symbols, {} shared timestamps", candles_by_symbol.size(), shared.size());
    return table;
}

} // namespace backtest
} // namespace quantsim
