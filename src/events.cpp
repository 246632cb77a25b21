// Events module - implementation (non-templated)
#include "events/loader.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <string>

#include "core/errors.hpp"
#include "core/json_utils.hpp"

namespace json = boost::json;

namespace stablesim {

std::vector<Candle> load_candles(const std::string& path, size_t max_candles) {
    json::value val;
    try {
        val = json::parse(read_file(path));
    } catch (const std::exception& e) {
        throw InvalidConfiguration("cannot read candles file " + path + ": " + e.what());
    }
    if (!val.is_array()) throw InvalidConfiguration("Candles JSON must be an array of arrays");

    const auto& arr = val.as_array();
    std::vector<Candle> out;
    out.reserve(arr.size());

    for (size_t idx = 0; idx < arr.size(); ++idx) {
        if (!arr[idx].is_array()) {
            throw InvalidConfiguration("candle " + std::to_string(idx) + " is not an array");
        }
        const auto& a = arr[idx].as_array();
        if (a.size() < 5) {
            throw InvalidConfiguration("candle " + std::to_string(idx) + " needs [ts, o, h, l, c, v]");
        }

        Candle c{};
        uint64_t ts = 0;
        const auto& tsv = a[0];
        if (tsv.is_uint64()) ts = tsv.as_uint64();
        else if (tsv.is_int64()) ts = static_cast<uint64_t>(tsv.as_int64());
        else if (tsv.is_double()) ts = static_cast<uint64_t>(tsv.as_double());
        else throw InvalidConfiguration("candle " + std::to_string(idx) + " has a non-numeric timestamp");
        if (ts > 10000000000ULL) ts /= 1000ULL; // ms->s
        c.ts = ts;

        const auto& cv = a[4];
        if (cv.is_double()) c.close = cv.as_double();
        else if (cv.is_int64()) c.close = static_cast<double>(cv.as_int64());
        else if (cv.is_uint64()) c.close = static_cast<double>(cv.as_uint64());
        else throw InvalidConfiguration("candle " + std::to_string(idx) + " has a non-numeric close");
        out.push_back(c);
    }

    std::stable_sort(out.begin(), out.end(), [](const Candle& a, const Candle& b) {
        return a.ts < b.ts;
    });
    if (max_candles && max_candles < out.size()) {
        out.resize(max_candles);
    }
    return out;
}

std::vector<double> candle_closes(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& c : candles) {
        closes.push_back(c.close);
    }
    return closes;
}

} // namespace stablesim
