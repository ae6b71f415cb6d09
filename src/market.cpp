#include "market.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace {

bool all_of_class(const std::string& text, int (*pred)(int)) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [pred](unsigned char c) { return pred(c) != 0; });
}

}

std::string infer_market(const std::string& symbol) {
    const std::string upper = boost::algorithm::to_upper_copy(symbol);
    using boost::algorithm::contains;

    if (contains(upper, ".HK")) return "HK";
    if (contains(upper, ".US") || contains(upper, ".NASDAQ") || contains(upper, ".NYSE")) return "US";
    if (contains(upper, ".SZ") || contains(upper, ".SH")) return "CN";
    if (contains(upper, ".SG")) return "SG";

    if (upper.size() <= 5 && all_of_class(upper, std::isupper)) {
        return "US";
    }
    if (all_of_class(upper, std::isdigit)) {
        if (upper.size() == 6) {
            const std::string board = upper.substr(0, 2);
            if (board == "00" || board == "30" || board == "60" || board == "68") {
                return "CN";
            }
        }
        if (upper.size() == 4 || upper.size() == 5) {
            return "HK";
        }
    }
    return "UNKNOWN";
}

std::map<std::string, size_t> market_distribution(const SymbolList& symbols) {
    std::map<std::string, size_t> counts;
    for (const auto& symbol : symbols) {
        ++counts[infer_market(symbol)];
    }
    return counts;
}

std::string default_provider_for(
    const SymbolList& symbols,
    const std::map<std::string, std::string>& market_providers,
    const std::string& fallback
) {
    const auto counts = market_distribution(symbols);
    auto primary = std::max_element(counts.begin(), counts.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    });
    if (primary == counts.end()) {
        return fallback;
    }
    auto it = market_providers.find(primary->first);
    return it == market_providers.end() ? fallback : it->second;
}
