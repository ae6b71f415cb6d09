#pragma once
#include <map>
#include <string>

#include "types.hpp"

// HK, US, CN, SG or UNKNOWN. Exchange suffix wins, then the bare code shape.
std::string infer_market(const std::string& symbol);

// Market -> count over the given symbols.
std::map<std::string, size_t> market_distribution(const SymbolList& symbols);

// Provider for the dominant market of symbols, or fallback when the table has no entry.
std::string default_provider_for(
    const SymbolList& symbols,
    const std::map<std::string, std::string>& market_providers,
    const std::string& fallback
);
