#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

// Canonical rule families understood by the transform collaborator.
enum class RuleType : uint8_t {
    QUOTE_FIELDS,
    OPTION_FIELDS,
    FUTURES_FIELDS,
    FOREX_FIELDS,
    CRYPTO_FIELDS,
    MARKET_DATA_FIELDS,
    TRADING_DATA_FIELDS,
    BASIC_INFO_FIELDS,
    COMPANY_INFO_FIELDS,
    MARKET_INFO_FIELDS,
    HISTORICAL_DATA_FIELDS,
    NEWS_FIELDS,
    ANNOUNCEMENT_FIELDS
};

enum class MappingMethod : uint8_t {DIRECT_TABLE, PATTERN, PROTOCOL_FALLBACK, DEFAULT};

const char* to_string(RuleType rule);
const char* to_string(MappingMethod method);

template<typename C, typename T>
std::basic_ostream<C, T>& operator<<(std::basic_ostream<C, T>& strm, RuleType rule) {
    strm << to_string(rule);
    return strm;
}

template<typename C, typename T>
std::basic_ostream<C, T>& operator<<(std::basic_ostream<C, T>& strm, MappingMethod method) {
    strm << to_string(method);
    return strm;
}

struct CapabilityMapping {
    RuleType rule;
    MappingMethod method;
    std::string matched; // table key, keyword or protocol prefix that decided the mapping
};

class CapabilityMapper {
    public:
        struct PatternRule {
            std::vector<std::string> keywords;
            RuleType rule;
        };

        CapabilityMapper();

        // Exact table lookup, then keyword patterns on the lower-cased name,
        // then protocol-prefix convention, then the default rule.
        CapabilityMapping resolve(const std::string& capability) const;
        RuleType map(const std::string& capability) const {return resolve(capability).rule;}

    private:
        std::vector<std::pair<std::string, RuleType>> table_;
        std::vector<PatternRule> patterns_;
        RuleType default_rule_ = RuleType::QUOTE_FIELDS;
};
