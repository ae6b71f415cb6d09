#include "capability_mapper.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "logging.hpp"

QR_INLINE_GLOBAL_LOGGER_WITH_CHANNEL(LG_PIPE, "PIPE")

const char* to_string(RuleType rule) {
    switch (rule) {
        case RuleType::QUOTE_FIELDS: return "quote_fields";
        case RuleType::OPTION_FIELDS: return "option_fields";
        case RuleType::FUTURES_FIELDS: return "futures_fields";
        case RuleType::FOREX_FIELDS: return "forex_fields";
        case RuleType::CRYPTO_FIELDS: return "crypto_fields";
        case RuleType::MARKET_DATA_FIELDS: return "market_data_fields";
        case RuleType::TRADING_DATA_FIELDS: return "trading_data_fields";
        case RuleType::BASIC_INFO_FIELDS: return "basic_info_fields";
        case RuleType::COMPANY_INFO_FIELDS: return "company_info_fields";
        case RuleType::MARKET_INFO_FIELDS: return "market_info_fields";
        case RuleType::HISTORICAL_DATA_FIELDS: return "historical_data_fields";
        case RuleType::NEWS_FIELDS: return "news_fields";
        case RuleType::ANNOUNCEMENT_FIELDS: return "announcement_fields";
    }
    return "quote_fields";
}

const char* to_string(MappingMethod method) {
    switch (method) {
        case MappingMethod::DIRECT_TABLE: return "direct_mapping";
        case MappingMethod::PATTERN: return "pattern_analysis";
        case MappingMethod::PROTOCOL_FALLBACK: return "protocol_fallback";
        case MappingMethod::DEFAULT: return "default";
    }
    return "default";
}

CapabilityMapper::CapabilityMapper()
    : table_{
        // websocket streams
        {"ws-stock-quote", RuleType::QUOTE_FIELDS},
        {"ws-option-quote", RuleType::OPTION_FIELDS},
        {"ws-futures-quote", RuleType::FUTURES_FIELDS},
        {"ws-forex-quote", RuleType::FOREX_FIELDS},
        {"ws-crypto-quote", RuleType::CRYPTO_FIELDS},
        // rest
        {"get-stock-quote", RuleType::QUOTE_FIELDS},
        {"get-option-quote", RuleType::OPTION_FIELDS},
        {"get-futures-quote", RuleType::FUTURES_FIELDS},
        {"get-forex-quote", RuleType::FOREX_FIELDS},
        {"get-crypto-quote", RuleType::CRYPTO_FIELDS},
        // streaming
        {"stream-stock-quote", RuleType::QUOTE_FIELDS},
        {"stream-option-quote", RuleType::OPTION_FIELDS},
        {"stream-market-data", RuleType::MARKET_DATA_FIELDS},
        {"stream-trading-data", RuleType::TRADING_DATA_FIELDS},
        // reference data
        {"get-stock-info", RuleType::BASIC_INFO_FIELDS},
        {"get-company-info", RuleType::COMPANY_INFO_FIELDS},
        {"get-market-info", RuleType::MARKET_INFO_FIELDS},
        {"get-historical-data", RuleType::HISTORICAL_DATA_FIELDS},
        {"get-historical-quotes", RuleType::QUOTE_FIELDS},
        {"get-news", RuleType::NEWS_FIELDS},
        {"get-announcements", RuleType::ANNOUNCEMENT_FIELDS},
      },
      // Instrument-specific families are tried before the generic quote/price rule
      // so that e.g. "ws-option-quote-l2" is not classified as a plain quote.
      patterns_{
        {{"option"}, RuleType::OPTION_FIELDS},
        {{"future"}, RuleType::FUTURES_FIELDS},
        {{"forex", "currency", "fx-"}, RuleType::FOREX_FIELDS},
        {{"crypto", "bitcoin", "eth"}, RuleType::CRYPTO_FIELDS},
        {{"quote", "price"}, RuleType::QUOTE_FIELDS},
        {{"announcement"}, RuleType::ANNOUNCEMENT_FIELDS},
        {{"news"}, RuleType::NEWS_FIELDS},
        {{"company"}, RuleType::COMPANY_INFO_FIELDS},
        {{"histor"}, RuleType::HISTORICAL_DATA_FIELDS},
        {{"trading"}, RuleType::TRADING_DATA_FIELDS},
        {{"market"}, RuleType::MARKET_DATA_FIELDS},
        {{"info", "basic"}, RuleType::BASIC_INFO_FIELDS},
      } {}

CapabilityMapping CapabilityMapper::resolve(const std::string& capability) const {
    for (const auto& [key, rule] : table_) {
        if (key == capability) {
            RLOG(LG_PIPE, LogLevel::LL_DEBUG)
                << "capability '" << capability << "' -> " << rule << " method=" << MappingMethod::DIRECT_TABLE;
            return {rule, MappingMethod::DIRECT_TABLE, key};
        }
    }

    const std::string lower = boost::algorithm::to_lower_copy(capability);

    for (const auto& pattern : patterns_) {
        for (const auto& keyword : pattern.keywords) {
            if (boost::algorithm::contains(lower, keyword)) {
                RLOG(LG_PIPE, LogLevel::LL_DEBUG)
                    << "capability '" << capability << "' -> " << pattern.rule
                    << " method=" << MappingMethod::PATTERN << " keyword=" << keyword;
                return {pattern.rule, MappingMethod::PATTERN, keyword};
            }
        }
    }

    static const std::pair<const char*, RuleType> protocol_prefixes[] = {
        {"stream", RuleType::QUOTE_FIELDS},
        {"ws", RuleType::QUOTE_FIELDS},
        {"get", RuleType::BASIC_INFO_FIELDS},
        {"rest", RuleType::BASIC_INFO_FIELDS},
        {"fetch", RuleType::BASIC_INFO_FIELDS},
    };
    for (const auto& [prefix, rule] : protocol_prefixes) {
        if (boost::algorithm::starts_with(lower, prefix)) {
            RLOG(LG_PIPE, LogLevel::LL_WARNING)
                << "capability '" << capability << "' -> " << rule << " method=" << MappingMethod::PROTOCOL_FALLBACK
                << " prefix=" << prefix << "; add an explicit mapping";
            return {rule, MappingMethod::PROTOCOL_FALLBACK, prefix};
        }
    }

    RLOG(LG_PIPE, LogLevel::LL_WARNING)
        << "capability '" << capability << "' unknown, using " << default_rule_ << " method=" << MappingMethod::DEFAULT;
    return {default_rule_, MappingMethod::DEFAULT, ""};
}
