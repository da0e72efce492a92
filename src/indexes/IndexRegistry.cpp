#include <ycurve/indexes/IndexRegistry.h>
#include <ycurve/utils/Errors.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>

std::string toString(IndexType type)
{
    switch (type) {
        case IndexType::OIS: return "OIS";
        case IndexType::IBOR: return "IBOR";
        case IndexType::Treasury: return "TREASURY";
        case IndexType::Swap: return "SWAP";
    }
    return "UNKNOWN";
}

std::string IndexRegistry::normalize(const std::string& code)
{
    return boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(code));
}

void IndexRegistry::add(const InterestRateIndex& index)
{
    if (index.code.empty()) {
        throw ValidationError("IndexRegistry: index code must not be empty");
    }
    InterestRateIndex entry = index;
    entry.code = normalize(index.code);
    _indexes[entry.code] = entry;
}

std::optional<InterestRateIndex> IndexRegistry::get(const std::string& code) const
{
    auto it = _indexes.find(normalize(code));
    if (it == _indexes.end()) {
        return std::nullopt;
    }
    return it->second;
}

const InterestRateIndex& IndexRegistry::at(const std::string& code) const
{
    auto it = _indexes.find(normalize(code));
    if (it == _indexes.end()) {
        throw UnknownStrategyError("Unknown index: " + normalize(code) +
                                   ". Available: " + boost::algorithm::join(codes(), ", "));
    }
    return it->second;
}

bool IndexRegistry::contains(const std::string& code) const
{
    return _indexes.count(normalize(code)) > 0;
}

std::vector<std::string> IndexRegistry::codes() const
{
    std::vector<std::string> result;
    result.reserve(_indexes.size());
    for (const auto& entry : _indexes) {
        result.push_back(entry.first);
    }
    return result;
}

std::map<std::string, InterestRateIndex> IndexRegistry::listAll() const
{
    return _indexes;
}

std::map<std::string, InterestRateIndex> IndexRegistry::listByCurrency(const std::string& currency) const
{
    const std::string ccy = normalize(currency);
    std::map<std::string, InterestRateIndex> result;
    for (const auto& entry : _indexes) {
        if (normalize(entry.second.currency) == ccy) {
            result.insert(entry);
        }
    }
    return result;
}

IndexRegistry IndexRegistry::withDefaults()
{
    IndexRegistry registry;

    // ---- USD ----
    registry.add({"SOFR", "Secured Overnight Financing Rate", "USD", IndexType::OIS,
                  "ACT/360", "simple", "daily",
                  "US Dollar overnight rate, replacement for LIBOR"});
    registry.add({"USD-LIBOR-1M", "US Dollar LIBOR 1 Month", "USD", IndexType::IBOR,
                  "ACT/360", "simple", "monthly",
                  "US Dollar 1-month interbank offered rate (legacy)"});
    registry.add({"USD-LIBOR-3M", "US Dollar LIBOR 3 Month", "USD", IndexType::IBOR,
                  "ACT/360", "simple", "quarterly",
                  "US Dollar 3-month interbank offered rate (legacy)"});
    registry.add({"USD-LIBOR-6M", "US Dollar LIBOR 6 Month", "USD", IndexType::IBOR,
                  "ACT/360", "simple", "semi-annual",
                  "US Dollar 6-month interbank offered rate (legacy)"});

    // ---- EUR ----
    registry.add({"EURIBOR-1M", "Euro Interbank Offered Rate 1 Month", "EUR", IndexType::IBOR,
                  "ACT/360", "simple", "monthly",
                  "Euro 1-month interbank offered rate"});
    registry.add({"EURIBOR-3M", "Euro Interbank Offered Rate 3 Month", "EUR", IndexType::IBOR,
                  "ACT/360", "simple", "quarterly",
                  "Euro 3-month interbank offered rate"});
    registry.add({"EURIBOR-6M", "Euro Interbank Offered Rate 6 Month", "EUR", IndexType::IBOR,
                  "ACT/360", "simple", "semi-annual",
                  "Euro 6-month interbank offered rate"});
    registry.add({"EONIA", "Euro Overnight Index Average", "EUR", IndexType::OIS,
                  "ACT/360", "simple", "daily",
                  "Euro overnight rate (replaced by ESTR)"});
    registry.add({"ESTR", "Euro Short-Term Rate", "EUR", IndexType::OIS,
                  "ACT/360", "simple", "daily",
                  "Euro overnight rate, replacement for EONIA"});

    // ---- GBP ----
    registry.add({"GBP-LIBOR-3M", "British Pound LIBOR 3 Month", "GBP", IndexType::IBOR,
                  "ACT/365", "simple", "quarterly",
                  "British Pound 3-month interbank offered rate"});
    registry.add({"SONIA", "Sterling Overnight Index Average", "GBP", IndexType::OIS,
                  "ACT/365", "simple", "daily",
                  "British Pound overnight rate"});

    // ---- Treasury ----
    registry.add({"USD-TREASURY", "US Treasury Constant Maturity", "USD", IndexType::Treasury,
                  "ACT/365", "simple", "daily",
                  "US Treasury constant maturity rates"});

    return registry;
}
