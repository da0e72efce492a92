#ifndef YCURVE_INDEXREGISTRY_H
#define YCURVE_INDEXREGISTRY_H

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class IndexType { OIS, IBOR, Treasury, Swap };

std::string toString(IndexType type);

// Benchmark rate definition and its quoting conventions
struct InterestRateIndex {
    std::string code;                       // e.g. "SOFR", "USD-LIBOR-3M"
    std::string name;
    std::string currency;                   // ISO code
    IndexType indexType = IndexType::OIS;
    std::string dayCount = "ACT/360";
    std::string compounding = "simple";
    std::string fixingFrequency = "daily";
    std::string description;
};

/**
 * Registry of interest-rate indexes keyed by upper-case code
 *
 * Populated once (withDefaults() or explicit add() calls) and then passed by const reference
 * to the index bootstrapper and factory. Lookups are case-insensitive.
 */
class IndexRegistry
{
public:
    IndexRegistry() = default;

    // SOFR, USD LIBOR 1M/3M/6M, EURIBOR 1M/3M/6M, EONIA, ESTR, GBP LIBOR 3M, SONIA, USD Treasury
    static IndexRegistry withDefaults();

    // replaces an existing entry with the same code
    void add(const InterestRateIndex& index);

    std::optional<InterestRateIndex> get(const std::string& code) const;

    // @throws UnknownStrategyError listing the registered codes
    const InterestRateIndex& at(const std::string& code) const;

    bool contains(const std::string& code) const;
    std::vector<std::string> codes() const;                 // sorted
    std::map<std::string, InterestRateIndex> listAll() const;
    std::map<std::string, InterestRateIndex> listByCurrency(const std::string& currency) const;
    size_t size() const { return _indexes.size(); }

private:
    std::map<std::string, InterestRateIndex> _indexes;

    static std::string normalize(const std::string& code);
};

#endif //YCURVE_INDEXREGISTRY_H
