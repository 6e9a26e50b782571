/**
 * @file market_data.hpp
 * @brief Source of comparable companies and company financials
 *
 * The engine never fetches data itself; callers resolve comparables through
 * a MarketDataSource and pass them in. Sources may return partial records:
 * missing multiples are tolerated by relative valuation.
 */

#ifndef VALUCALC_MARKET_DATA_HPP
#define VALUCALC_MARKET_DATA_HPP

#include "company.hpp"
#include <string>
#include <vector>

namespace valucalc {

/**
 * @brief Abstract market data provider
 */
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    /**
     * @brief Comparable companies for an industry classifier
     *
     * @return Possibly empty list; an unknown industry is not an error
     */
    virtual std::vector<Comparable> comparables_for_industry(const std::string& industry) const = 0;

    /**
     * @brief Raw financial fields of one company
     *
     * @throws DataError if the identifier is unknown to the source
     */
    virtual Company company_financials(const std::string& ts_code) const = 0;
};

/**
 * @brief Market data read from a comparables CSV file
 *
 * Industry matching is case-insensitive. company_financials() maps a
 * comparable's reported fields onto a Company; forecast drivers keep their
 * defaults, and growth_rate is taken over when the record reports one.
 */
class CsvMarketDataSource : public MarketDataSource {
public:
    explicit CsvMarketDataSource(const std::string& filepath);
    explicit CsvMarketDataSource(std::vector<Comparable> records);

    std::vector<Comparable> comparables_for_industry(const std::string& industry) const override;
    Company company_financials(const std::string& ts_code) const override;

    size_t size() const { return records_.size(); }

private:
    std::vector<Comparable> records_;
};

} // namespace valucalc

#endif // VALUCALC_MARKET_DATA_HPP
