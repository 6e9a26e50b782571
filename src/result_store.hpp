/**
 * @file result_store.hpp
 * @brief Persistence of valuation result bundles
 *
 * Storage is a collaborator of the engine, never a dependency: the CLI saves
 * a bundle after the analysis and only logs a warning when saving fails.
 */

#ifndef VALUCALC_RESULT_STORE_HPP
#define VALUCALC_RESULT_STORE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace valucalc {

/**
 * @brief Abstract store of result bundles keyed by identifier
 */
class ResultStore {
public:
    virtual ~ResultStore() = default;

    /**
     * @brief Persist a bundle
     *
     * @return Identifier for load()
     * @throws DataError if the bundle cannot be written
     */
    virtual std::string save(const nlohmann::json& bundle) = 0;

    /**
     * @brief Bundle previously saved under id, or nullopt if unknown
     *
     * @throws DataError if the stored bundle exists but cannot be parsed
     */
    virtual std::optional<nlohmann::json> load(const std::string& id) const = 0;

    /**
     * @brief Identifiers of every stored bundle, sorted
     */
    virtual std::vector<std::string> list() const = 0;
};

/**
 * @brief One JSON file per bundle in a directory
 *
 * Identifiers are "<timestamp>-<sequence>", so lexical order is save order.
 * The directory is created on first save.
 */
class JsonFileResultStore : public ResultStore {
public:
    explicit JsonFileResultStore(std::string directory);

    std::string save(const nlohmann::json& bundle) override;
    std::optional<nlohmann::json> load(const std::string& id) const override;
    std::vector<std::string> list() const override;

    const std::string& directory() const { return directory_; }
    std::string path_for(const std::string& id) const;

private:
    std::string directory_;
    unsigned sequence_ = 0;
};

} // namespace valucalc

#endif // VALUCALC_RESULT_STORE_HPP
