#ifndef SIPCALC_IO_PORTFOLIO_STORE_HPP
#define SIPCALC_IO_PORTFOLIO_STORE_HPP

#include "../goal.hpp"
#include <map>
#include <optional>
#include <string>

namespace sipcalc {
namespace io {

// Fixed key of the persisted planner record
constexpr const char* STORAGE_KEY = "goal-planner-v1";

/**
 * Key-value persistence port for the planner state.
 *
 * load() returns nullopt when nothing usable is stored (missing record,
 * unparseable text, wrong structure). save() throws std::runtime_error when
 * the record cannot be written.
 */
class PortfolioStore {
public:
    virtual ~PortfolioStore() = default;

    virtual std::optional<Portfolio> load() = 0;
    virtual void save(const Portfolio& portfolio) = 0;

    // Human-readable location used in log events
    virtual std::string describe() const = 0;
};

// Stores the record as <directory>/goal-planner-v1.json
class FilePortfolioStore : public PortfolioStore {
public:
    explicit FilePortfolioStore(const std::string& directory);

    std::optional<Portfolio> load() override;
    void save(const Portfolio& portfolio) override;
    std::string describe() const override { return path_; }

    const std::string& path() const { return path_; }

private:
    std::string directory_;
    std::string path_;
};

// In-process store keyed like the file store
class MemoryPortfolioStore : public PortfolioStore {
public:
    std::optional<Portfolio> load() override;
    void save(const Portfolio& portfolio) override;
    std::string describe() const override { return "memory"; }

    // Raw record access, e.g. to seed hand-written or corrupt state
    void set_raw(const std::string& text) { records_[STORAGE_KEY] = text; }
    std::optional<std::string> raw() const;

private:
    std::map<std::string, std::string> records_;
};

// Stored portfolio, or the default single-goal portfolio when the store has
// nothing usable or fails to read. Never throws.
Portfolio load_or_default(PortfolioStore& store);

} // namespace io
} // namespace sipcalc

#endif // SIPCALC_IO_PORTFOLIO_STORE_HPP
