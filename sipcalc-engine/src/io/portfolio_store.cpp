#include "portfolio_store.hpp"
#include "json_codec.hpp"
#include "../logger.hpp"
#include "../planner.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sipcalc {
namespace io {

// ============================================================================
// FilePortfolioStore
// ============================================================================

FilePortfolioStore::FilePortfolioStore(const std::string& directory)
    : directory_(directory),
      path_((fs::path(directory) / (std::string(STORAGE_KEY) + ".json")).string()) {}

std::optional<Portfolio> FilePortfolioStore::load() {
    std::ifstream file(path_);
    if (!file) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return portfolio_from_json_string(buffer.str());
}

void FilePortfolioStore::save(const Portfolio& portfolio) {
    std::error_code ec;
    if (!directory_.empty()) {
        fs::create_directories(directory_, ec);
        if (ec) {
            throw std::runtime_error("Cannot create state directory: " + directory_ + " - " + ec.message());
        }
    }

    std::ofstream file(path_);
    if (!file) {
        throw std::runtime_error("Failed to open state file: " + path_);
    }
    file << portfolio_to_json_string(portfolio) << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write state file: " + path_);
    }
}

// ============================================================================
// MemoryPortfolioStore
// ============================================================================

std::optional<Portfolio> MemoryPortfolioStore::load() {
    auto it = records_.find(STORAGE_KEY);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return portfolio_from_json_string(it->second);
}

void MemoryPortfolioStore::save(const Portfolio& portfolio) {
    records_[STORAGE_KEY] = portfolio_to_json_string(portfolio);
}

std::optional<std::string> MemoryPortfolioStore::raw() const {
    auto it = records_.find(STORAGE_KEY);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Loading with fallback
// ============================================================================

Portfolio load_or_default(PortfolioStore& store) {
    Logger& logger = Logger::get_instance();
    LogContext ctx("store", "load");

    std::optional<Portfolio> loaded;
    try {
        loaded = store.load();
    } catch (const std::exception& e) {
        logger.log_state_fallback(ctx, std::string("Failed to read stored state: ") + e.what());
        return default_portfolio();
    }

    if (!loaded) {
        logger.log_state_fallback(ctx, "No usable stored state at " + store.describe());
        return default_portfolio();
    }

    logger.log_portfolio_loaded(ctx, store.describe(), loaded->size());
    return *loaded;
}

} // namespace io
} // namespace sipcalc
