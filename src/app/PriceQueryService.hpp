#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/KeyedSlots.hpp"
#include "domain/InstrumentCatalog.hpp"
#include "domain/Types.hpp"

namespace phub::core {
class PriceCache;
}

namespace phub::feed {
class FeedConnectionPool;
}

namespace phub::app {

enum class QueryStatus {
    Ok,
    BadRequest,
    NotSupported,
    NotFound,
    Unavailable,
};

const char* toString(QueryStatus status) noexcept;

struct QueryResult {
    QueryStatus status{QueryStatus::NotFound};
    std::optional<domain::PriceTick> price;
    std::string message;
};

// Point-in-time price reads. A miss starts the symbol's feed and waits for its first tick;
// the service then keeps that feed open ("warm") until releaseAll().
class PriceQueryService {
public:
    PriceQueryService(std::shared_ptr<const domain::InstrumentCatalog> catalog,
                      core::PriceCache& cache,
                      feed::FeedConnectionPool& pool,
                      std::chrono::milliseconds coldReadTimeout);
    ~PriceQueryService();

    PriceQueryService(const PriceQueryService&) = delete;
    PriceQueryService& operator=(const PriceQueryService&) = delete;

    QueryResult currentPrice(const std::string& symbol);
    const std::vector<domain::Instrument>& instruments() const { return catalog_->all(); }
    std::vector<std::string> warmSymbols() const;
    void releaseAll();

private:
    struct WarmEntry {
        std::mutex mutex;
        bool retired{false};
        bool held{false};

        bool idle() const { return !held; }
    };

    std::shared_ptr<const domain::InstrumentCatalog> catalog_;
    core::PriceCache& cache_;
    feed::FeedConnectionPool& pool_;
    const std::chrono::milliseconds coldReadTimeout_;
    core::KeyedSlots<WarmEntry> warm_;
};

}  // namespace phub::app
