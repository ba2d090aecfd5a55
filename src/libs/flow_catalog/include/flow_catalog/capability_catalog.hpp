#pragma once

#include <flow_catalog/capability_source.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>

namespace flow_catalog {

// Session-wide catalog cache. The source is queried on the first snapshot()
// call only; concurrent first callers wait for that single fetch. A fetch
// that throws leaves the cache empty and the exception propagates, so a
// later call tries again.
class CapabilityCatalog {
public:
    explicit CapabilityCatalog(std::shared_ptr<CapabilitySource> source);

    CapabilityCatalog(const CapabilityCatalog&) = delete;
    CapabilityCatalog& operator=(const CapabilityCatalog&) = delete;

    std::shared_ptr<const CatalogSnapshot> snapshot();
    bool is_loaded() const { return loaded_.load(); }
    std::size_t fetch_count() const { return fetch_count_.load(); }

private:
    void fetch();

    std::shared_ptr<CapabilitySource> source_;
    std::mutex mutex_;
    std::shared_ptr<const CatalogSnapshot> snapshot_;
    std::atomic<bool> loaded_{ false };
    std::atomic<std::size_t> fetch_count_{ 0 };
};

} // namespace flow_catalog
