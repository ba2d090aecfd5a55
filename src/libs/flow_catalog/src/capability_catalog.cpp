#include <flow_catalog/capability_catalog.hpp>
#include <flow_log/logger.hpp>
#include <stdexcept>
#include <utility>

namespace flow_catalog {

CapabilityCatalog::CapabilityCatalog(std::shared_ptr<CapabilitySource> source)
    : source_(std::move(source))
{
    if (!source_) throw std::invalid_argument("CapabilityCatalog requires a source");
}

std::shared_ptr<const CatalogSnapshot> CapabilityCatalog::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!snapshot_) fetch();
    return snapshot_;
}

void CapabilityCatalog::fetch() {
    ++fetch_count_;
    auto s = std::make_shared<CatalogSnapshot>();
    s->triggers = source_->list_triggers();
    s->conditions = source_->list_conditions();
    s->actions = source_->list_actions();
    flow_log::logger()->info("Capability catalog loaded: {} triggers, {} conditions, {} actions",
        s->triggers.size(), s->conditions.size(), s->actions.size());
    snapshot_ = std::move(s);
    loaded_.store(true);
}

} // namespace flow_catalog
