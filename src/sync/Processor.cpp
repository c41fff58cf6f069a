#include "sync/Processor.hpp"
#include "sync/Applier.hpp"
#include "sync/Collector.hpp"
#include "sync/Normalizer.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace tally::sync;

Processor::Processor(ledger::SharedStore& store, const util::Clock& clock, config::SyncConfig cfg)
    : store_(store), clock_(clock), cfg_(std::move(cfg)) {}

Processor::OwnerLease::OwnerLease(Processor& processor, std::string ownerId)
    : processor_(processor), ownerId_(std::move(ownerId)), mutex_(processor_.acquireOwner(ownerId_)),
      lock_(*mutex_) {}

Processor::OwnerLease::~OwnerLease() {
    lock_.unlock();
    processor_.releaseOwner(ownerId_, mutex_);
}

std::shared_ptr<std::mutex> Processor::acquireOwner(const std::string& ownerId) {
    std::scoped_lock lock(ownersMutex_);
    auto& m = owners_[ownerId];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

void Processor::releaseOwner(const std::string& ownerId, std::shared_ptr<std::mutex>& mutex) {
    std::scoped_lock lock(ownersMutex_);
    mutex.reset();
    // every copy is made and dropped under ownersMutex_, so the count is exact here
    if (const auto it = owners_.find(ownerId); it != owners_.end() && it->second.use_count() == 1)
        owners_.erase(it);
}

std::size_t Processor::activeOwners() {
    std::scoped_lock lock(ownersMutex_);
    return owners_.size();
}

tally::util::Timestamp Processor::issueWatermark() {
    std::scoped_lock lock(stampMutex_);
    lastIssued_ = util::advanceStamp(lastIssued_, clock_.now());
    return lastIssued_;
}

model::SyncResponse Processor::process(const std::string& ownerId, const model::SyncRequest& request) {
    if (ownerId.empty()) throw std::invalid_argument("Sync request without an owner");

    OwnerLease lease(*this, ownerId);

    model::SyncResponse response;
    store_.withOwner(ownerId, [&](ledger::ChangeLedger& ledger) {
        const auto now = issueWatermark();

        Normalizer(ledger, now).run();
        const auto applied = Applier(ledger, now, Applier::Stamp::ReceiveTime, cfg_).apply(request.client_changes);
        Normalizer(ledger, now).run();

        response.server_changes = collect(ledger, request.last_synced_at);
        response.synced_at = now;

        log::Registry::sync()->info("[Processor] Owner {}: {} in ({} written, {} discarded), {} out, synced_at {}",
                                    ownerId, request.client_changes.size(), applied.written(), applied.discarded,
                                    response.server_changes.size(), util::timestampToString(now));
    });

    return response;
}
