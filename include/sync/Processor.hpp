#pragma once

#include "config/Config.hpp"
#include "ledger/SharedStore.hpp"
#include "sync/model/Payload.hpp"
#include "util/Clock.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tally::sync {

// Server half of a round trip for one owner: apply the client's changes,
// collapse duplicates, answer with everything newer than the client's watermark
// and a freshly issued watermark.
//
// Requests for the same owner are serialized; different owners run in parallel.
// Issued watermarks strictly increase across the whole process.
class Processor {
public:
    Processor(ledger::SharedStore& store, const util::Clock& clock, config::SyncConfig cfg);

    model::SyncResponse process(const std::string& ownerId, const model::SyncRequest& request);

    // Owners with a request in progress or waiting.
    [[nodiscard]] std::size_t activeOwners();

private:
    ledger::SharedStore& store_;
    const util::Clock& clock_;
    config::SyncConfig cfg_;

    std::mutex ownersMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> owners_;

    std::mutex stampMutex_;
    util::Timestamp lastIssued_{};

    // Holds one owner's request lock; the map entry goes away with the last lease.
    class OwnerLease {
    public:
        OwnerLease(Processor& processor, std::string ownerId);
        ~OwnerLease();

        OwnerLease(const OwnerLease&) = delete;
        OwnerLease& operator=(const OwnerLease&) = delete;

    private:
        Processor& processor_;
        std::string ownerId_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    std::shared_ptr<std::mutex> acquireOwner(const std::string& ownerId);
    void releaseOwner(const std::string& ownerId, std::shared_ptr<std::mutex>& mutex);
    util::Timestamp issueWatermark();
};

}
