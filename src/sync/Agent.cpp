#include "sync/Agent.hpp"
#include "sync/Applier.hpp"
#include "sync/Collector.hpp"
#include "sync/Normalizer.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace tally::sync;

const char* tally::sync::to_string(const SyncResult r) {
    switch (r) {
        case SyncResult::Completed: return "completed";
        case SyncResult::NotAuthenticated: return "not authenticated";
        case SyncResult::TransportFailed: return "transport failed";
        case SyncResult::Failed: return "failed";
        case SyncResult::Skipped: return "skipped";
    }
    return "unknown";
}

Agent::Agent(ledger::ChangeLedger& ledger,
             ledger::WatermarkStore& watermarks,
             Transport& transport,
             const auth::CredentialProvider& credentials,
             const util::Clock& clock,
             config::SyncConfig cfg)
    : ledger_(ledger), watermarks_(watermarks), transport_(transport),
      credentials_(credentials), clock_(clock), cfg_(std::move(cfg)),
      cursor_(watermarks.load().value_or(ledger::SyncCursor{})) {
    log::Registry::sync()->debug("[Agent] Starting from watermark {}, sent through {}",
                                 util::timestampToString(cursor_.watermark),
                                 util::timestampToString(cursor_.sent_through));
}

SyncResult Agent::sync() {
    const auto token = credentials_.getValidCredential();
    if (!token) {
        log::Registry::sync()->debug("[Agent] No credential, skipping sync");
        return SyncResult::NotAuthenticated;
    }

    model::SyncRequest request;
    util::Timestamp sending{};
    try {
        // one scope, so no local write lands between reading the mark and collecting
        ledger_.runInTransaction([&] {
            Normalizer(ledger_, ledger_.nextChangeStamp(clock_.now())).run();
            sending = ledger_.latestChange();
            request.client_changes = collectOutbound(ledger_, cursor_.sent_through);
        });
        request.last_synced_at = cursor_.watermark;
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[Agent] Preparing outbound changes failed: {}", e.what());
        return SyncResult::Failed;
    }

    model::SyncResponse response;
    try {
        response = transport_.exchange(request, *token);
    } catch (const TransportError& e) {
        log::Registry::sync()->warn("[Agent] Round trip failed, will retry: {}", e.what());
        return SyncResult::TransportFailed;
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[Agent] Round trip failed: {}", e.what());
        return SyncResult::Failed;
    }

    try {
        const auto stats = Applier(ledger_, ledger_.nextChangeStamp(clock_.now()), Applier::Stamp::Incoming, cfg_)
                               .apply(response.server_changes);

        const ledger::SyncCursor next{std::max(cursor_.watermark, response.synced_at),
                                      std::max(cursor_.sent_through, sending)};
        watermarks_.save(next);
        cursor_ = next;

        log::Registry::sync()->info("[Agent] Sync completed: sent {}, received {} ({} written), watermark {}",
                                    request.client_changes.size(), response.server_changes.size(),
                                    stats.written(), util::timestampToString(cursor_.watermark));
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[Agent] Applying server changes failed: {}", e.what());
        return SyncResult::Failed;
    }

    return SyncResult::Completed;
}
