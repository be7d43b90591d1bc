#include "privacy/purge_coordinator.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace {

struct ReturnToIdle {
    std::atomic<PurgeState>& state;
    ~ReturnToIdle() { state = PurgeState::Idle; }
};

} // namespace

PurgeCoordinator::PurgeCoordinator(DescriptorStore& store)
    : store(store)
{
}

PurgeReport PurgeCoordinator::purge_on_closing(ClosingWriter& writer) {
    PurgeState expected = PurgeState::Idle;
    if (!current.compare_exchange_strong(expected, PurgeState::Purging)) {
        throw PurgeFailure("Purge already in progress");
    }
    ReturnToIdle guard{current};

    spdlog::info("🧹 Closing: purging face descriptors");

    PurgeReport report;

    try {
        Transaction tx(store.database());

        report.closing_id = writer.commit(tx);
        report.descriptors_purged = store.purge_all(tx);

        size_t remaining = store.count(tx);
        if (remaining != 0) {
            throw PurgeFailure(std::to_string(remaining) + " descriptor(s) survived purge");
        }

        tx.commit();

    } catch (const PurgeFailure& e) {
        spdlog::critical("❌ Closing aborted, nothing committed: {}", e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::critical("❌ Closing aborted, nothing committed: {}", e.what());
        throw PurgeFailure(std::string("Closing + purge rolled back: ") + e.what());
    }

    // Committed; a failed checkpoint only delays WAL truncation
    try {
        store.database().checkpoint();
        report.checkpointed = true;
    } catch (const StoreError& e) {
        spdlog::error("WAL checkpoint after purge failed: {}", e.what());
    }

    spdlog::info("✓ Closing #{} recorded, {} descriptor(s) purged",
                 report.closing_id, report.descriptors_purged);
    return report;
}
