/*
 * Purge Coordinator - biometric data never outlives a closing
 *
 * STATE MACHINE:
 *   Idle --purge_on_closing()--> Purging --commit/rollback--> Idle
 *
 * ONE TRANSACTION:
 *   BEGIN IMMEDIATE
 *     writer.commit(tx)        closing record
 *     store.purge_all(tx)      every descriptor
 *     store.count(tx) == 0     verified before COMMIT
 *   COMMIT
 *   wal_checkpoint(TRUNCATE)
 *
 * Any failure rolls back both writes and surfaces as PurgeFailure. A second
 * call while one is running fails immediately without touching the data.
 */

#pragma once
#include "database/closing_ledger.hpp"
#include "database/descriptor_store.hpp"
#include <atomic>
#include <cstdint>

enum class PurgeState {
    Idle,
    Purging
};

struct PurgeReport {
    int64_t closing_id = 0;
    size_t descriptors_purged = 0;
    bool checkpointed = false;
};

class PurgeCoordinator {
public:
    explicit PurgeCoordinator(DescriptorStore& store);

    // Throws PurgeFailure
    PurgeReport purge_on_closing(ClosingWriter& writer);

    PurgeState state() const { return current; }

private:
    DescriptorStore& store;
    std::atomic<PurgeState> current{PurgeState::Idle};
};
