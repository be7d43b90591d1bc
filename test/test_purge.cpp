#include "privacy/purge_coordinator.hpp"
#include "database/photo_catalog.hpp"
#include "ingestion/ingestion_service.hpp"
#include "search/similarity_search.hpp"
#include "fake_extractor.hpp"
#include <gtest/gtest.h>
#include <future>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Writes the real closing row, then fails before the purge runs
class FailingAfterWrite : public ClosingWriter {
public:
    explicit FailingAfterWrite(std::unique_ptr<ClosingWriter> inner) : inner(std::move(inner)) {}

    int64_t commit(Transaction& tx) override {
        inner->commit(tx);
        throw StoreError("disk full");
    }

private:
    std::unique_ptr<ClosingWriter> inner;
};

// Blocks inside the transaction until released
class SlowWriter : public ClosingWriter {
public:
    SlowWriter(std::unique_ptr<ClosingWriter> inner, std::shared_future<void> release)
        : inner(std::move(inner)), release(std::move(release)) {}

    int64_t commit(Transaction& tx) override {
        entered.set_value();
        release.wait();
        return inner->commit(tx);
    }

    std::promise<void> entered;

private:
    std::unique_ptr<ClosingWriter> inner;
    std::shared_future<void> release;
};

} // namespace

class PurgeTest : public ::testing::Test {
protected:
    Database db{":memory:"};
    PhotoCatalog photos{db};
    DescriptorStore store{db, 4};
    ClosingLedger ledger{db};
    PurgeCoordinator coordinator{store};

    void seed(int n) {
        for (int i = 0; i < n; ++i) {
            int64_t photo = photos.add("p" + std::to_string(i) + ".jpg", "juan");
            store.add_all(photo, {face(direction(4, static_cast<size_t>(i), 0.2f))});
        }
    }

    ClosingSummary summary(const std::string& user = "admin") {
        ClosingSummary s;
        s.closing_user = user;
        s.total_revenue = 42.0;
        return s;
    }
};

TEST_F(PurgeTest, ScenarioD_ClosingPurgesEverything) {
    seed(10);
    ASSERT_EQ(store.count(), 10u);

    auto writer = ledger.writer(summary());
    PurgeReport report = coordinator.purge_on_closing(*writer);

    EXPECT_EQ(report.descriptors_purged, 10u);
    EXPECT_EQ(store.count(), 0u);
    ASSERT_EQ(ledger.count(), 1u);
    EXPECT_EQ(ledger.last_closing()->id, report.closing_id);
    EXPECT_EQ(coordinator.state(), PurgeState::Idle);
}

TEST_F(PurgeTest, ScenarioD_FailureLeavesNothingApplied) {
    seed(10);

    FailingAfterWrite writer(ledger.writer(summary()));
    EXPECT_THROW(coordinator.purge_on_closing(writer), PurgeFailure);

    EXPECT_EQ(store.count(), 10u);
    EXPECT_EQ(ledger.count(), 0u);
    EXPECT_EQ(coordinator.state(), PurgeState::Idle);

    // A fresh attempt is a new unit of work
    auto retry = ledger.writer(summary());
    EXPECT_EQ(coordinator.purge_on_closing(*retry).descriptors_purged, 10u);
}

TEST_F(PurgeTest, PurgeOfEmptyStoreSucceeds) {
    auto first = ledger.writer(summary("mon"));
    EXPECT_EQ(coordinator.purge_on_closing(*first).descriptors_purged, 0u);

    auto second = ledger.writer(summary("tue"));
    EXPECT_EQ(coordinator.purge_on_closing(*second).descriptors_purged, 0u);

    EXPECT_EQ(store.count(), 0u);
    EXPECT_EQ(ledger.count(), 2u);
}

TEST_F(PurgeTest, PurgedFaceNeverMatchesAgain) {
    std::vector<float> e{0.1f, 0.7f, -0.2f, 0.4f};
    int64_t photo = photos.add("kid.jpg", "ana");
    store.add_all(photo, {face(e)});

    LinearScanIndex index(store);
    auto extractor = std::make_shared<FakeExtractor>(4);
    extractor->script("probe", {face(e)});
    SimilaritySearch search(extractor, index);

    ASSERT_EQ(search.identify(image_of("probe")).matches.size(), 1u);

    auto writer = ledger.writer(summary());
    coordinator.purge_on_closing(*writer);

    auto after = search.identify(image_of("probe"));
    EXPECT_EQ(after.status, IdentifyStatus::Found);
    EXPECT_TRUE(after.matches.empty());
}

TEST_F(PurgeTest, SecondCallWhilePurgingFails) {
    seed(3);

    std::promise<void> release;
    SlowWriter slow(ledger.writer(summary("first")), release.get_future().share());
    auto entered = slow.entered.get_future();

    auto running = std::async(std::launch::async, [&] {
        return coordinator.purge_on_closing(slow);
    });
    entered.wait();
    EXPECT_EQ(coordinator.state(), PurgeState::Purging);

    auto other = ledger.writer(summary("second"));
    EXPECT_THROW(coordinator.purge_on_closing(*other), PurgeFailure);

    release.set_value();
    EXPECT_EQ(running.get().descriptors_purged, 3u);

    EXPECT_EQ(ledger.count(), 1u);
    EXPECT_EQ(ledger.last_closing()->closing_user, "first");
    EXPECT_EQ(coordinator.state(), PurgeState::Idle);
}

TEST_F(PurgeTest, DescriptorStoredAfterClosingIsStampedAfterIt) {
    int64_t photo = photos.add("late.jpg", "juan");

    std::promise<void> release;
    SlowWriter slow(ledger.writer(summary()), release.get_future().share());
    auto entered = slow.entered.get_future();

    auto closing = std::async(std::launch::async, [&] {
        return coordinator.purge_on_closing(slow);
    });
    entered.wait();

    // Waits on the closing's transaction
    auto late = std::async(std::launch::async, [&] {
        return store.add_all(photo, {face(direction(4, 0))});
    });
    std::this_thread::sleep_for(1100ms);
    release.set_value();

    closing.get();
    ASSERT_EQ(late.get().size(), 1u);

    auto rows = store.by_photo(photo);
    ASSERT_EQ(rows.size(), 1u);
    ASSERT_TRUE(ledger.last_closing().has_value());
    EXPECT_GE(rows[0].created_at, ledger.last_closing()->closed_at);
}

TEST_F(PurgeTest, ConcurrentIngestionNeverSeesPartialPurge) {
    auto extractor = std::make_shared<FakeExtractor>(4);
    MemoryPhotoSource source;
    IngestionService::Options options;
    options.workers = 4;
    options.queue_capacity = 512;
    IngestionService ingestion(extractor, source, store, options);

    std::vector<int64_t> ids;
    for (int i = 0; i < 200; ++i) {
        std::string name = "live_" + std::to_string(i) + ".jpg";
        ids.push_back(photos.add(name, "juan"));
        source.put(name, name);
        extractor->script(name, {face(direction(4, static_cast<size_t>(i))), face(direction(4, static_cast<size_t>(i + 1)))});
    }

    for (int i = 0; i < 200; ++i) {
        ingestion.submit(ids[i], "live_" + std::to_string(i) + ".jpg");
    }

    std::this_thread::sleep_for(2ms);
    auto writer = ledger.writer(summary());
    PurgeReport report = coordinator.purge_on_closing(*writer);

    ingestion.wait_idle();

    // Photos are atomic: purged ones have 0 rows, later ones have both faces
    size_t remaining = store.count();
    EXPECT_EQ(report.descriptors_purged + remaining, 400u);
    for (int64_t id : ids) {
        size_t n = store.by_photo(id).size();
        EXPECT_TRUE(n == 0 || n == 2) << "photo " << id << " has " << n;
    }
    EXPECT_EQ(report.descriptors_purged % 2, 0u);
}
