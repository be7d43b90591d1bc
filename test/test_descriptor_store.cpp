#include "database/descriptor_store.hpp"
#include "database/photo_catalog.hpp"
#include "core/errors.hpp"
#include "fake_extractor.hpp"
#include <gtest/gtest.h>
#include <cstdio>

class DescriptorStoreTest : public ::testing::Test {
protected:
    Database db{":memory:"};
    PhotoCatalog photos{db};
    DescriptorStore store{db, 4};

    FaceDescriptor descriptor(int64_t photo_id, std::vector<float> emb, BoundingBox box = {1, 2, 30, 40}) {
        FaceDescriptor d;
        d.photo_id = photo_id;
        d.embedding = std::move(emb);
        d.box = box;
        return d;
    }
};

TEST_F(DescriptorStoreTest, AddAndReadBack) {
    int64_t photo = photos.add("2025-11-24/juan/img_001.jpg", "juan");
    int64_t id = store.add(descriptor(photo, {0.5f, -0.5f, 0.25f, 1.0f}));

    auto rows = store.all();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].id, id);
    EXPECT_EQ(rows[0].photo_id, photo);
    EXPECT_EQ(rows[0].embedding, (std::vector<float>{0.5f, -0.5f, 0.25f, 1.0f}));
    EXPECT_EQ(rows[0].box.x, 1);
    EXPECT_EQ(rows[0].box.height, 40);
    EXPECT_EQ(rows[0].created_at.size(), 19u);
}

TEST_F(DescriptorStoreTest, RejectsWrongDimension) {
    int64_t photo = photos.add("a.jpg", "ana");
    EXPECT_THROW(store.add(descriptor(photo, {1, 0, 0})), DimensionMismatch);
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(DescriptorStoreTest, RejectsNegativeBox) {
    int64_t photo = photos.add("a.jpg", "ana");
    EXPECT_THROW(store.add(descriptor(photo, direction(4, 0), {-1, 0, 10, 10})), StoreError);
}

TEST_F(DescriptorStoreTest, UnknownPhotoViolatesForeignKey) {
    EXPECT_THROW(store.add(descriptor(9999, direction(4, 0))), StoreError);
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(DescriptorStoreTest, AddAllIsAtomicPerPhoto) {
    int64_t photo = photos.add("group.jpg", "juan");

    std::vector<FaceEmbedding> faces{
        face(direction(4, 0)),
        face(direction(4, 1)),
        face({1, 0, 0}),   // corrupt third face
    };
    EXPECT_THROW(store.add_all(photo, faces), DimensionMismatch);
    EXPECT_EQ(store.count(), 0u);

    faces.pop_back();
    auto ids = store.add_all(photo, faces);
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_EQ(store.by_photo(photo).size(), 2u);
}

TEST_F(DescriptorStoreTest, AddAllWithNoFacesWritesNothing) {
    int64_t photo = photos.add("landscape.jpg", "juan");
    EXPECT_TRUE(store.add_all(photo, {}).empty());
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(DescriptorStoreTest, DeleteByPhoto) {
    int64_t p1 = photos.add("1.jpg", "a");
    int64_t p2 = photos.add("2.jpg", "b");
    store.add_all(p1, {face(direction(4, 0)), face(direction(4, 1))});
    store.add_all(p2, {face(direction(4, 2))});

    EXPECT_EQ(store.delete_by_photo(p1), 2u);
    EXPECT_EQ(store.count(), 1u);
    EXPECT_EQ(store.all()[0].photo_id, p2);
}

TEST_F(DescriptorStoreTest, DeletingPhotoCascades) {
    int64_t p1 = photos.add("1.jpg", "a");
    int64_t p2 = photos.add("2.jpg", "b");
    store.add_all(p1, {face(direction(4, 0))});
    store.add_all(p2, {face(direction(4, 1)), face(direction(4, 2))});

    EXPECT_TRUE(photos.remove(p2));
    EXPECT_EQ(store.count(), 1u);
    EXPECT_FALSE(photos.remove(p2));
}

TEST_F(DescriptorStoreTest, PurgeAllEmptiesAndIsIdempotent) {
    int64_t photo = photos.add("1.jpg", "a");
    store.add_all(photo, {face(direction(4, 0)), face(direction(4, 1)), face(direction(4, 2))});

    EXPECT_EQ(store.purge_all(), 3u);
    EXPECT_EQ(store.count(), 0u);
    EXPECT_EQ(store.purge_all(), 0u);
    EXPECT_EQ(store.count(), 0u);

    // Photos are not part of the biometric purge
    EXPECT_EQ(photos.count(), 1u);
}

TEST_F(DescriptorStoreTest, PurgeInsideRolledBackTransactionKeepsRows) {
    int64_t photo = photos.add("1.jpg", "a");
    store.add_all(photo, {face(direction(4, 0)), face(direction(4, 1))});

    {
        Transaction tx(db);
        EXPECT_EQ(store.purge_all(tx), 2u);
        EXPECT_EQ(store.count(tx), 0u);
        // no commit
    }

    EXPECT_EQ(store.count(), 2u);
}

TEST_F(DescriptorStoreTest, IdsKeepGrowingAfterPurge) {
    int64_t photo = photos.add("1.jpg", "a");
    int64_t first = store.add(descriptor(photo, direction(4, 0)));
    store.purge_all();
    int64_t second = store.add(descriptor(photo, direction(4, 0)));
    EXPECT_GT(second, first);
}

TEST_F(DescriptorStoreTest, PhotoCatalogLookups) {
    int64_t p1 = photos.add("2025-11-24/juan/img_001.jpg", "juan");
    int64_t p2 = photos.add("2025-11-24/ana/img_002.jpg", "ana");

    auto photo = photos.find(p1);
    ASSERT_TRUE(photo.has_value());
    EXPECT_EQ(photo->filename, "img_001.jpg");
    EXPECT_EQ(photo->photographer, "juan");
    EXPECT_FALSE(photos.find(12345).has_value());

    auto many = photos.find_many({p2, p1, p2, 777});
    EXPECT_EQ(many.size(), 2u);
    EXPECT_EQ(many.at(p2).relative_path, "2025-11-24/ana/img_002.jpg");
}

TEST(DescriptorStoreFile, SurvivesReopen) {
    std::string path = ::testing::TempDir() + "kioskface_store_test.db";
    std::remove(path.c_str());

    int64_t photo;
    {
        Database db(path);
        PhotoCatalog photos(db);
        DescriptorStore store(db, 4);
        photo = photos.add("1.jpg", "a");
        store.add_all(photo, {face(direction(4, 3))});
    }
    {
        Database db(path);
        PhotoCatalog photos(db);
        DescriptorStore store(db, 4);
        auto rows = store.all();
        ASSERT_EQ(rows.size(), 1u);
        EXPECT_EQ(rows[0].photo_id, photo);
        EXPECT_EQ(rows[0].embedding, direction(4, 3));

        EXPECT_EQ(store.purge_all(), 1u);
        EXPECT_NO_THROW(db.checkpoint());
    }

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST(DescriptorStoreFile, DetectsDimensionChange) {
    std::string path = ::testing::TempDir() + "kioskface_dim_test.db";
    std::remove(path.c_str());
    {
        Database db(path);
        PhotoCatalog photos(db);
        DescriptorStore store(db, 4);
        store.add_all(photos.add("1.jpg", "a"), {face(direction(4, 0))});
    }
    {
        Database db(path);
        PhotoCatalog photos(db);
        DescriptorStore store(db, 8);
        EXPECT_EQ(store.count_mismatched(), 1u);
    }
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}
