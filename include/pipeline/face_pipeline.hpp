/*
 * Face Pipeline - composition root
 *
 *   Database ─┬─ PhotoCatalog
 *             ├─ DescriptorStore ── LinearScanIndex ── SimilaritySearch ── IdentifyHandler
 *             ├─ ClosingLedger
 *             └─ PurgeCoordinator
 *   EmbeddingExtractor (injected) ── IngestionService (start() .. shutdown())
 *
 * Event entry points:
 *   on_photo_stored(photo_id, file_reference)  -> ingestion (fire-and-forget)
 *   on_closing(writer)                         -> purge (synchronous, atomic)
 */

#pragma once
#include "api/identify_handler.hpp"
#include "config.hpp"
#include "database/closing_ledger.hpp"
#include "database/database.hpp"
#include "database/descriptor_store.hpp"
#include "database/photo_catalog.hpp"
#include "ingestion/ingestion_service.hpp"
#include "ingestion/photo_source.hpp"
#include "privacy/purge_coordinator.hpp"
#include "recognition/embedding_extractor.hpp"
#include "search/descriptor_index.hpp"
#include "search/similarity_search.hpp"
#include <memory>

class FacePipeline {
public:
    // source == nullptr -> FileSystemPhotoSource(config.upload_root)
    FacePipeline(const PipelineConfig& config,
                 std::shared_ptr<EmbeddingExtractor> extractor,
                 std::unique_ptr<PhotoSource> source = nullptr);
    ~FacePipeline();

    FacePipeline(const FacePipeline&) = delete;
    FacePipeline& operator=(const FacePipeline&) = delete;

    // Loads the extractor (if needed) and starts the ingestion workers
    void start();
    void shutdown();
    bool is_running() const { return ingestion_service != nullptr; }

    // Throws BackpressureError; PipelineError if not started
    void on_photo_stored(int64_t photo_id, const std::string& file_reference);

    // Throws PurgeFailure
    PurgeReport on_closing(ClosingWriter& writer);

    const PipelineConfig& config() const { return cfg; }
    Database& database() { return *db; }
    PhotoCatalog& photos() { return *catalog; }
    DescriptorStore& descriptors() { return *store; }
    ClosingLedger& closings() { return *ledger; }
    SimilaritySearch& search() { return *searcher; }
    IdentifyHandler& identify_handler() { return *handler; }
    PurgeCoordinator& purge() { return *coordinator; }
    IngestionService& ingestion();

private:
    PipelineConfig cfg;
    std::shared_ptr<EmbeddingExtractor> extractor;

    std::unique_ptr<Database> db;
    std::unique_ptr<PhotoCatalog> catalog;
    std::unique_ptr<DescriptorStore> store;
    std::unique_ptr<ClosingLedger> ledger;
    std::unique_ptr<PhotoSource> source;
    std::unique_ptr<LinearScanIndex> index;
    std::unique_ptr<SimilaritySearch> searcher;
    std::unique_ptr<IdentifyHandler> handler;
    std::unique_ptr<PurgeCoordinator> coordinator;
    std::unique_ptr<IngestionService> ingestion_service;
};
