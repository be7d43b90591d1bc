#include "pipeline/face_pipeline.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

FacePipeline::FacePipeline(const PipelineConfig& config,
                           std::shared_ptr<EmbeddingExtractor> extractor,
                           std::unique_ptr<PhotoSource> source)
    : cfg(config), extractor(std::move(extractor)), source(std::move(source))
{
    cfg.validate();

    if (!this->extractor) {
        throw ExtractionUnavailable("FacePipeline requires an extractor");
    }
    if (!this->source) {
        this->source = std::make_unique<FileSystemPhotoSource>(cfg.upload_root);
    }

    db = std::make_unique<Database>(cfg.db_path);
    catalog = std::make_unique<PhotoCatalog>(*db);
    store = std::make_unique<DescriptorStore>(*db, this->extractor->dimension());
    ledger = std::make_unique<ClosingLedger>(*db);

    index = std::make_unique<LinearScanIndex>(*store);
    searcher = std::make_unique<SimilaritySearch>(this->extractor, *index, cfg.extract_timeout);
    handler = std::make_unique<IdentifyHandler>(*searcher, *catalog, cfg.match_threshold,
                                                static_cast<size_t>(cfg.top_k));
    coordinator = std::make_unique<PurgeCoordinator>(*store);
}

FacePipeline::~FacePipeline() {
    shutdown();
}

// ==================== LIFECYCLE ====================

void FacePipeline::start() {
    if (ingestion_service) return;

    spdlog::info("========================================");
    spdlog::info("🚀 Starting face pipeline ({})", extractor->name());
    spdlog::info("========================================");

    if (!extractor->is_loaded()) {
        extractor->load();
    }
    // One helper per busy worker plus the hung ones we tolerate
    extractor->set_helper_limit(static_cast<size_t>(cfg.workers + cfg.max_hung_extractions));

    size_t mismatched = store->count_mismatched();
    if (mismatched > 0) {
        spdlog::error("❌ {} stored descriptor(s) do not have dimension {}; identify will fail "
                      "until the next closing purges them", mismatched, store->dimension());
    }

    IngestionService::Options options;
    options.workers = static_cast<size_t>(cfg.workers);
    options.queue_capacity = static_cast<size_t>(cfg.queue_capacity);
    options.overflow_policy = cfg.overflow_policy;
    options.block_timeout = cfg.block_timeout;
    options.extract_timeout = cfg.extract_timeout;

    ingestion_service = std::make_unique<IngestionService>(extractor, *source, *store, options);

    spdlog::info("✓ Pipeline running: {} photo(s), {} descriptor(s)",
                 catalog->count(), store->count());
}

void FacePipeline::shutdown() {
    if (!ingestion_service) return;

    ingestion_service->shutdown();
    ingestion_service.reset();
    extractor->shutdown();

    spdlog::info("Pipeline stopped");
}

// ==================== EVENTS ====================

void FacePipeline::on_photo_stored(int64_t photo_id, const std::string& file_reference) {
    ingestion().submit(photo_id, file_reference);
}

PurgeReport FacePipeline::on_closing(ClosingWriter& writer) {
    return coordinator->purge_on_closing(writer);
}

IngestionService& FacePipeline::ingestion() {
    if (!ingestion_service) {
        throw PipelineError("Pipeline not started");
    }
    return *ingestion_service;
}
