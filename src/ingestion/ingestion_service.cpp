#include "ingestion/ingestion_service.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

IngestionService::IngestionService(std::shared_ptr<EmbeddingExtractor> extractor,
                                   PhotoSource& source,
                                   DescriptorStore& store,
                                   const Options& options)
    : extractor(std::move(extractor)),
      source(source),
      store(store),
      extract_timeout(options.extract_timeout),
      pool(options.workers, options.queue_capacity, options.overflow_policy, options.block_timeout)
{
    if (!this->extractor) {
        throw ExtractionUnavailable("Ingestion requires an extractor");
    }

    spdlog::info("📥 Ingestion service ready");
    spdlog::info("   Workers: {}", options.workers);
    spdlog::info("   Extract timeout: {} ms", extract_timeout.count());
}

IngestionService::~IngestionService() {
    shutdown();
}

// ==================== SUBMIT ====================

void IngestionService::submit(int64_t photo_id, const std::string& file_reference) {
    try {
        pool.submit([this, photo_id, file_reference]() {
            process(photo_id, file_reference);
        });
    } catch (const BackpressureError& e) {
        rejected++;
        spdlog::warn("⚠️  Photo {} not queued for face indexing: {}", photo_id, e.what());
        throw;
    }

    submitted++;
    spdlog::debug("Photo {} queued ({})", photo_id, file_reference);
}

// ==================== TASK ====================

void IngestionService::process(int64_t photo_id, const std::string& file_reference) {
    auto start = std::chrono::steady_clock::now();

    try {
        ImageBytes image = source.read(file_reference);
        auto faces = extract_within(extractor, image, extract_timeout);

        if (!faces.empty()) {
            store.add_all(photo_id, faces);
            faces_stored += faces.size();
        }
        completed++;

        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (faces.empty()) {
            spdlog::debug("Photo {}: no face detected ({} ms)", photo_id, ms);
        } else {
            spdlog::info("✓ Photo {}: {} face(s) indexed ({} ms)", photo_id, faces.size(), ms);
        }

    } catch (const ExtractionTimeout& e) {
        timed_out++;
        failed++;
        spdlog::error("Photo {} dropped: {}", photo_id, e.what());
    } catch (const PipelineError& e) {
        failed++;
        spdlog::error("Photo {} dropped: {}", photo_id, e.what());
    } catch (const std::exception& e) {
        failed++;
        spdlog::error("Photo {} dropped (unexpected): {}", photo_id, e.what());
    }
}

// ==================== CONTROL ====================

void IngestionService::wait_idle() {
    pool.wait_all();
}

void IngestionService::shutdown() {
    if (pool.is_stopped()) return;

    spdlog::info("Stopping ingestion ({} queued)", pool.pending_tasks());
    pool.stop();
}

IngestionStats IngestionService::stats() const {
    IngestionStats s;
    s.submitted = submitted;
    s.rejected = rejected;
    s.completed = completed;
    s.failed = failed;
    s.timed_out = timed_out;
    s.faces_stored = faces_stored;
    s.pending = pool.pending_tasks() + pool.running_tasks();
    return s;
}
