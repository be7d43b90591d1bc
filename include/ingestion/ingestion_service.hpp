/*
 * Ingestion Service - "photo uploaded" -> face descriptors
 *
 * FLOW (per task, on a pool worker):
 *   PhotoSource::read -> extract_within(timeout) -> DescriptorStore::add_all
 *
 * submit() only enqueues; upload latency never includes extraction.
 * Task failures are logged and dropped (no retry). A failed photo ends up
 * with zero descriptors, same as a photo without faces.
 */

#pragma once
#include "database/descriptor_store.hpp"
#include "ingestion/photo_source.hpp"
#include "ingestion/thread_pool.hpp"
#include "recognition/embedding_extractor.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

struct IngestionStats {
    size_t submitted = 0;
    size_t rejected = 0;     // BackpressureError at submit
    size_t completed = 0;    // tasks that stored their faces (0 or more)
    size_t failed = 0;       // tasks dropped on error, timeouts included
    size_t timed_out = 0;
    size_t faces_stored = 0;
    size_t pending = 0;
};

class IngestionService {
public:
    struct Options {
        size_t workers = 4;
        size_t queue_capacity = 256;
        OverflowPolicy overflow_policy = OverflowPolicy::Reject;
        std::chrono::milliseconds block_timeout{250};
        std::chrono::milliseconds extract_timeout{30000};
    };

    IngestionService(std::shared_ptr<EmbeddingExtractor> extractor,
                     PhotoSource& source,
                     DescriptorStore& store,
                     const Options& options);
    ~IngestionService();

    IngestionService(const IngestionService&) = delete;
    IngestionService& operator=(const IngestionService&) = delete;

    // Fire-and-forget. Throws BackpressureError when the queue is full.
    void submit(int64_t photo_id, const std::string& file_reference);

    void wait_idle();
    void shutdown();

    IngestionStats stats() const;

private:
    std::shared_ptr<EmbeddingExtractor> extractor;
    PhotoSource& source;
    DescriptorStore& store;
    std::chrono::milliseconds extract_timeout;
    ThreadPool pool;

    std::atomic<size_t> submitted{0};
    std::atomic<size_t> rejected{0};
    std::atomic<size_t> completed{0};
    std::atomic<size_t> failed{0};
    std::atomic<size_t> timed_out{0};
    std::atomic<size_t> faces_stored{0};

    void process(int64_t photo_id, const std::string& file_reference);
};
