#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "batch/document_decoder.hpp"
#include "detection/detection_pipeline.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel {

/**
 * @brief Named byte source; bytes are pulled only when the item starts
 */
struct DocumentSource {
    std::string name;
    std::function<Result<std::string>()> read;

    static DocumentSource from_bytes(std::string name, std::string bytes);
};

struct BatchProgress {
    size_t index;               // 1-based position of the item that changed
    size_t total;
    const BatchItem& item;
};

struct BatchReport {
    std::vector<BatchItem> items;
    bool cancelled = false;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] size_t count(BatchItemStatus status) const;
    [[nodiscard]] size_t completed_count() const { return count(BatchItemStatus::COMPLETED); }
    [[nodiscard]] size_t error_count() const { return count(BatchItemStatus::ERROR); }
    [[nodiscard]] size_t total_detected() const;
};

/**
 * @brief Runs the detection pipeline over an ordered document collection
 *
 * Items move PENDING -> PROCESSING -> {COMPLETED | ERROR}, one at a time in
 * caller order (concurrency 1), so resident memory tracks the largest single
 * document rather than the batch. A failing item records its cause and the
 * batch continues; nothing per-item escapes run().
 */
class BatchOrchestrator {
public:
    using ProgressCallback = std::function<void(const BatchProgress&)>;

    struct Config {
        std::string artifact_prefix = "redacted_";
        bool include_manifest = true;
    };

    static constexpr std::string_view kManifestName = "manifest.json";

    BatchOrchestrator(std::shared_ptr<const DetectionPipeline> pipeline,
                      DocumentDecoder decoder,
                      Config config);

    explicit BatchOrchestrator(std::shared_ptr<const DetectionPipeline> pipeline)
        : BatchOrchestrator(std::move(pipeline), DocumentDecoder{}, Config{}) {}

    /**
     * @brief Process every source with a precompiled pattern set
     * @param progress Called after every item state transition
     * @param cancel Checked between items; remaining items stay PENDING
     */
    [[nodiscard]] BatchReport run(
        const std::vector<DocumentSource>& sources,
        const PatternSet& patterns,
        const ProgressCallback& progress = {},
        const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Write the ZIP bundle: one artifact per COMPLETED item (+ manifest)
     * @return Number of redacted artifacts written
     * @throws std::runtime_error on archive or stream failure
     */
    size_t export_bundle(const BatchReport& report, std::ostream& out) const;

    /**
     * @brief Deterministic artifact name: prefix + sanitized base name
     */
    [[nodiscard]] static std::string artifact_name_for(
        std::string_view source_name, std::string_view prefix, size_t id);

private:
    void process_item(BatchItem& item,
                      const DocumentSource& source,
                      const PatternSet& patterns) const;

    static void notify(const ProgressCallback& progress, size_t index, size_t total,
                       const BatchItem& item);

    std::shared_ptr<const DetectionPipeline> pipeline_;
    DocumentDecoder decoder_;
    Config config_;
};

} // namespace sentinel
