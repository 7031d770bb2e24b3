#include "batch/batch_orchestrator.hpp"
#include "batch/zip_writer.hpp"
#include "api/scan_api.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <map>
#include <stdexcept>
#include <unordered_set>

namespace sentinel {

// ============================================================================
// DocumentSource / BatchReport
// ============================================================================

DocumentSource DocumentSource::from_bytes(std::string name, std::string bytes) {
    DocumentSource source;
    source.name = std::move(name);
    source.read = [bytes = std::move(bytes)]() {
        return Result<std::string>::ok(bytes);
    };
    return source;
}

size_t BatchReport::count(BatchItemStatus status) const {
    size_t n = 0;
    for (const auto& item : items) {
        if (item.status == status) ++n;
    }
    return n;
}

size_t BatchReport::total_detected() const {
    size_t n = 0;
    for (const auto& item : items) {
        if (item.result) n += item.result->detected_pii.size();
    }
    return n;
}

// ============================================================================
// BatchOrchestrator
// ============================================================================

BatchOrchestrator::BatchOrchestrator(
    std::shared_ptr<const DetectionPipeline> pipeline,
    DocumentDecoder decoder,
    Config config)
    : pipeline_(std::move(pipeline)),
      decoder_(std::move(decoder)),
      config_(std::move(config)) {
    if (!pipeline_) {
        throw std::invalid_argument("BatchOrchestrator requires a detection pipeline");
    }
}

std::string BatchOrchestrator::artifact_name_for(
    std::string_view source_name, std::string_view prefix, size_t id) {

    // Base name only: never let a source name introduce directories
    const auto slash = source_name.find_last_of("/\\");
    std::string_view base = (slash == std::string_view::npos)
        ? source_name : source_name.substr(slash + 1);

    std::string sanitized;
    sanitized.reserve(base.size());
    for (const char c : base) {
        const bool keep = std::isalnum(static_cast<unsigned char>(c)) ||
                          c == '.' || c == '_' || c == '-';
        sanitized += keep ? c : '_';
    }

    if (sanitized.find_first_not_of('.') == std::string::npos) {
        sanitized = std::format("document_{}.txt", id);
    }
    return std::string(prefix) + sanitized;
}

void BatchOrchestrator::notify(const ProgressCallback& progress, size_t index, size_t total,
                               const BatchItem& item) {
    if (!progress) return;
    try {
        progress(BatchProgress{index, total, item});
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Batch progress callback failed: {}", e.what()));
    }
}

void BatchOrchestrator::process_item(
    BatchItem& item,
    const DocumentSource& source,
    const PatternSet& patterns) const {

    auto fail = [&item](ErrorCategory category, std::string message) {
        item.status = BatchItemStatus::ERROR;
        item.error_category = category;
        item.error = std::move(message);
    };

    if (!source.read) {
        fail(ErrorCategory::UNSUPPORTED_DOCUMENT, "document source has no reader");
        return;
    }

    auto bytes = source.read();
    if (bytes.is_error()) {
        fail(bytes.error_category(), bytes.error_message());
        return;
    }

    auto text = decoder_.decode(source.name, std::move(bytes.value()));
    if (text.is_error()) {
        fail(text.error_category(), text.error_message());
        return;
    }

    auto scanned = pipeline_->scan_compiled(text.value(), patterns);
    if (scanned.is_error()) {
        fail(scanned.error_category(), scanned.error_message());
        return;
    }

    item.result = std::move(scanned.value());
    item.status = BatchItemStatus::COMPLETED;
}

BatchReport BatchOrchestrator::run(
    const std::vector<DocumentSource>& sources,
    const PatternSet& patterns,
    const ProgressCallback& progress,
    const std::atomic<bool>* cancel) const {

    utils::Timer timer;
    BatchReport report;
    report.items.reserve(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        BatchItem item;
        item.id = i + 1;
        item.name = sources[i].name;
        report.items.emplace_back(std::move(item));
    }

    const size_t total = sources.size();
    utils::log::info(std::format("Batch started: {} documents, {} patterns", total, patterns.size()));

    std::unordered_set<std::string> used_names;

    for (size_t i = 0; i < total; ++i) {
        if (cancel && cancel->load(std::memory_order_acquire)) {
            report.cancelled = true;
            utils::log::warn(std::format("Batch cancelled after {} of {} documents", i, total));
            break;
        }

        BatchItem& item = report.items[i];
        item.status = BatchItemStatus::PROCESSING;
        notify(progress, i + 1, total, item);

        try {
            process_item(item, sources[i], patterns);
        } catch (const std::exception& e) {
            item.status = BatchItemStatus::ERROR;
            item.error_category = ErrorCategory::INTERNAL_ERROR;
            item.error = e.what();
        }

        if (item.status == BatchItemStatus::COMPLETED) {
            std::string name = artifact_name_for(item.name, config_.artifact_prefix, item.id);
            const bool reserved = config_.include_manifest && name == kManifestName;
            if (!used_names.insert(name).second || reserved) {
                const auto dot = name.find_last_of('.');
                const std::string stem = (dot == std::string::npos || dot == 0) ? name : name.substr(0, dot);
                const std::string ext = (dot == std::string::npos || dot == 0) ? "" : name.substr(dot);
                for (size_t n = 2;; ++n) {
                    std::string candidate = std::format("{}_{}{}", stem, n, ext);
                    if (used_names.insert(candidate).second) {
                        name = std::move(candidate);
                        break;
                    }
                }
            }
            item.artifact_name = std::move(name);
        } else {
            utils::log::warn(std::format("Batch item {} ({}) failed: {}",
                                         item.id, item.name, item.error));
        }

        notify(progress, i + 1, total, item);
    }

    report.elapsed = timer.elapsed_ms();
    utils::log::info(std::format("Batch finished: {} completed, {} errors, {} entities in {} ms",
                                 report.completed_count(), report.error_count(),
                                 report.total_detected(), report.elapsed.count()));
    return report;
}

size_t BatchOrchestrator::export_bundle(const BatchReport& report, std::ostream& out) const {
    ZipWriter zip(out);
    std::map<std::string, std::string> digests;

    for (const auto& item : report.items) {
        if (item.status != BatchItemStatus::COMPLETED || !item.result) continue;
        const auto& text = item.result->redacted_text;
        zip.add_file(item.artifact_name, text);
        digests[item.artifact_name] = sha256_hex(text);
    }

    const size_t artifacts = zip.entry_count();
    if (config_.include_manifest) {
        zip.add_file(std::string(kManifestName), batch_report_to_json(report, digests).dump(2));
    }
    zip.finish();

    utils::log::info(std::format("Export bundle written: {} artifacts", artifacts));
    return artifacts;
}

} // namespace sentinel
