#include "page_norm/core/events.hpp"
#include "page_norm/core/utils.hpp"

namespace page_norm::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    const std::string line = event.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out << line << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase,
                               const std::string& name, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = name;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::page_processed(const std::string& run_id, int page_idx, int total_pages,
                                  const NormalizationResult& result, bool accepted,
                                  std::ostream& out) {
    json event = base_event("page_processed", run_id);
    event["phase"] = phase_to_int(Phase::NORMALIZATION);
    event["page_id"] = result.page_id;
    event["page_idx"] = page_idx;
    event["total_pages"] = total_pages;
    event["skew_angle"] = result.skew_angle;
    event["mask_coverage"] = result.stats.mask_coverage;
    event["dpi_source"] = dpi_source_to_string(result.dpi_source);
    event["accepted"] = accepted;
    emit(event, out);
}

void EventEmitter::page_failed(const std::string& run_id, const PageFailure& failure,
                               std::ostream& out) {
    json event = base_event("page_failed", run_id);
    event["phase"] = phase_to_int(Phase::NORMALIZATION);
    event["page_id"] = failure.page_id;
    event["stage"] = failure.phase;
    event["kind"] = failure.kind;
    event["message"] = failure.message;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace page_norm::core
