#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace page_norm::core {

using json = nlohmann::json;

// JSON-lines run events, one object per line with type/run_id/ts.
// Lines are written whole when emitted from several worker threads.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, const std::string& name, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void page_processed(const std::string& run_id, int page_idx, int total_pages,
                        const NormalizationResult& result, bool accepted, std::ostream& out);
    void page_failed(const std::string& run_id, const PageFailure& failure, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    std::mutex mutex_;
};

} // namespace page_norm::core
