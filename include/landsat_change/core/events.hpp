#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace landsat_change::core {

using json = nlohmann::json;

// Writes one JSON object per line. Every event carries type, run_id and ts;
// phase events also carry phase (int) and phase_name.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, std::ostream& out);
    // progress is current / total, 0 when total is 0.
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& substep, const std::string& unit, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void year_processed(const std::string& run_id, Phase phase, int year,
                        int n_observations, const std::string& status, std::ostream& out);

    // type "run_stop_requested"
    void stop_requested(const std::string& run_id, Phase phase, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    static json header(const char* type, const std::string& run_id);
    static json phase_header(const char* type, const std::string& run_id, Phase phase);
    static void write_line(const json& event, std::ostream& out);
};

} // namespace landsat_change::core
