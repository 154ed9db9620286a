#include "landsat_change/core/events.hpp"
#include "landsat_change/core/utils.hpp"

namespace landsat_change::core {

namespace {

void merge_into(json& event, const json& extra) {
    if (!extra.is_object()) return;
    event.update(extra);
}

} // namespace

json EventEmitter::header(const char* type, const std::string& run_id) {
    json event = json::object();
    event["type"] = type;
    event["run_id"] = run_id;
    event["ts"] = get_iso_timestamp();
    return event;
}

json EventEmitter::phase_header(const char* type, const std::string& run_id, Phase phase) {
    json event = header(type, run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    return event;
}

void EventEmitter::write_line(const json& event, std::ostream& out) {
    out << event.dump() << '\n';
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = header("run_start", run_id);
    merge_into(event, extra);
    write_line(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = header("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    write_line(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    write_line(phase_header("phase_start", run_id, phase), out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, int current,
                                  int total, const std::string& substep,
                                  const std::string& unit, std::ostream& out) {
    const double fraction =
        total > 0 ? static_cast<double>(current) / static_cast<double>(total) : 0.0;

    json event = phase_header("phase_progress", run_id, phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = fraction;
    event["unit"] = unit;
    event["substep"] = substep;
    write_line(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase, const std::string& status,
                             const json& extra, std::ostream& out) {
    json event = phase_header("phase_end", run_id, phase);
    event["status"] = status;
    merge_into(event, extra);
    write_line(event, out);
}

void EventEmitter::year_processed(const std::string& run_id, Phase phase, int year,
                                  int n_observations, const std::string& status,
                                  std::ostream& out) {
    json event = phase_header("year_processed", run_id, phase);
    event["year"] = year;
    event["n_observations"] = n_observations;
    event["status"] = status;
    write_line(event, out);
}

void EventEmitter::stop_requested(const std::string& run_id, Phase phase, std::ostream& out) {
    write_line(phase_header("run_stop_requested", run_id, phase), out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = header("warning", run_id);
    event["message"] = message;
    write_line(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = header("error", run_id);
    event["message"] = message;
    write_line(event, out);
}

} // namespace landsat_change::core
