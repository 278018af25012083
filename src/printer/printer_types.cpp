// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_types.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace printdeck {

PrinterState parse_printer_state(const std::string& str) {
    static const PrinterState all_states[] = {
        PrinterState::READY,     PrinterState::PRINTING, PrinterState::PAUSED,
        PrinterState::COMPLETED, PrinterState::ERROR,    PrinterState::BUSY,
        PrinterState::CALIBRATING, PrinterState::HEATING, PrinterState::PAUSING,
        PrinterState::CANCELLED};

    for (PrinterState state : all_states) {
        if (str == printer_state_to_string(state)) {
            return state;
        }
    }
    return PrinterState::UNKNOWN;
}

namespace {

json temperature_to_json(const TemperatureReading& t) {
    return {{"current", t.current}, {"target", t.target}, {"isHeating", t.is_heating()}};
}

} // namespace

json printer_status_to_json(const PrinterStatus& status) {
    json temps = {{"bed", temperature_to_json(status.bed)},
                  {"extruder", temperature_to_json(status.extruder)}};
    if (status.chamber) {
        temps["chamber"] = temperature_to_json(*status.chamber);
    }

    json j = {
        {"state", printer_state_to_string(status.state)},
        {"temperatures", temps},
        {"fans",
         {{"coolingFan", status.fans.cooling_fan_speed},
          {"chamberFan", status.fans.chamber_fan_speed}}},
        {"filtration",
         {{"available", status.filtration.available},
          {"mode", filtration_mode_to_string(status.filtration.mode)},
          {"tvocLevel", status.filtration.tvoc_level}}},
        {"capabilities",
         {{"filtration", status.capabilities.filtration},
          {"materialStation", status.capabilities.material_station},
          {"ledControl", status.capabilities.led_control},
          {"camera", status.capabilities.camera}}},
        {"lastPolled", format_iso8601(status.polled_at)},
    };

    if (status.job) {
        const JobProgress& job = *status.job;
        j["currentJob"] = {{"fileName", job.file_name},
                           {"progress",
                            {{"percentage", job.percentage},
                             {"currentLayer", job.current_layer},
                             {"totalLayers", job.total_layers},
                             {"elapsedTime", job.elapsed_seconds},
                             {"timeRemaining", job.remaining_seconds}}}};
    } else {
        j["currentJob"] = nullptr;
    }
    return j;
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);

    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace printdeck
