// src/core/pacer_commands.cpp
#include "pacer_commands.h"
#include <cstdlib>
#include <iomanip>
#include <sstream>

std::string format_refresh_rate(double refresh_rate) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << refresh_rate;
    return ss.str();
}

std::string run_refresh_rate_command(CadenceController& controller, const std::string& argument) {
    std::string arg = DiagnosticCommands::trim(argument);
    if (arg.empty()) {
        return format_refresh_rate(controller.get_target());
    }

    const char* begin = arg.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        return "Invalid refresh rate '" + arg + "'. Usage: refresh_rate <hz> (<= 0 for unlimited)";
    }

    double effective = controller.set_target(value);
    return "Refresh rate set to " + format_refresh_rate(effective);
}

std::string run_pacer_status_command(const CadenceController& controller) {
    PacerStats stats = controller.get_stats();
    int64_t frequency = controller.get_clock_frequency();
    double to_us = frequency > 0 ? 1.0e6 / static_cast<double>(frequency) : 0.0;

    std::ostringstream ss;
    ss << "state=" << controller.get_state_name()
       << " target=" << format_refresh_rate(controller.get_target())
       << " interval_ticks=" << controller.get_interval_ticks()
       << " frequency=" << frequency
       << " ticks=" << stats.ticks
       << " waits=" << stats.waits
       << " late=" << stats.late_ticks
       << " resyncs=" << stats.resyncs
       << std::fixed << std::setprecision(1)
       << " max_overshoot_us=" << static_cast<double>(stats.max_overshoot_ticks) * to_us;
    return ss.str();
}

bool register_pacer_commands(DiagnosticCommands& commands, CadenceController& controller) {
    bool ok = commands.register_command(
        "refresh_rate", "refresh_rate [hz] - show or set the target rate (<= 0 unlimited)",
        [&controller](const std::string& argument) {
            return run_refresh_rate_command(controller, argument);
        });
    ok = commands.register_command(
        "pacer_status", "show pacer state and pacing statistics",
        [&controller](const std::string&) {
            return run_pacer_status_command(controller);
        }) && ok;
    ok = commands.register_command(
        "help", "list commands",
        [&commands](const std::string&) {
            return commands.help_text();
        }) && ok;
    return ok;
}
