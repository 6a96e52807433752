// src/core/pacer_commands.h
#pragma once

#include <string>
#include "cadence_controller.h"
#include "diagnostic_commands.h"

// refresh_rate [hz]: no argument prints the current rate, a number applies it.
std::string run_refresh_rate_command(CadenceController& controller, const std::string& argument);

std::string run_pacer_status_command(const CadenceController& controller);

std::string format_refresh_rate(double refresh_rate);

// Registers refresh_rate, pacer_status and help.
bool register_pacer_commands(DiagnosticCommands& commands, CadenceController& controller);
