// src/core/diagnostic_commands.cpp
#include "diagnostic_commands.h"
#include <cctype>
#include <sstream>

std::string DiagnosticCommands::trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool DiagnosticCommands::register_command(const std::string& name, const std::string& help,
                                          Handler handler) {
    if (name.empty() || !handler) return false;
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commands.emplace(name, Entry{help, std::move(handler)}).second;
}

bool DiagnosticCommands::unregister_command(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commands.erase(name) > 0;
}

bool DiagnosticCommands::has_command(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commands.count(name) > 0;
}

std::vector<std::string> DiagnosticCommands::command_names() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    for (const auto& kv : m_commands) {
        names.push_back(kv.first);
    }
    return names;
}

bool DiagnosticCommands::execute_line(const std::string& line, std::string& output) const {
    std::string trimmed = trim(line);
    size_t split = 0;
    while (split < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[split]))) {
        ++split;
    }
    return execute(trimmed.substr(0, split), trim(trimmed.substr(split)), output);
}

bool DiagnosticCommands::execute(const std::string& name, const std::string& argument,
                                 std::string& output) const {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_commands.find(name);
        if (it == m_commands.end()) {
            output = "Unknown command '" + name + "'. Try 'help'.";
            return false;
        }
        handler = it->second.handler;
    }
    // Handlers may call back into the registry (help).
    output = handler(trim(argument));
    return true;
}

std::string DiagnosticCommands::help_text() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostringstream ss;
    bool first = true;
    for (const auto& kv : m_commands) {
        if (!first) ss << "\n";
        first = false;
        ss << kv.first;
        if (!kv.second.help.empty()) {
            ss << " - " << kv.second.help;
        }
    }
    return ss.str();
}
