// src/core/diagnostic_commands.h
#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Named text commands, independent of whichever console feeds them.
class DiagnosticCommands {
public:
    using Handler = std::function<std::string(const std::string& argument)>;

    // Returns false when the name is empty, contains whitespace or is taken.
    bool register_command(const std::string& name, const std::string& help, Handler handler);
    bool unregister_command(const std::string& name);
    bool has_command(const std::string& name) const;
    std::vector<std::string> command_names() const;

    // "name argument..." -> runs the handler. Returns false for an unknown
    // command, with the error message in output.
    bool execute_line(const std::string& line, std::string& output) const;
    bool execute(const std::string& name, const std::string& argument, std::string& output) const;

    std::string help_text() const;

    static std::string trim(const std::string& text);

private:
    struct Entry {
        std::string help;
        Handler handler;
    };

    std::map<std::string, Entry> m_commands;
    mutable std::mutex m_mutex;
};
