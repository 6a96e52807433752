#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "message_types.h"

using json = nlohmann::json;

class JsonParser {
public:
    // Utilities
    static std::string generateUniqueId32();
    static std::string getCurrentTimestamp();
    static int getMessageId(const std::string& json_str);
    static std::string getUniqueId(const std::string& json_str);

    // --- Console client -> Pacer ---
    static std::string createConsoleCommand(const std::string& command,
                                            const std::string& argument,
                                            std::string session_uuid);

    // Returns false when json_str is not a well-formed console command.
    static bool parseConsoleCommand(const std::string& json_str, ConsoleCommand& out);

    // --- Pacer -> Console client ---
    static std::string createCommandReply(std::string unique_id_from_req,
                                          const std::string& command,
                                          bool ok,
                                          const std::string& output);

    static std::string createPacerStatus(const PacerStatusReport& report,
                                         std::string session_uuid);

    static bool parsePacerStatus(const std::string& json_str, PacerStatusReport& out);
};
