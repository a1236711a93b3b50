/** ServerConfig [Threadmail]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef ServerConfig_hpp
#define ServerConfig_hpp

#include <stdint.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

/**
 Process settings as one JSON document. Values are layered: built-in
 defaults, then an optional JSON file, then environment variables.
 Path settings left empty are derived from configDirPath.
 */
class ServerConfig {
    nlohmann::json _data;

    int intValue(const char * key);
    std::string stringValue(const char * key);

public:
    ServerConfig();

    static nlohmann::json defaults();

    // Throws MailException when the file cannot be read or parsed.
    void mergeFile(std::string path);

    void mergeEnvironment();

    void mergeJSON(const nlohmann::json & overrides);

    // Returns the names of the settings that are missing or out of range.
    std::vector<std::string> valid();

    int tcpPort();
    int httpPort();
    std::string serverHost();
    std::string configDirPath();
    std::string databasePath();
    std::string accountsPath();
    std::string attachmentsPath();
    std::string logPath();
    int relayPort();
    int relayTimeout();
    int keepaliveInterval();
    int dispatchThreads();
    std::string environment();
    bool isDevelopment();

    nlohmann::json toJSON();
};

#endif /* ServerConfig_hpp */
