/** RelayClient [Threadmail]
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

#ifndef RelayClient_hpp
#define RelayClient_hpp

#include <stdint.h>
#include <string>

#include "nlohmann/json.hpp"

#define THREADMAIL_RELAY_PATH "/federation/relay"

/**
 Best-effort push of a message to another server's relay endpoint. One
 attempt per call: there is no queue and no retry. Failures are thrown as
 MailException("relay-error") and never affect the local copy.
 */
class RelayClient {
    std::string _serverHost;
    int _relayPort;
    long _timeoutSec;

public:
    RelayClient(std::string serverHost, int relayPort, long timeoutSec);
    virtual ~RelayClient() {}

    virtual void sendMessage(std::string from, std::string to, std::string subject, std::string body, std::string targetHost);

    bool isSelf(std::string targetHost);

    std::string endpointFor(std::string targetHost);

    nlohmann::json envelopeFor(std::string from, std::string to, std::string subject, std::string body, int64_t timestamp);
};

#endif /* RelayClient_hpp */
