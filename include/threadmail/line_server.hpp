/** LineServer [Threadmail]
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

#ifndef LineServer_hpp
#define LineServer_hpp

#include <stdint.h>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "threadmail/identity_resolver.hpp"
#include "threadmail/ingestion_adapter.hpp"
#include "threadmail/tcp_socket.hpp"

/**
 Accepts line-protocol connections and runs one ProtocolSession per
 connection, each on its own thread with its own MessageStore.
 */
class LineServer {
    TcpListener _listener;
    std::string _storePath;
    IdentityResolver * _resolver;
    IngestionAdapter * _ingestion;

    std::thread * _acceptThread;

    std::mutex _sessionsMtx;
    uint64_t _nextSessionId;
    std::map<uint64_t, std::shared_ptr<SocketConnection>> _connections;
    std::map<uint64_t, std::thread> _threads;
    std::list<uint64_t> _finished;

    void runAcceptLoop();
    void runSession(uint64_t sessionId, std::shared_ptr<SocketConnection> conn);
    void reapFinished();

public:
    LineServer(std::string storePath, IdentityResolver * resolver, IngestionAdapter * ingestion);
    ~LineServer();

    void start(int port);

    void stop();
};

#endif /* LineServer_hpp */
