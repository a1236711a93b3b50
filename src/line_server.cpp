#include "threadmail/line_server.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/message_store.hpp"
#include "threadmail/protocol_session.hpp"
#include "threadmail/thread_utils.hpp"

#include <unistd.h>

#include "spdlog/spdlog.h"

LineServer::LineServer(std::string storePath, IdentityResolver * resolver, IngestionAdapter * ingestion) :
    _storePath(storePath), _resolver(resolver), _ingestion(ingestion), _acceptThread(nullptr), _nextSessionId(1)
{
}

LineServer::~LineServer() {
    stop();
}

void LineServer::start(int port) {
    _listener.listen(port);
    spdlog::get("logger")->info("Line protocol listening on port {}", port);

    _acceptThread = new std::thread([this]() {
        SetThreadName("line-accept");
        runAcceptLoop();
    });
}

void LineServer::runAcceptLoop() {
    while (true) {
        std::string peer;
        int fd = _listener.accept(peer);
        if (fd < 0) {
            return;
        }
        auto conn = std::make_shared<SocketConnection>(fd, peer);

        std::lock_guard<std::mutex> lock(_sessionsMtx);
        reapFinished();
        uint64_t sessionId = _nextSessionId++;
        _connections[sessionId] = conn;
        _threads[sessionId] = std::thread([this, sessionId, conn]() {
            SetThreadName("session");
            runSession(sessionId, conn);
        });
    }
}

void LineServer::runSession(uint64_t sessionId, std::shared_ptr<SocketConnection> conn) {
    try {
        MessageStore store(_storePath);
        ProtocolSession session(conn, &store, _resolver, _ingestion);
        session.run();
    } catch (SQLite::Exception & ex) {
        spdlog::get("logger")->error("Session {} could not open the message store: {}", conn->peerName(), ex.what());
        conn->writeLine("421 Service not available");
        conn->close();
    } catch (std::exception & ex) {
        spdlog::get("logger")->error("Session {} failed: {}", conn->peerName(), ex.what());
        conn->close();
    }

    std::lock_guard<std::mutex> lock(_sessionsMtx);
    _connections.erase(sessionId);
    _finished.push_back(sessionId);
}

// Must be called with _sessionsMtx held.
void LineServer::reapFinished() {
    for (auto sessionId : _finished) {
        auto it = _threads.find(sessionId);
        if (it != _threads.end()) {
            if (it->second.joinable()) {
                it->second.join();
            }
            _threads.erase(it);
        }
    }
    _finished.clear();
}

void LineServer::stop() {
    _listener.close();
    if (_acceptThread) {
        _acceptThread->join();
        delete _acceptThread;
        _acceptThread = nullptr;
    }

    std::map<uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(_sessionsMtx);
        for (auto & entry : _connections) {
            entry.second->close();
        }
        threads.swap(_threads);
        _finished.clear();
    }
    for (auto & entry : threads) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }
}
