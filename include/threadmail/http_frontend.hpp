/** HttpFrontend [Threadmail]
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

#ifndef HttpFrontend_hpp
#define HttpFrontend_hpp

#include <stdint.h>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "nlohmann/json.hpp"

#include "threadmail/delivery_hub.hpp"
#include "threadmail/identity_resolver.hpp"
#include "threadmail/ingestion_adapter.hpp"
#include "threadmail/message_store.hpp"
#include "threadmail/tcp_socket.hpp"

#define THREADMAIL_MAX_REQUEST_BYTES (100 * 1024 * 1024)
#define THREADMAIL_HTTP_READ_TIMEOUT 30

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    // Header names are lowercased.
    std::map<std::string, std::string> headers;
    std::string body;

    std::string header(const std::string & name) const;
    std::string param(const std::string & name) const;

    // Reads one request from the connection. Returns false on a clean hang
    // up; throws MailException when the request is malformed.
    static bool read(SocketConnection & conn, HttpRequest & request);

    static std::string urlDecode(const std::string & str);
};

struct HttpResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::map<std::string, std::string> headers;

    static HttpResponse withJSON(int status, const nlohmann::json & payload);
    static HttpResponse error(int status, std::string message);

    std::string serialize() const;
};

/**
 Streams live-update events to an HTTP client over its socket.
 */
class SocketEventSink : public EventSink {
    std::shared_ptr<SocketConnection> _conn;

public:
    SocketEventSink(std::shared_ptr<SocketConnection> conn);

    bool write(const std::string & chunk);
    bool isOpen();
};

/**
 The HTTP ingress: JSON API, relay endpoint and the live-update stream.
 One request per connection, each served on its own thread with its own
 MessageStore.
 */
class HttpFrontend {
    TcpListener _listener;
    std::string _storePath;
    IdentityResolver * _resolver;
    IngestionAdapter * _ingestion;
    DeliveryHub * _hub;

    std::thread * _acceptThread;

    std::mutex _requestsMtx;
    uint64_t _nextRequestId;
    std::map<uint64_t, std::shared_ptr<SocketConnection>> _connections;
    std::map<uint64_t, std::thread> _threads;
    std::list<uint64_t> _finished;

    void runAcceptLoop();
    void runRequest(uint64_t requestId, std::shared_ptr<SocketConnection> conn);
    void reapFinished();

    void streamInbox(std::shared_ptr<SocketConnection> conn, Account & account);

    HttpResponse listInbox(MessageStore & store, Account & account, const HttpRequest & request);
    HttpResponse listSent(MessageStore & store, Account & account, const HttpRequest & request);
    HttpResponse markRead(MessageStore & store, Account & account, int64_t messageId);
    HttpResponse getThread(MessageStore & store, Account & account, std::string threadId);
    HttpResponse getAttachment(MessageStore & store, Account & account, int64_t attachmentId);

public:
    HttpFrontend(std::string storePath, IdentityResolver * resolver, IngestionAdapter * ingestion, DeliveryHub * hub);
    ~HttpFrontend();

    void start(int port);

    void stop();

    // Returns the account named by Basic credentials or, when allowToken is
    // set, a `token` query parameter carrying base64("user:password").
    std::shared_ptr<Account> authenticate(const HttpRequest & request, bool allowToken);

    // Handles every route except the live-update stream.
    HttpResponse route(MessageStore & store, const HttpRequest & request);
};

#endif /* HttpFrontend_hpp */
