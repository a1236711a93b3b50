#include "threadmail/http_frontend.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"
#include "threadmail/thread_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include "spdlog/spdlog.h"

using namespace std;
using namespace nlohmann;

namespace beast = boost::beast;
namespace http = boost::beast::http;

static const string BODY_TOO_LARGE = "Request body too large";

static string toString(beast::string_view view) {
    return string(view.data(), view.size());
}

static vector<string> pathSegments(const string & path) {
    vector<string> segments;
    stringstream ss(path);
    string segment;
    while (getline(ss, segment, '/')) {
        if (segment.size() > 0) {
            segments.push_back(segment);
        }
    }
    return segments;
}

static bool parseInt64(const string & str, int64_t & out) {
    if (str.size() == 0) {
        return false;
    }
    try {
        size_t consumed = 0;
        long long val = stoll(str, &consumed);
        if (consumed != str.size()) {
            return false;
        }
        out = val;
        return true;
    } catch (std::exception &) {
        return false;
    }
}

static json dispatchArray(vector<shared_ptr<Message>> & messages) {
    json arr = json::array();
    for (auto & msg : messages) {
        arr.push_back(msg->toJSONDispatch());
    }
    return arr;
}

// HttpRequest

string HttpRequest::header(const string & name) const {
    auto it = headers.find(name);
    return it == headers.end() ? "" : it->second;
}

string HttpRequest::param(const string & name) const {
    auto it = query.find(name);
    return it == query.end() ? "" : it->second;
}

string HttpRequest::urlDecode(const string & str) {
    string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); i++) {
        char c = str[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < str.size() && isxdigit((unsigned char)str[i + 1]) && isxdigit((unsigned char)str[i + 2])) {
            out.push_back((char)stoi(str.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

bool HttpRequest::read(SocketConnection & conn, HttpRequest & request) {
    http::request_parser<http::string_body> parser;
    parser.body_limit(THREADMAIL_MAX_REQUEST_BYTES);

    string pending;
    bool started = false;
    bool needMore = false;
    while (!parser.is_done()) {
        if (pending.size() == 0 || needMore) {
            string chunk;
            if (!conn.readSome(chunk)) {
                if (!started) {
                    return false;
                }
                throw MailException(THREADMAIL_ERROR_VALIDATION, "Connection closed before the request was complete");
            }
            pending += chunk;
            started = true;
            needMore = false;
        }
        beast::error_code ec;
        size_t used = parser.put(boost::asio::buffer(pending.data(), pending.size()), ec);
        pending.erase(0, used);
        if (ec == http::error::need_more) {
            needMore = true;
            continue;
        }
        if (ec == http::error::body_limit) {
            throw MailException(THREADMAIL_ERROR_VALIDATION, BODY_TOO_LARGE);
        }
        if (ec) {
            throw MailException(THREADMAIL_ERROR_VALIDATION, "Malformed request: " + ec.message());
        }
    }

    auto & message = parser.get();
    request.method = toString(message.method_string());

    string target = toString(message.target());
    size_t qpos = target.find('?');
    request.path = urlDecode(target.substr(0, qpos));
    if (qpos != string::npos) {
        string queryString = target.substr(qpos + 1);
        vector<string> pairs;
        boost::split(pairs, queryString, boost::is_any_of("&"));
        for (auto & pair : pairs) {
            size_t eq = pair.find('=');
            if (eq == string::npos) {
                request.query[urlDecode(pair)] = "";
            } else {
                request.query[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
    }

    for (auto const & field : message) {
        string name = toString(field.name_string());
        transform(name.begin(), name.end(), name.begin(), ::tolower);
        request.headers[name] = toString(field.value());
    }
    request.body = message.body();
    return true;
}

// HttpResponse

HttpResponse HttpResponse::withJSON(int status, const nlohmann::json & payload) {
    HttpResponse response;
    response.status = status;
    response.body = MailUtils::dumpJSON(payload);
    return response;
}

HttpResponse HttpResponse::error(int status, string message) {
    return HttpResponse::withJSON(status, {{"error", message}});
}

string HttpResponse::serialize() const {
    http::response<http::string_body> response{static_cast<http::status>(status), 11};
    response.set(http::field::content_type, contentType);
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::connection, "close");
    for (auto & entry : headers) {
        response.set(entry.first, entry.second);
    }
    response.body() = body;
    response.prepare_payload();

    ostringstream out;
    out << response;
    return out.str();
}

// SocketEventSink

SocketEventSink::SocketEventSink(shared_ptr<SocketConnection> conn) :
    _conn(conn)
{
}

bool SocketEventSink::write(const string & chunk) {
    return _conn->writeRaw(chunk);
}

bool SocketEventSink::isOpen() {
    return !_conn->peerClosed();
}

// HttpFrontend

HttpFrontend::HttpFrontend(string storePath, IdentityResolver * resolver, IngestionAdapter * ingestion, DeliveryHub * hub) :
    _storePath(storePath), _resolver(resolver), _ingestion(ingestion), _hub(hub), _acceptThread(nullptr), _nextRequestId(1)
{
}

HttpFrontend::~HttpFrontend() {
    stop();
}

void HttpFrontend::start(int port) {
    _listener.listen(port);
    spdlog::get("logger")->info("HTTP listening on port {}", port);

    _acceptThread = new std::thread([this]() {
        SetThreadName("http-accept");
        runAcceptLoop();
    });
}

void HttpFrontend::runAcceptLoop() {
    while (true) {
        string peer;
        int fd = _listener.accept(peer);
        if (fd < 0) {
            return;
        }
        auto conn = make_shared<SocketConnection>(fd, peer);

        lock_guard<mutex> lock(_requestsMtx);
        reapFinished();
        uint64_t requestId = _nextRequestId++;
        _connections[requestId] = conn;
        _threads[requestId] = std::thread([this, requestId, conn]() {
            SetThreadName("http");
            runRequest(requestId, conn);
        });
    }
}

void HttpFrontend::runRequest(uint64_t requestId, shared_ptr<SocketConnection> conn) {
    auto logger = spdlog::get("logger");
    conn->setReadTimeout(THREADMAIL_HTTP_READ_TIMEOUT);

    HttpRequest request;
    bool hasRequest = false;
    try {
        hasRequest = HttpRequest::read(*conn, request);
    } catch (MailException & ex) {
        logger->warn("Rejected request from {}: {}", conn->peerName(), ex.what());
        conn->writeRaw(HttpResponse::error(ex.debuginfo == BODY_TOO_LARGE ? 413 : 400, ex.debuginfo).serialize());
    }

    if (hasRequest) {
        logger->debug("{} {} from {}", request.method, request.path, conn->peerName());

        if (request.method == "GET" && request.path == "/api/sse/inbox") {
            shared_ptr<Account> account;
            HttpResponse refusal = HttpResponse::error(401, "Unauthorized");
            try {
                account = authenticate(request, true);
            } catch (MailException & ex) {
                logger->error("Could not authenticate stream request: {}", ex.what());
                refusal = HttpResponse::error(503, "Identity service unavailable");
            }
            if (account) {
                try {
                    streamInbox(conn, *account);
                } catch (std::exception & ex) {
                    logger->error("Stream for {} failed: {}", account->username(), ex.what());
                }
            } else {
                logger->info("Refused stream request from {} ({})", conn->peerName(), refusal.status);
                conn->writeRaw(refusal.serialize());
            }
        } else {
            HttpResponse response;
            try {
                MessageStore store(_storePath);
                response = route(store, request);
            } catch (SQLite::Exception & ex) {
                logger->error("Could not open the message store: {}", ex.what());
                response = HttpResponse::error(503, "Service unavailable");
            } catch (std::exception & ex) {
                logger->error("{} {} failed: {}", request.method, request.path, ex.what());
                response = HttpResponse::error(500, "Internal server error");
            }
            conn->writeRaw(response.serialize());
        }
    }
    conn->close();

    lock_guard<mutex> lock(_requestsMtx);
    _connections.erase(requestId);
    _finished.push_back(requestId);
}

void HttpFrontend::streamInbox(shared_ptr<SocketConnection> conn, Account & account) {
    string head = "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "\r\n";
    if (!conn->writeRaw(head)) {
        return;
    }

    auto sink = make_shared<SocketEventSink>(conn);
    auto subscription = _hub->subscribe(account.id(), sink);
    subscription->run();
    spdlog::get("logger")->info("Stream for {} closed", account.username());
}

// Must be called with _requestsMtx held.
void HttpFrontend::reapFinished() {
    for (auto requestId : _finished) {
        auto it = _threads.find(requestId);
        if (it != _threads.end()) {
            if (it->second.joinable()) {
                it->second.join();
            }
            _threads.erase(it);
        }
    }
    _finished.clear();
}

void HttpFrontend::stop() {
    _listener.close();
    if (_acceptThread) {
        _acceptThread->join();
        delete _acceptThread;
        _acceptThread = nullptr;
    }

    std::map<uint64_t, std::thread> threads;
    {
        lock_guard<mutex> lock(_requestsMtx);
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

shared_ptr<Account> HttpFrontend::authenticate(const HttpRequest & request, bool allowToken) {
    string credentials;
    string authorization = request.header("authorization");
    if (authorization.find("Basic ") == 0) {
        credentials = MailUtils::trim(authorization.substr(6));
    } else if (allowToken) {
        credentials = request.param("token");
    }
    if (credentials.size() == 0) {
        return nullptr;
    }

    string decoded;
    try {
        decoded = MailUtils::fromBase64(credentials);
    } catch (std::invalid_argument &) {
        return nullptr;
    }
    size_t colon = decoded.find(':');
    if (colon == string::npos) {
        return nullptr;
    }
    return _resolver->authenticate(decoded.substr(0, colon), decoded.substr(colon + 1));
}

HttpResponse HttpFrontend::route(MessageStore & store, const HttpRequest & request) {
    auto segments = pathSegments(request.path);

    if (request.method == "OPTIONS") {
        HttpResponse response;
        response.status = 204;
        response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
        response.headers["Access-Control-Allow-Headers"] = "Authorization, Content-Type";
        return response;
    }

    try {
        if (request.path == "/api/health") {
            return HttpResponse::withJSON(200, {{"status", "healthy"}, {"server", _resolver->serverHost()}});
        }

        if (request.path == "/federation/relay") {
            if (request.method != "POST") {
                return HttpResponse::error(405, "Method not allowed");
            }
            json envelope = json::parse(request.body, nullptr, false);
            SendResult result = _ingestion->acceptRelayed(store, envelope);
            return HttpResponse::withJSON(result.status, result.toJSON());
        }

        if (segments.size() == 0 || segments[0] != "api") {
            return HttpResponse::error(404, "Not found");
        }

        shared_ptr<Account> account = authenticate(request, false);
        if (!account) {
            HttpResponse response = HttpResponse::error(401, "Unauthorized");
            response.headers["WWW-Authenticate"] = "Basic realm=\"threadmail\"";
            return response;
        }

        if (request.path == "/api/send") {
            if (request.method != "POST") {
                return HttpResponse::error(405, "Method not allowed");
            }
            json payload = json::parse(request.body, nullptr, false);
            if (payload.is_discarded()) {
                return HttpResponse::withJSON(400, SendResult::failure(400, "invalid_json", "Invalid JSON").toJSON());
            }
            SendRequest sendRequest = SendRequest::fromJSON(payload);
            SendResult result = _ingestion->send(store, *account, sendRequest);
            return HttpResponse::withJSON(result.status, result.toJSON());
        }

        if (segments.size() >= 2 && segments[1] == "messages") {
            if (segments.size() == 2 && request.method == "GET") {
                return listInbox(store, *account, request);
            }
            if (segments.size() == 3 && segments[2] == "sent" && request.method == "GET") {
                return listSent(store, *account, request);
            }
            if (segments.size() == 3 && segments[2] == "unread-count" && request.method == "GET") {
                return HttpResponse::withJSON(200, {{"unread_count", store.unreadCount(account->id())}});
            }
            int64_t messageId = 0;
            if (segments.size() == 4 && segments[3] == "read" && request.method == "POST") {
                if (!parseInt64(segments[2], messageId)) {
                    return HttpResponse::error(400, "Invalid message ID");
                }
                return markRead(store, *account, messageId);
            }
        }

        if (segments.size() == 3 && segments[1] == "threads" && request.method == "GET") {
            return getThread(store, *account, segments[2]);
        }

        if (segments.size() == 3 && segments[1] == "attachments" && request.method == "GET") {
            int64_t attachmentId = 0;
            if (!parseInt64(segments[2], attachmentId)) {
                return HttpResponse::error(400, "Invalid attachment ID");
            }
            return getAttachment(store, *account, attachmentId);
        }

        return HttpResponse::error(404, "Not found");

    } catch (MailException & ex) {
        spdlog::get("logger")->error("{} {} failed: {}", request.method, request.path, ex.what());
        if (ex.is(THREADMAIL_ERROR_VALIDATION)) {
            return HttpResponse::error(400, ex.debuginfo);
        }
        if (ex.is(THREADMAIL_ERROR_LOOKUP)) {
            return HttpResponse::error(503, "Identity service unavailable");
        }
        return HttpResponse::error(500, "Internal server error");
    } catch (std::exception & ex) {
        spdlog::get("logger")->error("{} {} failed: {}", request.method, request.path, ex.what());
        return HttpResponse::error(500, "Internal server error");
    }
}

HttpResponse HttpFrontend::listInbox(MessageStore & store, Account & account, const HttpRequest & request) {
    int64_t limit = THREADMAIL_INBOX_DEFAULT_LIMIT;
    int64_t offset = 0;
    if (request.param("limit").size() && (!parseInt64(request.param("limit"), limit) || limit < 1 || limit > 100)) {
        return HttpResponse::error(400, "limit must be between 1 and 100");
    }
    if (request.param("offset").size() && (!parseInt64(request.param("offset"), offset) || offset < 0)) {
        return HttpResponse::error(400, "offset must not be negative");
    }
    auto roots = store.getInboxRoots(account.id(), (int)limit, (int)offset);
    return HttpResponse::withJSON(200, dispatchArray(roots));
}

HttpResponse HttpFrontend::listSent(MessageStore & store, Account & account, const HttpRequest & request) {
    int64_t limit = THREADMAIL_INBOX_DEFAULT_LIMIT;
    int64_t offset = 0;
    if (request.param("limit").size() && (!parseInt64(request.param("limit"), limit) || limit < 1 || limit > 100)) {
        return HttpResponse::error(400, "limit must be between 1 and 100");
    }
    if (request.param("offset").size() && (!parseInt64(request.param("offset"), offset) || offset < 0)) {
        return HttpResponse::error(400, "offset must not be negative");
    }
    auto sent = store.getSent(account.id(), (int)limit, (int)offset);
    return HttpResponse::withJSON(200, dispatchArray(sent));
}

HttpResponse HttpFrontend::markRead(MessageStore & store, Account & account, int64_t messageId) {
    auto message = store.getMessage(messageId);
    if (!message) {
        return HttpResponse::error(404, "Message not found");
    }
    if (!message->isAddressedTo(account.id())) {
        return HttpResponse::error(403, "Access denied");
    }
    store.markRead(messageId);
    return HttpResponse::withJSON(200, {{"status", "success"}});
}

HttpResponse HttpFrontend::getThread(MessageStore & store, Account & account, string threadId) {
    auto messages = store.getThread(threadId);
    vector<shared_ptr<Message>> visible;
    for (auto & msg : messages) {
        if (msg->involves(account.id())) {
            visible.push_back(msg);
        }
    }
    if (visible.size() == 0) {
        return HttpResponse::error(404, "Thread not found");
    }
    return HttpResponse::withJSON(200, dispatchArray(visible));
}

HttpResponse HttpFrontend::getAttachment(MessageStore & store, Account & account, int64_t attachmentId) {
    auto attachment = store.getAttachment(attachmentId);
    if (!attachment) {
        return HttpResponse::error(404, "Attachment not found");
    }
    auto message = store.getMessage(attachment->messageId());
    if (!message || !message->involves(account.id())) {
        return HttpResponse::error(403, "Access denied");
    }

    ifstream file(attachment->path(), ios::in | ios::binary);
    if (!file) {
        spdlog::get("logger")->error("Attachment {} is missing its file at {}", attachmentId, attachment->path());
        return HttpResponse::error(404, "Attachment file not found");
    }
    stringstream contents;
    contents << file.rdbuf();

    HttpResponse response;
    response.contentType = attachment->contentType();
    response.body = contents.str();
    response.headers["Content-Disposition"] = "attachment; filename=\"" + attachment->safeFilename() + "\"";
    return response;
}
