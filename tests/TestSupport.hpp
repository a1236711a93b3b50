#ifndef TESTSUPPORT_HPP
#define TESTSUPPORT_HPP

#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include "threadmail/constants.hpp"
#include "threadmail/delivery_hub.hpp"
#include "threadmail/identity_resolver.hpp"
#include "threadmail/line_connection.hpp"
#include "threadmail/mail_exception.hpp"

inline void EnsureTestLogger() {
    if (!spdlog::get("logger")) {
        auto logger = spdlog::stdout_color_mt("logger");
        logger->set_level(spdlog::level::warn);
    }
}

// Creates an empty scratch directory under /tmp, unique to this process.
inline std::string MakeTestDir(const std::string & name) {
    std::string dir = "/tmp/threadmail_test_" + name + "_" + std::to_string(getpid());
    system(("rm -rf " + dir + " && mkdir -p " + dir).c_str());
    return dir;
}

inline void RemoveTestDir(const std::string & dir) {
    system(("rm -rf " + dir).c_str());
}

class RecordingSink : public EventSink {
    std::mutex _mtx;
    std::condition_variable _cv;
    std::vector<std::string> _chunks;

public:
    bool open = true;
    bool failWrites = false;

    bool write(const std::string & chunk) override {
        std::lock_guard<std::mutex> lock(_mtx);
        if (failWrites) {
            return false;
        }
        _chunks.push_back(chunk);
        _cv.notify_all();
        return true;
    }

    bool isOpen() override {
        return open;
    }

    std::vector<std::string> chunks() {
        std::lock_guard<std::mutex> lock(_mtx);
        return _chunks;
    }

    bool waitForChunks(size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(_mtx);
        return _cv.wait_for(lock, timeout, [&]() { return _chunks.size() >= count; });
    }
};

class ScriptedLineConnection : public LineConnection {
public:
    std::deque<std::string> input;
    std::vector<std::string> output;
    bool closed = false;

    ScriptedLineConnection(std::vector<std::string> lines) : input(lines.begin(), lines.end()) {}

    bool readLine(std::string & line) override {
        if (closed || input.empty()) {
            return false;
        }
        line = input.front();
        input.pop_front();
        return true;
    }

    bool writeLine(const std::string & line) override {
        output.push_back(line);
        return !closed;
    }

    void close() override {
        closed = true;
    }

    std::string peerName() override {
        return "scripted";
    }
};

// Stands in for an identity backend that is unreachable.
class UnavailableResolver : public IdentityResolver {
public:
    UnavailableResolver() : IdentityResolver("localhost") {}

    std::shared_ptr<Account> authenticate(std::string, std::string) override {
        throw MailException(THREADMAIL_ERROR_LOOKUP, "identity backend offline");
    }
    std::shared_ptr<Account> findByUsername(std::string) override {
        throw MailException(THREADMAIL_ERROR_LOOKUP, "identity backend offline");
    }
    std::shared_ptr<Account> findById(int64_t) override {
        throw MailException(THREADMAIL_ERROR_LOOKUP, "identity backend offline");
    }
};

#endif // TESTSUPPORT_HPP
