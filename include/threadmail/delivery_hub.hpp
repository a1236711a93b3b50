/** DeliveryHub [Threadmail]
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

#ifndef DeliveryHub_hpp
#define DeliveryHub_hpp

#include <stdint.h>
#include <stdio.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "threadmail/constants.hpp"
#include "threadmail/message_store.hpp"
#include "threadmail/models/message.hpp"

class HubEvent {
public:
    std::string kind;
    nlohmann::json payload;

    HubEvent(std::string kind, nlohmann::json payload);

    static HubEvent keepalive();

    bool isKeepalive() const;
    std::string dump() const;
};

/**
 The output half of a live-update connection. write() returns false once
 the peer is gone; isOpen() lets the delivering thread notice a closed
 peer without waiting for the next write.
 */
class EventSink {
public:
    virtual ~EventSink() {}
    virtual bool write(const std::string & chunk) = 0;
    virtual bool isOpen() { return true; }
};

class DeliveryHub;

class Subscription : public std::enable_shared_from_this<Subscription> {
    uint64_t _id;
    int64_t _accountId;
    std::shared_ptr<EventSink> _sink;
    DeliveryHub * _hub;

    std::mutex _queueMtx;
    std::condition_variable _queueCv;
    std::deque<HubEvent> _queue;
    bool _closed;

    std::mutex _writeMtx;
    std::atomic<int64_t> _lastSeen;

    bool writeLocked(const std::string & chunk);

public:
    Subscription(uint64_t id, int64_t accountId, std::shared_ptr<EventSink> sink, DeliveryHub * hub);

    uint64_t id();
    int64_t accountId();
    int64_t lastSeen();
    bool isClosed();

    // Never blocks on the sink. Returns false when the subscription is
    // closed or its queue is full.
    bool enqueue(HubEvent event);

    // Waits up to `timeout` for one event and writes it. Returns false once
    // the subscription is closed or the sink has failed.
    bool deliverNext(std::chrono::milliseconds timeout);

    // Delivers events on the calling thread until the connection ends, then
    // removes itself from the hub.
    void run();

    // Writes a keepalive comment. A subscription that is mid-write counts
    // as alive.
    bool probe();

    void close();
};

class DispatchWorker {
    std::string _name;
    std::string _storePath;

    std::mutex _mtx;
    std::condition_variable _cv;
    std::condition_variable _idleCv;
    std::deque<std::function<void(MessageStore *)>> _tasks;
    bool _busy;
    bool _stopping;
    std::thread * _thread;

    void run();

public:
    DispatchWorker(std::string name, std::string storePath);
    ~DispatchWorker();

    bool submit(std::function<void(MessageStore *)> task);
    void drain();
    void stop();
};

class DeliveryHub {
    std::shared_timed_mutex _registryMtx;
    std::map<int64_t, std::vector<std::shared_ptr<Subscription>>> _registry;
    std::atomic<uint64_t> _nextSubscriptionId;

    std::vector<std::unique_ptr<DispatchWorker>> _workers;

    std::chrono::seconds _keepaliveInterval;
    std::mutex _sweepMtx;
    std::condition_variable _sweepCv;
    std::thread * _sweepThread;
    std::atomic<bool> _stopping;

    std::vector<std::shared_ptr<Subscription>> snapshot(int64_t accountId);
    std::vector<std::shared_ptr<Subscription>> snapshotAll();

    bool submit(int64_t accountId, std::function<void(MessageStore *)> task);
    void deliver(int64_t accountId, const HubEvent & event);
    void pushUnreadCount(MessageStore * store, int64_t accountId, std::shared_ptr<Subscription> only);
    void runSweepLoop();

public:
    DeliveryHub(std::string storePath, int dispatchThreads = 2, std::chrono::seconds keepaliveInterval = std::chrono::seconds(30));
    ~DeliveryHub();

    std::shared_ptr<Subscription> subscribe(int64_t accountId, std::shared_ptr<EventSink> sink);

    bool unsubscribe(std::shared_ptr<Subscription> subscription);

    bool notify(int64_t accountId, std::string kind, nlohmann::json payload);

    bool notifyNewMessage(Message * message);

    size_t subscriberCount(int64_t accountId);

    size_t accountCount();

    void sweep();

    void drain();

    void shutdown();
};

#endif /* DeliveryHub_hpp */
