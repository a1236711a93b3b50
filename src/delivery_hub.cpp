#include "threadmail/delivery_hub.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"
#include "threadmail/thread_utils.hpp"

#include <algorithm>

using namespace std;
using namespace nlohmann;

#define DISPATCH_QUEUE_LIMIT 4096

// HubEvent

HubEvent::HubEvent(string kind, json payload) :
    kind(kind), payload(payload)
{
}

HubEvent HubEvent::keepalive() {
    return HubEvent("", nullptr);
}

bool HubEvent::isKeepalive() const {
    return kind == "";
}

string HubEvent::dump() const {
    if (isKeepalive()) {
        return ": ping\n\n";
    }
    return "event: " + kind + "\ndata: " + MailUtils::dumpJSON(payload) + "\n\n";
}

// Subscription

Subscription::Subscription(uint64_t id, int64_t accountId, shared_ptr<EventSink> sink, DeliveryHub * hub) :
    _id(id), _accountId(accountId), _sink(sink), _hub(hub), _closed(false), _lastSeen(MailUtils::nowMilliseconds())
{
}

uint64_t Subscription::id() {
    return _id;
}

int64_t Subscription::accountId() {
    return _accountId;
}

int64_t Subscription::lastSeen() {
    return _lastSeen.load();
}

bool Subscription::isClosed() {
    lock_guard<mutex> lock(_queueMtx);
    return _closed;
}

bool Subscription::enqueue(HubEvent event) {
    {
        lock_guard<mutex> lock(_queueMtx);
        if (_closed || _queue.size() >= THREADMAIL_SUBSCRIPTION_QUEUE) {
            return false;
        }
        _queue.push_back(event);
    }
    _queueCv.notify_one();
    return true;
}

bool Subscription::writeLocked(const string & chunk) {
    bool ok = false;
    try {
        ok = _sink->write(chunk);
    } catch (std::exception & ex) {
        spdlog::get("logger")->debug("Subscription {} sink threw: {}", _id, ex.what());
        ok = false;
    }
    if (ok) {
        _lastSeen = MailUtils::nowMilliseconds();
    }
    return ok;
}

bool Subscription::deliverNext(chrono::milliseconds timeout) {
    unique_lock<mutex> lock(_queueMtx);
    _queueCv.wait_for(lock, timeout, [this]() { return _closed || !_queue.empty(); });
    if (_closed) {
        return false;
    }
    if (_queue.empty()) {
        lock.unlock();
        return _sink->isOpen();
    }
    HubEvent event = _queue.front();
    _queue.pop_front();
    lock.unlock();

    lock_guard<mutex> writeLock(_writeMtx);
    return writeLocked(event.dump());
}

void Subscription::run() {
    while (deliverNext(chrono::milliseconds(1000))) {
        // keep delivering
    }
    _hub->unsubscribe(shared_from_this());
}

bool Subscription::probe() {
    if (isClosed()) {
        return false;
    }
    unique_lock<mutex> writeLock(_writeMtx, try_to_lock);
    if (!writeLock.owns_lock()) {
        return true;
    }
    return writeLocked(HubEvent::keepalive().dump());
}

void Subscription::close() {
    {
        lock_guard<mutex> lock(_queueMtx);
        _closed = true;
        _queue.clear();
    }
    _queueCv.notify_all();
}

// DispatchWorker

DispatchWorker::DispatchWorker(string name, string storePath) :
    _name(name), _storePath(storePath), _busy(false), _stopping(false)
{
    _thread = new thread([this]() {
        SetThreadName(_name.c_str());
        run();
    });
}

DispatchWorker::~DispatchWorker() {
    stop();
    delete _thread;
}

bool DispatchWorker::submit(function<void(MessageStore *)> task) {
    {
        lock_guard<mutex> lock(_mtx);
        if (_stopping || _tasks.size() >= DISPATCH_QUEUE_LIMIT) {
            return false;
        }
        _tasks.push_back(task);
    }
    _cv.notify_one();
    return true;
}

void DispatchWorker::drain() {
    unique_lock<mutex> lock(_mtx);
    _idleCv.wait(lock, [this]() { return _tasks.empty() && !_busy; });
}

void DispatchWorker::stop() {
    {
        lock_guard<mutex> lock(_mtx);
        _stopping = true;
    }
    _cv.notify_all();
    if (_thread->joinable()) {
        _thread->join();
    }
}

void DispatchWorker::run() {
    auto logger = spdlog::get("logger");

    // Each worker owns its own connection, like every other thread that
    // touches the database.
    unique_ptr<MessageStore> store;
    if (_storePath != "") {
        try {
            store.reset(new MessageStore(_storePath));
        } catch (SQLite::Exception & ex) {
            logger->error("{} could not open the message store: {}", _name, ex.what());
        }
    }

    while (true) {
        function<void(MessageStore *)> task;
        {
            unique_lock<mutex> lock(_mtx);
            _cv.wait(lock, [this]() { return _stopping || !_tasks.empty(); });
            if (_tasks.empty()) {
                _idleCv.notify_all();
                return; // stopping, and nothing left in flight
            }
            task = _tasks.front();
            _tasks.pop_front();
            _busy = true;
        }

        try {
            task(store.get());
        } catch (MailException & ex) {
            logger->error("{} task failed: {}", _name, MailUtils::dumpJSON(ex.toJSON()));
        } catch (SQLite::Exception & ex) {
            logger->error("{} task failed: {}", _name, ex.what());
        } catch (std::exception & ex) {
            logger->error("{} task failed: {}", _name, ex.what());
        }

        {
            lock_guard<mutex> lock(_mtx);
            _busy = false;
        }
        _idleCv.notify_all();
    }
}

// DeliveryHub

DeliveryHub::DeliveryHub(string storePath, int dispatchThreads, chrono::seconds keepaliveInterval) :
    _nextSubscriptionId(1), _keepaliveInterval(keepaliveInterval), _sweepThread(nullptr), _stopping(false)
{
    if (dispatchThreads < 1) {
        dispatchThreads = 1;
    }
    for (int ii = 0; ii < dispatchThreads; ii ++) {
        _workers.push_back(unique_ptr<DispatchWorker>(new DispatchWorker("hub-dispatch-" + to_string(ii), storePath)));
    }
    if (_keepaliveInterval.count() > 0) {
        _sweepThread = new thread([this]() {
            SetThreadName("hub-sweep");
            runSweepLoop();
        });
    }
}

DeliveryHub::~DeliveryHub() {
    shutdown();
}

vector<shared_ptr<Subscription>> DeliveryHub::snapshot(int64_t accountId) {
    shared_lock<shared_timed_mutex> lock(_registryMtx);
    auto it = _registry.find(accountId);
    if (it == _registry.end()) {
        return {};
    }
    return it->second;
}

vector<shared_ptr<Subscription>> DeliveryHub::snapshotAll() {
    shared_lock<shared_timed_mutex> lock(_registryMtx);
    vector<shared_ptr<Subscription>> all;
    for (auto & entry : _registry) {
        all.insert(all.end(), entry.second.begin(), entry.second.end());
    }
    return all;
}

shared_ptr<Subscription> DeliveryHub::subscribe(int64_t accountId, shared_ptr<EventSink> sink) {
    auto subscription = make_shared<Subscription>(_nextSubscriptionId++, accountId, sink, this);
    subscription->enqueue(HubEvent(THREADMAIL_EVENT_CONNECTED, {{"message", "Connected to inbox updates"}}));
    {
        unique_lock<shared_timed_mutex> lock(_registryMtx);
        if (_stopping) {
            subscription->close();
            return subscription;
        }
        _registry[accountId].push_back(subscription);
    }
    spdlog::get("logger")->info("Subscription {} opened for account {}", subscription->id(), accountId);

    submit(accountId, [this, accountId, subscription](MessageStore * store) {
        pushUnreadCount(store, accountId, subscription);
    });
    return subscription;
}

bool DeliveryHub::unsubscribe(shared_ptr<Subscription> subscription) {
    bool removed = false;
    {
        unique_lock<shared_timed_mutex> lock(_registryMtx);
        auto it = _registry.find(subscription->accountId());
        if (it != _registry.end()) {
            auto & subs = it->second;
            auto pos = find(subs.begin(), subs.end(), subscription);
            if (pos != subs.end()) {
                subs.erase(pos);
                removed = true;
            }
            if (subs.empty()) {
                _registry.erase(it);
            }
        }
    }
    subscription->close();
    if (removed) {
        spdlog::get("logger")->info("Subscription {} closed for account {}", subscription->id(), subscription->accountId());
    }
    return removed;
}

void DeliveryHub::deliver(int64_t accountId, const HubEvent & event) {
    vector<shared_ptr<Subscription>> overflowing;
    for (auto & subscription : snapshot(accountId)) {
        if (!subscription->enqueue(event) && !subscription->isClosed()) {
            overflowing.push_back(subscription);
        }
    }
    for (auto & subscription : overflowing) {
        spdlog::get("logger")->warn("Subscription {} is not keeping up, dropping it", subscription->id());
        unsubscribe(subscription);
    }
}

void DeliveryHub::pushUnreadCount(MessageStore * store, int64_t accountId, shared_ptr<Subscription> only) {
    if (store == nullptr) {
        return;
    }
    HubEvent event(THREADMAIL_EVENT_UNREAD_COUNT, {{"count", store->unreadCount(accountId)}});
    if (only) {
        only->enqueue(event);
    } else {
        deliver(accountId, event);
    }
}

bool DeliveryHub::submit(int64_t accountId, function<void(MessageStore *)> task) {
    // Sharding by account keeps one account's events in submission order.
    size_t shard = hash<int64_t>()(accountId) % _workers.size();
    if (!_workers[shard]->submit(task)) {
        spdlog::get("logger")->warn("Dispatch queue for account {} is full or stopped, dropping event", accountId);
        return false;
    }
    return true;
}

bool DeliveryHub::notify(int64_t accountId, string kind, json payload) {
    HubEvent event(kind, payload);
    return submit(accountId, [this, accountId, event](MessageStore * store) {
        deliver(accountId, event);
        if (event.kind == THREADMAIL_EVENT_NEW_MESSAGE) {
            pushUnreadCount(store, accountId, nullptr);
        }
    });
}

bool DeliveryHub::notifyNewMessage(Message * message) {
    if (message->toAccountId() == 0) {
        return false;
    }
    return notify(message->toAccountId(), THREADMAIL_EVENT_NEW_MESSAGE, message->toJSONDispatch());
}

size_t DeliveryHub::subscriberCount(int64_t accountId) {
    shared_lock<shared_timed_mutex> lock(_registryMtx);
    auto it = _registry.find(accountId);
    return it == _registry.end() ? 0 : it->second.size();
}

size_t DeliveryHub::accountCount() {
    shared_lock<shared_timed_mutex> lock(_registryMtx);
    return _registry.size();
}

void DeliveryHub::sweep() {
    for (auto & subscription : snapshotAll()) {
        if (!subscription->probe()) {
            spdlog::get("logger")->info("Subscription {} failed its keepalive", subscription->id());
            unsubscribe(subscription);
        }
    }
}

void DeliveryHub::runSweepLoop() {
    while (true) {
        {
            unique_lock<mutex> lock(_sweepMtx);
            _sweepCv.wait_for(lock, _keepaliveInterval, [this]() { return _stopping; });
            if (_stopping) {
                return;
            }
        }
        sweep();
    }
}

void DeliveryHub::drain() {
    for (auto & worker : _workers) {
        worker->drain();
    }
}

void DeliveryHub::shutdown() {
    {
        lock_guard<mutex> lock(_sweepMtx);
        if (_stopping.exchange(true)) {
            return;
        }
    }
    _sweepCv.notify_all();
    if (_sweepThread) {
        _sweepThread->join();
        delete _sweepThread;
        _sweepThread = nullptr;
    }

    // Finish in-flight notifications before releasing the connections.
    for (auto & worker : _workers) {
        worker->stop();
    }

    vector<shared_ptr<Subscription>> all;
    {
        unique_lock<shared_timed_mutex> lock(_registryMtx);
        for (auto & entry : _registry) {
            all.insert(all.end(), entry.second.begin(), entry.second.end());
        }
        _registry.clear();
    }
    for (auto & subscription : all) {
        subscription->close();
    }
}
