#include "threadmail/spd_log_extensions.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/thread_utils.hpp"

#include <chrono>

using namespace std;

SPDFlusherSink::SPDFlusherSink() {
    _flushThread = new std::thread([this]() {
        SetThreadName("log-flusher");
        runFlushLoop();
    });
}

SPDFlusherSink::~SPDFlusherSink() {
    {
        lock_guard<mutex> lck(_flushMtx);
        _exit = true;
        _flushCV.notify_one();
    }
    _flushThread->join();
    delete _flushThread;
}

void SPDFlusherSink::runFlushLoop() {
    while (true) {
        chrono::system_clock::time_point desiredTime = chrono::system_clock::now();
        desiredTime += chrono::milliseconds(30000);
        {
            // Wait for a message, or for 30 seconds, whichever happens first
            unique_lock<mutex> lck(_flushMtx);
            _flushCV.wait_until(lck, desiredTime);
            if (_exit) {
                return;
            }
            if (_unflushed == 0) {
                continue; // spurious wake
            }
        }

        // Debounce 1sec for more messages to arrive
        this_thread::sleep_for(chrono::milliseconds(1000));

        {
            unique_lock<mutex> lck(_flushMtx);
            if (_exit) {
                return;
            }
            _unflushed = 0;
        }

        // Not under _flushMtx: sink_it_ takes it while holding the sink lock.
        auto logger = spdlog::get(THREADMAIL_LOGGER_NAME);
        if (logger) {
            logger->flush();
        }
    }
}

void SPDFlusherSink::sink_it_(const spdlog::details::log_msg& msg) {
    lock_guard<mutex> lck(_flushMtx);
    _unflushed += 1;
    _flushCV.notify_one();
}

void SPDFlusherSink::flush_() {
    // no-op
}

void SPDThreadNameFlag::format(const spdlog::details::log_msg & msg, const std::tm &, spdlog::memory_buf_t & dest) {
    string name = GetThreadName(msg.thread_id);
    dest.append(name.data(), name.data() + name.size());
}

unique_ptr<spdlog::custom_flag_formatter> SPDThreadNameFlag::clone() const {
    return spdlog::details::make_unique<SPDThreadNameFlag>();
}

unique_ptr<spdlog::formatter> SPDFormatterWithThreadNames(const string & pattern) {
    auto formatter = spdlog::details::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<SPDThreadNameFlag>('N').set_pattern(pattern);
    return std::move(formatter);
}
