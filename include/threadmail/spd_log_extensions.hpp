/** SPDLogExtensions [Threadmail]
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

#ifndef SPDLogExtensions_hpp
#define SPDLogExtensions_hpp

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/base_sink.h>

// Flushes the logger a second after the last message arrives, or every
// 30 seconds, so the file sink never needs flush_on(info).
class SPDFlusherSink : public spdlog::sinks::base_sink<std::mutex> {
    std::mutex _flushMtx;
    std::condition_variable _flushCV;
    int _unflushed = 0;
    bool _exit = false;
    std::thread * _flushThread;

    void runFlushLoop();

public:
    SPDFlusherSink();
    ~SPDFlusherSink();

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override;
};

// Adds %N to the pattern: the name passed to SetThreadName for the
// logging thread.
class SPDThreadNameFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg & msg, const std::tm &, spdlog::memory_buf_t & dest) override;
    std::unique_ptr<custom_flag_formatter> clone() const override;
};

std::unique_ptr<spdlog::formatter> SPDFormatterWithThreadNames(const std::string & pattern);

#endif /* SPDLogExtensions_hpp */
