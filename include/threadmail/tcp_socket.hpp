/** TcpSocket [Threadmail]
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

#ifndef TcpSocket_hpp
#define TcpSocket_hpp

#include <stdint.h>
#include <atomic>
#include <mutex>
#include <string>

#include "threadmail/line_connection.hpp"

#define THREADMAIL_MAX_LINE_BYTES (1024 * 1024)

class SocketConnection : public LineConnection {
    int _fd;
    std::string _peer;
    std::string _buffer;
    std::mutex _writeMtx;
    std::atomic<bool> _closed;

    bool fill();

public:
    SocketConnection(int fd, std::string peer);
    ~SocketConnection();

    bool readLine(std::string & line);
    // Hands over whatever is buffered, reading from the socket first when
    // nothing is. Returns false once the peer has hung up.
    bool readSome(std::string & out);

    bool writeLine(const std::string & line);
    bool writeRaw(const std::string & data);

    // True once the peer has hung up, checked without blocking.
    bool peerClosed();

    void setReadTimeout(int seconds);

    void close();

    std::string peerName();
};

class TcpListener {
    std::atomic<int> _fd;
    int _port;

public:
    TcpListener();
    ~TcpListener();

    // Throws MailException when the port cannot be bound.
    void listen(int port);

    // Blocks for the next connection. Returns -1 once the listener is closed.
    int accept(std::string & peer);

    int port();

    void close();
};

#endif /* TcpSocket_hpp */
