/** LineConnection [Threadmail]
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

#ifndef LineConnection_hpp
#define LineConnection_hpp

#include <string>

/**
 A duplex, line-oriented connection. Lines are read without their
 terminator and written with CRLF appended.
 */
class LineConnection {
public:
    virtual ~LineConnection() {}

    // Returns false at end of stream or on a read error.
    virtual bool readLine(std::string & line) = 0;

    virtual bool writeLine(const std::string & line) = 0;

    virtual void close() = 0;

    virtual std::string peerName() = 0;
};

#endif /* LineConnection_hpp */
