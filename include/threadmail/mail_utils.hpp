/** MailUtils [Threadmail]
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

#ifndef MailUtils_hpp
#define MailUtils_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#define FS_PATH_SEP "/"

using namespace nlohmann;
using namespace std;

struct AddressParts {
    string local;
    string domain;
};

class MailUtils {

public:
    static string getEnvUTF8(string key);

    static json merge(const json &a, const json &b);

    // Message text arrives as raw bytes from the line protocol. Invalid
    // UTF-8 is written as U+FFFD rather than failing the whole document.
    static string dumpJSON(const json & j, int indent = -1);

    static string idRandomlyGenerated();

    static bool isValidAddress(const string & address);
    static AddressParts splitAddress(const string & address);

    static int64_t nowMilliseconds();
    static string timestampForTime(int64_t ms);
    static string formatTimestamp(int64_t ms, const char * format);

    static string toBase64(const string & data);
    static string fromBase64(const string & encoded);

    static string trim(const string & str);
    static string toUpper(string str);

    static string qmarks(size_t count);

    static bool ensureDirectory(const string & path);
    // <root>/<messageId>/<unix time>_<random>_<filename>
    static string pathForAttachment(string root, int64_t messageId, string filename, bool create);

};

#endif /* MailUtils_hpp */
