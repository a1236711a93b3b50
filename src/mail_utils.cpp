#include "threadmail/mail_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <random>
#include <stdexcept>

#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>

using namespace std;

static const char * BASE64_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

string MailUtils::getEnvUTF8(string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return string(val);
}

json MailUtils::merge(const json &a, const json &b)
{
    json result = a.flatten();
    json tmp = b.flatten();

    for (json::iterator it = tmp.begin(); it != tmp.end(); ++it)
    {
        result[it.key()] = it.value();
    }

    return result.unflatten();
}

string MailUtils::dumpJSON(const json & j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

string MailUtils::idRandomlyGenerated() {
    static random_device rd;
    static mutex rdMtx;
    static const char * hex = "0123456789abcdef";

    string result;
    result.reserve(32);

    lock_guard<mutex> lock(rdMtx);
    for (int i = 0; i < 16; i ++) {
        unsigned char byte = (unsigned char)(rd() & 0xFF);
        result += hex[byte >> 4];
        result += hex[byte & 0x0F];
    }
    return result;
}

bool MailUtils::isValidAddress(const string & address) {
    size_t at = address.find('@');
    if (at == string::npos || at == 0 || at == address.size() - 1) {
        return false;
    }
    if (address.find('@', at + 1) != string::npos) {
        return false;
    }
    for (char c : address) {
        if (isspace((unsigned char)c)) {
            return false;
        }
    }
    return true;
}

AddressParts MailUtils::splitAddress(const string & address) {
    AddressParts parts;
    size_t at = address.find('@');
    if (at == string::npos) {
        parts.local = address;
        return parts;
    }
    parts.local = address.substr(0, at);
    parts.domain = address.substr(at + 1);
    return parts;
}

int64_t MailUtils::nowMilliseconds() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

string MailUtils::timestampForTime(int64_t ms) {
    return formatTimestamp(ms, "%Y-%m-%dT%H:%M:%SZ");
}

string MailUtils::formatTimestamp(int64_t ms, const char * format) {
    time_t time = (time_t)(ms / 1000);
    tm ptm;
    gmtime_r(&time, &ptm);
    char buffer[64];
    strftime(buffer, 64, format, &ptm);
    return string(buffer);
}

string MailUtils::toBase64(const string & data) {
    string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t n = ((unsigned char)data[i] << 16) | ((unsigned char)data[i + 1] << 8) | (unsigned char)data[i + 2];
        out += BASE64_CHARS[(n >> 18) & 63];
        out += BASE64_CHARS[(n >> 12) & 63];
        out += BASE64_CHARS[(n >> 6) & 63];
        out += BASE64_CHARS[n & 63];
        i += 3;
    }
    size_t rem = data.size() - i;
    if (rem == 1) {
        uint32_t n = ((unsigned char)data[i] << 16);
        out += BASE64_CHARS[(n >> 18) & 63];
        out += BASE64_CHARS[(n >> 12) & 63];
        out += "==";
    } else if (rem == 2) {
        uint32_t n = ((unsigned char)data[i] << 16) | ((unsigned char)data[i + 1] << 8);
        out += BASE64_CHARS[(n >> 18) & 63];
        out += BASE64_CHARS[(n >> 12) & 63];
        out += BASE64_CHARS[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

string MailUtils::fromBase64(const string & encoded) {
    string out;
    uint32_t buffer = 0;
    int bits = 0;

    for (char c : encoded) {
        if (c == '=' ) {
            break;
        }
        if (isspace((unsigned char)c)) {
            continue;
        }
        const char * p = strchr(BASE64_CHARS, c);
        if (p == nullptr || c == '\0') {
            throw invalid_argument("invalid base64 character");
        }
        buffer = (buffer << 6) | (uint32_t)(p - BASE64_CHARS);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += (char)((buffer >> bits) & 0xFF);
        }
    }
    return out;
}

string MailUtils::trim(const string & str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

string MailUtils::toUpper(string str) {
    transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return toupper(c); });
    return str;
}

string MailUtils::qmarks(size_t count) {
    if (count == 0) {
        return "";
    }
    string qmarks{"?"};
    for (size_t i = 1; i < count; i ++) {
        qmarks = qmarks + ",?";
    }
    return qmarks;
}

bool MailUtils::ensureDirectory(const string & path) {
    if (path == "") {
        return false;
    }
    string partial = "";
    size_t pos = 0;
    while (pos != string::npos) {
        pos = path.find('/', pos + 1);
        partial = path.substr(0, pos);
        if (mkdir(partial.c_str(), 0775) != 0 && errno != EEXIST) {
            return false;
        }
    }
    return true;
}

string MailUtils::pathForAttachment(string root, int64_t messageId, string filename, bool create) {
    string dir = root + FS_PATH_SEP + to_string(messageId);
    if (create) {
        ensureDirectory(dir);
    }
    time_t now = time(nullptr);
    string token = idRandomlyGenerated().substr(0, 8);
    return dir + FS_PATH_SEP + to_string((long long)now) + "_" + token + "_" + filename;
}
