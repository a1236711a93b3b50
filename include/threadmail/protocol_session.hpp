/** ProtocolSession [Threadmail]
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

#ifndef ProtocolSession_hpp
#define ProtocolSession_hpp

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

#include "threadmail/identity_resolver.hpp"
#include "threadmail/ingestion_adapter.hpp"
#include "threadmail/line_connection.hpp"
#include "threadmail/message_store.hpp"
#include "threadmail/models/account.hpp"
#include "threadmail/models/message.hpp"

enum class ComposeState {
    Empty,
    HaveRecipient,
    HaveSubject,
};

enum class ComposeCommand {
    Send,
    Subject,
    Body,
};

struct ComposeTransition {
    ComposeState from;
    ComposeCommand command;
    ComposeState to;
};

/**
 One line-protocol connection. Each accepted connection gets its own
 session on its own thread; sessions share nothing but the store file,
 the identity resolver and the ingestion adapter.
 */
class ProtocolSession {
    std::shared_ptr<LineConnection> _conn;
    MessageStore * _store;
    IdentityResolver * _resolver;
    IngestionAdapter * _ingestion;

    std::shared_ptr<Account> _account;
    ComposeState _state;
    std::string _pendingRecipient;
    std::string _pendingSubject;

    static const std::vector<ComposeTransition> TRANSITIONS;

    void reply(const std::string & line);

    bool requireAuthenticated();

    void handleConnect(const std::string & args);
    void handleSend(const std::string & args);
    void handleSubject(const std::string & args);
    void handleBody(const std::string & args);
    void handleList();
    void handleRead(const std::string & args);
    void handleHelp();
    void handleQuit();

public:
    ProtocolSession(std::shared_ptr<LineConnection> conn, MessageStore * store, IdentityResolver * resolver, IngestionAdapter * ingestion);

    // Returns the state `command` leads to from `from`, or false when the
    // command is not allowed there.
    static bool nextComposeState(ComposeState from, ComposeCommand command, ComposeState & to);

    void run();

    // Returns false once the session should end.
    bool handleLine(const std::string & line);

    bool isAuthenticated();
    ComposeState composeState();
};

#endif /* ProtocolSession_hpp */
