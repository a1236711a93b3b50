/** IngestionAdapter [Threadmail]
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

#ifndef IngestionAdapter_hpp
#define IngestionAdapter_hpp

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "threadmail/attachment_store.hpp"
#include "threadmail/delivery_hub.hpp"
#include "threadmail/identity_resolver.hpp"
#include "threadmail/message_store.hpp"
#include "threadmail/relay_client.hpp"
#include "threadmail/models/account.hpp"
#include "threadmail/models/message.hpp"

struct SendRequest {
    std::string to;
    std::string subject;
    std::string body;
    bool isRich = false;
    std::string threadId;
    int64_t parentId = 0;
    std::vector<AttachmentUpload> attachments;

    // Attachment data arrives base64 encoded. Throws MailException on
    // malformed input.
    static SendRequest fromJSON(const nlohmann::json & json);
};

struct SendResult {
    bool success = false;
    int status = 200;
    std::string error;
    std::string message;
    std::shared_ptr<Message> stored;
    std::vector<std::string> warnings;
    int attachmentsProcessed = 0;
    int attachmentsTotal = 0;

    static SendResult failure(int status, std::string error, std::string message);

    nlohmann::json toJSON();
};

/**
 The single path every ingress takes into the thread store: validate,
 resolve the recipient, persist, then notify locally or relay remotely.
 Holds no per-request state, so one instance serves every thread.
 */
class IngestionAdapter {
    IdentityResolver * _resolver;
    DeliveryHub * _hub;
    RelayClient * _relay;
    AttachmentStore * _attachments;

    void storeAttachments(MessageStore & store, const SendRequest & request, SendResult & result);

public:
    IngestionAdapter(IdentityResolver * resolver, DeliveryHub * hub, RelayClient * relay, AttachmentStore * attachments);

    SendResult send(MessageStore & store, Account & sender, const SendRequest & request);

    SendResult acceptRelayed(MessageStore & store, const nlohmann::json & envelope);
};

#endif /* IngestionAdapter_hpp */
