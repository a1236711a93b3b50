/** AttachmentStore [Threadmail]
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

#ifndef AttachmentStore_hpp
#define AttachmentStore_hpp

#include <stdint.h>
#include <memory>
#include <string>

#include "threadmail/message_store.hpp"
#include "threadmail/models/attachment.hpp"

struct AttachmentUpload {
    std::string filename;
    std::string contentType;
    std::string data;
};

class AttachmentStore {
public:
    virtual ~AttachmentStore() {}

    // Persists the bytes and records them against messageId. Throws
    // MailException when either step fails.
    virtual std::shared_ptr<Attachment> storeAttachment(MessageStore & store, int64_t messageId, const AttachmentUpload & upload) = 0;
};

class LocalAttachmentStore : public AttachmentStore {
    std::string _root;

public:
    LocalAttachmentStore(std::string root);

    std::shared_ptr<Attachment> storeAttachment(MessageStore & store, int64_t messageId, const AttachmentUpload & upload);

    std::string root();
};

#endif /* AttachmentStore_hpp */
