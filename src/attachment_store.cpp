#include "threadmail/attachment_store.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"
#include "threadmail/message_store_transaction.hpp"

#include <cstdio>
#include <fstream>

#include "spdlog/spdlog.h"

LocalAttachmentStore::LocalAttachmentStore(std::string root) :
    _root(root)
{
}

std::string LocalAttachmentStore::root() {
    return _root;
}

std::shared_ptr<Attachment> LocalAttachmentStore::storeAttachment(MessageStore & store, int64_t messageId, const AttachmentUpload & upload) {
    auto attachment = std::make_shared<Attachment>(messageId, upload.filename, upload.contentType, (int64_t)upload.data.size(), "");
    std::string path = MailUtils::pathForAttachment(_root, messageId, attachment->safeFilename(), true);
    attachment->_data["path"] = path;

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            throw MailException(THREADMAIL_ERROR_PERSISTENCE, "Could not open " + path + " for writing");
        }
        out.write(upload.data.data(), upload.data.size());
        if (!out.good()) {
            throw MailException(THREADMAIL_ERROR_PERSISTENCE, "Could not write " + path);
        }
    }

    try {
        MessageStoreTransaction transaction(&store, "storeAttachment");
        store.save(attachment.get());
        transaction.commit();
    } catch (SQLite::Exception & ex) {
        std::remove(path.c_str());
        throw MailException(THREADMAIL_ERROR_PERSISTENCE, "Failed to record attachment " + upload.filename + ": " + ex.what());
    }

    spdlog::get("logger")->info("Stored attachment {} ({} bytes) for message {}", attachment->filename(), attachment->size(), messageId);
    return attachment;
}
