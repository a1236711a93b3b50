#include "threadmail/ingestion_adapter.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"

#include "spdlog/spdlog.h"

using namespace std;
using namespace nlohmann;

static string stringField(const json & j, const char * key) {
    if (!j.count(key) || j[key].is_null()) {
        return "";
    }
    if (!j[key].is_string()) {
        throw MailException(THREADMAIL_ERROR_VALIDATION, string(key) + " must be a string");
    }
    return j[key].get<string>();
}

SendRequest SendRequest::fromJSON(const json & j) {
    if (!j.is_object()) {
        throw MailException(THREADMAIL_ERROR_VALIDATION, "Request body must be a JSON object");
    }
    SendRequest request;
    request.to = MailUtils::trim(stringField(j, "to"));
    request.subject = stringField(j, "subject");
    request.body = stringField(j, "body");
    request.threadId = stringField(j, "thread_id");

    if (j.count("is_html") && j["is_html"].is_boolean()) {
        request.isRich = j["is_html"].get<bool>();
    }
    if (j.count("parent_id") && j["parent_id"].is_number_integer()) {
        request.parentId = j["parent_id"].get<int64_t>();
    }
    if (j.count("attachments") && j["attachments"].is_array()) {
        for (const auto & a : j["attachments"]) {
            AttachmentUpload upload;
            upload.filename = stringField(a, "filename");
            upload.contentType = stringField(a, "content_type");
            try {
                upload.data = MailUtils::fromBase64(stringField(a, "data"));
            } catch (std::invalid_argument &) {
                throw MailException(THREADMAIL_ERROR_VALIDATION, "Attachment " + upload.filename + " is not valid base64");
            }
            request.attachments.push_back(upload);
        }
    }
    return request;
}

SendResult SendResult::failure(int status, string error, string message) {
    SendResult result;
    result.success = false;
    result.status = status;
    result.error = error;
    result.message = message;
    return result;
}

json SendResult::toJSON() {
    json j = {
        {"success", success},
        {"message", message},
    };
    if (!success) {
        j["error"] = error;
        return j;
    }
    if (stored) {
        j["id"] = stored->id();
        j["thread_id"] = stored->threadId();
    }
    if (warnings.size() > 0) {
        j["warnings"] = warnings;
    }
    if (attachmentsTotal > 0) {
        j["attachments"] = {
            {"processed", attachmentsProcessed},
            {"total", attachmentsTotal},
        };
    }
    return j;
}

IngestionAdapter::IngestionAdapter(IdentityResolver * resolver, DeliveryHub * hub, RelayClient * relay, AttachmentStore * attachments) :
    _resolver(resolver), _hub(hub), _relay(relay), _attachments(attachments)
{
}

SendResult IngestionAdapter::send(MessageStore & store, Account & sender, const SendRequest & request) {
    auto logger = spdlog::get("logger");

    if (request.to == "") {
        return SendResult::failure(400, "missing_recipient", "Recipient is required");
    }
    if (request.subject == "") {
        return SendResult::failure(400, "missing_subject", "Subject is required");
    }
    if (!MailUtils::isValidAddress(request.to)) {
        return SendResult::failure(400, "invalid_email", "Invalid email format: " + request.to);
    }

    shared_ptr<Account> recipient = nullptr;
    try {
        recipient = _resolver->resolveAddress(request.to);
    } catch (MailException & ex) {
        logger->error("Failed to lookup recipient {}: {}", request.to, ex.what());
        return SendResult::failure(500, "user_lookup_failed", "Failed to lookup recipient user: " + ex.debuginfo);
    }

    MessageDraft draft;
    draft.fromAccountId = sender.id();
    draft.toAccountId = recipient ? recipient->id() : 0;
    draft.fromAddress = _resolver->addressFor(sender);
    draft.toAddress = request.to;
    draft.subject = request.subject;
    draft.body = request.body;
    draft.isRich = request.isRich;
    draft.threadId = request.threadId;
    draft.parentId = request.parentId;

    SendResult result;
    try {
        result.stored = store.createMessage(draft);
    } catch (MailException & ex) {
        return SendResult::failure(500, "message_creation_failed", "Failed to create message: " + ex.debuginfo);
    }
    result.success = true;
    result.message = "Message sent successfully";
    logger->info("Message {} stored from {} to {} (thread {})", result.stored->id(), draft.fromAddress, draft.toAddress, result.stored->threadId());

    if (request.attachments.size() > 0) {
        storeAttachments(store, request, result);
    }

    if (recipient) {
        _hub->notifyNewMessage(result.stored.get());
    } else {
        string targetHost = MailUtils::splitAddress(request.to).domain;
        try {
            _relay->sendMessage(draft.fromAddress, request.to, request.subject, request.body, targetHost);
        } catch (MailException & ex) {
            string warning = "Relay to " + targetHost + " failed: " + ex.debuginfo;
            logger->warn(warning);
            result.warnings.push_back(warning);
        } catch (std::exception & ex) {
            string warning = "Relay to " + targetHost + " failed: " + ex.what();
            logger->warn(warning);
            result.warnings.push_back(warning);
        }
    }
    return result;
}

void IngestionAdapter::storeAttachments(MessageStore & store, const SendRequest & request, SendResult & result) {
    auto logger = spdlog::get("logger");
    int64_t messageId = result.stored->id();

    result.attachmentsTotal = (int)request.attachments.size();
    for (const auto & upload : request.attachments) {
        if (upload.data.size() > THREADMAIL_MAX_ATTACHMENT_BYTES) {
            string warning = "Attachment " + upload.filename + " exceeds the 50MB limit and was skipped";
            logger->warn(warning);
            result.warnings.push_back(warning);
            continue;
        }
        try {
            _attachments->storeAttachment(store, messageId, upload);
            result.attachmentsProcessed += 1;
        } catch (MailException & ex) {
            string warning = "Attachment " + upload.filename + " could not be saved: " + ex.debuginfo;
            logger->warn(warning);
            result.warnings.push_back(warning);
        }
    }

    if (result.attachmentsProcessed > 0) {
        try {
            auto reloaded = store.getMessage(messageId);
            if (reloaded) {
                result.stored = reloaded;
            }
        } catch (MailException & ex) {
            logger->warn("Could not reload message {} after attachments: {}", messageId, ex.what());
        }
    }
}

SendResult IngestionAdapter::acceptRelayed(MessageStore & store, const json & envelope) {
    auto logger = spdlog::get("logger");

    string from;
    string to;
    string subject;
    string body;
    try {
        if (!envelope.is_object()) {
            throw MailException(THREADMAIL_ERROR_VALIDATION, "Relay envelope must be a JSON object");
        }
        from = stringField(envelope, "from");
        to = stringField(envelope, "to");
        subject = stringField(envelope, "subject");
        body = stringField(envelope, "body");
    } catch (MailException & ex) {
        return SendResult::failure(400, "invalid_json", ex.debuginfo);
    }

    if (!MailUtils::isValidAddress(to)) {
        return SendResult::failure(400, "invalid_recipient_format", "Invalid recipient format");
    }
    if (from == "") {
        return SendResult::failure(400, "invalid_json", "Relay envelope is missing a sender");
    }
    AddressParts parts = MailUtils::splitAddress(to);
    if (!_resolver->isLocalDomain(parts.domain)) {
        return SendResult::failure(400, "recipient_not_on_server", "Recipient not on this server");
    }

    shared_ptr<Account> recipient = nullptr;
    try {
        recipient = _resolver->findByUsername(parts.local);
    } catch (MailException & ex) {
        logger->error("Failed to lookup relayed recipient {}: {}", to, ex.what());
        return SendResult::failure(500, "user_lookup_failed", "Failed to lookup user: " + ex.debuginfo);
    }
    if (recipient == nullptr) {
        return SendResult::failure(404, "user_not_found", "User not found");
    }

    MessageDraft draft;
    draft.toAccountId = recipient->id();
    draft.fromAddress = from;
    draft.toAddress = to;
    draft.subject = subject;
    draft.body = body;

    SendResult result;
    try {
        result.stored = store.createMessage(draft);
    } catch (MailException & ex) {
        return SendResult::failure(500, "message_storage_failed", "Failed to store message: " + ex.debuginfo);
    }
    result.success = true;
    result.message = "Message relayed successfully";
    logger->info("Accepted relayed message {} from {} for {}", result.stored->id(), from, to);

    _hub->notifyNewMessage(result.stored.get());
    return result;
}
