#include "threadmail/message_store_transaction.hpp"

#include "spdlog/spdlog.h"

MessageStoreTransaction::MessageStoreTransaction(MessageStore * store, std::string nameHint, bool readOnly) :
    mStore(store), mCommited(false), mStart(std::chrono::system_clock::now()), mBegan(std::chrono::system_clock::now()), mNameHint(nameHint)
{
    mStore->beginTransaction(readOnly);
    mBegan = std::chrono::system_clock::now();
}

MessageStoreTransaction::~MessageStoreTransaction() noexcept // nothrow
{
    if (false == mCommited) {
        try {
            mStore->rollbackTransaction();
        } catch (SQLite::Exception& ex) {
            // Never throw an exception in a destructor: error if
            // already rollbacked, but no harm is caused by this.
            spdlog::get("logger")->debug("Rollback of {} failed: {}", mNameHint, ex.what());
        }
    }
}

void MessageStoreTransaction::commit()
{
    if (false == mCommited) {
        mStore->commitTransaction();
        mCommited = true;

        auto now = std::chrono::system_clock::now();
        auto elapsed = now - mStart;
        long long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        if (milliseconds > 80) { // 80ms
            long long waiting = std::chrono::duration_cast<std::chrono::milliseconds>(mBegan - mStart).count();
            spdlog::get("logger")->warn("[SLOW] Transaction={} > 80ms ({}ms, {} waiting to aquire)", mNameHint, milliseconds, waiting);
        }

    } else {
        throw SQLite::Exception("Transaction already commited.");
    }
}
