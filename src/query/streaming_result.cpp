#include "query/streaming_result.h"
#include "query/query_errors.h"
#include "utils/logger.h"

#include <stdexcept>

namespace quarry {
namespace query {

StreamingResult::StreamingResult(std::unique_ptr<RecordCursor> cursor, Converter convert,
                                 CancellationToken token, std::string queryText)
    : cursor_(std::move(cursor)),
      convert_(std::move(convert)),
      token_(std::move(token)),
      query_text_(std::move(queryText)) {}

std::unique_ptr<StreamingResult> StreamingResult::empty(std::string queryText) {
    return std::make_unique<StreamingResult>(nullptr, Converter(), CancellationToken(), std::move(queryText));
}

bool StreamingResult::pull() {
    if (!cursor_) return false;
    if (token_.isCancelled()) {
        disconnect();
        return false;
    }

    std::optional<Record> record;
    try {
        record = cursor_->next();
    } catch (const StoreError& e) {
        cursor_.reset();
        QUARRY_ERROR("Store failure while reading results of {}: {}", query_text_, e.what());
        throw StoreAccessError(query_text_, e.what());
    }
    if (!record) {
        cursor_.reset();
        return false;
    }
    items_.push_back(convert_(*record));
    return true;
}

bool StreamingResult::ensure(size_t index) {
    while (items_.size() <= index) {
        if (!pull()) return false;
    }
    return true;
}

const nlohmann::json& StreamingResult::at(size_t index) {
    if (!ensure(index)) {
        throw std::out_of_range("Result index " + std::to_string(index) + " out of range (size " +
                                std::to_string(items_.size()) + ")");
    }
    return items_[index];
}

size_t StreamingResult::size() {
    while (pull()) {
    }
    return items_.size();
}

void StreamingResult::disconnect() {
    if (cursor_) {
        QUARRY_DEBUG("Disconnecting result stream of {} after {} records", query_text_, items_.size());
        cursor_.reset();
    }
    disconnected_ = true;
}

} // namespace query
} // namespace quarry
