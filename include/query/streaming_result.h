#pragma once

#include "storage/store_client.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace quarry {
namespace query {

/// Read side of a ResourceScope's release flag.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    bool isCancelled() const { return flag_ && flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<const std::atomic<bool>> flag_;
};

/**
 * Owner of the results produced within it (a persistence session or request).
 * flush() or destruction releases the scope; results bound to its token stop
 * reading from the store but keep what they already materialised.
 */
class ResourceScope {
public:
    ResourceScope() : released_(std::make_shared<std::atomic<bool>>(false)) {}
    ~ResourceScope() { flush(); }

    ResourceScope(const ResourceScope&) = delete;
    ResourceScope& operator=(const ResourceScope&) = delete;

    CancellationToken token() const { return CancellationToken(released_); }
    void flush() { released_->store(true, std::memory_order_release); }
    bool isReleased() const { return released_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> released_;
};

/**
 * Lazy, forward-only view over a store cursor. Records are converted on
 * first access and cached, so earlier elements stay valid after the stream
 * disconnects. The cancellation token is checked before every pull; store
 * failures surface as StoreAccessError.
 */
class StreamingResult {
public:
    using Converter = std::function<nlohmann::json(const Record&)>;

    StreamingResult(std::unique_ptr<RecordCursor> cursor, Converter convert,
                    CancellationToken token, std::string queryText);

    static std::unique_ptr<StreamingResult> empty(std::string queryText);

    /// Element i, pulling from the store as needed. Throws std::out_of_range past the end.
    const nlohmann::json& at(size_t index);
    /// Forces full consumption (up to a disconnect).
    size_t size();
    size_t materializedCount() const { return items_.size(); }

    void disconnect();
    bool isDisconnected() const { return disconnected_; }
    bool isExhausted() const { return cursor_ == nullptr; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = nlohmann::json;
        using difference_type = std::ptrdiff_t;
        using pointer = const nlohmann::json*;
        using reference = const nlohmann::json&;

        iterator() = default;
        iterator(StreamingResult* owner, size_t index) : owner_(owner), index_(index) {}

        reference operator*() const { return owner_->items_[index_]; }
        pointer operator->() const { return &owner_->items_[index_]; }
        iterator& operator++() {
            ++index_;
            return *this;
        }
        bool operator==(const iterator& other) const { return atEnd() == other.atEnd() && (atEnd() || index_ == other.index_); }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        bool atEnd() const { return owner_ == nullptr || !owner_->ensure(index_); }

        StreamingResult* owner_ = nullptr;
        size_t index_ = 0;
    };

    iterator begin() { return iterator(this, 0); }
    iterator end() { return iterator(); }

private:
    // True once element `index` is materialised
    bool ensure(size_t index);
    bool pull();

    std::unique_ptr<RecordCursor> cursor_;
    Converter convert_;
    CancellationToken token_;
    std::string query_text_;
    std::vector<nlohmann::json> items_;
    bool disconnected_ = false;
};

} // namespace query
} // namespace quarry
