#pragma once

#include "swiftstore/storage/transport.hpp"
#include "swiftstore/storage/types.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swiftstore {

class TransferMetrics;

// One page of a marker-paginated listing.
// marker is the identity of the last entry; exhausted means no page follows.
template <typename T>
struct ListingPage {
    std::vector<T> entries;
    std::string marker;
    bool exhausted = false;
};

// Fetches the page that follows `marker` (empty marker = first page)
template <typename T>
class PageSource {
public:
    virtual ~PageSource() = default;

    virtual ListingPage<T> fetch(const std::string& marker) = 0;
};

/// Pull-based cursor over a paginated listing.
///
/// State is {source, marker, exhausted} and nothing else. Each page is a
/// separate server snapshot, so entries added or removed while iterating may
/// be seen twice or not at all. Once exhausted, the source is never called
/// again until reset().
template <typename T>
class ListingCursor {
public:
    explicit ListingCursor(std::shared_ptr<PageSource<T>> source)
        : source_(std::move(source)) {}

    // Next entry, or nullopt once the listing is exhausted
    std::optional<T> next() {
        while (position_ >= buffer_.size()) {
            auto page = next_page();
            if (!page) return std::nullopt;
            buffer_ = std::move(*page);
            position_ = 0;
        }
        return buffer_[position_++];
    }

    // Next whole page, or nullopt once the listing is exhausted.
    // A page that ends the listing may still carry entries.
    std::optional<std::vector<T>> next_page() {
        if (exhausted_) return std::nullopt;

        auto page = source_->fetch(marker_);
        ++pages_fetched_;

        // An empty page ends the listing even if the source did not say so
        if (page.exhausted || page.entries.empty()) {
            exhausted_ = true;
        } else {
            marker_ = page.marker;
        }

        if (page.entries.empty()) return std::nullopt;
        return std::move(page.entries);
    }

    // Start over from the first page
    void reset() {
        marker_.clear();
        exhausted_ = false;
        buffer_.clear();
        position_ = 0;
    }

    const std::string& marker() const { return marker_; }
    bool exhausted() const { return exhausted_ && position_ >= buffer_.size(); }
    size_t pages_fetched() const { return pages_fetched_; }

private:
    std::shared_ptr<PageSource<T>> source_;
    std::string marker_;
    bool exhausted_ = false;
    std::vector<T> buffer_;
    size_t position_ = 0;
    size_t pages_fetched_ = 0;
};

/// Lazily fetched sequence over a paginated listing.
///
/// Nothing is requested until iteration starts. Every begin() restarts from
/// the first page with a fresh cursor; stopping early leaves later pages
/// unrequested.
template <typename T>
class LazyList {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;  // end
        explicit iterator(std::shared_ptr<ListingCursor<T>> cursor)
            : cursor_(std::move(cursor)) {
            advance();
        }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const {
            if (!current_ || !other.current_) return !current_ && !other.current_;
            return cursor_ == other.cursor_ && index_ == other.index_;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance() {
            current_ = cursor_->next();
            ++index_;
        }

        std::shared_ptr<ListingCursor<T>> cursor_;
        std::optional<T> current_;
        size_t index_ = 0;
    };

    explicit LazyList(std::shared_ptr<PageSource<T>> source)
        : source_(std::move(source)) {}

    iterator begin() const {
        return iterator(std::make_shared<ListingCursor<T>>(source_));
    }
    iterator end() const { return iterator(); }

    ListingCursor<T> cursor() const { return ListingCursor<T>(source_); }

    // Drain every page
    std::vector<T> to_vector() const {
        std::vector<T> out;
        auto c = cursor();
        while (auto page = c.next_page()) {
            for (auto& entry : *page) {
                out.push_back(std::move(entry));
            }
        }
        return out;
    }

private:
    std::shared_ptr<PageSource<T>> source_;
};

// GET /<container>?marker=... on the storage endpoint
class ObjectPageSource : public PageSource<Object> {
public:
    ObjectPageSource(Transport& transport, Container container,
                     TransferMetrics* metrics = nullptr);

    ListingPage<Object> fetch(const std::string& marker) override;

private:
    Transport& transport_;
    Container container_;
    std::string path_;
    TransferMetrics* metrics_;
};

// GET on the storage URL itself
class ContainerPageSource : public PageSource<Container> {
public:
    explicit ContainerPageSource(Transport& transport, TransferMetrics* metrics = nullptr);

    ListingPage<Container> fetch(const std::string& marker) override;

private:
    Transport& transport_;
    TransferMetrics* metrics_;
};

} // namespace swiftstore
