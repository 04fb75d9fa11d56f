#ifndef TICKHOOK_RECEIPT_FOLD_HPP
#define TICKHOOK_RECEIPT_FOLD_HPP

#include <tickhook/types.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace tickhook {

struct ReceiptFold {
    uint64_t root_hash = 0;
    uint64_t count = 0;
    uint64_t first_timestamp_ms = 0;
    uint64_t last_timestamp_ms = 0;
    uint64_t total_ticks = 0;
    uint64_t budget_violations = 0;
};

/**
 * Consumer-side compaction of the receipt stream before it reaches the
 * audit log. Receipts are XOR-merged into a fold that closes every
 * 2^fold_shift receipts. Null receipts (zero content hash) and exact
 * duplicates (a receipt id already in the open fold) are pruned.
 *
 * XOR is order-independent, so the same receipt set always yields the same
 * root no matter how lanes interleaved. Not thread-safe; one consumer.
 */
class ReceiptFolder {
public:
    static constexpr unsigned MAX_FOLD_SHIFT = 16;

    explicit ReceiptFolder(unsigned fold_shift)
        : fold_size_(fold_size_for(fold_shift)) {}

    // Returns the closed fold when this receipt completes one
    std::optional<ReceiptFold> add(const ReceiptEntry& receipt) {
        if (receipt.content_hash == 0 || !seen_.insert(receipt.id).second) {
            ++pruned_;
            return std::nullopt;
        }

        current_.root_hash ^= mix(receipt);
        if (current_.count == 0) {
            current_.first_timestamp_ms = receipt.timestamp_ms;
        }
        current_.last_timestamp_ms = receipt.timestamp_ms;
        current_.total_ticks += receipt.ticks;
        if (receipt.budget_violation) {
            ++current_.budget_violations;
        }
        ++current_.count;

        if (current_.count >= fold_size_) {
            return take();
        }
        return std::nullopt;
    }

    // Closes a partial fold, nullopt if it is empty
    std::optional<ReceiptFold> flush() {
        if (current_.count == 0) {
            return std::nullopt;
        }
        return take();
    }

    uint64_t fold_size() const { return fold_size_; }
    uint64_t pruned() const { return pruned_; }
    uint64_t pending() const { return current_.count; }

private:
    static uint64_t fold_size_for(unsigned fold_shift) {
        if (fold_shift > MAX_FOLD_SHIFT) {
            throw std::invalid_argument("ReceiptFolder fold_shift too large");
        }
        return uint64_t{1} << fold_shift;
    }

    // Binds the content hash to the receipt id so two receipts of identical
    // content do not cancel each other out
    static uint64_t mix(const ReceiptEntry& receipt) {
        uint64_t x = receipt.content_hash ^ (receipt.id * 0x9E3779B97F4A7C15ULL);
        x ^= x >> 33;
        x *= 0xFF51AFD7ED558CCDULL;
        x ^= x >> 33;
        return x;
    }

    ReceiptFold take() {
        ReceiptFold fold = current_;
        current_ = ReceiptFold{};
        seen_.clear();
        return fold;
    }

    const uint64_t fold_size_;
    ReceiptFold current_;
    std::unordered_set<uint64_t> seen_;
    uint64_t pruned_ = 0;
};

} // namespace tickhook

#endif // TICKHOOK_RECEIPT_FOLD_HPP
