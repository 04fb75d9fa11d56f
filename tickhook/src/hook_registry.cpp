#include <tickhook/hook_registry.hpp>
#include <tickhook/debug_log.hpp>

#include <algorithm>
#include <stdexcept>

namespace tickhook {

// =============================================================================
// HookSnapshot
// =============================================================================

HookSnapshot::HookSnapshot(uint64_t epoch, std::vector<RegisteredHook> hooks,
                           std::atomic<uint8_t>* strikes)
    : epoch_(epoch)
    , hooks_(std::move(hooks))
    , strikes_(strikes) {
    size_t padded = (hooks_.size() + SCREEN_GROUP - 1) / SCREEN_GROUP * SCREEN_GROUP;
    predicate_values_.assign(padded, 0);
    wildcard_words_.assign(padded, 0);

    for (size_t i = 0; i < hooks_.size(); ++i) {
        const TermPattern& p = hooks_[i].entry.predicate_pattern;
        predicate_values_[i] = p.wildcard ? 0 : p.value;
        wildcard_words_[i] = p.wildcard ? ~uint64_t{0} : 0;
    }

    if (!strikes_) {
        owned_strikes_ = std::make_unique<std::atomic<uint8_t>[]>(MAX_HOOKS);
        for (size_t i = 0; i < MAX_HOOKS; ++i) {
            owned_strikes_[i].store(0, std::memory_order_relaxed);
        }
        strikes_ = owned_strikes_.get();
    }
}

std::optional<size_t> HookSnapshot::index_of(HookId id) const {
    for (size_t i = 0; i < hooks_.size(); ++i) {
        if (hooks_[i].entry.id == id) {
            return i;
        }
    }
    return std::nullopt;
}

// =============================================================================
// HookRegistry
// =============================================================================

HookRegistry::HookRegistry(size_t max_readers)
    : max_readers_(max_readers) {
    if (max_readers == 0) {
        throw std::invalid_argument("HookRegistry needs at least one reader");
    }
    readers_ = std::make_unique<ReaderSlot[]>(max_readers_);
    strikes_ = std::make_unique<std::atomic<uint8_t>[]>(MAX_HOOKS);
    for (size_t i = 0; i < MAX_HOOKS; ++i) {
        strikes_[i].store(0, std::memory_order_relaxed);
    }
    current_.store(new HookSnapshot(0, {}, strikes_.get()), std::memory_order_seq_cst);
}

HookRegistry::~HookRegistry() {
    // Owners stop every reader before destroying the registry
    delete current_.load(std::memory_order_acquire);
}

void HookRegistry::register_hook(HookEntry entry, std::vector<Branch> branches) {
    if (entry.id == INVALID_ID) {
        throw std::invalid_argument("Hook id is reserved");
    }
    if (branches.empty()) {
        throw std::invalid_argument("Hook '" + entry.name + "' has no branches");
    }
    if (branches.size() > MAX_BRANCHES) {
        throw std::invalid_argument("Hook '" + entry.name + "' exceeds MAX_BRANCHES");
    }
    for (const Branch& branch : branches) {
        if (!branch.handler) {
            throw std::invalid_argument("Branch '" + branch.name + "' of hook '" +
                                        entry.name + "' has no handler");
        }
    }

    std::lock_guard<std::mutex> lock(control_mutex_);
    for (const RegisteredHook& existing : staged_) {
        if (existing.entry.id == entry.id) {
            throw std::invalid_argument("Duplicate hook id " + std::to_string(entry.id));
        }
    }
    if (staged_.size() >= MAX_HOOKS) {
        throw std::length_error("Hook set is full");
    }

    uint16_t slot = allocate_strike_slot();
    strikes_[slot].store(0, std::memory_order_relaxed);

    TICKHOOK_LOG_DEBUG("Staged hook %u '%s' (%s, %zu branches, strike slot %u)",
                       entry.id, entry.name.c_str(),
                       operation_kind_name(entry.operation_kind), branches.size(), slot);
    staged_.push_back(RegisteredHook{std::move(entry), std::move(branches), slot});
    ++pending_changes_;
}

bool HookRegistry::unregister_hook(HookId id) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    auto it = std::find_if(staged_.begin(), staged_.end(),
                           [id](const RegisteredHook& h) { return h.entry.id == id; });
    if (it == staged_.end()) {
        return false;
    }
    staged_.erase(it);
    ++pending_changes_;
    return true;
}

uint64_t HookRegistry::publish() {
    std::lock_guard<std::mutex> lock(control_mutex_);

    const HookSnapshot* old = current_.load(std::memory_order_seq_cst);
    uint64_t next_epoch = epoch_.load(std::memory_order_relaxed) + 1;

    auto fresh = std::make_unique<HookSnapshot>(next_epoch, staged_, strikes_.get());

    // Pointer first, then epoch: a reader that sees the new epoch is
    // guaranteed to load the new snapshot
    current_.store(fresh.release(), std::memory_order_seq_cst);
    epoch_.store(next_epoch, std::memory_order_seq_cst);

    retired_.emplace_back(next_epoch, std::unique_ptr<const HookSnapshot>(old));
    pending_changes_ = 0;

    size_t freed = reclaim_locked();
    TICKHOOK_LOG_DEBUG("Published hook epoch %llu (%zu hooks, %zu retired freed, %zu waiting)",
                       static_cast<unsigned long long>(next_epoch), staged_.size(),
                       freed, retired_.size());
    (void)freed;
    return next_epoch;
}

HookRegistry::ReadGuard HookRegistry::read(size_t reader) const {
    if (reader >= max_readers_) {
        throw std::out_of_range("Reader id out of range");
    }
    uint64_t epoch = epoch_.load(std::memory_order_seq_cst);
    readers_[reader].epoch.store(epoch, std::memory_order_seq_cst);
    const HookSnapshot* snapshot = current_.load(std::memory_order_seq_cst);
    return ReadGuard(this, reader, snapshot);
}

size_t HookRegistry::reclaim() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return reclaim_locked();
}

size_t HookRegistry::reclaim_locked() {
    uint64_t oldest_active = IDLE;
    for (size_t i = 0; i < max_readers_; ++i) {
        oldest_active = std::min(oldest_active, readers_[i].epoch.load(std::memory_order_seq_cst));
    }

    size_t before = retired_.size();
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [oldest_active](const auto& retired) {
                                      return retired.first <= oldest_active;
                                  }),
                   retired_.end());
    return before - retired_.size();
}

uint16_t HookRegistry::allocate_strike_slot() const {
    // Prefer a slot no live or staged hook uses, so a strike raised by an
    // in-flight dispatch of a removed hook never lands on its replacement
    HookMask used;
    for (const RegisteredHook& hook : staged_) {
        used.set(hook.strike_slot);
    }
    HookMask staged_only = used;
    const HookSnapshot* active = current_.load(std::memory_order_seq_cst);
    for (size_t i = 0; i < active->size(); ++i) {
        used.set(active->hook(i).strike_slot);
    }

    for (uint16_t slot = 0; slot < MAX_HOOKS; ++slot) {
        if (!used.test(slot)) {
            return slot;
        }
    }
    for (uint16_t slot = 0; slot < MAX_HOOKS; ++slot) {
        if (!staged_only.test(slot)) {
            return slot;
        }
    }
    // register_hook bounds staged_ to MAX_HOOKS
    throw std::length_error("No free strike slot");
}

size_t HookRegistry::retired_count() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return retired_.size();
}

size_t HookRegistry::pending_changes() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return pending_changes_;
}

size_t HookRegistry::staged_size() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return staged_.size();
}

} // namespace tickhook
