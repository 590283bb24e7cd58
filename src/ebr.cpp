#include <lfq/ebr.hpp>

#include <memory>
#include <utility>

namespace lfq {

namespace {

std::uint64_t next_manager_id() noexcept {
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

}  // namespace

thread_local std::vector<EBRManager::LocalSlot> EBRManager::tls_slots_;

EBRManager::EBRManager() : id_(next_manager_id()) {}

void EBRManager::RetiredPointer::reclaim_pointer(Retirable* node) noexcept {
    auto* rp = static_cast<RetiredPointer*>(node);
    if (rp->deleter) {
        rp->deleter(rp->ptr);
    }
    delete rp;
}

EBRManager::~EBRManager() {
    ThreadRecord* rec = records_.exchange(nullptr, std::memory_order_acquire);
    while (rec != nullptr) {
        for (Retirable* head : rec->retired) {
            while (head != nullptr) {
                Retirable* next = head->retired_next;
                head->reclaim(head);
                head = next;
            }
        }
        ThreadRecord* next = rec->next;
        delete rec;
        rec = next;
    }
    pending_.store(0, std::memory_order_relaxed);

    // Other threads' cache entries for this manager never match again: ids are not reused.
    for (auto& slot : tls_slots_) {
        if (slot.owner_id == id_) {
            slot = LocalSlot{0, nullptr, 0};
        }
    }
}

EBRManager::LocalSlot* EBRManager::find_slot() noexcept {
    for (auto& slot : tls_slots_) {
        if (slot.owner_id == id_) {
            return &slot;
        }
    }
    return nullptr;
}

EBRManager::LocalSlot& EBRManager::bind_slot(ThreadRecord* record) {
    for (auto& slot : tls_slots_) {
        if (slot.owner_id == 0) {
            slot = LocalSlot{id_, record, 0};
            return slot;
        }
    }
    if (tls_slots_.size() >= kLocalSlots) {
        for (auto& slot : tls_slots_) {
            if (slot.depth == 0) {
                slot = LocalSlot{id_, record, 0};
                return slot;
            }
        }
    }
    tls_slots_.push_back(LocalSlot{id_, record, 0});
    return tls_slots_.back();
}

bool EBRManager::try_claim(ThreadRecord* record) noexcept {
    bool expected = false;
    return !record->in_use.load(std::memory_order_relaxed) &&
           record->in_use.compare_exchange_strong(expected, true, std::memory_order_acquire,
                                                  std::memory_order_relaxed);
}

EBRManager::ThreadRecord* EBRManager::acquire_record() {
    for (ThreadRecord* rec = records_.load(std::memory_order_acquire); rec != nullptr;
         rec = rec->next) {
        if (try_claim(rec)) {
            return rec;
        }
    }

    auto* rec = new ThreadRecord();
    rec->in_use.store(true, std::memory_order_relaxed);

    ThreadRecord* head = records_.load(std::memory_order_relaxed);
    do {
        rec->next = head;
    } while (!records_.compare_exchange_weak(head, rec, std::memory_order_release,
                                             std::memory_order_relaxed));
    record_count_.fetch_add(1, std::memory_order_relaxed);
    return rec;
}

void EBRManager::enter_critical() {
    LocalSlot* slot = find_slot();
    if (slot != nullptr && slot->depth > 0) {
        ++slot->depth;
        return;
    }

    if (slot == nullptr) {
        slot = &bind_slot(nullptr);
    }

    ThreadRecord* rec = slot->record;
    if (rec == nullptr || !try_claim(rec)) {
        rec = acquire_record();
        slot->record = rec;
    }

    rec->local_epoch.store(global_epoch_.load(std::memory_order_acquire),
                           std::memory_order_relaxed);
    // Publish the pin before any pointer is loaded from the protected structure.
    std::atomic_thread_fence(std::memory_order_seq_cst);
    slot->depth = 1;
}

void EBRManager::exit_critical() noexcept {
    LocalSlot* slot = find_slot();
    if (slot == nullptr || slot->depth == 0) {
        return;
    }
    if (--slot->depth > 0) {
        return;
    }

    ThreadRecord* rec = slot->record;
    rec->local_epoch.store(kQuiescent, std::memory_order_release);
    rec->in_use.store(false, std::memory_order_release);
}

void EBRManager::retire(Retirable* node, Retirable::Reclaimer reclaim) {
    if (node == nullptr) {
        return;
    }
    node->reclaim = reclaim;

    LocalSlot* slot = find_slot();
    if (slot != nullptr && slot->depth > 0) {
        retire_into(slot->record, node);
        return;
    }

    EpochGuard guard(*this);
    retire_into(find_slot()->record, node);
}

void EBRManager::retire(void* ptr, std::function<void(void*)> deleter) {
    if (ptr == nullptr) {
        return;
    }

    auto holder = std::make_unique<RetiredPointer>();
    holder->ptr = ptr;
    holder->deleter = std::move(deleter);
    retire(holder.get(), &RetiredPointer::reclaim_pointer);
    (void)holder.release();
}

void EBRManager::retire_into(ThreadRecord* record, Retirable* node) noexcept {
    const std::uint64_t epoch = global_epoch_.load(std::memory_order_seq_cst);
    Retirable*& bucket = record->retired[epoch % kNumGenerations];
    node->retired_epoch = epoch;
    node->retired_next = bucket;
    bucket = node;
    ++record->retired_total;
    pending_.fetch_add(1, std::memory_order_relaxed);

    if (record->retired_total >= record->reclaim_at) {
        (void)try_advance_epoch();
        (void)reclaim_record(record, current_epoch());
    }
}

bool EBRManager::try_advance_epoch() noexcept {
    std::uint64_t current = global_epoch_.load(std::memory_order_acquire);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    for (const ThreadRecord* rec = records_.load(std::memory_order_acquire); rec != nullptr;
         rec = rec->next) {
        const std::uint64_t e = rec->local_epoch.load(std::memory_order_acquire);
        if (e != kQuiescent && e < current) {
            return false;
        }
    }
    return global_epoch_.compare_exchange_strong(current, current + 1, std::memory_order_seq_cst,
                                                 std::memory_order_relaxed);
}

std::size_t EBRManager::reclaim_record(ThreadRecord* record, std::uint64_t epoch) noexcept {
    std::size_t reclaimed = 0;

    // A node retired at epoch E is unreachable by every thread once the epoch reaches E + 2.
    if (epoch >= 2) {
        const std::uint64_t safe_epoch = epoch - 2;

        for (Retirable*& bucket : record->retired) {
            Retirable** link = &bucket;
            while (*link != nullptr) {
                Retirable* node = *link;
                if (node->retired_epoch <= safe_epoch) {
                    *link = node->retired_next;
                    node->reclaim(node);
                    ++reclaimed;
                } else {
                    link = &node->retired_next;
                }
            }
        }
    }

    record->retired_total -= reclaimed;
    record->reclaim_at = record->retired_total + config::EBR_RECLAIM_THRESHOLD;
    pending_.fetch_sub(reclaimed, std::memory_order_relaxed);
    return reclaimed;
}

std::size_t EBRManager::try_reclaim() {
    (void)try_advance_epoch();
    const std::uint64_t epoch = current_epoch();

    // The caller's own record, if it is inside a critical section, is already owned by it.
    const LocalSlot* slot = find_slot();
    ThreadRecord* mine = (slot != nullptr && slot->depth > 0) ? slot->record : nullptr;

    std::size_t reclaimed = 0;
    for (ThreadRecord* rec = records_.load(std::memory_order_acquire); rec != nullptr;
         rec = rec->next) {
        if (rec == mine) {
            reclaimed += reclaim_record(rec, epoch);
            continue;
        }
        if (try_claim(rec)) {
            reclaimed += reclaim_record(rec, epoch);
            rec->in_use.store(false, std::memory_order_release);
        }
    }
    return reclaimed;
}

std::uint64_t EBRManager::current_epoch() const noexcept {
    return global_epoch_.load(std::memory_order_acquire);
}

bool EBRManager::has_pending() const noexcept {
    return pending_.load(std::memory_order_acquire) != 0;
}

std::size_t EBRManager::pending_count() const noexcept {
    return pending_.load(std::memory_order_acquire);
}

std::size_t EBRManager::participant_count() const noexcept {
    return record_count_.load(std::memory_order_relaxed);
}

}  // namespace lfq
