/**
 * @file ebr.hpp
 * @brief Epoch-Based Reclamation (EBR) for cells unlinked from lock-free structures.
 * @author lfq contributors
 * @version 0.1.0
 *
 * Threads pin the global epoch while they may hold pointers into a shared structure. A pointer
 * retired at epoch E is destroyed only after the global epoch reaches E + 2, at which point every
 * thread that could have loaded it has since become quiescent at least once.
 */

#ifndef LFQ_EBR_HPP_
#define LFQ_EBR_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

#include <lfq/config.hpp>

namespace lfq {

/**
 * @brief Intrusive hook for objects retired without any allocation.
 *
 * Embed as a base class. The manager threads retired objects through the hook and calls
 * @c reclaim exactly once when the object is safe to destroy. The reclaim function must not throw.
 */
struct Retirable {
    using Reclaimer = void (*)(Retirable*) noexcept;

    Retirable* retired_next{nullptr};
    std::uint64_t retired_epoch{0};
    Reclaimer reclaim{nullptr};
};

/**
 * @class EBRManager
 * @brief Lock-free epoch-based reclamation domain.
 *
 * The manager keeps a push-only list of participant records. A thread entering a critical
 * section claims a record (its cached one, any free one, or a freshly allocated one), publishes
 * the epoch it observed, and owns the record until the outermost @ref exit_critical. Retired
 * objects are linked into the owner's record through their @ref Retirable hook, bucketed by epoch
 * modulo 3:
 * - Nodes retired in epoch E are stored in retired[E % 3]
 * - The global epoch advances from E to E + 1 only once every pinned record has published E
 * - Nodes can be safely reclaimed once global_epoch >= E + 2
 *
 * No mutex is involved: record ownership and the epoch are arbitrated with CAS.
 *
 * Thread-safety: all public methods except the destructor are safe for concurrent callers.
 * Bracket every access to an EBR-protected structure with @ref enter_critical and
 * @ref exit_critical (or use @ref EpochGuard). Sections nest.
 *
 * Complexity:
 * - @ref enter_critical / @ref exit_critical - O(1) when the thread's cached record is free,
 *   O(P) otherwise, where P is the number of records ever registered
 * - @ref retire - O(1) plus an amortized reclamation pass; hooked objects never allocate
 * - @ref try_reclaim - O(P + R) where R is the number of retired pointers examined
 *
 * Example:
 * @code
 * lfq::EBRManager ebr;
 * {
 *     lfq::EpochGuard g(ebr);
 *     Node* n = unlink_somehow();
 *     ebr.retire(n);  // freed two epochs later
 * }
 * ebr.try_reclaim();
 * @endcode
 */
class EBRManager {
   public:
    /** @brief Construct an empty reclamation domain at epoch 0. */
    EBRManager();

    /**
     * @brief Destroy the domain, freeing every pending pointer and every record.
     *
     * @note No thread may be inside a critical section of this manager, or call into it, while
     * the destructor runs.
     */
    ~EBRManager();

    EBRManager(const EBRManager&) = delete;
    EBRManager& operator=(const EBRManager&) = delete;
    EBRManager(EBRManager&&) = delete;
    EBRManager& operator=(EBRManager&&) = delete;

    /**
     * @brief Enter a critical section (pin the current epoch).
     *
     * Must be called before loading any pointer from an EBR-protected structure. Nested calls
     * from the same thread are counted and only the outermost pair pins/unpins.
     *
     * @throws std::bad_alloc If a new participant record has to be allocated and that fails.
     */
    void enter_critical();

    /**
     * @brief Exit a critical section.
     *
     * Pointers loaded inside the section must not be dereferenced afterwards. A call without a
     * matching @ref enter_critical is ignored.
     */
    void exit_critical() noexcept;

    /**
     * @brief Retire an intrusively hooked object for deferred destruction.
     *
     * Never allocates when the calling thread is inside a critical section of this manager, so
     * a structure can unlink a node and hand it over without a failure path in between.
     *
     * @param node Object already unlinked from every shared structure (nullptr is ignored).
     * @param reclaim Called exactly once with @p node when no thread can still reference it.
     *
     * @throws std::bad_alloc Only when called outside a critical section and a new participant
     * record has to be registered; @p node is not retired in that case.
     */
    void retire(Retirable* node, Retirable::Reclaimer reclaim);

    /**
     * @brief Retire a pointer for deferred destruction.
     *
     * @param ptr Pointer already unlinked from every shared structure (nullptr is ignored).
     * @param deleter Called exactly once with @p ptr when no thread can still reference it. Must
     *        not throw.
     *
     * @throws std::bad_alloc If the bookkeeping node cannot be allocated. The caller still owns
     * @p ptr in that case.
     */
    void retire(void* ptr, std::function<void(void*)> deleter);

    /**
     * @brief Retire a pointer using default delete.
     *
     * @tparam T Type of the pointee
     * @param ptr Pointer to retire
     *
     * @throws std::bad_alloc If bookkeeping storage grows and allocation fails.
     */
    template <typename T>
    void retire(T* ptr) {
        retire(static_cast<void*>(ptr), [](void* p) { delete static_cast<T*>(p); });
    }

    /**
     * @brief Try to advance the epoch and free pointers that are safe to free.
     *
     * Records currently owned by other threads are skipped; their pointers are freed by a later
     * call or by their next owner.
     *
     * @return Number of pointers freed
     */
    std::size_t try_reclaim();

    /** @brief Current global epoch. */
    std::uint64_t current_epoch() const noexcept;

    /** @brief Whether any retired pointer is still waiting to be freed. */
    bool has_pending() const noexcept;

    /** @brief Number of retired pointers still waiting to be freed. */
    std::size_t pending_count() const noexcept;

    /** @brief Number of participant records registered so far (peak concurrent pinning). */
    std::size_t participant_count() const noexcept;

   private:
    // Bookkeeping for pointers retired without a hook of their own.
    struct RetiredPointer : Retirable {
        void* ptr{nullptr};
        std::function<void(void*)> deleter;

        static void reclaim_pointer(Retirable* node) noexcept;
    };

    static constexpr std::size_t kNumGenerations = 3;
    static constexpr std::uint64_t kQuiescent = std::numeric_limits<std::uint64_t>::max();

    struct alignas(config::CACHE_LINE_SIZE) ThreadRecord {
        std::atomic<bool> in_use{false};
        std::atomic<std::uint64_t> local_epoch{kQuiescent};
        Retirable* retired[kNumGenerations]{};  // Intrusive lists, owner-only.
        std::size_t retired_total{0};
        std::size_t reclaim_at{config::EBR_RECLAIM_THRESHOLD};
        ThreadRecord* next{nullptr};  // Immutable once published.
    };

    // Per-thread cache entry: which record this thread last used for a given manager.
    struct LocalSlot {
        std::uint64_t owner_id;
        ThreadRecord* record;
        std::uint32_t depth;
    };

    static constexpr std::size_t kLocalSlots = 8;

    alignas(config::CACHE_LINE_SIZE) std::atomic<std::uint64_t> global_epoch_{0};
    alignas(config::CACHE_LINE_SIZE) std::atomic<ThreadRecord*> records_{nullptr};
    std::atomic<std::size_t> record_count_{0};
    alignas(config::CACHE_LINE_SIZE) std::atomic<std::size_t> pending_{0};

    // Process-unique id; thread-local cache entries of destroyed managers never match again.
    const std::uint64_t id_;

    static thread_local std::vector<LocalSlot> tls_slots_;

    LocalSlot* find_slot() noexcept;
    LocalSlot& bind_slot(ThreadRecord* record);
    ThreadRecord* acquire_record();
    bool try_claim(ThreadRecord* record) noexcept;
    void retire_into(ThreadRecord* record, Retirable* node) noexcept;
    bool try_advance_epoch() noexcept;
    std::size_t reclaim_record(ThreadRecord* record, std::uint64_t epoch) noexcept;
};

/**
 * @class EpochGuard
 * @brief RAII guard for EBR critical sections.
 *
 * Automatically calls enter_critical() on construction and exit_critical() on destruction.
 *
 * Usage:
 * @code
 * EBRManager& ebr = ...;
 * {
 *     EpochGuard guard(ebr);
 *     // Access shared data structure safely
 * } // exit_critical() called automatically
 * @endcode
 */
class EpochGuard {
   public:
    /**
     * @brief Construct an EpochGuard and enter critical section
     *
     * @param ebr Reference to the EBR manager
     * @throws std::bad_alloc See @ref EBRManager::enter_critical.
     */
    explicit EpochGuard(EBRManager& ebr) : ebr_(ebr) { ebr_.enter_critical(); }

    /**
     * @brief Destroy the EpochGuard and exit critical section
     */
    ~EpochGuard() noexcept { ebr_.exit_critical(); }

    EpochGuard(const EpochGuard&) = delete;
    EpochGuard& operator=(const EpochGuard&) = delete;
    EpochGuard(EpochGuard&&) = delete;
    EpochGuard& operator=(EpochGuard&&) = delete;

   private:
    EBRManager& ebr_;
};

}  // namespace lfq

#endif  // LFQ_EBR_HPP_
