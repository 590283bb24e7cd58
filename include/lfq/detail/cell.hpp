#pragma once

#include <atomic>
#include <optional>
#include <utility>

#include <lfq/ebr.hpp>

namespace lfq::detail {

/**
 * @brief One link of a @ref lfq::ConcurrentQueue chain.
 *
 * A cell holds at most one value. The queue head always references a cell whose value is empty
 * (the sentinel); real data starts at its successor. @c next is only ever written through CAS by
 * the queue. The @ref lfq::Retirable base lets an unlinked cell be handed to the reclamation
 * manager without allocating.
 *
 * @tparam T Value type stored in the cell.
 */
template <class T>
struct Cell : Retirable {
    std::optional<T> value;
    std::atomic<Cell*> next;

    Cell() : Retirable(), value(), next(nullptr) {}

    template <class... Args>
    explicit Cell(std::in_place_t, Args&&... args)
        : Retirable(), value(std::in_place, std::forward<Args>(args)...), next(nullptr) {}

    Cell(const Cell&) = delete;
    Cell& operator=(const Cell&) = delete;

    /**
     * @brief Allocate a data cell holding a value constructed from @p args.
     * @throws std::bad_alloc or whatever the constructor of @p T throws.
     */
    template <class... Args>
    static Cell* create(Args&&... args) {
        return new Cell(std::in_place, std::forward<Args>(args)...);
    }

    /** @brief Allocate the empty cell a queue starts with. */
    static Cell* create_sentinel() { return new Cell(); }

    /** @brief Reclaimer passed to @ref lfq::EBRManager::retire. */
    static void reclaim(Retirable* node) noexcept { delete static_cast<Cell*>(node); }
};

}  // namespace lfq::detail
