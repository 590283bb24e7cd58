#include <lfq/concurrent_queue.hpp>

#include <cstdint>

namespace lfq {

template class ConcurrentQueue<std::uint64_t>;
template class ConcurrentQueue<std::uint32_t>;

}  // namespace lfq
