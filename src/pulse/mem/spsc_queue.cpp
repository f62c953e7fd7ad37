/**
 * @file spsc_queue.cpp
 * @brief Explicit template instantiations for SpscQueue to reduce code bloat.
*/

#include "pulse/mem/spsc_queue.hpp"
#include "pulse/mem/packet.hpp"
namespace pulse::mem {

    /// Explicit instantiations of SpscQueue for commonly used types.
    /// This ensures one compiled instance instead of every TU instantiating its own.

    template class SpscQueue<int>;    // For unit tests and benchmarks
    template class SpscQueue<Packet>; // Link rings
} // namespace pulse::mem
