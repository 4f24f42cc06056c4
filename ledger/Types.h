#ifndef PAYPROC_TYPES_H
#define PAYPROC_TYPES_H

#include <cstdint>

namespace payproc {

// Identifies one client account; stable for the duration of a run.
using ClientId = uint16_t;

// Unique per transaction across the whole input, not per client.
using TransactionId = uint32_t;

} // namespace payproc

#endif // PAYPROC_TYPES_H
