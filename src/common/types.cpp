// =============================================================================
// gpack - Common Type Definitions Implementation
// =============================================================================

#include "gpack/common/types.h"

#include <fmt/format.h>

namespace gpack {

VoidResult PackerOptions::validate() const {
    if (capacityBits > kWordBits) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("capacityBits ({}) must not exceed {}", capacityBits,
                                         kWordBits));
    }
    if (grainSize == 0) {
        return makeVoidError(ErrorCode::kUsageError, "grainSize must be greater than zero");
    }
    return makeVoidSuccess();
}

}  // namespace gpack
