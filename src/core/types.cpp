#include "core/types.hpp"

#include <type_traits>

// Timestamp is header-only; this unit pins its layout guarantees.

namespace tagsync {

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(sizeof(Timestamp) == sizeof(int64_t), "Timestamp should be a bare millisecond count");

} // namespace tagsync
