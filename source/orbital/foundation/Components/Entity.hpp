#pragma once
#include <limits>

#include "common.hpp"

namespace orbital::foundation {

    using Entity = uint32;
    constexpr Entity root_entity = 0;
    constexpr uint32 invalid_entity = std::numeric_limits<uint32>::max();

}  // namespace orbital::foundation
