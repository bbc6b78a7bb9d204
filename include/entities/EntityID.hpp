/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_ID_HPP
#define ENTITY_ID_HPP

#include <cstdint>

namespace Spacegame {

using EntityID = uint32_t;

// Placeholder id; never handed out by the registry
constexpr EntityID INVALID_ENTITY = 0;

} // namespace Spacegame

#endif // ENTITY_ID_HPP
