#include "rrect/core/constants.hpp"

namespace PhysicsConstants {

    const double MaxVelocity = 256.0;

    const double DefaultSecondsPerTick = 1.0 / 64.0;
    const double DefaultCellSize       = 20.0;
    const double DefaultColliderRadius = 0.2;
    const double DefaultTileSize       = 8.0;
    const double RenderLerpFactor      = 0.2;

    const char* const DefaultForceName = "default_force";

} // namespace PhysicsConstants
