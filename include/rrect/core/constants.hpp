#ifndef RRECT_CONSTANTS_HPP
#define RRECT_CONSTANTS_HPP

namespace PhysicsConstants {

    // Fixed by the pipeline, not part of SystemConfig
    extern const double MaxVelocity;   // distance-units per second

    // Defaults for SystemConfig and the components
    extern const double DefaultSecondsPerTick;
    extern const double DefaultCellSize;
    extern const double DefaultColliderRadius;
    extern const double DefaultTileSize;
    extern const double RenderLerpFactor;

    extern const char* const DefaultForceName;

}

#endif // RRECT_CONSTANTS_HPP
