#pragma once

#include <cstddef>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable (the build may override)
#ifndef RRECT_ENABLE_DEBUG
#define RRECT_ENABLE_DEBUG 0
#endif

// Debug levels
#define RRECT_DEBUG_LEVEL_NONE 0
#define RRECT_DEBUG_LEVEL_BASIC 1
#define RRECT_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef RRECT_CURRENT_DEBUG_LEVEL
#define RRECT_CURRENT_DEBUG_LEVEL RRECT_DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define RRECT_DEBUG_MSG(level, x) do { \
    if (RRECT_ENABLE_DEBUG && (level) <= RRECT_CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Per-tick counters for the physics pipeline
class PhysicsDebugStats {
public:
    static void reset() {
        pairs_tested = 0;
        collisions = 0;
        velocity_clamps = 0;
        grid_updates = 0;
        grid_removals = 0;
    }

    static void countPairTested() { pairs_tested++; }
    static void countCollision() { collisions++; }
    static void countVelocityClamp() { velocity_clamps++; }
    static void countGridUpdates(std::size_t n) { grid_updates += n; }
    static void countGridRemoval() { grid_removals++; }

    static std::size_t pairsTested() { return pairs_tested; }
    static std::size_t collisionCount() { return collisions; }
    static std::size_t velocityClamps() { return velocity_clamps; }
    static std::size_t gridUpdates() { return grid_updates; }
    static std::size_t gridRemovals() { return grid_removals; }

    static void printTickStats() {
        RRECT_DEBUG_MSG(RRECT_DEBUG_LEVEL_BASIC,
            "Tick stats:\n"
            "  Pairs tested: " << pairs_tested << "\n"
            "  Collisions: " << collisions << "\n"
            "  Clamped velocities: " << velocity_clamps << "\n"
            "  Grid cell changes: " << grid_updates << "\n"
            "  Grid removals: " << grid_removals << "\n"
        );
    }

private:
    static std::size_t pairs_tested;
    static std::size_t collisions;
    static std::size_t velocity_clamps;
    static std::size_t grid_updates;
    static std::size_t grid_removals;
};
