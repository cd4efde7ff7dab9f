#include "rrect/core/debug.hpp"

// Initialize static members
std::size_t PhysicsDebugStats::pairs_tested = 0;
std::size_t PhysicsDebugStats::collisions = 0;
std::size_t PhysicsDebugStats::velocity_clamps = 0;
std::size_t PhysicsDebugStats::grid_updates = 0;
std::size_t PhysicsDebugStats::grid_removals = 0;
