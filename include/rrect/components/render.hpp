#pragma once

namespace Components {

    /**
     * @brief Render-space translation derived from Position
     *
     * Written only by Systems::RenderSyncSystem. z is the draw layer and is
     * never touched by the sync.
     */
    struct RenderPose {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
        bool placed = false;  ///< false until the first sync snaps the pose

        RenderPose() = default;
        explicit RenderPose(double z) : z(z) {}
    };

} // namespace Components
