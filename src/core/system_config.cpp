#include "rrect/core/system_config.hpp"

#include <cmath>
#include <iostream>

static bool checkPositive(const char* name, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::cerr << "SystemConfig: " << name << " must be a positive finite number, got "
                  << value << std::endl;
        return false;
    }
    return true;
}

bool SystemConfig::validate() const {
    return checkPositive("SecondsPerTick", SecondsPerTick)
        && checkPositive("CellSize", CellSize)
        && checkPositive("TileSize", TileSize);
}
