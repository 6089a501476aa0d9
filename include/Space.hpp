#pragma once

#ifndef PROXIMALPOLICY_SPACE_HPP
#define PROXIMALPOLICY_SPACE_HPP

#include<limits>
#include<string>
#include<vector>

namespace ProximalPolicy
{
    /**
     * @brief Description of the action space exposed by an environment
     *
     * Follows gym naming: `type` is "Box" for continuous actions (shape holds the
     * action dimensionality) or "Discrete" for categorical actions (shape holds the
     * number of actions). Bounds are only meaningful for "Box" spaces.
     */
    struct ActionSpace
    {
        std::string type;
        std::vector<int64_t> shape;
        std::vector<float> low;  ///< Per-dimension lower bound ("Box" only)
        std::vector<float> high; ///< Per-dimension upper bound ("Box" only)
    };

    struct ObservationSpace
    {
        std::vector<int64_t> shape;
    };

    inline bool isDiscrete(const ActionSpace &space)
    {
        return space.type == "Discrete";
    }
}

#endif //PROXIMALPOLICY_SPACE_HPP
