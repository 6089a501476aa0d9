#pragma once

#ifndef PROXIMALPOLICY_CHECKPOINT_HPP
#define PROXIMALPOLICY_CHECKPOINT_HPP

#include<string>

#include"Model/Policy.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Writes every parameter of `policy` (both approximators and `logStd`) to `path`
     *
     * Missing parent directories are created.
     */
    void saveCheckpoint(const Policy &policy, const std::string &path);

    /**
     * @brief Restores parameters written by saveCheckpoint() into `policy`
     *
     * `policy` must have the same topology as the saved one.
     *
     * @throws std::runtime_error if the file cannot be read or does not match
     */
    void loadCheckpoint(Policy &policy, const std::string &path);
}

#endif //PROXIMALPOLICY_CHECKPOINT_HPP
