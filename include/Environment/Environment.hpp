#pragma once

#ifndef PROXIMALPOLICY_ENVIRONMENT_HPP
#define PROXIMALPOLICY_ENVIRONMENT_HPP

#include<map>
#include<string>

#include<torch/torch.h>

#include"../Space.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Outcome of one Environment::step()
     */
    struct StepResult
    {
        torch::Tensor observation;           ///< Observation after the step, without a batch axis
        float reward;
        bool done;                           ///< Natural end of the episode
        std::map<std::string, float> info;   ///< Environment specific extras, e.g. "real_reward"
    };

    /**
     * @brief A single, sequential environment the agent interacts with
     *
     * Observations and actions carry no batch axis. Continuous actions are float vectors of
     * the action dimensionality, discrete actions a one-element tensor holding the index.
     * Errors raised by an implementation propagate to the caller unchanged.
     */
    class Environment
    {
    public:
        virtual ~Environment() = 0;

        /**
         * @brief Starts a new episode and returns its first observation
         */
        virtual torch::Tensor reset() = 0;

        /**
         * @brief Applies `action` and advances the environment by one step
         */
        virtual StepResult step(const torch::Tensor &action) = 0;

        virtual ActionSpace getActionSpace() const = 0;

        virtual ObservationSpace getObservationSpace() const = 0;

        /**
         * @brief Turns on-screen rendering of subsequent steps on or off
         *
         * Environments that cannot render ignore the request.
         */
        virtual void setRendering(bool) {}
    };

    inline Environment::~Environment() {}
}

#endif //PROXIMALPOLICY_ENVIRONMENT_HPP
