#pragma once

#ifndef PROXIMALPOLICY_EVALUATOR_HPP
#define PROXIMALPOLICY_EVALUATOR_HPP

#include<torch/torch.h>

#include"Environment/Environment.hpp"
#include"Model/Policy.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Plays single episodes with the current policy and reports their return
     *
     * Nothing is stored and no gradients are recorded; the policy parameters are left
     * untouched. The environment is reset at the start of every episode and left in its
     * final state afterwards.
     */
    class Evaluator
    {
    private:
        Environment &environment;
        Policy &policy;
        bool deterministic;
        bool render;
        int maxEpisodeLength;
        torch::Device device;

    public:
        /**
         * @param deterministic Take the mode of the action distribution instead of sampling
         * @param render Ask the environment to render while evaluating
         * @param maxEpisodeLength Step cap per episode, 0 for none
         * @param device Device holding the policy parameters
         */
        Evaluator(Environment &environment,
                  Policy &policy,
                  bool deterministic,
                  bool render,
                  int maxEpisodeLength = 0,
                  torch::Device device = torch::kCPU);

        /**
         * @brief Runs one episode and returns its cumulative reward
         */
        float evaluate();

        inline bool isDeterministic() const { return deterministic; }
    };
}

#endif //PROXIMALPOLICY_EVALUATOR_HPP
