#pragma once

#ifndef PROXIMALPOLICY_ALGORITHM_HPP
#define PROXIMALPOLICY_ALGORITHM_HPP

#include<string>
#include<vector>

#include"../Storage.hpp"

namespace ProximalPolicy
{
    /**
     * @brief One named scalar produced by an update
     *
     * Updates return a list of these (losses, approximate KL, iteration counts); the Trainer
     * forwards them to the MetricsWriter under `name`.
     */
    struct UpdateDatum
    {
        std::string name; /**< Metric tag, e.g. "Policy loss" */
        float value;
    };

    /**
     * @brief Interface of an on-policy optimizer
     *
     * The Trainer fills an ExperienceBuffer for one epoch and hands it to update(), which
     * consumes the epoch with ExperienceBuffer::get() and adjusts the policy parameters.
     */
    class Algorithms
    {
    public:
        virtual ~Algorithms() = 0;

        /**
         * @brief Runs the gradient updates for one full epoch
         *
         * @param buffer A full buffer; it is rewound by the call
         * @return Training statistics for this epoch
         *
         * @throws BufferNotFull if the epoch has not been completely collected
         * @throws NumericInstability if a loss becomes non-finite
         */
        virtual std::vector<UpdateDatum> update(ExperienceBuffer &buffer) = 0;
    };

    inline Algorithms::~Algorithms() {}
}

#endif //PROXIMALPOLICY_ALGORITHM_HPP
