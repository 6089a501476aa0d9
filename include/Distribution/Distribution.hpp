#pragma once

#ifndef PROXIMALPOLICY_DISTRIBUTION_HPP
#define PROXIMALPOLICY_DISTRIBUTION_HPP

#include<vector>
#include<torch/torch.h>

namespace ProximalPolicy
{
    /**
     * @class Distribution
     * @brief Abstract action distribution produced by an OutputLayer.
     *
     * A Distribution is built from the raw output of a FunctionApproximator for a batch of
     * states. It draws actions, scores arbitrary actions and reports its entropy and mode.
     * Implementations work on a batch of independent distributions whose shape is kept in
     * `batch_shape`; `event_shape` describes a single draw.
     *
     * @see Normal
     * @see Categorical
    */
    class Distribution
    {
    protected:
        std::vector<int64_t> batch_shape;  ///< Shape of the batch dimension(s)
        std::vector<int64_t> event_shape;  ///< Shape of the event dimension(s)

        /**
         * @brief Concatenates `sampleShapes`, `batch_shape` and `event_shape`.
        */
        std::vector<int64_t> extendedShape(c10::ArrayRef<int64_t> &sampleShapes);
    public:
        virtual ~Distribution() = 0;

        /**
         * @brief Entropy of each distribution in the batch, in nats.
        */
        virtual torch::Tensor entropy() = 0;

        /**
         * @brief Log-probability (density or mass) of `value`.
         *
         * @param value Actions broadcastable against the distribution parameters
         * @return Element-wise log-probabilities; callers sum over the event axis if needed
         */
        virtual torch::Tensor logProbability(torch::Tensor value) = 0;

        /**
         * @brief Draws samples without recording gradients.
         *
         * @param sampleShape Leading sample dimensions (default: {})
         * @return Tensor of shape [sampleShape, batch_shape, event_shape]
        */
        virtual torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) = 0;

        /**
         * @brief Most likely action, used for deterministic evaluation.
         */
        virtual torch::Tensor mode() = 0;
    };

    inline Distribution::~Distribution() {}
}

#endif //PROXIMALPOLICY_DISTRIBUTION_HPP
