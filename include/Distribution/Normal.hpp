#pragma once

#ifndef PROXIMALPOLICY_NORMAL_HPP
#define PROXIMALPOLICY_NORMAL_HPP

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"

namespace ProximalPolicy
{
    /**
     * @class Normal
     * @brief Diagonal Gaussian over continuous actions.
     *
     * Parameterized by the mean `loc` and the log standard deviation `logScale`. The log
     * standard deviation is usually a single learned vector broadcast over the batch, so the
     * exploration noise does not depend on the state.
     *
     * @inherits Distribution
    */
    class Normal : public Distribution
    {
    private:
        torch::Tensor loc;       ///< Mean of each dimension
        torch::Tensor logScale;  ///< Log standard deviation, broadcast to `loc`
        torch::Tensor scale;     ///< exp(logScale)
    public:
        /**
         * @brief Constructs the distribution and broadcasts `logScale` against `loc`.
         *
         * @param loc Mean, shape [B, A] or [A]
         * @param logScale Log standard deviation, broadcastable to `loc`
        */
        Normal(const torch::Tensor loc, const torch::Tensor logScale);

        /**
         * @brief Entropy summed over the last (action) dimension.
         *
         * Per dimension: 0.5 + 0.5 * log(2 * pi) + logScale.
        */
        torch::Tensor entropy() override;

        /**
         * @brief Element-wise Gaussian log-density.
         *
         * Computes `-0.5 * ((value - loc) / (scale + 1e-8))^2 - logScale - 0.5 * log(2 * pi)`.
         * The small constant keeps the ratio finite for vanishing scales.
         *
         * @return Tensor of the broadcast shape of `value` and `loc`; not summed
        */
        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Draws `loc + noise * scale` with standard normal noise.
         */
        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {}) override;

        torch::Tensor mode() override;

        inline torch::Tensor getLoc() { return loc; }
        inline torch::Tensor getLogScale() { return logScale; }
        inline torch::Tensor getScale() { return scale; }
    };
}

#endif //PROXIMALPOLICY_NORMAL_HPP
