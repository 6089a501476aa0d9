#pragma once

#ifndef PROXIMALPOLICY_CATEGORICAL_HPP
#define PROXIMALPOLICY_CATEGORICAL_HPP

#include"Distribution.hpp"
#include<c10/util/ArrayRef.h>

namespace ProximalPolicy
{
    /**
    * @class Categorical
    * @brief Distribution over `N` discrete actions.
    *
    * Built from unnormalized logits over the last dimension. The
    * logits are kept normalized (`logits - logsumexp(logits)`), so they double as the
    * log-softmax used for scoring actions.
    */
    class Categorical : public Distribution
    {
    private:
        torch::Tensor probs;      ///< softmax(logits)
        torch::Tensor logits;     ///< Normalized log-probabilities
        int64_t numEvents;        ///< Number of discrete actions

    public:
        /**
         * @param logits Unnormalized log-probabilities over the last dimension
         * @throws std::runtime_error if `logits` is 0-D
         */
        explicit Categorical(const torch::Tensor &logits);

        /**
         * @brief `-sum(p * log p)` over the last dimension.
         */
        torch::Tensor entropy() override;

        /**
         * @brief Log-softmax at the given action indices.
         *
         * @param value Action indices in [0, N); any dtype, converted to long
         * @return Tensor with the shape of `value`
         */
        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Draws action indices with `torch::multinomial`.
         *
         * @return Long tensor of shape [sampleShape, batch_shape]
        */
        torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) override;

        /**
         * @brief argmax over the last dimension.
         */
        torch::Tensor mode() override;

        inline torch::Tensor getLogits() { return logits; }
        inline torch::Tensor getProbability() { return probs; }
    };
}

#endif //PROXIMALPOLICY_CATEGORICAL_HPP
