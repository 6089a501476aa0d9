#pragma once

#ifndef PROXIMALPOLICY_STORAGE_HPP
#define PROXIMALPOLICY_STORAGE_HPP

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"Space.hpp"

namespace ProximalPolicy
{
    /**
     * @brief One epoch of experience, ready for a policy/value update
     *
     * All tensors share the leading dimension `capacity` and are aligned by index.
     * The tensors alias the buffer's storage and stay valid until the next
     * ExperienceBuffer::store().
     */
    struct EpochBatch
    {
        torch::Tensor observations; /**< [capacity, ...observation shape] */
        torch::Tensor actions;      /**< [capacity, A] float or [capacity, 1] long */
        torch::Tensor advantages;   /**< [capacity], normalized over the epoch */
        torch::Tensor returns;      /**< [capacity], discounted return-to-go */
        torch::Tensor logProbs;     /**< [capacity], log-probabilities at collection time */
    };

    /**
     * @brief Reverse discounted cumulative sum of a 1-D tensor
     *
     * Computes `y[t] = x[t] + discount * y[t + 1]` with `y[last] = x[last]`.
     *
     * @param x 1-D tensor
     * @param discount Discount applied per step
     * @return Tensor of the same shape as `x` (float, CPU)
     */
    torch::Tensor discountedCumulativeSum(const torch::Tensor &x, double discount);

    /**
     * @brief Fixed-capacity store of one epoch of transitions
     *
     * `ExperienceBuffer` keeps observations, actions, rewards, value predictions and
     * log-probabilities for exactly `capacity` steps. Episodes are packed back to back;
     * each one is closed with finishPath(), which computes its GAE-lambda advantages and
     * discounted returns. get() hands the complete epoch to the optimizer and rewinds
     * the buffer.
     *
     * Invariant: `pathStart <= ptr <= capacity`.
     */
    class ExperienceBuffer
    {
    private:
        torch::Tensor observations;    /**< [capacity, ...] */
        torch::Tensor actions;         /**< [capacity, A] or [capacity, 1] for Discrete */
        torch::Tensor rewards;         /**< [capacity] */
        torch::Tensor valuePredictions; /**< [capacity] */
        torch::Tensor logProbs;        /**< [capacity] */
        torch::Tensor advantages;      /**< [capacity], filled by finishPath() */
        torch::Tensor returns;         /**< [capacity], filled by finishPath() */
        torch::Device device;
        int64_t capacity;
        int64_t ptr;                   /**< Next slot to write */
        int64_t pathStart;             /**< First slot of the open episode */
        float gamma;
        float lambda;

    public:
        /**
         * @brief Allocates the buffer
         *
         * @param capacity Number of transitions per epoch (steps_per_epoch)
         * @param observationShape Shape of a single observation
         * @param actionSpace Determines the action tensor's shape and dtype
         * @param gamma Discount factor
         * @param lambda GAE-lambda smoothing factor
         * @param device Device where tensors are allocated
         */
        ExperienceBuffer(int64_t capacity,
            c10::ArrayRef<int64_t> observationShape,
            const ActionSpace &actionSpace,
            float gamma,
            float lambda,
            torch::Device device = torch::kCPU);

        /**
         * @brief Appends one transition at the write cursor
         *
         * @throws BufferFull if the epoch is already full
         */
        void store(const torch::Tensor &observation,
            const torch::Tensor &action,
            float reward,
            float value,
            float logProb);

        /**
         * @brief Closes the open episode `[pathStart, ptr)`
         *
         * Computes TD residuals, GAE-lambda advantages and discounted returns for the
         * episode, using `lastValue` as bootstrap: 0 for a natural termination, the
         * value estimate of the next state for a truncated episode.
         *
         * @throws NumericInstability if the results are not finite
         */
        void finishPath(float lastValue = 0);

        /**
         * @brief Returns the full epoch with normalized advantages and rewinds the buffer
         *
         * @throws BufferNotFull unless every slot has been written
         */
        EpochBatch get();

        void to(torch::Device device);

        inline int64_t getCapacity() const { return capacity; }
        inline int64_t getPtr() const { return ptr; }
        inline int64_t getPathStart() const { return pathStart; }
        inline bool isFull() const { return ptr == capacity; }

        inline const torch::Tensor &getObservations() const { return observations; }
        inline const torch::Tensor &getActions() const { return actions; }
        inline const torch::Tensor &getRewards() const { return rewards; }
        inline const torch::Tensor &getValuePredictions() const { return valuePredictions; }
        inline const torch::Tensor &getLogProbs() const { return logProbs; }
        inline const torch::Tensor &getAdvantages() const { return advantages; }
        inline const torch::Tensor &getReturns() const { return returns; }
    };
}

#endif //PROXIMALPOLICY_STORAGE_HPP
