#pragma once

#ifndef PROXIMALPOLICY_PPO_HPP
#define PROXIMALPOLICY_PPO_HPP

#include<functional>
#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"Algorithm.hpp"
#include"../Model/Policy.hpp"
#include"../Storage.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Negated PPO clipped surrogate objective
     *
     * \f[
     * L = -\mathrm{mean}\left(\min\left(r A,\ \mathrm{clip}(r, 1 - \epsilon, 1 + \epsilon) A\right)\right)
     * \f]
     *
     * For a positive advantage the objective stops growing once `ratio > 1 + clip`; for a
     * negative one once `ratio < 1 - clip`.
     *
     * @param ratio `exp(newLogProb - oldLogProb)`
     * @param advantages Same shape as `ratio`
     * @param clipRatio \f$ \epsilon \f$
     * @return Scalar loss to minimize
     */
    torch::Tensor clippedSurrogateLoss(const torch::Tensor &ratio,
                                       const torch::Tensor &advantages,
                                       float clipRatio);

    /**
     * @brief Outcome of runPolicyIterations()
     */
    struct IterationSummary
    {
        int iterations;     /**< Steps actually run */
        bool stoppedEarly;  /**< True if the KL threshold ended the loop */
    };

    /**
     * @brief Calls `step` until it has run `maxIterations` times or reports a large KL
     *
     * `step` performs one policy optimization step and returns the approximate KL divergence
     * between the policy that collected the data and the policy before the step. The loop
     * ends after the step whose KL exceeds `1.5 * targetKl`.
     */
    IterationSummary runPolicyIterations(int maxIterations,
                                         float targetKl,
                                         const std::function<float()> &step);

    /**
     * @brief Calls `step` exactly `iterations` times
     *
     * @return Value returned by the last step (the value loss), or 0 if none ran
     */
    float runValueIterations(int iterations, const std::function<float()> &step);

    /**
     * @class PPO
     * @brief Proximal Policy Optimization with separate policy and value phases
     *
     * Each update first takes up to `trainPolicyIterations` full-batch Adam steps on the
     * clipped surrogate objective, over the policy approximator and the Gaussian `logStd`,
     * stopping early when the approximate KL to the data-collecting policy exceeds
     * `1.5 * targetKl`. It then takes exactly `trainValueIterations` Adam steps on the mean
     * squared error between the value estimates and the discounted returns.
     *
     * The two phases use independent optimizers and learning rates, so the value phase never
     * touches the policy parameters and vice versa.
     *
     * @see Algorithms
     */
    class PPO : public Algorithms
    {
    private:
        Policy &policy;
        float clipRatio;
        int trainPolicyIterations;
        int trainValueIterations;
        float targetKl;
        std::unique_ptr<torch::optim::Adam> policyOptimizer;  ///< Over PolicyImpl::policyParameters()
        std::unique_ptr<torch::optim::Adam> valueOptimizer;   ///< Over PolicyImpl::valueParameters()

    public:
        /**
         * @param policy Policy updated in place; must outlive this object
         * @param clipRatio Clipping range of the probability ratio
         * @param policyLearningRate Adam step size of the policy phase
         * @param valueLearningRate Adam step size of the value phase
         * @param trainPolicyIterations Upper bound on policy steps per epoch
         * @param trainValueIterations Exact number of value steps per epoch
         * @param targetKl KL divergence the policy phase aims to stay under
         */
        PPO(Policy &policy,
            float clipRatio,
            float policyLearningRate,
            float valueLearningRate,
            int trainPolicyIterations,
            int trainValueIterations,
            float targetKl);

        /**
         * @brief Takes the epoch out of `buffer` and updates the policy with it
         *
         * @return "Policy loss", "Value loss", "KL divergence", "Entropy",
         *         "Policy iterations" and, when the KL threshold was hit,
         *         "KL divergence early stop update"
         */
        std::vector<UpdateDatum> update(ExperienceBuffer &buffer) override;

        /**
         * @brief Updates the policy with an already extracted epoch
         */
        std::vector<UpdateDatum> update(const EpochBatch &batch);
    };
}

#endif //PROXIMALPOLICY_PPO_HPP
