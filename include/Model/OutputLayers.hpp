#ifndef PROXIMALPOLICY_OUTPUTLAYERS_HPP
#define PROXIMALPOLICY_OUTPUTLAYERS_HPP

#include<torch/torch.h>
#include<torch/nn.h>
#include<memory>

#include"../Distribution/Distribution.hpp"

namespace ProximalPolicy {
    /**
     * @class OutputLayer
     * @brief Turns the raw output of the policy approximator into an action distribution.
     *
     * The approximator already produces one value per action dimension (continuous) or per
     * action (discrete); the output layer only adds what the distribution needs beyond that,
     * such as the state-independent log standard deviation of a Gaussian policy. One
     * OutputLayer is chosen when the Policy is constructed, from the action space.
    */
    class OutputLayer : public torch::nn::Module
    {
    public:
        virtual ~OutputLayer() = 0;

        /**
          * @brief Builds the distribution for a batch of approximator outputs.
          *
          * @param x Tensor of shape [B, outputs]
          * @return Distribution over the B actions
          */
        virtual std::unique_ptr<Distribution> forward(torch::Tensor x) = 0;

        /**
         * @brief Log-probability of a batch of stored actions, shape [B, 1]
         *
         * @param actions Actions in the layout returned by toStoredAction()
         */
        virtual torch::Tensor jointLogProbability(Distribution &dist, const torch::Tensor &actions) const = 0;

        /**
         * @brief Converts samples or modes of the distribution to the layout kept in an ExperienceBuffer
         */
        virtual torch::Tensor toStoredAction(const torch::Tensor &action) const = 0;
    };

    inline OutputLayer::~OutputLayer() {}

    /**
     * @class CategoricalOutput
     * @brief Interprets its input as logits of a Categorical distribution. Has no parameters.
    */
    class CategoricalOutput : public OutputLayer
    {
    public:
        std::unique_ptr<Distribution> forward(torch::Tensor x) override;

        /**
         * @param actions Indices of shape [B, 1]
         */
        torch::Tensor jointLogProbability(Distribution &dist, const torch::Tensor &actions) const override;

        /**
         * @brief [B] indices become [B, 1]
         */
        torch::Tensor toStoredAction(const torch::Tensor &action) const override;
    };

    /**
     * @class NormalOutput
     * @brief Interprets its input as the mean of a diagonal Gaussian.
     *
     * Owns the learned `logStd` vector, one entry per action dimension, initialized to
     * -0.5 and shared by every state in the batch.
    */
    class NormalOutput : public OutputLayer
    {
    private:
        torch::Tensor logStd;

    public:
        /**
         * @param numOutputs Dimensionality of the continuous action space
         */
        explicit NormalOutput(unsigned int numOutputs);

        std::unique_ptr<Distribution> forward(torch::Tensor x) override;

        /**
         * @brief Sums the element-wise log-densities over the action dimensions
         */
        torch::Tensor jointLogProbability(Distribution &dist, const torch::Tensor &actions) const override;

        torch::Tensor toStoredAction(const torch::Tensor &action) const override;

        inline const torch::Tensor &getLogStd() const { return logStd; }
    };
}

#endif //PROXIMALPOLICY_OUTPUTLAYERS_HPP
