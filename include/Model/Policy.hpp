#ifndef PROXIMALPOLICY_POLICY_HPP
#define PROXIMALPOLICY_POLICY_HPP

#include<vector>
#include<memory>

#include<torch/torch.h>
#include<torch/nn.h>

#include"FunctionApproximator.hpp"
#include"OutputLayers.hpp"
#include"../Space.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Stochastic policy and state-value estimate
     *
     * PolicyImpl owns two independent FunctionApproximators and one OutputLayer:
     * - `pi` maps states to the parameters of the action distribution (Gaussian means for a
     *   "Box" action space, logits for a "Discrete" one);
     * - `value` maps states to a scalar estimate of the expected return.
     *
     * The output layer, and therefore the distribution family, is fixed at construction
     * from the action space. All methods take a batch of states with a leading batch axis.
     *
     * Shapes returned, for a batch of B states and A action dimensions:
     * - value: [B, 1]
     * - action: [B, A] float for "Box", [B, 1] long for "Discrete"
     * - log-probability: [B, 1], summed over the action dimensions
     */
    class PolicyImpl : public torch::nn::Module
    {
    private:
        ActionSpace actionSpace;
        std::shared_ptr<FunctionApproximator> pi;
        std::shared_ptr<FunctionApproximator> value;
        std::shared_ptr<OutputLayer> outputLayer;

    public:
        /**
         * @brief Builds a policy for `actionSpace`
         *
         * @param actionSpace "Box" (one-dimensional, with one bound per dimension) or
         *        "Discrete" (one entry, the number of actions)
         * @param pi Approximator whose output width equals `actionSpace.shape[0]`
         * @param value Approximator with an output width of 1
         *
         * @throws UnsupportedActionSpace for any other or malformed action space
         * @throws std::invalid_argument if an approximator has the wrong output width
         */
        PolicyImpl(ActionSpace actionSpace,
                   std::shared_ptr<FunctionApproximator> pi,
                   std::shared_ptr<FunctionApproximator> value);

        /**
         * @brief Samples actions for a batch of states
         *
         * @return {value, action, log-probability of the action}
         */
        std::vector<torch::Tensor> act(torch::Tensor states) const;

        /**
         * @brief Like act(), but returns the mode of the distribution instead of a sample
         */
        std::vector<torch::Tensor> actDeterministic(torch::Tensor states) const;

        /**
         * @brief Log-probability of given actions under the current parameters
         *
         * The result carries gradients to `pi` and, for a Gaussian policy, to `logStd`.
         *
         * @param actions Actions as stored in an ExperienceBuffer
         * @return Tensor of shape [B, 1]
         */
        torch::Tensor evaluateActions(torch::Tensor states, torch::Tensor actions) const;

        /**
         * @brief Entropy of the action distribution for each state, shape [B]
         */
        torch::Tensor entropy(torch::Tensor states) const;

        /**
         * @brief Value estimate for each state, shape [B, 1]
         */
        torch::Tensor getValue(torch::Tensor states) const;

        /**
         * @brief Parameters optimized by the policy phase of PPO: `pi` and `logStd`
         */
        std::vector<torch::Tensor> policyParameters() const;

        /**
         * @brief Parameters optimized by the value phase of PPO
         */
        std::vector<torch::Tensor> valueParameters() const;

        inline const ActionSpace &getActionSpace() const
        {
            return actionSpace;
        }
    };

    /**
     * @brief Module holder for PolicyImpl; copies share the same parameters.
     */
    TORCH_MODULE(Policy);
}

#endif //PROXIMALPOLICY_POLICY_HPP
