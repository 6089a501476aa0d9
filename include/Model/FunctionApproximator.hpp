#ifndef PROXIMALPOLICY_FUNCTIONAPPROXIMATOR_HPP
#define PROXIMALPOLICY_FUNCTIONAPPROXIMATOR_HPP

#include<memory>
#include<vector>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<torch/nn.h>

namespace ProximalPolicy
{
    /**
     * @brief Network mapping a batch of states to a batch of fixed-size vectors
     *
     * A Policy holds two independent approximators: one whose output parameterizes the
     * action distribution (width = action dimensionality or number of actions, no output
     * nonlinearity) and one producing the scalar state value (width 1). Subclasses decide
     * the topology; nothing else in the training pipeline depends on it.
     */
    class FunctionApproximator : public torch::nn::Module
    {
    private:
        unsigned int outputSize;

    public:
        explicit FunctionApproximator(unsigned int outputSize) : outputSize(outputSize) {}

        virtual ~FunctionApproximator() = default;

        /**
         * @brief Evaluates the network
         *
         * @param states Tensor of shape [B, ...observation shape]
         * @return Tensor of shape [B, getOutputSize()]
         */
        virtual torch::Tensor forward(torch::Tensor states) = 0;

        inline unsigned int getOutputSize() const
        {
            return outputSize;
        }
    };

    /**
     * @brief Picks the reference topology for an observation shape
     *
     * 1-D observations get an MlpApproximator, 3-D `[H, W, C]` observations a
     * CnnApproximator.
     *
     * @param outputGain Gain for the orthogonal initialization of the output layer
     * @throws std::invalid_argument for any other observation rank
     */
    std::shared_ptr<FunctionApproximator> makeApproximator(c10::ArrayRef<int64_t> observationShape,
                                                           unsigned int outputSize,
                                                           double outputGain = 1);
}

#endif //PROXIMALPOLICY_FUNCTIONAPPROXIMATOR_HPP
