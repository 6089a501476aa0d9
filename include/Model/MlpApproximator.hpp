#ifndef PROXIMALPOLICY_MLPAPPROXIMATOR_HPP
#define PROXIMALPOLICY_MLPAPPROXIMATOR_HPP

#include<vector>

#include<torch/nn.h>
#include"FunctionApproximator.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Fully connected approximator for vector observations
     *
     * Stacks one `Linear` + `tanh` pair per entry of `hiddenSizes`, followed by a linear
     * output layer. Hidden weights are initialized orthogonally with gain sqrt(2), the
     * output layer with `outputGain`; all biases start at 0.
     */
    class MlpApproximator : public FunctionApproximator
    {
    private:
        torch::nn::Sequential hidden;  /**< Linear/tanh pairs */
        torch::nn::Linear output;      /**< Maps the last hidden layer to getOutputSize() */
        unsigned int numInputs;

    public:
        /**
         * @param numInputs Size of a flattened observation
         * @param outputSize Width of the output
         * @param hiddenSizes Width of each hidden layer, defaults to three layers of 100
         * @param outputGain Orthogonal gain of the output layer
         */
        MlpApproximator(unsigned int numInputs,
                        unsigned int outputSize,
                        std::vector<unsigned int> hiddenSizes = {100, 100, 100},
                        double outputGain = 1);

        torch::Tensor forward(torch::Tensor states) override;

        inline unsigned int getNumInputs() const
        {
            return numInputs;
        }
    };
}

#endif //PROXIMALPOLICY_MLPAPPROXIMATOR_HPP
