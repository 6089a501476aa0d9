#ifndef PROXIMALPOLICY_CNNAPPROXIMATOR_HPP
#define PROXIMALPOLICY_CNNAPPROXIMATOR_HPP

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"FunctionApproximator.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Convolutional approximator for image observations
     *
     * Observations arrive channels-last, `[B, H, W, C]`, the layout produced by frame
     * stacking, and are permuted to `[B, C, H, W]` before three ReLU convolutions
     * (32 filters 8x8 stride 4, 64 filters 4x4 stride 2, 32 filters 3x3 stride 1). The
     * flattened feature map feeds a single linear output layer.
     */
    class CnnApproximator : public FunctionApproximator
    {
    private:
        torch::nn::Sequential features;  /**< Convolutions and flatten */
        torch::nn::Linear output;
        int64_t flattenedSize;

    public:
        /**
         * @param observationShape `[H, W, C]`; the image must be at least 36x36 so every
         *        convolution has a non-empty output
         * @param outputSize Width of the output
         * @param outputGain Orthogonal gain of the output layer
         * @throws std::invalid_argument if the shape is not 3-D or too small
         */
        CnnApproximator(c10::ArrayRef<int64_t> observationShape,
                        unsigned int outputSize,
                        double outputGain = 1);

        torch::Tensor forward(torch::Tensor states) override;

        inline int64_t getFlattenedSize() const
        {
            return flattenedSize;
        }
    };
}

#endif //PROXIMALPOLICY_CNNAPPROXIMATOR_HPP
