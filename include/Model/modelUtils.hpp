#ifndef PROXIMALPOLICY_MODELUTILS_HPP
#define PROXIMALPOLICY_MODELUTILS_HPP

#include<torch/nn.h>

#include<string>

namespace ProximalPolicy
{
    /**
     * @brief Fills `tensor` in place with a (semi) orthogonal matrix scaled by `gain`
     *
     * The tensor is viewed as `[size(0), numel / size(0)]`; the orthogonal factor of the QR
     * decomposition of a Gaussian matrix of that shape is copied into it, with the signs of
     * `diag(R)` applied so the result is uniformly distributed.
     *
     * @param tensor Tensor with at least 2 dimensions; lower ranks are returned untouched
     * @param gain Multiplier applied after the copy
     * @return `tensor`
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain);

    /**
     * @brief Initializes every parameter of a module by name
     *
     * Parameters whose name contains "weight" receive orthogonal_() with `weightGain`,
     * those containing "bias" are filled with the constant `biasGain`. Anything else
     * (for example a log standard deviation) is left alone.
     *
     * @param parameters Result of `module->named_parameters()`; tensors are modified in place
     */
    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters, double weightGain, double biasGain);
}

#endif //PROXIMALPOLICY_MODELUTILS_HPP
