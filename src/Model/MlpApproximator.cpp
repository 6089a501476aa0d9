#include<cmath>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/MlpApproximator.hpp"
#include"../../include/Model/modelUtils.hpp"

namespace ProximalPolicy
{
    MlpApproximator::MlpApproximator(unsigned int numInputs,
                                     unsigned int outputSize,
                                     std::vector<unsigned int> hiddenSizes,
                                     double outputGain) :
        FunctionApproximator(outputSize),
        output(nullptr),
        numInputs(numInputs)
    {
        auto inputs = numInputs;
        for (auto size : hiddenSizes)
        {
            hidden->push_back(torch::nn::Linear(inputs, size));
            hidden->push_back(torch::nn::Functional(torch::tanh));
            inputs = size;
        }
        output = torch::nn::Linear(inputs, outputSize);

        register_module("hidden", hidden);
        register_module("output", output);

        initWeights(hidden->named_parameters(), std::sqrt(2.), 0);
        initWeights(output->named_parameters(), outputGain, 0);
        train();
    }

    torch::Tensor MlpApproximator::forward(torch::Tensor states)
    {
        auto x = states.reshape({states.size(0), -1});
        if (!hidden->is_empty())
        {
            x = hidden->forward(x);
        }
        return output->forward(x);
    }

    TEST_CASE("MlpApproximator")
    {
        SUBCASE("Output tensors are correct shapes")
        {
            auto approximator = MlpApproximator(5, 3);
            auto outputs = approximator.forward(torch::rand({4, 5}));

            CHECK(outputs.sizes().vec() == std::vector<int64_t>{4, 3});
            CHECK(approximator.getOutputSize() == 3);
            CHECK(approximator.getNumInputs() == 5);
        }

        SUBCASE("Default topology has three hidden layers of 100 units")
        {
            auto approximator = MlpApproximator(5, 1);
            int linearLayers = 0;
            for (const auto &parameter : approximator.named_parameters())
            {
                if (parameter.key().find("weight") != std::string::npos)
                {
                    ++linearLayers;
                }
            }
            CHECK(linearLayers == 4);
            CHECK(approximator.named_parameters()["hidden.4.weight"].sizes().vec() ==
                  std::vector<int64_t>{100, 100});
        }

        SUBCASE("Hidden layers can be configured")
        {
            auto approximator = MlpApproximator(2, 1, {8});
            CHECK(approximator.forward(torch::rand({7, 2})).sizes().vec() == std::vector<int64_t>{7, 1});
            CHECK(approximator.parameters().size() == 4);
        }

        SUBCASE("Gradients reach every parameter")
        {
            auto approximator = MlpApproximator(3, 2);
            approximator.forward(torch::rand({6, 3})).pow(2).sum().backward();
            for (const auto &parameter : approximator.parameters())
            {
                CHECK(parameter.grad().defined());
            }
        }
    }
}
