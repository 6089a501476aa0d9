#include<cmath>
#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/CnnApproximator.hpp"
#include"../../include/Model/modelUtils.hpp"

namespace ProximalPolicy
{
    CnnApproximator::CnnApproximator(c10::ArrayRef<int64_t> observationShape,
                                     unsigned int outputSize,
                                     double outputGain) :
        FunctionApproximator(outputSize),
        output(nullptr),
        flattenedSize(0)
    {
        if (observationShape.size() != 3)
        {
            throw std::invalid_argument("CnnApproximator needs [H, W, C] observations, got rank " +
                                        std::to_string(observationShape.size()));
        }
        const auto height = observationShape[0];
        const auto width = observationShape[1];
        const auto channels = observationShape[2];
        if (height < 36 || width < 36 || channels < 1)
        {
            throw std::invalid_argument("CnnApproximator needs at least 36x36 images, got " +
                                        std::to_string(height) + "x" + std::to_string(width));
        }

        features = torch::nn::Sequential(
            torch::nn::Conv2d(torch::nn::Conv2dOptions(channels, 32, 8).stride(4)),
            torch::nn::Functional(torch::relu),
            torch::nn::Conv2d(torch::nn::Conv2dOptions(32, 64, 4).stride(2)),
            torch::nn::Functional(torch::relu),
            torch::nn::Conv2d(torch::nn::Conv2dOptions(64, 32, 3).stride(1)),
            torch::nn::Functional(torch::relu),
            torch::nn::Flatten());

        {
            torch::NoGradGuard no_grad;
            flattenedSize = features->forward(torch::zeros({1, channels, height, width})).size(1);
        }
        output = torch::nn::Linear(flattenedSize, outputSize);

        register_module("features", features);
        register_module("output", output);

        initWeights(features->named_parameters(), std::sqrt(2.), 0);
        initWeights(output->named_parameters(), outputGain, 0);
        train();
    }

    torch::Tensor CnnApproximator::forward(torch::Tensor states)
    {
        auto x = states.permute({0, 3, 1, 2}).contiguous();
        return output->forward(features->forward(x));
    }

    TEST_CASE("CnnApproximator")
    {
        SUBCASE("Flattened size matches the 84x84 Atari layout")
        {
            auto approximator = CnnApproximator({84, 84, 4}, 6);
            CHECK(approximator.getFlattenedSize() == 32 * 7 * 7);
        }

        SUBCASE("Output tensors are correct shapes")
        {
            auto approximator = CnnApproximator({48, 40, 2}, 1);
            auto outputs = approximator.forward(torch::rand({3, 48, 40, 2}));

            CHECK(outputs.sizes().vec() == std::vector<int64_t>{3, 1});
        }

        SUBCASE("Rejects unusable shapes")
        {
            CHECK_THROWS_AS(CnnApproximator({84, 84}, 1), std::invalid_argument);
            CHECK_THROWS_AS(CnnApproximator({20, 84, 1}, 1), std::invalid_argument);
        }
    }
}
