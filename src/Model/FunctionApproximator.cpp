#include<memory>
#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/FunctionApproximator.hpp"
#include"../../include/Model/MlpApproximator.hpp"
#include"../../include/Model/CnnApproximator.hpp"

namespace ProximalPolicy
{
    std::shared_ptr<FunctionApproximator> makeApproximator(c10::ArrayRef<int64_t> observationShape,
                                                           unsigned int outputSize,
                                                           double outputGain)
    {
        if (observationShape.size() == 1)
        {
            return std::make_shared<MlpApproximator>(observationShape[0], outputSize,
                                                     std::vector<unsigned int>{100, 100, 100}, outputGain);
        }
        if (observationShape.size() == 3)
        {
            return std::make_shared<CnnApproximator>(observationShape, outputSize, outputGain);
        }
        throw std::invalid_argument("No approximator for observations of rank " +
                                    std::to_string(observationShape.size()));
    }

    TEST_CASE("makeApproximator()")
    {
        SUBCASE("Vector observations get an MLP")
        {
            auto approximator = makeApproximator({8}, 2);
            CHECK(std::dynamic_pointer_cast<MlpApproximator>(approximator) != nullptr);
            CHECK(approximator->forward(torch::rand({5, 8})).sizes().vec() == std::vector<int64_t>{5, 2});
        }

        SUBCASE("Image observations get a CNN")
        {
            auto approximator = makeApproximator({64, 64, 3}, 1);
            CHECK(std::dynamic_pointer_cast<CnnApproximator>(approximator) != nullptr);
        }

        SUBCASE("Other ranks throw")
        {
            CHECK_THROWS_AS(makeApproximator({4, 4}, 1), std::invalid_argument);
        }
    }
}
