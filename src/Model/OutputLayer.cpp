#include<memory>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/OutputLayers.hpp"
#include"../../include/Distribution/Categorical.hpp"
#include"../../include/Distribution/Normal.hpp"

namespace ProximalPolicy
{
    std::unique_ptr<Distribution> CategoricalOutput::forward(torch::Tensor x)
    {
        return std::make_unique<Categorical>(x);
    }

    torch::Tensor CategoricalOutput::jointLogProbability(Distribution &dist, const torch::Tensor &actions) const
    {
        return dist.logProbability(actions.reshape({actions.size(0)})).unsqueeze(-1);
    }

    torch::Tensor CategoricalOutput::toStoredAction(const torch::Tensor &action) const
    {
        return action.unsqueeze(-1);
    }

    NormalOutput::NormalOutput(unsigned int numOutputs)
    {
        logStd = register_parameter("logStd", torch::full({static_cast<int64_t>(numOutputs)}, -0.5));
    }

    std::unique_ptr<Distribution> NormalOutput::forward(torch::Tensor x)
    {
        return std::make_unique<Normal>(x, logStd);
    }

    torch::Tensor NormalOutput::jointLogProbability(Distribution &dist, const torch::Tensor &actions) const
    {
        return dist.logProbability(actions).sum(-1, true);
    }

    torch::Tensor NormalOutput::toStoredAction(const torch::Tensor &action) const
    {
        return action;
    }

    TEST_CASE("CategoricalOutput")
    {
        auto output_layer = CategoricalOutput();

        CHECK(output_layer.parameters().empty());

        float input_array[2][3] = {{0, 1, 2}, {3, 4, 5}};
        auto input_tensor = torch::from_blob(input_array, {2, 3});
        auto dist = output_layer.forward(input_tensor);

        CHECK(dist->sample().sizes().vec() == std::vector<int64_t>{2});

        SUBCASE("Stored actions are [B, 1] indices")
        {
            auto actions = output_layer.toStoredAction(dist->sample());
            CHECK(actions.sizes().vec() == std::vector<int64_t>{2, 1});

            auto logProbs = output_layer.jointLogProbability(*dist, actions);
            auto expected = torch::log_softmax(input_tensor, -1).gather(-1, actions);
            CHECK(logProbs.sizes().vec() == std::vector<int64_t>{2, 1});
            CHECK(torch::allclose(logProbs, expected));
        }
    }

    TEST_CASE("NormalOutput")
    {
        auto output_layer = NormalOutput(3);

        SUBCASE("logStd is a registered parameter initialized to -0.5")
        {
            auto parameters = output_layer.named_parameters();
            REQUIRE(parameters.contains("logStd"));
            CHECK(parameters["logStd"].sizes().vec() == std::vector<int64_t>{3});
            CHECK(torch::allclose(parameters["logStd"], torch::full({3}, -0.5)));
        }

        SUBCASE("Output distribution has correct output shape")
        {
            float input_array[2][3] = {{0, 1, 2}, {3, 4, 5}};
            auto input_tensor = torch::from_blob(input_array, {2, 3});
            auto dist = output_layer.forward(input_tensor);

            CHECK(dist->sample().sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(torch::equal(dist->mode(), input_tensor));
        }

        SUBCASE("Joint log-probability sums over action dimensions")
        {
            auto input_tensor = torch::zeros({2, 3});
            auto dist = output_layer.forward(input_tensor);
            auto actions = output_layer.toStoredAction(dist->mode());

            auto logProbs = output_layer.jointLogProbability(*dist, actions);
            CHECK(logProbs.sizes().vec() == std::vector<int64_t>{2, 1});
            CHECK(torch::allclose(logProbs, dist->logProbability(actions).sum(-1, true)));
        }
    }
}
