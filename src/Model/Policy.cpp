#include<cmath>
#include<limits>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/Policy.hpp"
#include"../../include/Model/MlpApproximator.hpp"
#include"../../include/Model/OutputLayers.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Space.hpp"

namespace ProximalPolicy
{
    namespace
    {
        void validateActionSpace(const ActionSpace &actionSpace)
        {
            if (actionSpace.shape.size() != 1 || actionSpace.shape[0] < 1)
            {
                throw UnsupportedActionSpace("Action space \"" + actionSpace.type +
                                             "\" must have a one-dimensional, non-empty shape");
            }
            if (actionSpace.type == "Discrete")
            {
                return;
            }
            if (actionSpace.type != "Box")
            {
                throw UnsupportedActionSpace("Unsupported action space type \"" + actionSpace.type + "\"");
            }

            const auto dimensions = static_cast<size_t>(actionSpace.shape[0]);
            if (actionSpace.low.size() != dimensions || actionSpace.high.size() != dimensions)
            {
                throw UnsupportedActionSpace("Box action space needs one lower and one upper bound per dimension");
            }
            for (size_t i = 0; i < dimensions; ++i)
            {
                // Negated so NaN bounds are rejected as well
                if (!(actionSpace.low[i] <= actionSpace.high[i]))
                {
                    throw UnsupportedActionSpace("Box action space has invalid bounds in dimension " +
                                                 std::to_string(i));
                }
            }
        }
    }

    PolicyImpl::PolicyImpl(ActionSpace actionSpace,
                           std::shared_ptr<FunctionApproximator> pi,
                           std::shared_ptr<FunctionApproximator> value) :
        actionSpace(actionSpace)
    {
        validateActionSpace(actionSpace);

        const auto numOutputs = static_cast<unsigned int>(actionSpace.shape[0]);
        if (pi->getOutputSize() != numOutputs)
        {
            throw std::invalid_argument("Policy approximator outputs " + std::to_string(pi->getOutputSize()) +
                                        " values, the action space needs " + std::to_string(numOutputs));
        }
        if (value->getOutputSize() != 1)
        {
            throw std::invalid_argument("Value approximator must output a single value");
        }

        if (ProximalPolicy::isDiscrete(actionSpace))
        {
            outputLayer = std::make_shared<CategoricalOutput>();
        }
        else
        {
            outputLayer = std::make_shared<NormalOutput>(numOutputs);
        }

        this->pi = register_module("pi", pi);
        this->value = register_module("value", value);
        register_module("output", outputLayer);
    }

    std::vector<torch::Tensor> PolicyImpl::act(torch::Tensor states) const
    {
        auto dist = outputLayer->forward(pi->forward(states));
        auto action = outputLayer->toStoredAction(dist->sample());
        auto logProb = outputLayer->jointLogProbability(*dist, action);

        return {value->forward(states), action, logProb};
    }

    std::vector<torch::Tensor> PolicyImpl::actDeterministic(torch::Tensor states) const
    {
        auto dist = outputLayer->forward(pi->forward(states));
        auto action = outputLayer->toStoredAction(dist->mode());
        auto logProb = outputLayer->jointLogProbability(*dist, action);

        return {value->forward(states), action, logProb};
    }

    torch::Tensor PolicyImpl::evaluateActions(torch::Tensor states, torch::Tensor actions) const
    {
        auto dist = outputLayer->forward(pi->forward(states));
        return outputLayer->jointLogProbability(*dist, actions);
    }

    torch::Tensor PolicyImpl::entropy(torch::Tensor states) const
    {
        return outputLayer->forward(pi->forward(states))->entropy();
    }

    torch::Tensor PolicyImpl::getValue(torch::Tensor states) const
    {
        return value->forward(states);
    }

    std::vector<torch::Tensor> PolicyImpl::policyParameters() const
    {
        auto parameters = pi->parameters();
        auto outputParameters = outputLayer->parameters();
        parameters.insert(parameters.end(), outputParameters.begin(), outputParameters.end());
        return parameters;
    }

    std::vector<torch::Tensor> PolicyImpl::valueParameters() const
    {
        return value->parameters();
    }

    TEST_CASE("Policy")
    {
        const auto inf = std::numeric_limits<float>::infinity();

        SUBCASE("Discrete")
        {
            Policy policy(ActionSpace{"Discrete", {5}},
                          std::make_shared<MlpApproximator>(3, 5),
                          std::make_shared<MlpApproximator>(3, 1));
            auto inputs = torch::rand({4, 3});

            SUBCASE("act() output tensors are correct shapes")
            {
                auto outputs = policy->act(inputs);
                REQUIRE(outputs.size() == 3);

                INFO("Value: \n" << outputs[0] << "\n");
                CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{4, 1});

                INFO("Actions: \n" << outputs[1] << "\n");
                CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{4, 1});
                CHECK(outputs[1].dtype() == torch::kLong);

                INFO("Log probs: \n" << outputs[2] << "\n");
                CHECK(outputs[2].sizes().vec() == std::vector<int64_t>{4, 1});
            }

            SUBCASE("act() log-probabilities match evaluateActions()")
            {
                auto outputs = policy->act(inputs);
                auto evaluated = policy->evaluateActions(inputs, outputs[1]);

                CHECK(torch::allclose(outputs[2], evaluated));
            }

            SUBCASE("actDeterministic() takes the most likely action")
            {
                auto outputs = policy->actDeterministic(inputs);
                auto logits = policy->named_modules()["pi"]->as<MlpApproximator>()->forward(inputs);

                CHECK(torch::equal(outputs[1], logits.argmax(-1, true)));
            }

            SUBCASE("entropy() has one value per state")
            {
                CHECK(policy->entropy(inputs).sizes().vec() == std::vector<int64_t>{4});
            }

            SUBCASE("Policy parameters don't include value parameters")
            {
                CHECK(policy->policyParameters().size() == 8);
                CHECK(policy->valueParameters().size() == 8);
                CHECK(policy->parameters().size() == 16);
            }
        }

        SUBCASE("Box")
        {
            Policy policy(ActionSpace{"Box", {2}, {-1, -1}, {1, 1}},
                          std::make_shared<MlpApproximator>(3, 2),
                          std::make_shared<MlpApproximator>(3, 1));
            auto inputs = torch::rand({4, 3});

            SUBCASE("act() output tensors are correct shapes")
            {
                auto outputs = policy->act(inputs);
                REQUIRE(outputs.size() == 3);

                CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{4, 1});
                CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{4, 2});
                CHECK(outputs[1].dtype() == torch::kFloat);
                CHECK(outputs[2].sizes().vec() == std::vector<int64_t>{4, 1});
            }

            SUBCASE("evaluateActions() sums the Gaussian log-density over dimensions")
            {
                auto mean = policy->named_modules()["pi"]->as<MlpApproximator>()->forward(inputs);
                auto logProbs = policy->evaluateActions(inputs, mean);

                // At the mean only the normalization terms remain, with logStd = -0.5
                auto expected = 2 * (0.5 - 0.5 * std::log(2 * M_PI));
                CHECK(logProbs.sizes().vec() == std::vector<int64_t>{4, 1});
                CHECK(logProbs[0][0].item().toDouble() == doctest::Approx(expected));
            }

            SUBCASE("logStd belongs to the policy parameters")
            {
                CHECK(policy->policyParameters().size() == 9);
                CHECK(policy->named_parameters().contains("output.logStd"));
            }

            SUBCASE("Gradients of evaluateActions() reach logStd")
            {
                auto actions = torch::rand({4, 2});
                policy->evaluateActions(inputs, actions).sum().backward();
                CHECK(policy->named_parameters()["output.logStd"].grad().defined());
            }

            SUBCASE("Unbounded boxes are accepted")
            {
                CHECK_NOTHROW(Policy(ActionSpace{"Box", {1}, {-inf}, {inf}},
                                     std::make_shared<MlpApproximator>(3, 1),
                                     std::make_shared<MlpApproximator>(3, 1)));
            }
        }

        SUBCASE("Both action space kinds go through the same calls")
        {
            std::vector<Policy> policies{
                Policy(ActionSpace{"Discrete", {3}},
                       std::make_shared<MlpApproximator>(3, 3),
                       std::make_shared<MlpApproximator>(3, 1)),
                Policy(ActionSpace{"Box", {3}, {-1, -1, -1}, {1, 1, 1}},
                       std::make_shared<MlpApproximator>(3, 3),
                       std::make_shared<MlpApproximator>(3, 1))};
            auto inputs = torch::rand({5, 3});

            for (auto &policy : policies)
            {
                INFO("Action space: " << policy->getActionSpace().type);
                for (const auto &outputs : {policy->act(inputs), policy->actDeterministic(inputs)})
                {
                    CHECK(outputs[1].size(0) == 5);
                    CHECK(outputs[2].sizes().vec() == std::vector<int64_t>{5, 1});
                    CHECK(torch::allclose(outputs[2], policy->evaluateActions(inputs, outputs[1])));
                }
            }
        }

        SUBCASE("Construction validates its inputs")
        {
            auto pi = std::make_shared<MlpApproximator>(3, 2);
            auto value = std::make_shared<MlpApproximator>(3, 1);

            CHECK_THROWS_AS(Policy(ActionSpace{"MultiBinary", {2}}, pi, value), UnsupportedActionSpace);
            CHECK_THROWS_AS(Policy(ActionSpace{"Box", {2}}, pi, value), UnsupportedActionSpace);
            CHECK_THROWS_AS(Policy(ActionSpace{"Box", {2, 1}, {0, 0}, {1, 1}}, pi, value), UnsupportedActionSpace);
            CHECK_THROWS_AS(Policy(ActionSpace{"Box", {2}, {1, 0}, {0, 1}}, pi, value), UnsupportedActionSpace);
            CHECK_THROWS_AS(Policy(ActionSpace{"Discrete", {0}}, pi, value), UnsupportedActionSpace);
            CHECK_THROWS_AS(Policy(ActionSpace{"Discrete", {3}}, pi, value), std::invalid_argument);
            CHECK_THROWS_AS(Policy(ActionSpace{"Discrete", {2}}, pi, pi), std::invalid_argument);
        }
    }
}
