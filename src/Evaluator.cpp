#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/Evaluator.hpp"
#include"../include/Model/MlpApproximator.hpp"

namespace ProximalPolicy
{
    Evaluator::Evaluator(Environment &environment,
                         Policy &policy,
                         bool deterministic,
                         bool render,
                         int maxEpisodeLength,
                         torch::Device device) :
        environment(environment),
        policy(policy),
        deterministic(deterministic),
        render(render),
        maxEpisodeLength(maxEpisodeLength),
        device(device)
    {
        if (maxEpisodeLength < 0)
        {
            throw std::invalid_argument("maxEpisodeLength must not be negative");
        }
    }

    float Evaluator::evaluate()
    {
        torch::NoGradGuard noGrad;

        environment.setRendering(render);
        auto state = environment.reset();
        float episodeReturn = 0;
        int episodeLength = 0;

        bool done = false;
        while (!done)
        {
            auto batch = state.to(device).unsqueeze(0);
            auto output = deterministic ? policy->actDeterministic(batch) : policy->act(batch);
            auto result = environment.step(output[1][0].to(torch::kCPU));

            episodeReturn += result.reward;
            ++episodeLength;
            state = result.observation;
            done = result.done || (maxEpisodeLength > 0 && episodeLength >= maxEpisodeLength);
        }

        if (render)
        {
            environment.setRendering(false);
        }
        return episodeReturn;
    }

    namespace
    {
        // Episode of fixed length; the reward is 1 when action 1 is taken, 0 otherwise
        class ChoiceEnvironment : public Environment
        {
        public:
            int episodeLength;
            int steps = 0;
            int resets = 0;
            bool rendering = false;
            bool renderedDuringStep = false;

            explicit ChoiceEnvironment(int episodeLength) : episodeLength(episodeLength) {}

            torch::Tensor reset() override
            {
                ++resets;
                steps = 0;
                return torch::ones({2});
            }

            StepResult step(const torch::Tensor &action) override
            {
                ++steps;
                renderedDuringStep = renderedDuringStep || rendering;
                float reward = action.item().toLong() == 1 ? 1 : 0;
                return {torch::ones({2}), reward, episodeLength > 0 && steps >= episodeLength, {}};
            }

            ActionSpace getActionSpace() const override { return {"Discrete", {2}}; }
            ObservationSpace getObservationSpace() const override { return {{2}}; }
            void setRendering(bool render) override { rendering = render; }
        };

        Policy makeChoicePolicy()
        {
            return Policy(ActionSpace{"Discrete", {2}},
                          std::make_shared<MlpApproximator>(2, 2),
                          std::make_shared<MlpApproximator>(2, 1));
        }
    }

    TEST_CASE("Evaluator")
    {
        torch::manual_seed(0);

        SUBCASE("Returns the cumulative reward of one episode")
        {
            ChoiceEnvironment environment(5);
            auto policy = makeChoicePolicy();
            Evaluator evaluator(environment, policy, false, false);

            auto episodeReturn = evaluator.evaluate();

            CHECK(environment.resets == 1);
            CHECK(environment.steps == 5);
            CHECK(episodeReturn >= 0);
            CHECK(episodeReturn <= 5);
        }

        SUBCASE("Deterministic evaluation always takes the most likely action")
        {
            ChoiceEnvironment environment(10);
            auto policy = makeChoicePolicy();
            {
                torch::NoGradGuard noGrad;
                for (auto &parameter : policy->policyParameters())
                {
                    parameter.zero_();
                }
                // Favor action 1 through the output bias
                policy->named_parameters()["pi.output.bias"][1] = 5;
            }
            Evaluator evaluator(environment, policy, true, false);

            CHECK(evaluator.evaluate() == doctest::Approx(10));
        }

        SUBCASE("Step cap ends endless episodes")
        {
            ChoiceEnvironment environment(0);
            auto policy = makeChoicePolicy();
            Evaluator evaluator(environment, policy, false, false, 7);

            evaluator.evaluate();

            CHECK(environment.steps == 7);
        }

        SUBCASE("Rendering is only on while evaluating")
        {
            ChoiceEnvironment environment(3);
            auto policy = makeChoicePolicy();
            Evaluator evaluator(environment, policy, false, true);

            evaluator.evaluate();

            CHECK(environment.renderedDuringStep);
            CHECK(!environment.rendering);
        }

        SUBCASE("Parameters are left unchanged")
        {
            ChoiceEnvironment environment(4);
            auto policy = makeChoicePolicy();
            std::vector<torch::Tensor> before;
            for (const auto &parameter : policy->parameters())
            {
                before.push_back(parameter.clone());
            }

            Evaluator(environment, policy, false, false).evaluate();

            auto after = policy->parameters();
            for (size_t i = 0; i < before.size(); ++i)
            {
                CHECK(torch::equal(before[i], after[i]));
            }
        }
    }
}
