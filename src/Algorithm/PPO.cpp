#include<cmath>
#include<memory>
#include<string>

#include<torch/torch.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/PPO.hpp"
#include"../../include/Algorithms/Algorithm.hpp"
#include"../../include/Model/MlpApproximator.hpp"
#include"../../include/Model/Policy.hpp"
#include"../../include/Storage.hpp"
#include"../../include/Space.hpp"
#include"../../include/Errors.hpp"

namespace ProximalPolicy {

    torch::Tensor clippedSurrogateLoss(const torch::Tensor &ratio,
                                       const torch::Tensor &advantages,
                                       float clipRatio)
    {
        auto surr_1 = ratio * advantages;
        auto surr_2 = torch::clamp(ratio, 1.0 - clipRatio, 1.0 + clipRatio) * advantages;
        return -torch::min(surr_1, surr_2).mean();
    }

    IterationSummary runPolicyIterations(int maxIterations,
                                         float targetKl,
                                         const std::function<float()> &step)
    {
        for (int i = 0; i < maxIterations; ++i)
        {
            auto kl = step();
            if (kl > 1.5 * targetKl)
            {
                spdlog::debug("Early stopping at step {} due to reaching max kl ({:.5f})", i, kl);
                return {i + 1, true};
            }
        }
        return {maxIterations, false};
    }

    float runValueIterations(int iterations, const std::function<float()> &step)
    {
        float loss = 0;
        for (int i = 0; i < iterations; ++i)
        {
            loss = step();
        }
        return loss;
    }

    PPO::PPO(Policy &policy,
             float clipRatio,
             float policyLearningRate,
             float valueLearningRate,
             int trainPolicyIterations,
             int trainValueIterations,
             float targetKl) :
    policy(policy),
    clipRatio(clipRatio),
    trainPolicyIterations(trainPolicyIterations),
    trainValueIterations(trainValueIterations),
    targetKl(targetKl),
    policyOptimizer(std::make_unique<torch::optim::Adam>(policy->policyParameters(),
                                                         torch::optim::AdamOptions(policyLearningRate))),
    valueOptimizer(std::make_unique<torch::optim::Adam>(policy->valueParameters(),
                                                        torch::optim::AdamOptions(valueLearningRate)))
    {
    }

    std::vector<UpdateDatum> PPO::update(ExperienceBuffer &buffer)
    {
        return update(buffer.get());
    }

    /**
     * @details Both phases use the whole epoch as a single batch. The approximate KL of a
     * policy step is measured before that step's parameter change, so the step that crosses
     * the threshold is still applied.
     */
    std::vector<UpdateDatum> PPO::update(const EpochBatch &batch)
    {
        const auto &observations = batch.observations;
        const auto &actions = batch.actions;
        const auto advantages = batch.advantages.detach();
        const auto returns = batch.returns.detach();
        const auto oldLogProbs = batch.logProbs.detach();

        float policyLoss = 0;
        float klDivergence = 0;
        auto policyStep = [&]() -> float {
            auto newLogProbs = policy->evaluateActions(observations, actions).squeeze(-1);
            auto ratio = torch::exp(newLogProbs - oldLogProbs);
            auto loss = clippedSurrogateLoss(ratio, advantages, clipRatio);

            policyLoss = loss.item<float>();
            if (!std::isfinite(policyLoss))
            {
                throw NumericInstability("Policy loss is not finite");
            }
            klDivergence = (oldLogProbs - newLogProbs.detach()).mean().item<float>();

            policyOptimizer->zero_grad();
            loss.backward();
            policyOptimizer->step();
            return klDivergence;
        };
        auto policySummary = runPolicyIterations(trainPolicyIterations, targetKl, policyStep);

        auto valueStep = [&]() -> float {
            auto values = policy->getValue(observations).squeeze(-1);
            auto loss = (returns - values).pow(2).mean();

            auto valueLoss = loss.item<float>();
            if (!std::isfinite(valueLoss))
            {
                throw NumericInstability("Value loss is not finite");
            }

            valueOptimizer->zero_grad();
            loss.backward();
            valueOptimizer->step();
            return valueLoss;
        };
        auto valueLoss = runValueIterations(trainValueIterations, valueStep);

        float entropy;
        {
            torch::NoGradGuard no_grad;
            entropy = policy->entropy(observations).mean().item<float>();
        }

        std::vector<UpdateDatum> data{{"Policy loss", policyLoss},
                                      {"Value loss", valueLoss},
                                      {"KL divergence", klDivergence},
                                      {"Entropy", entropy},
                                      {"Policy iterations", static_cast<float>(policySummary.iterations)}};
        if (policySummary.stoppedEarly)
        {
            data.push_back({"KL divergence early stop update", static_cast<float>(policySummary.iterations - 1)});
        }
        return data;
    }

    static float findDatum(const std::vector<UpdateDatum> &data, const std::string &name)
    {
        for (const auto &datum : data)
        {
            if (datum.name == name)
            {
                return datum.value;
            }
        }
        throw std::runtime_error("No update datum named " + name);
    }

    /**
     * Every step is a one-step episode whose reward equals the action taken, so the
     * policy should learn to prefer action 1.
     */
    static void learnPattern(Policy &policy, ExperienceBuffer &buffer, PPO &ppo, int epochs)
    {
        for (int epoch = 0; epoch < epochs; ++epoch)
        {
            for (int step = 0; step < buffer.getCapacity(); ++step)
            {
                auto observation = torch::ones({1, 1});
                std::vector<torch::Tensor> act_result;
                {
                    torch::NoGradGuard no_grad;
                    act_result = policy->act(observation);
                }
                auto reward = act_result[1].item().toFloat();
                buffer.store(observation, act_result[1], reward,
                             act_result[0].item().toFloat(), act_result[2].item().toFloat());
                buffer.finishPath(0);
            }
            ppo.update(buffer);
        }
    }

    TEST_CASE("clippedSurrogateLoss()")
    {
        const float clip = 0.2;

        SUBCASE("Positive advantages are clipped above 1 + clip")
        {
            auto ratio = torch::full({1}, 1 + clip + 0.1);
            auto advantages = torch::full({1}, 2.0);

            CHECK(clippedSurrogateLoss(ratio, advantages, clip).item().toDouble() ==
                  doctest::Approx(-(1 + clip) * 2.0));
        }

        SUBCASE("Negative advantages are clipped below 1 - clip")
        {
            auto ratio = torch::full({1}, 1 - clip - 0.1);
            auto advantages = torch::full({1}, -2.0);

            CHECK(clippedSurrogateLoss(ratio, advantages, clip).item().toDouble() ==
                  doctest::Approx((1 - clip) * 2.0));
        }

        SUBCASE("Ratios inside the clipping range are not clipped")
        {
            float ratios[] = {0.9, 1.1};
            float advantages[] = {1, -1};
            auto loss = clippedSurrogateLoss(torch::from_blob(ratios, {2}),
                                             torch::from_blob(advantages, {2}), clip);

            CHECK(loss.item().toDouble() == doctest::Approx(-(0.9 - 1.1) / 2));
        }

        SUBCASE("The pessimistic side is not clipped")
        {
            auto ratio = torch::full({1}, 0.5);
            auto advantages = torch::full({1}, 1.0);

            CHECK(clippedSurrogateLoss(ratio, advantages, clip).item().toDouble() == doctest::Approx(-0.5));
        }
    }

    TEST_CASE("runPolicyIterations()")
    {
        SUBCASE("Stops after the step whose KL exceeds 1.5 * target")
        {
            int calls = 0;
            auto summary = runPolicyIterations(80, 0.01, [&calls]() {
                ++calls;
                return calls < 4 ? 0.001f : 0.016f;
            });

            CHECK(calls == 4);
            CHECK(summary.iterations == 4);
            CHECK(summary.stoppedEarly);
        }

        SUBCASE("KL below the threshold runs every iteration")
        {
            auto summary = runPolicyIterations(5, 0.02, []() { return 0.02f; });

            CHECK(summary.iterations == 5);
            CHECK(!summary.stoppedEarly);
        }
    }

    TEST_CASE("runValueIterations()")
    {
        int calls = 0;
        auto loss = runValueIterations(80, [&calls]() {
            ++calls;
            return 1000.0f / calls;
        });

        CHECK(calls == 80);
        CHECK(loss == doctest::Approx(12.5));
        CHECK(runValueIterations(0, []() { return 1.0f; }) == 0);
    }

    TEST_CASE("PPO")
    {
        torch::manual_seed(0);
        ActionSpace space{"Discrete", {2}};
        Policy policy(space,
                      std::make_shared<MlpApproximator>(1, 2),
                      std::make_shared<MlpApproximator>(1, 1));

        SUBCASE("update() learns basic pattern")
        {
            ExperienceBuffer buffer(20, {1}, space, 0.99, 0.97);
            PPO ppo(policy, 0.2, 3e-3, 1e-2, 10, 10, 1.0);

            auto action_one = torch::ones({1, 1}, torch::kLong);
            auto pre_game_prob = policy->evaluateActions(torch::ones({1, 1}), action_one).exp();

            learnPattern(policy, buffer, ppo, 10);

            auto post_game_prob = policy->evaluateActions(torch::ones({1, 1}), action_one).exp();

            INFO("Pre-training probability: \n" << pre_game_prob << "\n");
            INFO("Post-training probability: \n" << post_game_prob << "\n");
            CHECK(post_game_prob[0][0].item().toDouble() > pre_game_prob[0][0].item().toDouble());
        }

        SUBCASE("update() reports its statistics and reduces the value loss")
        {
            auto observations = torch::rand({16, 1});
            EpochBatch batch{observations,
                             torch::randint(0, 2, {16, 1}, torch::kLong),
                             torch::randn({16}),
                             torch::full({16}, 5.0),
                             torch::full({16}, std::log(0.5))};
            PPO ppo(policy, 0.2, 1e-4, 1e-2, 5, 20, 0.01);

            auto first = ppo.update(batch);
            auto second = ppo.update(batch);

            CHECK(findDatum(first, "Policy iterations") >= 1);
            CHECK(findDatum(first, "Policy iterations") <= 5);
            CHECK(findDatum(first, "Entropy") > 0);
            CHECK(findDatum(second, "Value loss") < findDatum(first, "Value loss"));
        }

        SUBCASE("The value phase leaves the policy parameters alone")
        {
            auto observations = torch::rand({8, 1});
            EpochBatch batch{observations,
                             torch::zeros({8, 1}, torch::kLong),
                             torch::zeros({8}),
                             torch::full({8}, 3.0),
                             torch::full({8}, std::log(0.5))};
            PPO ppo(policy, 0.2, 1e-3, 1e-2, 0, 10, 0.01);

            std::vector<torch::Tensor> before;
            for (const auto &parameter : policy->policyParameters())
            {
                before.push_back(parameter.clone());
            }
            ppo.update(batch);

            auto after = policy->policyParameters();
            for (size_t i = 0; i < before.size(); ++i)
            {
                CHECK(torch::equal(before[i], after[i]));
            }
        }

        SUBCASE("Non-finite losses throw before any update")
        {
            EpochBatch batch{torch::rand({4, 1}),
                             torch::zeros({4, 1}, torch::kLong),
                             torch::full({4}, std::nan("")),
                             torch::zeros({4}),
                             torch::zeros({4})};
            PPO ppo(policy, 0.2, 1e-3, 1e-3, 5, 5, 0.01);

            CHECK_THROWS_AS(ppo.update(batch), NumericInstability);
        }

        SUBCASE("update() on a partially filled buffer throws BufferNotFull")
        {
            ExperienceBuffer buffer(4, {1}, space, 0.99, 0.97);
            PPO ppo(policy, 0.2, 1e-3, 1e-3, 5, 5, 0.01);

            CHECK_THROWS_AS(ppo.update(buffer), BufferNotFull);
        }
    }
}
