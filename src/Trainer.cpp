#include<filesystem>
#include<map>
#include<memory>
#include<string>
#include<vector>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/Trainer.hpp"
#include"../include/Checkpoint.hpp"
#include"../include/Model/MlpApproximator.hpp"

namespace ProximalPolicy
{
    Trainer::Trainer(Environment &environment,
                     Policy &policy,
                     Algorithms &algorithm,
                     ExperienceBuffer &buffer,
                     const TrainingConfig &config,
                     MetricsWriter &metrics,
                     Evaluator *evaluator,
                     torch::Device device) :
        environment(environment),
        policy(policy),
        algorithm(algorithm),
        buffer(buffer),
        config(config),
        metrics(metrics),
        evaluator(evaluator),
        device(device)
    {
        config.validate();
    }

    void Trainer::endEpisode()
    {
        ++episode;
        metrics.addScalar("Episode Rewards", episodeReturn, episode);
        spdlog::debug("Episode {} finished after {} steps with return {}", episode, episodeLength, episodeReturn);

        if (evaluator != nullptr)
        {
            metrics.addScalar("Episode Evaluation", evaluator->evaluate(), episode);
        }

        state = environment.reset();
        episodeReturn = 0;
        episodeLength = 0;
    }

    std::vector<UpdateDatum> Trainer::runEpoch()
    {
        if (!state.defined())
        {
            state = environment.reset();
        }

        for (int step = 0; step < config.stepsPerEpoch; ++step)
        {
            std::vector<torch::Tensor> output;
            {
                torch::NoGradGuard noGrad;
                output = policy->act(state.to(device).unsqueeze(0));
            }
            auto action = output[1][0];
            auto result = environment.step(action.to(torch::kCPU));

            buffer.store(state.to(device), action, result.reward,
                         output[0].item().toFloat(), output[2].item().toFloat());
            episodeReturn += result.reward;
            ++episodeLength;
            state = result.observation;

            bool terminal = result.done ||
                            episodeLength == config.maxEpisodeLength ||
                            step == config.stepsPerEpoch - 1;
            if (terminal)
            {
                float lastValue = 0;
                if (!result.done)
                {
                    torch::NoGradGuard noGrad;
                    lastValue = policy->getValue(state.to(device).unsqueeze(0)).item().toFloat();
                }
                buffer.finishPath(lastValue);
                endEpisode();
            }
        }

        auto data = algorithm.update(buffer);
        ++epoch;

        std::string summary;
        for (const auto &datum : data)
        {
            metrics.addScalar(datum.name, datum.value, epoch);
            summary += datum.name + ": " + std::to_string(datum.value) + " | ";
        }
        spdlog::info("Epoch {} | Episodes: {} | {}", epoch, episode, summary);
        return data;
    }

    void Trainer::train()
    {
        spdlog::info("Training for {} epochs of {} steps", config.epochs, config.stepsPerEpoch);
        for (int i = 0; i < config.epochs; ++i)
        {
            runEpoch();

            bool lastEpoch = i == config.epochs - 1;
            if (!config.checkpointPath.empty() && (epoch % config.saveFrequency == 0 || lastEpoch))
            {
                saveCheckpoint(policy, config.checkpointPath);
            }
        }
    }

    namespace
    {
        // Observations are [step within episode, 1, 1]; every step is rewarded with 1
        class TimerEnvironment : public Environment
        {
        public:
            int episodeLength;  ///< 0 for episodes that never end
            int steps = 0;
            int resets = 0;

            explicit TimerEnvironment(int episodeLength) : episodeLength(episodeLength) {}

            torch::Tensor reset() override
            {
                ++resets;
                steps = 0;
                return torch::tensor({0.f, 1.f, 1.f});
            }

            StepResult step(const torch::Tensor &) override
            {
                ++steps;
                bool done = episodeLength > 0 && steps >= episodeLength;
                return {torch::tensor({static_cast<float>(steps), 1.f, 1.f}), 1, done, {}};
            }

            ActionSpace getActionSpace() const override { return {"Discrete", {2}}; }
            ObservationSpace getObservationSpace() const override { return {{3}}; }
        };

        class RecordingMetricsWriter : public MetricsWriter
        {
        public:
            std::map<std::string, std::vector<std::pair<int64_t, float>>> scalars;

            void addScalar(const std::string &tag, float value, int64_t step) override
            {
                scalars[tag].emplace_back(step, value);
            }
        };

        // Keeps the epoch instead of learning from it
        class RecordingAlgorithm : public Algorithms
        {
        public:
            std::vector<EpochBatch> batches;

            std::vector<UpdateDatum> update(ExperienceBuffer &buffer) override
            {
                auto batch = buffer.get();
                batches.push_back({batch.observations.clone(), batch.actions.clone(),
                                   batch.advantages.clone(), batch.returns.clone(),
                                   batch.logProbs.clone()});
                return {{"Updates", static_cast<float>(batches.size())}};
            }
        };

        Policy makeTimerPolicy()
        {
            return Policy(ActionSpace{"Discrete", {2}},
                          std::make_shared<MlpApproximator>(3, 2),
                          std::make_shared<MlpApproximator>(3, 1));
        }

        TrainingConfig makeTimerConfig()
        {
            TrainingConfig config;
            config.stepsPerEpoch = 10;
            config.epochs = 2;
            config.gamma = 1;
            config.lambda = 1;
            config.maxEpisodeLength = 100;
            return config;
        }
    }

    TEST_CASE("Trainer")
    {
        torch::manual_seed(0);
        auto policy = makeTimerPolicy();
        auto config = makeTimerConfig();
        RecordingMetricsWriter metrics;
        RecordingAlgorithm algorithm;

        SUBCASE("Episodes are closed on termination and at the end of the epoch")
        {
            TimerEnvironment environment(4);
            ExperienceBuffer buffer(config.stepsPerEpoch, {3}, environment.getActionSpace(),
                                    config.gamma, config.lambda);
            Trainer trainer(environment, policy, algorithm, buffer, config, metrics);

            trainer.runEpoch();

            // Episodes end after steps 4, 8 and 10
            const auto &rewards = metrics.scalars["Episode Rewards"];
            REQUIRE(rewards.size() == 3);
            CHECK(rewards[0] == std::make_pair(int64_t{1}, 4.f));
            CHECK(rewards[1] == std::make_pair(int64_t{2}, 4.f));
            CHECK(rewards[2] == std::make_pair(int64_t{3}, 2.f));
            CHECK(environment.resets == 4);
            CHECK(trainer.getEpisodeCount() == 3);
            CHECK(metrics.scalars.count("Episode Evaluation") == 0);
        }

        SUBCASE("Terminal steps bootstrap with zero, truncated ones with the value estimate")
        {
            TimerEnvironment environment(4);
            ExperienceBuffer buffer(config.stepsPerEpoch, {3}, environment.getActionSpace(),
                                    config.gamma, config.lambda);
            Trainer trainer(environment, policy, algorithm, buffer, config, metrics);

            trainer.runEpoch();

            REQUIRE(algorithm.batches.size() == 1);
            auto returns = algorithm.batches[0].returns;
            INFO("Returns: \n" << returns);
            CHECK(returns[0].item().toFloat() == doctest::Approx(4));
            CHECK(returns[3].item().toFloat() == doctest::Approx(1));
            CHECK(returns[7].item().toFloat() == doctest::Approx(1));

            torch::NoGradGuard noGrad;
            auto bootstrap = policy->getValue(torch::tensor({2.f, 1.f, 1.f}).unsqueeze(0)).item().toFloat();
            CHECK(returns[9].item().toFloat() == doctest::Approx(1 + bootstrap).epsilon(1e-4));
            CHECK(returns[8].item().toFloat() == doctest::Approx(2 + bootstrap).epsilon(1e-4));
        }

        SUBCASE("Episodes are cut at maxEpisodeLength")
        {
            TimerEnvironment environment(0);
            config.maxEpisodeLength = 3;
            ExperienceBuffer buffer(config.stepsPerEpoch, {3}, environment.getActionSpace(),
                                    config.gamma, config.lambda);
            Trainer trainer(environment, policy, algorithm, buffer, config, metrics);

            trainer.runEpoch();

            // 3 + 3 + 3 + 1
            CHECK(metrics.scalars["Episode Rewards"].size() == 4);
        }

        SUBCASE("An attached evaluator reports once per episode")
        {
            TimerEnvironment environment(5);
            ExperienceBuffer buffer(config.stepsPerEpoch, {3}, environment.getActionSpace(),
                                    config.gamma, config.lambda);
            Evaluator evaluator(environment, policy, true, false);
            Trainer trainer(environment, policy, algorithm, buffer, config, metrics, &evaluator);

            trainer.runEpoch();

            const auto &evaluations = metrics.scalars["Episode Evaluation"];
            REQUIRE(evaluations.size() == 2);
            CHECK(evaluations[0].first == 1);
            CHECK(evaluations[0].second == doctest::Approx(5));
            CHECK(evaluations[1].first == 2);
        }

        SUBCASE("train() runs every epoch and writes a checkpoint")
        {
            TimerEnvironment environment(4);
            ExperienceBuffer buffer(config.stepsPerEpoch, {3}, environment.getActionSpace(),
                                    config.gamma, config.lambda);
            config.epochs = 3;
            config.saveFrequency = 2;
            config.checkpointPath = (std::filesystem::temp_directory_path() /
                                     "proximalpolicy-trainer-test" / "policy.pt").string();
            std::filesystem::remove(config.checkpointPath);
            Trainer trainer(environment, policy, algorithm, buffer, config, metrics);

            trainer.train();

            CHECK(trainer.getEpochCount() == 3);
            CHECK(algorithm.batches.size() == 3);
            const auto &updates = metrics.scalars["Updates"];
            REQUIRE(updates.size() == 3);
            CHECK(updates[2] == std::make_pair(int64_t{3}, 3.f));
            CHECK(std::filesystem::exists(config.checkpointPath));
        }

        SUBCASE("Invalid configuration is rejected")
        {
            TimerEnvironment environment(4);
            ExperienceBuffer buffer(config.stepsPerEpoch, {3}, environment.getActionSpace(),
                                    config.gamma, config.lambda);
            config.saveFrequency = 0;
            CHECK_THROWS_AS(Trainer(environment, policy, algorithm, buffer, config, metrics),
                            std::invalid_argument);
        }
    }
}
