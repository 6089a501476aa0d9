#include<cmath>
#include<string>
#include<vector>

#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../include/Storage.hpp"
#include"../include/Errors.hpp"
#include"../include/Space.hpp"

namespace ProximalPolicy
{
    torch::Tensor discountedCumulativeSum(const torch::Tensor &x, double discount)
    {
        auto input = x.detach().to(torch::kCPU, torch::kFloat).contiguous();
        auto output = torch::zeros_like(input);
        auto inputAccessor = input.accessor<float, 1>();
        auto outputAccessor = output.accessor<float, 1>();

        double running = 0;
        for (int64_t step = input.size(0) - 1; step >= 0; --step)
        {
            running = inputAccessor[step] + discount * running;
            outputAccessor[step] = static_cast<float>(running);
        }
        return output;
    }

    /**
     * @brief Allocates zeroed tensors for one epoch.
     *
     * @details Discrete actions are stored as a single long index per step, continuous
     * actions as a float vector of the action dimensionality.
     */
    ExperienceBuffer::ExperienceBuffer(int64_t capacity,
        c10::ArrayRef<int64_t> observationShape,
        const ActionSpace &actionSpace,
        float gamma,
        float lambda,
        torch::Device device) :
    device(device), capacity(capacity), ptr(0), pathStart(0), gamma(gamma), lambda(lambda)
    {
        if (capacity <= 0)
        {
            throw std::invalid_argument("Buffer capacity must be positive, got " + std::to_string(capacity));
        }

        std::vector<int64_t> observation_Shape{capacity};
        observation_Shape.insert(observation_Shape.end(), observationShape.begin(), observationShape.end());
        observations = torch::zeros(observation_Shape, torch::TensorOptions(device));

        if (isDiscrete(actionSpace))
        {
            actions = torch::zeros({capacity, 1}, torch::TensorOptions(device).dtype(torch::kLong));
        }
        else
        {
            actions = torch::zeros({capacity, actionSpace.shape[0]}, torch::TensorOptions(device));
        }

        rewards = torch::zeros({capacity}, torch::TensorOptions(device));
        valuePredictions = torch::zeros({capacity}, torch::TensorOptions(device));
        logProbs = torch::zeros({capacity}, torch::TensorOptions(device));
        advantages = torch::zeros({capacity}, torch::TensorOptions(device));
        returns = torch::zeros({capacity}, torch::TensorOptions(device));
    }

    void ExperienceBuffer::store(const torch::Tensor &observation,
        const torch::Tensor &action,
        float reward,
        float value,
        float logProb)
    {
        if (ptr == capacity)
        {
            throw BufferFull("Cannot store transition: all " + std::to_string(capacity) +
                             " slots of the epoch are used");
        }

        auto observationSlot = observations[ptr];
        observationSlot.copy_(observation.reshape(observationSlot.sizes()));
        auto actionSlot = actions[ptr];
        actionSlot.copy_(action.reshape(actionSlot.sizes()));
        rewards[ptr].fill_(reward);
        valuePredictions[ptr].fill_(value);
        logProbs[ptr].fill_(logProb);

        ++ptr;
    }

    /**
     * @brief Computes GAE-lambda advantages and returns for the open episode.
     *
     * @details With \f$ r \f$ and \f$ V \f$ extended by the bootstrap value:
     * \f[
     * \delta_t = r_t + \gamma V_{t+1} - V_t, \qquad
     * A_t = \delta_t + \gamma \lambda A_{t+1}, \qquad
     * R_t = r_t + \gamma R_{t+1}
     * \f]
     * The scans stop at `pathStart`, so rewards never leak across an episode boundary.
     */
    void ExperienceBuffer::finishPath(float lastValue)
    {
        const auto length = ptr - pathStart;
        if (length == 0)
        {
            return;
        }

        auto bootstrap = torch::full({1}, lastValue);
        auto pathRewards = torch::cat({rewards.narrow(0, pathStart, length).to(torch::kCPU), bootstrap});
        auto pathValues = torch::cat({valuePredictions.narrow(0, pathStart, length).to(torch::kCPU), bootstrap});

        auto deltas = pathRewards.narrow(0, 0, length) +
                      gamma * pathValues.narrow(0, 1, length) -
                      pathValues.narrow(0, 0, length);

        auto pathAdvantages = discountedCumulativeSum(deltas, static_cast<double>(gamma) * lambda);
        auto pathReturns = discountedCumulativeSum(pathRewards, gamma).narrow(0, 0, length);

        if (!torch::isfinite(pathAdvantages).all().item<bool>() ||
            !torch::isfinite(pathReturns).all().item<bool>())
        {
            throw NumericInstability("Non-finite advantage or return in episode [" +
                                     std::to_string(pathStart) + ", " + std::to_string(ptr) + ")");
        }

        advantages.narrow(0, pathStart, length).copy_(pathAdvantages);
        returns.narrow(0, pathStart, length).copy_(pathReturns);

        pathStart = ptr;
    }

    EpochBatch ExperienceBuffer::get()
    {
        if (ptr != capacity)
        {
            throw BufferNotFull("Cannot read epoch: " + std::to_string(ptr) + " of " +
                                std::to_string(capacity) + " slots written");
        }
        if (pathStart != ptr)
        {
            spdlog::warn("Reading epoch with an open episode [{}, {}); its advantages are stale",
                         pathStart, ptr);
        }

        auto mean = advantages.mean();
        auto std = torch::std(advantages, /*unbiased=*/false);
        auto normalized = (advantages - mean) / (std + 1e-8);

        ptr = 0;
        pathStart = 0;

        return {observations, actions, normalized, returns, logProbs};
    }

    void ExperienceBuffer::to(torch::Device device)
    {
        this->device = device;
        observations = observations.to(device);
        actions = actions.to(device);
        rewards = rewards.to(device);
        valuePredictions = valuePredictions.to(device);
        logProbs = logProbs.to(device);
        advantages = advantages.to(device);
        returns = returns.to(device);
    }

    static void storeEpisode(ExperienceBuffer &buffer,
                             const std::vector<float> &rewards,
                             const std::vector<float> &values)
    {
        for (size_t i = 0; i < rewards.size(); ++i)
        {
            buffer.store(torch::zeros({2}), torch::zeros({1}), rewards[i], values[i], 0);
        }
    }

    TEST_CASE("discountedCumulativeSum()")
    {
        float values[] = {1, 2, 3};
        auto output = discountedCumulativeSum(torch::from_blob(values, {3}), 0.5);

        CHECK(output[0].item().toDouble() == doctest::Approx(1 + 0.5 * 2 + 0.25 * 3));
        CHECK(output[1].item().toDouble() == doctest::Approx(2 + 0.5 * 3));
        CHECK(output[2].item().toDouble() == doctest::Approx(3));
    }

    TEST_CASE("ExperienceBuffer")
    {
        SUBCASE("Initializes tensors to correct sizes")
        {
            ExperienceBuffer buffer(3, {5, 2}, ActionSpace{"Box", {4}}, 0.99, 0.97);

            CHECK(buffer.getObservations().sizes().vec() == std::vector<int64_t>{3, 5, 2});
            CHECK(buffer.getActions().sizes().vec() == std::vector<int64_t>{3, 4});
            CHECK(buffer.getRewards().sizes().vec() == std::vector<int64_t>{3});
            CHECK(buffer.getValuePredictions().sizes().vec() == std::vector<int64_t>{3});
            CHECK(buffer.getLogProbs().sizes().vec() == std::vector<int64_t>{3});
            CHECK(buffer.getAdvantages().sizes().vec() == std::vector<int64_t>{3});
            CHECK(buffer.getReturns().sizes().vec() == std::vector<int64_t>{3});
            CHECK(buffer.getPtr() == 0);
            CHECK(buffer.getPathStart() == 0);
        }

        SUBCASE("Initializes actions to correct type")
        {
            SUBCASE("Long")
            {
                ExperienceBuffer buffer(3, {5}, ActionSpace{"Discrete", {3}}, 0.99, 0.97);

                CHECK(buffer.getActions().dtype() == torch::kLong);
                CHECK(buffer.getActions().sizes().vec() == std::vector<int64_t>{3, 1});
            }

            SUBCASE("Float")
            {
                ExperienceBuffer buffer(3, {5}, ActionSpace{"Box", {3}}, 0.99, 0.97);

                CHECK(buffer.getActions().dtype() == torch::kFloat);
            }
        }

        SUBCASE("store() writes values at the cursor")
        {
            ExperienceBuffer buffer(3, {2}, ActionSpace{"Discrete", {3}}, 0.99, 0.97);
            float observation[] = {4, 5};
            buffer.store(torch::from_blob(observation, {1, 2}), torch::full({1, 1}, 2, torch::kLong), 1.5, 0.25, -0.7);

            CHECK(buffer.getPtr() == 1);
            CHECK(buffer.getObservations()[0][1].item().toDouble() == doctest::Approx(5));
            CHECK(buffer.getActions()[0][0].item().toLong() == 2);
            CHECK(buffer.getRewards()[0].item().toDouble() == doctest::Approx(1.5));
            CHECK(buffer.getValuePredictions()[0].item().toDouble() == doctest::Approx(0.25));
            CHECK(buffer.getLogProbs()[0].item().toDouble() == doctest::Approx(-0.7));
        }

        SUBCASE("finishPath() with lambda 1 gives discounted returns as advantages")
        {
            ExperienceBuffer buffer(3, {2}, ActionSpace{"Box", {1}}, 0.9, 1.0);
            storeEpisode(buffer, {1, 1, 1}, {0, 0, 0});
            buffer.finishPath(0);

            INFO("Returns: \n" << buffer.getReturns() << "\n");
            CHECK(buffer.getReturns()[0].item().toDouble() == doctest::Approx(2.71));
            CHECK(buffer.getReturns()[1].item().toDouble() == doctest::Approx(1.9));
            CHECK(buffer.getReturns()[2].item().toDouble() == doctest::Approx(1.0));

            INFO("Advantages: \n" << buffer.getAdvantages() << "\n");
            for (int i = 0; i < 3; ++i)
            {
                CHECK(buffer.getAdvantages()[i].item().toDouble() ==
                      doctest::Approx(buffer.getReturns()[i].item().toDouble()));
            }
            CHECK(buffer.getPathStart() == 3);
        }

        SUBCASE("finishPath() computes GAE over TD residuals")
        {
            // delta = [1 + 0.9 * 1 - 0.5, 2 + 0 - 1] = [1.4, 1.0]
            ExperienceBuffer buffer(2, {2}, ActionSpace{"Box", {1}}, 0.9, 0.95);
            storeEpisode(buffer, {1, 2}, {0.5, 1.0});
            buffer.finishPath(0);

            CHECK(buffer.getAdvantages()[1].item().toDouble() == doctest::Approx(1.0));
            CHECK(buffer.getAdvantages()[0].item().toDouble() == doctest::Approx(1.4 + 0.9 * 0.95 * 1.0));
            CHECK(buffer.getReturns()[1].item().toDouble() == doctest::Approx(2.0));
            CHECK(buffer.getReturns()[0].item().toDouble() == doctest::Approx(2.8));
        }

        SUBCASE("finishPath() bootstraps truncated episodes with the last value")
        {
            ExperienceBuffer buffer(1, {2}, ActionSpace{"Box", {1}}, 0.9, 0.95);
            storeEpisode(buffer, {1}, {0.5});
            buffer.finishPath(2);

            CHECK(buffer.getAdvantages()[0].item().toDouble() == doctest::Approx(1 + 0.9 * 2 - 0.5));
            CHECK(buffer.getReturns()[0].item().toDouble() == doctest::Approx(1 + 0.9 * 2));
        }

        SUBCASE("finishPath() does not propagate rewards across episodes")
        {
            ExperienceBuffer buffer(4, {2}, ActionSpace{"Box", {1}}, 0.5, 1.0);
            storeEpisode(buffer, {1, 1}, {0, 0});
            buffer.finishPath(0);
            storeEpisode(buffer, {10, 10}, {0, 0});
            buffer.finishPath(0);

            CHECK(buffer.getReturns()[0].item().toDouble() == doctest::Approx(1.5));
            CHECK(buffer.getReturns()[1].item().toDouble() == doctest::Approx(1));
            CHECK(buffer.getReturns()[2].item().toDouble() == doctest::Approx(15));
            CHECK(buffer.getReturns()[3].item().toDouble() == doctest::Approx(10));
        }

        SUBCASE("finishPath() on an empty episode is a no-op")
        {
            ExperienceBuffer buffer(2, {2}, ActionSpace{"Box", {1}}, 0.9, 0.95);
            buffer.finishPath(5);

            CHECK(buffer.getPathStart() == 0);
            CHECK(buffer.getReturns()[0].item().toDouble() == doctest::Approx(0));
        }

        SUBCASE("store() on a full buffer throws BufferFull")
        {
            ExperienceBuffer buffer(2, {2}, ActionSpace{"Box", {1}}, 0.9, 0.95);
            storeEpisode(buffer, {1, 1}, {0, 0});

            CHECK_THROWS_AS(buffer.store(torch::zeros({2}), torch::zeros({1}), 0, 0, 0), BufferFull);
        }

        SUBCASE("get() before the epoch is full throws BufferNotFull")
        {
            ExperienceBuffer buffer(3, {2}, ActionSpace{"Box", {1}}, 0.9, 0.95);
            storeEpisode(buffer, {1, 1}, {0, 0});

            CHECK_THROWS_AS(buffer.get(), BufferNotFull);
        }

        SUBCASE("get() normalizes advantages over the epoch")
        {
            ExperienceBuffer buffer(5, {2}, ActionSpace{"Box", {1}}, 0.99, 0.95);
            storeEpisode(buffer, {1, -2, 3}, {0.5, 0.1, -0.3});
            buffer.finishPath(0);
            storeEpisode(buffer, {0.5, 4}, {1, 2});
            buffer.finishPath(1.5);

            auto batch = buffer.get();

            INFO("Advantages: \n" << batch.advantages << "\n");
            CHECK(batch.advantages.mean().item().toDouble() == doctest::Approx(0).epsilon(1e-6));
            CHECK(torch::std(batch.advantages, false).item().toDouble() == doctest::Approx(1).epsilon(1e-6));
            CHECK(batch.observations.size(0) == 5);
            CHECK(batch.actions.size(0) == 5);
            CHECK(batch.returns.size(0) == 5);
            CHECK(batch.logProbs.size(0) == 5);
        }

        SUBCASE("get() rewinds the cursors and accepts a fresh epoch")
        {
            ExperienceBuffer buffer(3, {2}, ActionSpace{"Box", {1}}, 0.9, 0.95);
            storeEpisode(buffer, {1, 2, 3}, {0, 0, 0});
            buffer.finishPath(0);
            buffer.get();

            CHECK(buffer.getPtr() == 0);
            CHECK(buffer.getPathStart() == 0);

            CHECK_NOTHROW(storeEpisode(buffer, {3, 2, 1}, {0, 0, 0}));
            buffer.finishPath(0);
            CHECK_NOTHROW(buffer.get());
        }

        SUBCASE("Non-finite rewards throw NumericInstability")
        {
            ExperienceBuffer buffer(1, {2}, ActionSpace{"Box", {1}}, 0.9, 0.95);
            storeEpisode(buffer, {std::nanf("")}, {0});

            CHECK_THROWS_AS(buffer.finishPath(0), NumericInstability);
        }

        SUBCASE("get() ignores rewards of an episode that was never finished")
        {
            ExperienceBuffer buffer(4, {2}, ActionSpace{"Box", {1}}, 0.9, 0.95);
            storeEpisode(buffer, {1, 2}, {0, 0});
            buffer.finishPath(0);
            storeEpisode(buffer, {std::nanf(""), 1}, {0, 0});

            auto batch = buffer.get();

            INFO("Advantages: \n" << batch.advantages);
            CHECK(torch::isfinite(batch.advantages).all().item<bool>());
            CHECK(buffer.getPtr() == 0);
        }

        SUBCASE("to() doesn't crash")
        {
            ExperienceBuffer buffer(3, {4}, ActionSpace{"Discrete", {3}}, 0.9, 0.95);
            buffer.to(torch::kCPU);
        }
    }
}
