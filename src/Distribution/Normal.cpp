#include<cmath>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Distribution/Normal.hpp"

namespace ProximalPolicy
{
    namespace
    {
        const double halfLogTwoPi = 0.5 * std::log(2 * M_PI);
    }

    /**
     * @details `batch_shape` is the broadcast shape of the parameters. Each element is an
     * independent scalar Gaussian, so `event_shape` is empty.
     */
    Normal::Normal(const torch::Tensor loc, const torch::Tensor logScale)
    {
        auto broadcasted_tensors = torch::broadcast_tensors({loc, logScale});
        this->loc = broadcasted_tensors[0];
        this->logScale = broadcasted_tensors[1];
        this->scale = this->logScale.exp();
        this->batch_shape = this->loc.sizes().vec();
        this->event_shape = {};
    }

    /**
     * @details For independent dimensions the entropy of the joint distribution is the sum of
     * the per-dimension entropies:
     * \f[
     * H = \sum_i \left( \frac{1}{2} + \frac{1}{2}\ln(2\pi) + \log\sigma_i \right)
     * \f]
     */
    torch::Tensor Normal::entropy()
    {
        return (0.5 + halfLogTwoPi + logScale).sum(-1);
    }

    torch::Tensor Normal::logProbability(torch::Tensor value)
    {
        auto standardized = (value - loc) / (scale + 1e-8);
        return -0.5 * standardized.pow(2) - logScale - halfLogTwoPi;
    }

    torch::Tensor Normal::sample(c10::ArrayRef<int64_t> sample_shape)
    {
        auto shape = extendedShape(sample_shape);
        torch::NoGradGuard no_grad_guard;
        auto noise = torch::randn(shape, loc.options());
        return loc.expand(shape) + noise * scale.expand(shape);
    }

    torch::Tensor Normal::mode()
    {
        return loc;
    }

    TEST_CASE("Normal")
    {
        float locs_array[] = {0, 1, 2, 3, 4, 5};
        float log_scales_array[] = {0, -0.5, 1};
        auto locs = torch::from_blob(locs_array, {2, 3});
        auto log_scales = torch::from_blob(log_scales_array, {3});
        auto dist = Normal(locs, log_scales);

        SUBCASE("Sampled tensors have correct shape")
        {
            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(dist.sample({20}).sizes().vec() == std::vector<int64_t>{20, 2, 3});
            CHECK(dist.sample({4, 5}).sizes().vec() == std::vector<int64_t>{4, 5, 2, 3});
        }

        SUBCASE("Samples are centred on the mean")
        {
            auto samples = dist.sample({20000});
            auto means = samples.mean(0);

            INFO("Sample means: \n" << means);
            CHECK(means[1][2].item().toDouble() == doctest::Approx(5).epsilon(0.02));
            CHECK(samples.std(0)[0][2].item().toDouble() == doctest::Approx(std::exp(1.0)).epsilon(0.05));
        }

        SUBCASE("entropy()")
        {
            auto entropies = dist.entropy();

            SUBCASE("Returns correct values")
            {
                INFO("Entropies: \n" << entropies);

                auto expected = 3 * (0.5 + halfLogTwoPi) + 0.5;
                CHECK(entropies[0].item().toDouble() == doctest::Approx(expected));
                CHECK(entropies[1].item().toDouble() == doctest::Approx(expected));
            }

            SUBCASE("Output tensor is the correct size")
            {
                CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});
            }
        }

        SUBCASE("logProbability()")
        {
            SUBCASE("Matches the unit-variance density when logScale is 0")
            {
                auto unit = Normal(torch::full({1}, 0.3), torch::zeros({1}));
                auto log_prob = unit.logProbability(torch::full({1}, 1.2));

                CHECK(log_prob[0].item().toDouble() ==
                      doctest::Approx(-0.5 * 0.9 * 0.9 - halfLogTwoPi));
            }

            SUBCASE("Is element-wise and uses the shared scale")
            {
                float actions[2][3] = {{1, 1, 1},
                                       {3, 4, 5}};
                auto actions_tensor = torch::from_blob(actions, {2, 3});
                auto log_probs = dist.logProbability(actions_tensor);

                INFO(log_probs << "\n");
                CHECK(log_probs.sizes().vec() == std::vector<int64_t>{2, 3});
                CHECK(log_probs[0][0].item().toDouble() == doctest::Approx(-0.5 - halfLogTwoPi));
                CHECK(log_probs[1][1].item().toDouble() == doctest::Approx(0.5 - halfLogTwoPi));
                CHECK(log_probs[0][2].item().toDouble() ==
                      doctest::Approx(-0.5 * std::exp(-2.0) - 1 - halfLogTwoPi));
            }
        }

        SUBCASE("mode() returns the mean")
        {
            CHECK(torch::equal(dist.mode(), locs));
        }

        SUBCASE("Gradients flow to the log scale")
        {
            auto log_scale = torch::zeros({2}, torch::requires_grad());
            auto learnable = Normal(torch::zeros({4, 2}), log_scale);
            learnable.logProbability(torch::ones({4, 2})).sum().backward();

            CHECK(log_scale.grad().defined());
            // d/dlogScale of -0.5 * x^2 * exp(-2 logScale) - logScale at x = 1 is 0 per sample.
            CHECK(log_scale.grad()[0].item().toDouble() == doctest::Approx(0).epsilon(1e-5));
        }
    }
}
