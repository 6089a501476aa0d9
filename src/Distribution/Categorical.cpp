#include<cmath>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Distribution/Categorical.hpp"

namespace ProximalPolicy
{
    /**
     * @details Logits are normalized with log-sum-exp. `batch_shape` is the logits shape
     * without its last (event) dimension.
     */
    Categorical::Categorical(const torch::Tensor &logits)
    {
        if (logits.dim() < 1)
        {
            throw std::runtime_error("Categorical logits need at least one dimension");
        }
        this->logits = logits - logits.logsumexp(-1, true);
        probs = torch::softmax(this->logits, -1);
        numEvents = logits.size(-1);
        batch_shape = logits.sizes().vec();
        batch_shape.pop_back();
    }

    torch::Tensor Categorical::entropy()
    {
        return -(logits * probs).sum(-1);
    }

    /**
     * @details `value` is broadcast against the batch of logits, then `gather` picks the
     * log-probability of each index along the event dimension.
     */
    torch::Tensor Categorical::logProbability(torch::Tensor value)
    {
        value = value.to(torch::kLong).unsqueeze(-1);
        auto broadcastedTensors = torch::broadcast_tensors({value, logits});
        auto indices = broadcastedTensors[0].narrow(-1, 0, 1);
        return broadcastedTensors[1].gather(-1, indices).squeeze(-1);
    }

    /**
     * @details The probabilities are expanded to [sampleShape, batch_shape, N] and flattened
     * to 2-D for `torch::multinomial`; the draws are reshaped back afterwards.
     */
    torch::Tensor Categorical::sample(c10::ArrayRef<int64_t> sampleShape)
    {
        auto outputShape = extendedShape(sampleShape);
        auto paramShape = outputShape;
        paramShape.push_back(numEvents);

        torch::NoGradGuard no_grad_guard;
        auto expanded = probs;
        for (size_t i = 0; i < sampleShape.size(); ++i)
        {
            expanded = expanded.unsqueeze(0);
        }
        auto probs2D = expanded.expand(paramShape).contiguous().view({-1, numEvents});
        auto sample2D = torch::multinomial(probs2D, 1, true);
        return sample2D.view(outputShape);
    }

    torch::Tensor Categorical::mode()
    {
        return probs.argmax(-1);
    }

    TEST_CASE("Categorical")
    {
        SUBCASE("Throws on scalar logits")
        {
            CHECK_THROWS(Categorical(torch::tensor(1.0)));
        }

        SUBCASE("Sampled indices are in range and shaped correctly")
        {
            auto logits = torch::zeros({5});
            auto dist = Categorical(logits);

            auto output = dist.sample({100});
            CHECK(output.dtype() == torch::kLong);
            CHECK(!(output > 4).any().item<bool>());
            CHECK(!(output < 0).any().item<bool>());
            CHECK(dist.sample({3, 7}).sizes().vec() == std::vector<int64_t>{3, 7});
        }

        SUBCASE("Batched logits are sampled per row")
        {
            float logits_array[2][4] = {{-100, -100, 100, -100},
                                        {100, -100, -100, -100}};
            auto logits = torch::from_blob(logits_array, {2, 4});
            auto dist = Categorical(logits);

            auto output = dist.sample({6});
            CHECK(output.sizes().vec() == std::vector<int64_t>{6, 2});

            auto sum = output.sum({0});
            CHECK(sum[0].item().toInt() == 12);
            CHECK(sum[1].item().toInt() == 0);
        }

        SUBCASE("logProbability() is the log-softmax at the action")
        {
            float logits_array[] = {1, 2, 3};
            auto logits = torch::from_blob(logits_array, {1, 3});
            auto dist = Categorical(logits);

            auto lse = 3 + std::log(1 + std::exp(-1.0) + std::exp(-2.0));
            auto first = dist.logProbability(torch::zeros({1}, torch::kLong));
            auto last = dist.logProbability(torch::full({1}, 2, torch::kLong));
            CHECK(first[0].item().toDouble() == doctest::Approx(1 - lse));
            CHECK(last[0].item().toDouble() == doctest::Approx(3 - lse));

            SUBCASE("Also for sampled actions")
            {
                auto action = dist.sample();
                auto expected = torch::log_softmax(logits, -1).gather(-1, action.unsqueeze(-1)).squeeze(-1);
                CHECK(dist.logProbability(action)[0].item().toDouble() ==
                      doctest::Approx(expected[0].item().toDouble()));
            }
        }

        SUBCASE("entropy()")
        {
            // Two equally likely actions, then four
            float logits_array[2][4] = {{1, 1, -30, -30},
                                        {0, 0, 0, 0}};
            auto logits = torch::from_blob(logits_array, {2, 4});
            auto dist = Categorical(logits);

            auto entropies = dist.entropy();
            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});
            CHECK(entropies[0].item().toDouble() == doctest::Approx(std::log(2.0)).epsilon(1e-3));
            CHECK(entropies[1].item().toDouble() == doctest::Approx(std::log(4.0)).epsilon(1e-3));
        }

        SUBCASE("mode() picks the most likely action")
        {
            float logits_array[2][3] = {{0.1, 2, -1},
                                        {5, 0, 4.9}};
            auto logits = torch::from_blob(logits_array, {2, 3});
            auto dist = Categorical(logits);

            auto mode = dist.mode();
            CHECK(mode[0].item().toLong() == 1);
            CHECK(mode[1].item().toLong() == 0);
        }
    }
}
