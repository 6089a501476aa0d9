#include<cmath>
#include<tuple>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/modelUtils.hpp"

namespace ProximalPolicy
{
    /**
     * @details See Saxe et al., "Exact solutions to the nonlinear dynamics of learning in
     * deep linear neural networks". For wide matrices the decomposition is taken of the
     * transpose and transposed back.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain)
    {
        torch::NoGradGuard guard;
        if (tensor.dim() < 2)
        {
            return tensor;
        }

        const auto rows = tensor.size(0);
        const auto columns = tensor.numel() / rows;
        auto flattened = torch::randn({rows, columns});
        if (rows < columns)
        {
            flattened.t_();
        }

        torch::Tensor q, r;
        std::tie(q, r) = torch::linalg_qr(flattened);
        q *= torch::diag(r, 0).sign();

        if (rows < columns)
        {
            q.t_();
        }

        tensor.view_as(q).copy_(q);
        tensor.mul_(gain);
        return tensor;
    }

    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters,
                     double weightGain,
                     double biasGain)
    {
        torch::NoGradGuard guard;
        for (const auto &parameter : parameters)
        {
            if (parameter.value().numel() == 0)
            {
                continue;
            }
            if (parameter.key().find("bias") != std::string::npos)
            {
                torch::nn::init::constant_(parameter.value(), biasGain);
            }
            else if (parameter.key().find("weight") != std::string::npos)
            {
                orthogonal_(parameter.value(), weightGain);
            }
        }
    }

    TEST_CASE("orthogonal_()")
    {
        SUBCASE("Tall matrices have orthonormal columns")
        {
            auto weight = torch::empty({8, 4});
            orthogonal_(weight, 1);

            auto gram = weight.t().mm(weight);
            CHECK(torch::allclose(gram, torch::eye(4), 1e-4, 1e-5));
        }

        SUBCASE("Wide matrices have orthonormal rows scaled by the gain")
        {
            auto weight = torch::empty({3, 6});
            orthogonal_(weight, std::sqrt(2.0));

            auto gram = weight.mm(weight.t());
            CHECK(torch::allclose(gram, 2 * torch::eye(3), 1e-4, 1e-5));
        }

        SUBCASE("Vectors are left untouched")
        {
            auto bias = torch::full({5}, 3.0);
            orthogonal_(bias, 1);
            CHECK(bias[0].item().toDouble() == doctest::Approx(3));
        }
    }

    TEST_CASE("initWeights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Linear(5, 10),
            torch::nn::Functional(torch::tanh),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0.5);

        for (const auto &parameter : module->named_parameters())
        {
            INFO(parameter.key());
            if (parameter.key().find("bias") != std::string::npos)
            {
                CHECK(torch::allclose(parameter.value(), torch::full_like(parameter.value(), 0.5)));
            }
            else
            {
                auto weight = parameter.value();
                auto gram = weight.size(0) > weight.size(1) ? weight.t().mm(weight) : weight.mm(weight.t());
                CHECK(torch::allclose(gram, torch::eye(gram.size(0)), 1e-4, 1e-5));
            }
        }
    }
}
