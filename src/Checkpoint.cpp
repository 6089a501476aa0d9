#include<filesystem>
#include<limits>
#include<memory>
#include<stdexcept>
#include<string>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/Checkpoint.hpp"
#include"../include/Model/MlpApproximator.hpp"
#include"../include/Space.hpp"

namespace ProximalPolicy
{
    void saveCheckpoint(const Policy &policy, const std::string &path)
    {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent);
        }
        torch::save(policy, path);
        spdlog::info("Saved checkpoint to {}", path);
    }

    void loadCheckpoint(Policy &policy, const std::string &path)
    {
        if (!std::filesystem::exists(path))
        {
            throw std::runtime_error("Checkpoint " + path + " does not exist");
        }
        try
        {
            torch::load(policy, path);
        }
        catch (const c10::Error &e)
        {
            throw std::runtime_error("Could not load checkpoint " + path + ": " + e.what_without_backtrace());
        }
        spdlog::info("Loaded checkpoint from {}", path);
    }

    TEST_CASE("Checkpoint")
    {
        const auto inf = std::numeric_limits<float>::infinity();
        ActionSpace space{"Box", {2}, {-inf, -inf}, {inf, inf}};
        auto makePolicy = [&space]() {
            return Policy(space,
                          std::make_shared<MlpApproximator>(3, 2),
                          std::make_shared<MlpApproximator>(3, 1));
        };
        auto path = (std::filesystem::temp_directory_path() /
                     "proximalpolicy-checkpoint-test" / "policy.pt").string();

        SUBCASE("Round trip restores every parameter")
        {
            auto saved = makePolicy();
            {
                torch::NoGradGuard no_grad;
                saved->named_parameters()["output.logStd"].fill_(0.25);
            }
            saveCheckpoint(saved, path);

            auto loaded = makePolicy();
            loadCheckpoint(loaded, path);

            auto savedParameters = saved->named_parameters();
            auto loadedParameters = loaded->named_parameters();
            CHECK(torch::allclose(loadedParameters["output.logStd"], torch::full({2}, 0.25)));
            for (const auto &parameter : savedParameters)
            {
                INFO(parameter.key());
                CHECK(torch::equal(parameter.value(), loadedParameters[parameter.key()]));
            }
            std::filesystem::remove(path);
        }

        SUBCASE("Missing files throw")
        {
            auto policy = makePolicy();
            CHECK_THROWS_AS(loadCheckpoint(policy, path + ".missing"), std::runtime_error);
        }
    }
}
