#include<exception>
#include<iostream>
#include<memory>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../include/ProximalPolicy.hpp"
#include"GymEnvironment.hpp"

using namespace ProximalPolicy;

int main(int argc, char *argv[])
{
    spdlog::set_pattern("%^[%T %7l] %v%$");

    try
    {
        auto config = parseArguments(argc, argv);
        if (config.showUsage)
        {
            std::cout << usage(argv[0]);
            return 0;
        }

        at::set_num_threads(config.numThreads);
        torch::manual_seed(config.seed);

        torch::Device device = torch::kCPU;
        if (config.useCuda)
        {
            if (!torch::cuda::is_available())
            {
                spdlog::error("CUDA was requested but is not available");
                return 1;
            }
            device = torch::kCUDA;
        }

        spdlog::info("Connecting to the gym server at {}", config.serverUrl);
        GymEnvironment gym(config.serverUrl, config.envName);

        std::unique_ptr<FrameStack> frameStack;
        Environment *environment = &gym;
        if (config.frameStack > 1 || config.observationScale != 1)
        {
            frameStack = std::make_unique<FrameStack>(gym, config.frameStack, config.observationScale);
            environment = frameStack.get();
        }

        auto actionSpace = environment->getActionSpace();
        auto observationShape = environment->getObservationSpace().shape;

        Policy policy(actionSpace,
                      makeApproximator(observationShape, static_cast<unsigned>(actionSpace.shape[0])),
                      makeApproximator(observationShape, 1));
        if (!config.loadPath.empty())
        {
            loadCheckpoint(policy, config.loadPath);
            spdlog::info("Loaded checkpoint {}", config.loadPath);
        }
        policy->to(device);

        ExperienceBuffer buffer(config.stepsPerEpoch, observationShape, actionSpace,
                                config.gamma, config.lambda, device);
        PPO ppo(policy,
                config.clipRatio,
                config.policyLearningRate,
                config.valueLearningRate,
                config.trainPolicyIterations,
                config.trainValueIterations,
                config.targetKl);
        LoggingMetricsWriter metrics(config.logDirectory, config.envName);

        std::unique_ptr<Evaluator> evaluator;
        if (config.evaluate)
        {
            evaluator = std::make_unique<Evaluator>(*environment, policy,
                                                    config.deterministicEvaluation,
                                                    config.renderEvaluation,
                                                    config.maxEpisodeLength,
                                                    device);
        }

        Trainer trainer(*environment, policy, ppo, buffer, config, metrics, evaluator.get(), device);
        trainer.train();
    }
    catch (const std::invalid_argument &e)
    {
        spdlog::error(e.what());
        std::cerr << usage(argv[0]);
        return 1;
    }
    catch (const std::exception &e)
    {
        spdlog::error(e.what());
        return 1;
    }

    return 0;
}
