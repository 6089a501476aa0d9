#pragma once

#ifndef PROXIMALPOLICY_CONFIG_HPP
#define PROXIMALPOLICY_CONFIG_HPP

#include<string>

namespace ProximalPolicy
{
    /**
     * @brief Hyperparameters and run settings of a training session
     */
    struct TrainingConfig
    {
        // Environment
        std::string envName = "BipedalWalker-v2";
        std::string serverUrl = "tcp://127.0.0.1:10201";
        int frameStack = 1;          ///< Frames stacked per observation; 1 disables stacking
        float observationScale = 1;  ///< Applied to every observation, e.g. 1/255 for images

        // PPO
        int stepsPerEpoch = 4000;
        int epochs = 3000;
        float gamma = 0.99;
        float clipRatio = 0.2;
        float policyLearningRate = 1e-4;
        float valueLearningRate = 1e-4;
        int trainPolicyIterations = 80;
        int trainValueIterations = 80;
        float lambda = 0.97;
        int maxEpisodeLength = 10000;
        float targetKl = 0.01;

        // Run
        int saveFrequency = 10;      ///< Epochs between checkpoints
        std::string checkpointPath;  ///< Where checkpoints go; empty disables saving
        std::string loadPath;        ///< Checkpoint to start from; empty starts fresh
        std::string logDirectory = "logs";
        bool evaluate = true;        ///< Run an evaluation episode after every training episode
        bool deterministicEvaluation = false;
        bool renderEvaluation = false;
        int numThreads = 1;
        int seed = 0;
        bool useCuda = false;
        bool showUsage = false;      ///< Set by --help; the caller prints usage() and exits

        /**
         * @throws std::invalid_argument naming the first out-of-range field
         */
        void validate() const;
    };

    /**
     * @brief Builds a TrainingConfig from command line options
     *
     * Unspecified options keep their defaults. The result is validated.
     *
     * @throws std::invalid_argument on unknown options, malformed numbers or invalid values
     */
    TrainingConfig parseArguments(int argc, char *argv[]);

    /**
     * @brief Text listing every option, for `--help`
     */
    std::string usage(const std::string &program);
}

#endif //PROXIMALPOLICY_CONFIG_HPP
