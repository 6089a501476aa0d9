#pragma once

#ifndef PROXIMALPOLICY_TRAINER_HPP
#define PROXIMALPOLICY_TRAINER_HPP

#include<vector>

#include<torch/torch.h>

#include"Algorithms/Algorithm.hpp"
#include"Config.hpp"
#include"Environment/Environment.hpp"
#include"Evaluator.hpp"
#include"Metrics.hpp"
#include"Model/Policy.hpp"
#include"Storage.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Alternates experience collection and policy updates
     *
     * Every epoch collects `stepsPerEpoch` transitions into the buffer, closing an episode on
     * natural termination, at `maxEpisodeLength` steps, and at the end of the epoch. Finished
     * episodes are reported as "Episode Rewards" (and "Episode Evaluation" when an Evaluator
     * is attached), numbered by a running episode counter. The update statistics of every
     * epoch are reported under their own names, numbered by epoch.
     *
     * All collaborators are borrowed and must outlive the Trainer.
     */
    class Trainer
    {
    private:
        Environment &environment;
        Policy &policy;
        Algorithms &algorithm;
        ExperienceBuffer &buffer;
        const TrainingConfig &config;
        MetricsWriter &metrics;
        Evaluator *evaluator;
        torch::Device device;

        torch::Tensor state;
        float episodeReturn = 0;
        int episodeLength = 0;
        int64_t episode = 0;
        int64_t epoch = 0;

        void endEpisode();

    public:
        /**
         * @param evaluator Optional; run after every finished training episode
         * @param device Device holding the policy parameters and the buffer
         */
        Trainer(Environment &environment,
                Policy &policy,
                Algorithms &algorithm,
                ExperienceBuffer &buffer,
                const TrainingConfig &config,
                MetricsWriter &metrics,
                Evaluator *evaluator = nullptr,
                torch::Device device = torch::kCPU);

        /**
         * @brief Runs `config.epochs` epochs, checkpointing every `config.saveFrequency`
         * epochs and after the last one when `config.checkpointPath` is set
         */
        void train();

        /**
         * @brief Collects one epoch of experience and updates the policy with it
         *
         * @return Statistics of the update
         */
        std::vector<UpdateDatum> runEpoch();

        inline int64_t getEpisodeCount() const { return episode; }

        inline int64_t getEpochCount() const { return epoch; }
    };
}

#endif //PROXIMALPOLICY_TRAINER_HPP
