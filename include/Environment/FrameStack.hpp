#pragma once

#ifndef PROXIMALPOLICY_FRAMESTACK_HPP
#define PROXIMALPOLICY_FRAMESTACK_HPP

#include<deque>

#include<torch/torch.h>

#include"Environment.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Observation wrapper keeping the last `numFrames` observations
     *
     * Each observation returned is the concatenation of the most recent frames along the
     * trailing axis, oldest first. Two-dimensional frames (grayscale images) first gain a
     * trailing channel axis, so `[H, W]` frames stack to `[H, W, numFrames]` and
     * `[H, W, C]` frames to `[H, W, C * numFrames]`. After reset() the first frame is
     * repeated to fill the stack. Every frame is multiplied by `scale`.
     *
     * The wrapped environment must outlive the wrapper. Actions pass through untouched.
     */
    class FrameStack : public Environment
    {
    private:
        Environment &environment;
        int numFrames;
        float scale;
        std::deque<torch::Tensor> frames;

        torch::Tensor prepare(const torch::Tensor &observation) const;
        torch::Tensor stacked() const;

    public:
        /**
         * @throws std::invalid_argument if `numFrames < 1`
         */
        FrameStack(Environment &environment, int numFrames, float scale = 1);

        torch::Tensor reset() override;
        StepResult step(const torch::Tensor &action) override;

        ActionSpace getActionSpace() const override;

        /**
         * @brief Shape of the stacked observations
         */
        ObservationSpace getObservationSpace() const override;

        void setRendering(bool render) override;

        inline int getNumFrames() const { return numFrames; }
    };
}

#endif //PROXIMALPOLICY_FRAMESTACK_HPP
