#include<stdexcept>
#include<string>
#include<vector>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Environment/FrameStack.hpp"

namespace ProximalPolicy
{
    FrameStack::FrameStack(Environment &environment, int numFrames, float scale) :
        environment(environment), numFrames(numFrames), scale(scale)
    {
        if (numFrames < 1)
        {
            throw std::invalid_argument("FrameStack needs at least one frame, got " + std::to_string(numFrames));
        }
    }

    torch::Tensor FrameStack::prepare(const torch::Tensor &observation) const
    {
        auto frame = observation.to(torch::kFloat);
        if (frame.dim() == 2)
        {
            frame = frame.unsqueeze(-1);
        }
        return scale == 1 ? frame : frame * scale;
    }

    torch::Tensor FrameStack::stacked() const
    {
        return torch::cat(std::vector<torch::Tensor>(frames.begin(), frames.end()), -1);
    }

    torch::Tensor FrameStack::reset()
    {
        auto frame = prepare(environment.reset());
        frames.assign(static_cast<size_t>(numFrames), frame);
        return stacked();
    }

    StepResult FrameStack::step(const torch::Tensor &action)
    {
        if (frames.empty())
        {
            throw std::logic_error("FrameStack::step() called before reset()");
        }

        auto result = environment.step(action);
        frames.pop_front();
        frames.push_back(prepare(result.observation));
        result.observation = stacked();
        return result;
    }

    ActionSpace FrameStack::getActionSpace() const
    {
        return environment.getActionSpace();
    }

    ObservationSpace FrameStack::getObservationSpace() const
    {
        auto shape = environment.getObservationSpace().shape;
        if (shape.size() == 2)
        {
            shape.push_back(1);
        }
        if (!shape.empty())
        {
            shape.back() *= numFrames;
        }
        return {shape};
    }

    void FrameStack::setRendering(bool render)
    {
        environment.setRendering(render);
    }

    namespace
    {
        // Emits frames filled with the number of steps taken since reset
        class CountingEnvironment : public Environment
        {
        public:
            std::vector<int64_t> shape;
            int count = 0;
            bool rendering = false;

            explicit CountingEnvironment(std::vector<int64_t> shape) : shape(shape) {}

            torch::Tensor reset() override
            {
                count = 0;
                return torch::zeros(shape);
            }

            StepResult step(const torch::Tensor &) override
            {
                ++count;
                return {torch::full(shape, static_cast<float>(count)), 1, false, {}};
            }

            ActionSpace getActionSpace() const override { return {"Discrete", {2}}; }
            ObservationSpace getObservationSpace() const override { return {shape}; }
            void setRendering(bool render) override { rendering = render; }
        };
    }

    TEST_CASE("FrameStack")
    {
        SUBCASE("Grayscale frames gain a channel axis")
        {
            CountingEnvironment inner({6, 5});
            FrameStack stack(inner, 4);

            CHECK(stack.getObservationSpace().shape == std::vector<int64_t>{6, 5, 4});
            CHECK(stack.reset().sizes().vec() == std::vector<int64_t>{6, 5, 4});
        }

        SUBCASE("Frames are stacked oldest first")
        {
            CountingEnvironment inner({2, 2, 1});
            FrameStack stack(inner, 3);

            stack.reset();
            stack.step(torch::zeros({1}));
            auto observation = stack.step(torch::zeros({1})).observation;

            INFO("Observation: \n" << observation);
            CHECK(observation.sizes().vec() == std::vector<int64_t>{2, 2, 3});
            CHECK(observation[0][0][0].item().toFloat() == doctest::Approx(0));
            CHECK(observation[0][0][1].item().toFloat() == doctest::Approx(1));
            CHECK(observation[1][1][2].item().toFloat() == doctest::Approx(2));
        }

        SUBCASE("reset() clears previous frames")
        {
            CountingEnvironment inner({3});
            FrameStack stack(inner, 2);

            stack.reset();
            stack.step(torch::zeros({1}));
            auto observation = stack.reset();

            CHECK(observation.sizes().vec() == std::vector<int64_t>{6});
            CHECK(observation.sum().item().toFloat() == doctest::Approx(0));
        }

        SUBCASE("Observations are scaled")
        {
            CountingEnvironment inner({2});
            FrameStack stack(inner, 1, 0.5);

            stack.reset();
            auto result = stack.step(torch::zeros({1}));
            CHECK(result.observation[0].item().toFloat() == doctest::Approx(0.5));
            CHECK(result.reward == doctest::Approx(1));
        }

        SUBCASE("Rendering requests reach the wrapped environment")
        {
            CountingEnvironment inner({2});
            FrameStack stack(inner, 2);

            stack.setRendering(true);
            CHECK(inner.rendering);
        }

        SUBCASE("Invalid arguments")
        {
            CountingEnvironment inner({2});
            CHECK_THROWS_AS(FrameStack(inner, 0), std::invalid_argument);

            FrameStack stack(inner, 2);
            CHECK_THROWS_AS(stack.step(torch::zeros({1})), std::logic_error);
        }
    }
}
