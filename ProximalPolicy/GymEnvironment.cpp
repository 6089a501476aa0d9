#include<functional>
#include<limits>
#include<map>
#include<numeric>
#include<stdexcept>
#include<string>
#include<thread>
#include<vector>

#include<unistd.h>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<zmq.hpp>
#include<doctest/doctest.h>

#include"GymEnvironment.hpp"
#include"Communication.hpp"
#include"Request.hpp"

namespace ProximalPolicy
{
    namespace
    {
        template<class Response>
        StepResult toStepResult(const Response &response, torch::Tensor observation)
        {
            if (response.reward.empty() || response.reward[0].empty() ||
                response.done.empty() || response.done[0].empty())
            {
                throw std::runtime_error("Malformed step response from gym server");
            }

            StepResult result{observation, response.reward[0][0], static_cast<bool>(response.done[0][0]), {}};
            if (!response.real_reward.empty() && !response.real_reward[0].empty())
            {
                result.info["real_reward"] = response.real_reward[0][0];
            }
            return result;
        }
    }

    GymEnvironment::GymEnvironment(const std::string &url, const std::string &envName, int timeout) :
        communicator(std::make_unique<GymClient::Communicator>(url, timeout)),
        render(false)
    {
        spdlog::info("Creating environment {}", envName);
        auto makeParam = std::make_shared<GymClient::MakeParam>();
        makeParam->envName = envName;
        makeParam->numEnv = 1;
        communicator->sendRequest(GymClient::Request<GymClient::MakeParam>("make", makeParam));
        spdlog::info("{}", communicator->getResponse<GymClient::MakeResponse>()->result);

        communicator->sendRequest(GymClient::Request<GymClient::InfoParam>("info", std::make_shared<GymClient::InfoParam>()));
        auto info = communicator->getResponse<GymClient::InfoResponse>();
        spdlog::info("Action space: {} - [{}]", info->actionSpaceType, fmt::join(info->actionSpaceShape, ", "));
        spdlog::info("Observation space: {} - [{}]", info->observationSpaceType,
                     fmt::join(info->observationSpaceShape, ", "));

        const auto rank = info->observationSpaceShape.size();
        if (rank != 1 && rank != 3)
        {
            throw std::runtime_error("Gym server reported an observation of rank " + std::to_string(rank) +
                                     "; only vector and image observations are supported");
        }
        observationSpace.shape = info->observationSpaceShape;

        actionSpace.type = info->actionSpaceType;
        actionSpace.shape = info->actionSpaceShape;
        if (actionSpace.type == "Box" && !actionSpace.shape.empty())
        {
            const auto dimensions = static_cast<size_t>(actionSpace.shape[0]);
            actionSpace.low.assign(dimensions, -std::numeric_limits<float>::infinity());
            actionSpace.high.assign(dimensions, std::numeric_limits<float>::infinity());
        }
    }

    torch::Tensor GymEnvironment::toObservation(const std::vector<float> &values) const
    {
        const auto expected = std::accumulate(observationSpace.shape.begin(), observationSpace.shape.end(),
                                              int64_t{1}, std::multiplies<int64_t>());
        if (static_cast<int64_t>(values.size()) != expected)
        {
            throw std::runtime_error(fmt::format("Gym server sent {} observation values, expected {}",
                                                 values.size(), expected));
        }
        auto data = values;
        return torch::from_blob(data.data(), observationSpace.shape).clone();
    }

    torch::Tensor GymEnvironment::reset()
    {
        communicator->sendRequest(GymClient::Request<GymClient::ResetParam>("reset", std::make_shared<GymClient::ResetParam>()));
        if (observationSpace.shape.size() == 1)
        {
            return toObservation(flattenVector(communicator->getResponse<GymClient::MlpResetResponse>()->observation));
        }
        return toObservation(flattenVector(communicator->getResponse<GymClient::CnnResetResponse>()->observation));
    }

    StepResult GymEnvironment::step(const torch::Tensor &action)
    {
        auto flat = action.detach().to(torch::kCPU, torch::kFloat).contiguous().reshape({-1});
        auto stepParam = std::make_shared<GymClient::StepParam>();
        stepParam->action = {std::vector<float>(flat.data_ptr<float>(), flat.data_ptr<float>() + flat.numel())};
        stepParam->render = render;
        communicator->sendRequest(GymClient::Request<GymClient::StepParam>("step", stepParam));

        if (observationSpace.shape.size() == 1)
        {
            auto response = communicator->getResponse<GymClient::MlpStepResponse>();
            return toStepResult(*response, toObservation(flattenVector(response->observation)));
        }
        auto response = communicator->getResponse<GymClient::CnnStepResponse>();
        return toStepResult(*response, toObservation(flattenVector(response->observation)));
    }

    namespace
    {
        // Answers a fixed number of requests the way the gym server does
        class FakeGymServer
        {
        private:
            zmq::context_t context;
            zmq::socket_t socket;
            std::thread thread;
            std::vector<int64_t> observationShape;

            template<class T>
            void reply(const T &response)
            {
                msgpack::sbuffer buffer;
                msgpack::pack(buffer, response);
                socket.send(zmq::message_t(buffer.data(), buffer.size()), zmq::send_flags::none);
            }

            void serve(int requests)
            {
                for (int i = 0; i < requests; ++i)
                {
                    zmq::message_t message;
                    if (!socket.recv(message, zmq::recv_flags::none))
                    {
                        return;
                    }
                    auto handle = msgpack::unpack(static_cast<const char *>(message.data()), message.size());
                    std::map<std::string, msgpack::object> request;
                    handle.get().convert(request);
                    auto method = request.at("method").as<std::string>();
                    methods.push_back(method);

                    if (method == "make")
                    {
                        reply(GymClient::MakeResponse{"Made " + request.at("param").as<GymClient::MakeParam>().envName});
                    }
                    else if (method == "info")
                    {
                        reply(GymClient::InfoResponse{"Box", {2}, "Box", observationShape});
                    }
                    else if (method == "reset")
                    {
                        reply(GymClient::MlpResetResponse{{{0.1f, 0.2f, 0.3f}}});
                    }
                    else if (method == "step")
                    {
                        auto param = request.at("param").as<GymClient::StepParam>();
                        actions.push_back(param.action.at(0));
                        renders.push_back(param.render);

                        GymClient::MlpStepResponse response;
                        response.observation = {{1.f, 2.f, 3.f}};
                        response.reward = {{0.5f}};
                        response.done = {{renders.size() == 2}};
                        response.real_reward = {{0.7f}};
                        reply(response);
                    }
                }
            }

        public:
            std::vector<std::string> methods;
            std::vector<std::vector<float>> actions;
            std::vector<bool> renders;

            FakeGymServer(const std::string &url, std::vector<int64_t> observationShape, int requests) :
                context(1),
                socket(context, zmq::socket_type::pair),
                observationShape(observationShape)
            {
                socket.set(zmq::sockopt::rcvtimeo, 5000);
                socket.set(zmq::sockopt::linger, 0);
                socket.bind(url);
                thread = std::thread([this, requests]() { serve(requests); });
            }

            void join()
            {
                if (thread.joinable())
                {
                    thread.join();
                }
            }

            ~FakeGymServer()
            {
                join();
            }
        };

        std::string testEndpoint(const std::string &name)
        {
            return "ipc:///tmp/proximalpolicy-" + name + "-" + std::to_string(getpid());
        }
    }

    TEST_CASE("flattenVector()")
    {
        std::vector<std::vector<std::vector<float>>> nested{{{1, 2}, {3}}, {{4, 5, 6}}};
        CHECK(flattenVector(nested) == std::vector<float>{1, 2, 3, 4, 5, 6});
    }

    TEST_CASE("GymEnvironment")
    {
        SUBCASE("Talks the gym server protocol")
        {
            auto url = testEndpoint("gym");
            FakeGymServer server(url, {3}, 5);
            {
                GymEnvironment environment(url, "Pendulum-v0");

                CHECK(environment.getActionSpace().type == "Box");
                CHECK(environment.getActionSpace().shape == std::vector<int64_t>{2});
                CHECK(environment.getActionSpace().low.size() == 2);
                CHECK(environment.getObservationSpace().shape == std::vector<int64_t>{3});

                auto observation = environment.reset();
                CHECK(observation.sizes().vec() == std::vector<int64_t>{3});
                CHECK(observation[2].item().toFloat() == doctest::Approx(0.3));

                float action[] = {0.25, -0.5};
                auto first = environment.step(torch::from_blob(action, {2}));
                CHECK(first.observation[1].item().toFloat() == doctest::Approx(2));
                CHECK(first.reward == doctest::Approx(0.5));
                CHECK(!first.done);
                CHECK(first.info.at("real_reward") == doctest::Approx(0.7));

                environment.setRendering(true);
                auto second = environment.step(torch::from_blob(action, {2}));
                CHECK(second.done);
            }
            server.join();

            CHECK(server.methods == std::vector<std::string>{"make", "info", "reset", "step", "step"});
            REQUIRE(server.actions.size() == 2);
            CHECK(server.actions[0] == std::vector<float>{0.25, -0.5});
            CHECK(server.renders == std::vector<bool>{false, true});
        }

        SUBCASE("Unsupported observation ranks are rejected")
        {
            auto url = testEndpoint("gym-rank");
            FakeGymServer server(url, {4, 4}, 2);
            CHECK_THROWS_AS(GymEnvironment(url, "Gray-v0"), std::runtime_error);
        }

        SUBCASE("A silent server times out")
        {
            CHECK_THROWS_AS(GymEnvironment(testEndpoint("nobody"), "CartPole-v1", 100), std::runtime_error);
        }
    }
}
