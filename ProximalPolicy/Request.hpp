#pragma once
/**
 * @file Request.hpp
 * @brief Messages exchanged with the gym server
 *
 * Every request is a MessagePack map `{method, param}`; every response a map whose
 * fields are listed in the response structs below. The server can run several
 * environments side by side, so observations, rewards and done flags carry a leading
 * environment axis.
 */

#ifndef PROXIMALPOLICY_REQUEST_HPP
#define PROXIMALPOLICY_REQUEST_HPP

#include<memory>
#include<string>
#include<vector>

#include<msgpack.hpp>

namespace GymClient
{
    /**
     * @brief Envelope of a request
     * @tparam T Parameter struct of the method
     */
    template<class T>
    struct Request
    {
        std::string method; ///< "make", "info", "reset" or "step"
        std::shared_ptr<T> param;

        Request(const std::string &method, std::shared_ptr<T> param) : method(method), param(param) {}

        MSGPACK_DEFINE_MAP(method, param);
    };

    struct MakeParam
    {
        std::string envName; ///< Gym id, e.g. "BipedalWalker-v2"
        int numEnv;
        MSGPACK_DEFINE_MAP(envName, numEnv);
    };

    struct InfoParam
    {
        int x;
        MSGPACK_DEFINE_MAP(x);
    };

    struct ResetParam
    {
        int x;
        MSGPACK_DEFINE_MAP(x);
    };

    struct StepParam
    {
        std::vector<std::vector<float>> action; ///< One action vector per environment
        bool render;
        MSGPACK_DEFINE_MAP(action, render);
    };

    struct MakeResponse
    {
        std::string result;
        MSGPACK_DEFINE_MAP(result);
    };

    struct InfoResponse
    {
        std::string actionSpaceType;               ///< "Box" or "Discrete"
        std::vector<int64_t> actionSpaceShape;
        std::string observationSpaceType;
        std::vector<int64_t> observationSpaceShape;
        MSGPACK_DEFINE_MAP(actionSpaceType, actionSpaceShape, observationSpaceType, observationSpaceShape);
    };

    /**
     * @brief Reset response for vector observations, `[env][feature]`
     */
    struct MlpResetResponse
    {
        std::vector<std::vector<float>> observation;
        MSGPACK_DEFINE_MAP(observation);
    };

    /**
     * @brief Reset response for image observations, `[env][height][width][channel]`
     */
    struct CnnResetResponse
    {
        std::vector<std::vector<std::vector<std::vector<float>>>> observation;
        MSGPACK_DEFINE_MAP(observation);
    };

    struct StepResponse
    {
        std::vector<std::vector<float>> reward;      ///< `[env][1]`
        std::vector<std::vector<bool>> done;         ///< `[env][1]`
        std::vector<std::vector<float>> real_reward; ///< Reward before any server-side shaping
    };

    struct MlpStepResponse : StepResponse
    {
        std::vector<std::vector<float>> observation;
        MSGPACK_DEFINE_MAP(observation, reward, done, real_reward);
    };

    struct CnnStepResponse : StepResponse
    {
        std::vector<std::vector<std::vector<std::vector<float>>>> observation;
        MSGPACK_DEFINE_MAP(observation, reward, done, real_reward);
    };
}

#endif //PROXIMALPOLICY_REQUEST_HPP
