#pragma once

#ifndef PROXIMALPOLICY_GYMENVIRONMENT_HPP
#define PROXIMALPOLICY_GYMENVIRONMENT_HPP

#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../include/Environment/Environment.hpp"
#include"../include/Space.hpp"
#include"Communication.hpp"

namespace ProximalPolicy
{
    /**
     * @brief Environment hosted by a remote gym server
     *
     * On construction the client asks the server to make one instance of `envName` and
     * queries its spaces. Vector observations (rank 1) and image observations
     * (rank 3, channels last) are supported. The server does not report bounds of "Box"
     * action spaces, so they are left unbounded.
     */
    class GymEnvironment : public Environment
    {
    private:
        std::unique_ptr<GymClient::Communicator> communicator;
        ActionSpace actionSpace;
        ObservationSpace observationSpace;
        bool render;

        torch::Tensor toObservation(const std::vector<float> &values) const;

    public:
        /**
         * @throws std::runtime_error if the server does not answer or reports an
         *         observation rank other than 1 or 3
         */
        GymEnvironment(const std::string &url, const std::string &envName, int timeout = 5000);

        torch::Tensor reset() override;
        StepResult step(const torch::Tensor &action) override;

        ActionSpace getActionSpace() const override { return actionSpace; }
        ObservationSpace getObservationSpace() const override { return observationSpace; }

        void setRendering(bool render) override { this->render = render; }
    };

    /**
     * @brief Row-major flattening of nested vectors
     */
    inline std::vector<float> flattenVector(std::vector<float> const &input)
    {
        return input;
    }

    template<typename T>
    std::vector<float> flattenVector(std::vector<std::vector<T>> const &input)
    {
        std::vector<float> output;
        for (auto const &elements : input)
        {
            auto subVector = flattenVector(elements);
            output.insert(output.end(), subVector.cbegin(), subVector.cend());
        }
        return output;
    }
}

#endif //PROXIMALPOLICY_GYMENVIRONMENT_HPP
