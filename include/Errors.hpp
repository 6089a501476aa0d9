#pragma once

#ifndef PROXIMALPOLICY_ERRORS_HPP
#define PROXIMALPOLICY_ERRORS_HPP

#include<stdexcept>
#include<string>

namespace ProximalPolicy
{
    /**
     * @brief Thrown by ExperienceBuffer::store() when every slot of the epoch is used.
     *
     * Indicates a programming error in the rollout loop; it is never retried.
     */
    class BufferFull : public std::runtime_error
    {
    public:
        explicit BufferFull(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief Thrown by ExperienceBuffer::get() before the epoch has been filled.
     */
    class BufferNotFull : public std::runtime_error
    {
    public:
        explicit BufferNotFull(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief Thrown at policy construction when the action space is neither a
     * bounded "Box" nor a "Discrete" space.
     */
    class UnsupportedActionSpace : public std::runtime_error
    {
    public:
        explicit UnsupportedActionSpace(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief Thrown when advantages, returns or losses stop being finite.
     *
     * Raised before the offending values reach a parameter update.
     */
    class NumericInstability : public std::runtime_error
    {
    public:
        explicit NumericInstability(const std::string &what) : std::runtime_error(what) {}
    };
}

#endif //PROXIMALPOLICY_ERRORS_HPP
