#pragma once
/**
 * @file Communication.hpp
 * @brief ZeroMQ client talking MessagePack to the gym server
 */

#ifndef PROXIMALPOLICY_COMMUNICATION_HPP
#define PROXIMALPOLICY_COMMUNICATION_HPP

#include<cstring>
#include<memory>
#include<stdexcept>
#include<string>

#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Request.hpp"

namespace GymClient
{
    /**
     * @class Communicator
     * @brief Owns a ZeroMQ PAIR socket connected to the gym server
     *
     * Requests and responses strictly alternate: every sendRequest() is followed by one
     * getResponse() of the type matching the method. Receiving waits at most `timeout`
     * milliseconds.
     */
    class Communicator
    {
    private:
        std::unique_ptr<zmq::context_t> context;
        std::unique_ptr<zmq::socket_t> socket;

        zmq::message_t receive();

    public:
        /**
         * @param url ZeroMQ endpoint of the server, e.g. "tcp://127.0.0.1:10201"
         * @param timeout Receive timeout in milliseconds
         *
         * @throws zmq::error_t if the socket cannot be created or connected
         */
        explicit Communicator(const std::string &url, int timeout = 5000);

        ~Communicator();

        /**
         * @brief Receives the next message as raw bytes
         *
         * @throws std::runtime_error on timeout
         */
        std::string getRawResponse();

        /**
         * @brief Receives the next message and decodes it as `T`
         *
         * @tparam T MessagePack-convertible response struct
         * @throws std::runtime_error on timeout or if the message does not decode as `T`
         */
        template <typename T>
        std::unique_ptr<T> getResponse()
        {
            auto packedMessage = receive();

            msgpack::object_handle objectHandle;
            try
            {
                objectHandle = msgpack::unpack(static_cast<const char *>(packedMessage.data()), packedMessage.size());
            }
            catch (const msgpack::unpack_error &e)
            {
                throw std::runtime_error(std::string("Malformed response from gym server: ") + e.what());
            }

            msgpack::object object = objectHandle.get();
            auto response = std::make_unique<T>();
            try
            {
                object.convert(*response);
            }
            catch (const msgpack::type_error &e)
            {
                spdlog::error("Unexpected response from gym server: {}", e.what());
                throw std::runtime_error(std::string("Unexpected response from gym server: ") + e.what());
            }
            return response;
        }

        /**
         * @brief Encodes `request` and sends it to the server
         */
        template<class T>
        void sendRequest(const Request<T> &request)
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, request);

            zmq::message_t message(buffer.size());
            std::memcpy(message.data(), buffer.data(), buffer.size());
            socket->send(message, zmq::send_flags::none);
        }
    };
}

#endif //PROXIMALPOLICY_COMMUNICATION_HPP
