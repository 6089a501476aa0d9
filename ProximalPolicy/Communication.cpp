#include<memory>
#include<stdexcept>
#include<string>

#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Communication.hpp"

namespace GymClient
{
    Communicator::Communicator(const std::string &url, int timeout)
    {
        context = std::make_unique<zmq::context_t>(1);
        socket = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pair);
        socket->set(zmq::sockopt::rcvtimeo, timeout);
        socket->set(zmq::sockopt::linger, 0);

        socket->connect(url);
        spdlog::info("Connected to gym environment at: {}", url);
    }

    Communicator::~Communicator()
    {
        socket->close();
    }

    zmq::message_t Communicator::receive()
    {
        zmq::message_t message;
        auto received = socket->recv(message, zmq::recv_flags::none);
        if (!received)
        {
            spdlog::error("Timeout waiting for response from gym server");
            throw std::runtime_error("Timeout waiting for response from gym server");
        }
        return message;
    }

    std::string Communicator::getRawResponse()
    {
        auto message = receive();
        return std::string(static_cast<const char *>(message.data()), message.size());
    }
}
