#pragma once
#include <boost/beast.hpp>
#include <boost/asio.hpp>
#include <cstdint>
#include <exception>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;

using UserId = std::int64_t;
using Millis = std::int64_t;

bool session_ended(const boost::system::error_code& ec);
Millis now_ms();

class LogOnCatch{
public:
    LogOnCatch(std::string source);
    void operator()(std::exception_ptr e);
private:
    std::string m_source;
};
