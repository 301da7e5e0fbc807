#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class ReadStatus { Command, Pending, Invalid, Closed };

class IpcServer {
public:
    virtual ~IpcServer() = default;
    // Fails if another daemon already answers on the endpoint.
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    // One newline-delimited JSON command per Command result. Lines already
    // buffered are returned before the socket is read again.
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
