#include "server.hpp"
#include <format>
#include <iostream>

int main(int argc, char **argv) {
    ServerConfig config;
    try{
        config = ServerConfig::load(argc, argv);
    }catch(const std::exception &e){
        std::cerr << std::format("Invalid configuration: {}\n", e.what());
        return 1;
    }
    std::cout << std::format("Starting with {} threads, master handoff {}\n", config.threads,
        config.room.master_handoff == MasterHandoff::Transfer ? "transfer" : "freeze");
    Server::start(config);
}
