#include "realtime/RealtimeProtocol.hpp"

#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocket.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: ws_probe <ws://host:port> <token> [ticket_id ...]" << std::endl;
        return 1;
    }

    std::string url = std::string(argv[1]) + "/?token=" + argv[2];
    std::vector<long long> ticket_ids;
    for (int i = 3; i < argc; ++i) {
        try {
            ticket_ids.push_back(std::stoll(argv[i]));
        } catch (const std::logic_error&) {
            std::cerr << "Not a ticket id: " << argv[i] << std::endl;
            return 1;
        }
    }

    ix::initNetSystem();

    ix::WebSocket ws;
    ws.setUrl(url);
    ws.disableAutomaticReconnection();

    ws.setOnMessageCallback([&](const ix::WebSocketMessagePtr& msg) {
        switch (msg->type) {
            case ix::WebSocketMessageType::Open:
                std::cout << "[connected] Subscribing to " << ticket_ids.size()
                          << " ticket(s)..." << std::endl;
                for (auto id : ticket_ids) {
                    ws.sendText(desk::realtime::RealtimeProtocol::encode_subscribe(id));
                }
                ws.sendText(desk::realtime::RealtimeProtocol::encode_ping());
                break;

            case ix::WebSocketMessageType::Message:
                std::cout << msg->str << "\n" << std::endl;
                break;

            case ix::WebSocketMessageType::Error:
                std::cerr << "[error] " << msg->errorInfo.reason << std::endl;
                break;

            case ix::WebSocketMessageType::Close:
                std::cout << "[disconnected] code=" << msg->closeInfo.code
                          << " reason=" << msg->closeInfo.reason << std::endl;
                running = false;
                break;

            default:
                break;
        }
    });

    std::signal(SIGINT, signal_handler);

    ws.start();
    std::cout << "Listening... (Ctrl+C to quit)" << std::endl;

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ws.stop();
    ix::uninitNetSystem();
    std::cout << "\nDone." << std::endl;
    return 0;
}
