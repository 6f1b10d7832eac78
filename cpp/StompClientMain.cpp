#include "StompClient.hpp"
#include "StompErrors.hpp"
#include <iostream>
#include <vector>
#include <string>

namespace {

void printUsage() {
    std::cerr << "Usage:\n"
              << "  stomp_client listen <host> <port> <destination> [--login L] [--passcode P] [--verbose]\n"
              << "  stomp_client send <host> <port> <destination> <message> [--login L] [--passcode P] [--verbose]"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    std::string login;
    std::string passcode;
    StompClientOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--login" && i + 1 < argc) {
            login = argv[++i];
        } else if (arg == "--passcode" && i + 1 < argc) {
            passcode = argv[++i];
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            args.push_back(arg);
        }
    }

    if (args.size() < 4) {
        printUsage();
        return 2;
    }

    std::string mode = args[0];
    std::string host = args[1];
    int port = 0;
    try {
        port = std::stoi(args[2]);
    } catch (const std::exception&) {
        std::cerr << "Invalid port: " << args[2] << std::endl;
        return 2;
    }
    std::string destination = args[3];

    try {
        auto client = StompClient::open({StompAddress{host, port}}, login, passcode,
                                        StompHeaders(), kStompWaitForever, options);

        if (mode == "listen") {
            client->subscribe(destination);
            for (const auto& frame : *client) {
                std::cout << "<<< " << frame.text() << std::endl;
            }
        } else if (mode == "send" && args.size() >= 5) {
            auto receipt = client->message(destination, args[4], "", StompHeaders(), true);
            // disconnect() keeps reading until its own receipt, so ours arrives first
            client->disconnect(std::chrono::seconds(10));
            if (!receipt->isResolved()) {
                std::cerr << "No receipt for message to " << destination << std::endl;
                return 1;
            }
            std::cout << "Sent message to " << destination << ": " << args[4] << std::endl;
        } else {
            printUsage();
            return 2;
        }
    } catch (const StompError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Client error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
