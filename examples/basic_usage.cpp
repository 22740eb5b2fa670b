// Basic OrderedJson usage example
// Compile: g++ -std=c++23 -I../include -I<pfr>/include basic_usage.cpp -o basic_usage

#include <OrderedJson/parser.hpp>
#include <OrderedJson/serializer.hpp>
#include <OrderedJson/error_formatting.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace OrderedJson;
using namespace OrderedJson::options;

struct Config {
    Annotated<std::string, key<"app_name">> appName;
    int version = 0;
    Annotated<bool, key<"debug_mode">, omitempty> debugMode;

    struct Server {
        std::string host;
        Annotated<int, as_string> port;
    };
    Server server;

    // kept in the order it was read
    Object extra;
};

int main() {
    const char* json = R"({
        "app_name": "MyApp",
        "version": 1,
        "debug_mode": true,
        "server": {
            "host": "localhost",
            "port": "8080"
        },
        "extra": {"zeta": 1, "alpha": [true, null]}
    })";

    Config config;
    auto result = Decode(config, std::string_view(json));

    if (!result) {
        std::cout << DecodeResultToString(result, json) << std::endl;
        return 1;
    }

    std::cout << "App: " << config.appName.value << std::endl;
    std::cout << "Version: " << config.version << std::endl;
    std::cout << "Debug: " << (config.debugMode.value ? "ON" : "OFF") << std::endl;
    std::cout << "Server: " << config.server.host << ":" << config.server.port.value << std::endl;

    std::string out;
    auto encoded = EncodeIndent(config, out, "", "  ");
    if (!encoded) {
        std::cout << EncodeResultToString(encoded) << std::endl;
        return 1;
    }
    std::cout << out << std::endl;
    /* {
         "app_name": "MyApp",
         "version": 1,
         "debug_mode": true,
         "server": {
           "host": "localhost",
           "port": "8080"
         },
         "extra": {
           "zeta": 1,
           "alpha": [
             true,
             null
           ]
         }
       } */

    return 0;
}
