/**
 * @file custom_key.cpp
 * @brief Example of a trie keyed by a user-defined type
 * @date 2024-05-22
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "gentrie/trie.hpp"

// Requests are routed by method and path segments
enum class Method : std::uint8_t { Get, Post, Delete };

struct Route {
    Method method;
    std::vector<std::string> segments;
};

template <>
struct gentrie::KeyShape<Route> {
    using shape_type =
        shape::Wrap<shape::Fields<Method, std::vector<std::string>>, "Route">;

    static auto toShape(const Route& route) -> shape_type {
        return {shape::makeFields(route.method, route.segments)};
    }

    static auto fromShape(const shape_type& shape) -> Route {
        auto [method, segments] =
            shape::takeFields<Method, std::vector<std::string>>(shape.inner);
        return {method, std::move(segments)};
    }
};

void printSection(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n";
}

auto methodName(Method method) -> const char* {
    switch (method) {
        case Method::Get:
            return "GET";
        case Method::Post:
            return "POST";
        case Method::Delete:
            return "DELETE";
    }
    return "?";
}

auto render(const Route& route) -> std::string {
    std::string text = methodName(route.method);
    text += " /";
    for (std::size_t i = 0; i < route.segments.size(); ++i) {
        text += (i == 0 ? "" : "/") + route.segments[i];
    }
    return text;
}

int main() {
    spdlog::set_level(spdlog::level::debug);

    printSection("1. Building a routing table");
    auto routes = gentrie::DerivedMap<Route, std::string>::fromPairs({
        {{Method::Get, {"users"}}, "listUsers"},
        {{Method::Get, {"users", "me"}}, "currentUser"},
        {{Method::Post, {"users"}}, "createUser"},
        {{Method::Delete, {"users", "me"}}, "deleteUser"},
    });
    routes.forEach([](const Route& route, const std::string& handler) {
        std::cout << render(route) << " -> " << handler << "\n";
    });

    printSection("2. Lookup");
    for (const Route& query : {Route{Method::Get, {"users", "me"}},
                               Route{Method::Get, {"users", "you"}}}) {
        auto handler = routes.lookup(query);
        std::cout << render(query) << ": "
                  << (handler ? *handler : std::string("<no route>")) << "\n";
    }

    printSection("3. Merging a second table");
    gentrie::DerivedMap<Route, std::string> admin;
    admin.insert({Method::Get, {"users"}}, "auditUsers");
    admin.insert({Method::Get, {"health"}}, "health");
    auto merged = routes.merge(admin, [](const std::string& mine,
                                         const std::string& theirs) {
        return mine + "+" + theirs;
    });
    for (const auto& [route, handler] : merged.toPairs()) {
        std::cout << render(route) << " -> " << handler << "\n";
    }

    printSection("4. Removing routes");
    merged.erase({Method::Delete, {"users", "me"}});
    std::cout << "routes left: " << merged.size() << "\n";
    std::cout << "structure valid: " << std::boolalpha << merged.validate()
              << "\n";

    printSection("5. Rejecting overlong keys");
    Route deep{Method::Get,
               std::vector<std::string>(gentrie::config::MAX_SEQUENCE_DEPTH + 1,
                                        "x")};
    try {
        merged.insert(deep, "never");
    } catch (const gentrie::KeyDepthError& e) {
        std::cout << "rejected: " << e.getMessage() << "\n";
    }
    std::cout << "lookup finds it: " << merged.contains(deep) << "\n";

    return 0;
}
