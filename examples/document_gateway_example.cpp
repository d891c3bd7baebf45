/**
 * @file document_gateway_example.cpp
 * @brief Example: one shared watch channel, typed writes and business errors.
 *
 * Runs entirely in process on an InMemoryDocumentStore. Usage:
 * @code
 *   document_gateway_example [config.json]
 * @endcode
 * The optional config file uses the GatewayConfig format; DOCGATE_LOG_LEVEL and the
 * other DOCGATE_* variables override it.
 *
 * Key concepts shown:
 *  - Two watchers of one document share a single backend subscription.
 *  - Every view starts with the `{}` bootstrap event.
 *  - A serialized repository keeps writes to one document in submission order.
 *  - Business errors embedded in payloads surface as failures, not values.
 */
#include "dgt_gateway.hpp"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <string>
#include <vector>

using namespace docgate::gateway;
using namespace std::chrono_literals;
using docgate::utils::Logger;

namespace
{

struct Profile
{
    std::string id;
    std::string name;
    int visits = 0;
};

void to_json(nlohmann::json &j, const Profile &p)
{
    j = nlohmann::json{{"name", p.name}, {"visits", p.visits}};
}

void from_json(const nlohmann::json &j, Profile &p)
{
    p.id = j.value("id", "");
    p.name = j.value("name", "");
    p.visits = j.value("visits", 0);
}

void print_event(const char *who, const std::optional<DocEvent> &event)
{
    if (!event)
        std::cout << "[" << who << "] (no event)\n";
    else if (event->is_ok())
        std::cout << "[" << who << "] value " << event->content().dump() << "\n";
    else
        std::cout << "[" << who << "] error " << event->error().to_string() << "\n";
}

void drain(const char *who, WatchView &view)
{
    while (auto event = view.next(50ms))
        print_event(who, event);
}

int run(const GatewayConfig &cfg)
{
    auto store = std::make_shared<InMemoryDocumentStore>(cfg.store);
    auto gateway = std::make_shared<ReactiveDocumentGateway>(store, nullptr, to_gateway_options(cfg));

    // --- Shared watch channel ---
    auto first = gateway->watch("profile-1");
    auto second = gateway->watch("profile-1");
    std::cout << "[main] backend subscriptions for profile-1: " << store->subscribe_calls() << "\n";

    (void)gateway->write("profile-1", {{"name", "Ana"}, {"visits", 1}});
    drain("watcher-1", *first);
    drain("watcher-2", *second);

    // --- Business error inside a payload ---
    (void)store->write("profile-1", {{"ok", false}, {"message", "account locked"}});
    drain("watcher-1", *first);

    gateway->detach_watch("profile-1");
    std::cout << "[main] after one detach, channel alive: " << std::boolalpha
              << gateway->has_channel("profile-1") << "\n";
    gateway->detach_watch("profile-1");
    std::cout << "[main] after second detach, channel alive: "
              << gateway->has_channel("profile-1") << "\n";

    // --- Typed repository with serialized writes ---
    SerializingRepository<Profile> repo(gateway, cfg.serialize_writes);
    std::vector<std::future<DocResult<Profile>>> pending;
    for (int visits = 1; visits <= 5; ++visits)
        pending.push_back(repo.write("profile-2", Profile{"", "Bo", visits}));
    for (auto &f : pending)
    {
        auto result = f.get();
        if (result.is_error())
            std::cout << "[repo] write failed: " << result.error().to_string() << "\n";
    }

    auto stored = repo.read("profile-2");
    if (stored.is_ok())
        std::cout << "[repo] profile-2 id=" << stored.content().id
                  << " visits=" << stored.content().visits << "\n";

    auto missing = repo.read("nobody");
    if (missing.is_error())
        std::cout << "[repo] read(nobody): " << missing.error().to_string() << "\n";

    repo.dispose();
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv)
{
    auto &logger = Logger::instance();
    logger.start();
    auto stop_logger = docgate::basics::make_scope_guard([&logger] { logger.shutdown(); });

    try
    {
        const GatewayConfig cfg = load_gateway_config(argc > 1 ? argv[1] : "");
        if (!apply_logging_config(cfg))
            std::cerr << "warning: could not open log file '" << cfg.log_file << "'\n";
        LOGGER_INFO("document_gateway_example: collection='{}'", cfg.collection);
        return run(cfg);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("document_gateway_example: {}", e.what());
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
