#include <catch2/catch_test_macros.hpp>

#include <agent_relay/rpc/connection_pool.hpp>

#include "../mocks/mock_connection_pool.hpp"

#include <map>
#include <memory>
#include <string>

using namespace agent_relay;
using agent_relay::testing::FakeServerConnection;

namespace {

std::map<std::string, ServerConfig> TwoServers() {
    std::map<std::string, ServerConfig> servers;
    servers["weather"] = ServerConfig{"weather-mcp", {}, {}, "Weather lookups"};
    servers["notes"] = ServerConfig{"notes-mcp", {"--stdio"}, {}, "Personal notes"};
    return servers;
}

struct CountingFactory {
    int created = 0;
    std::map<std::string, std::shared_ptr<FakeServerConnection>> made;

    ConnectionPool::Factory Make() {
        return [this](const std::string& name, const ServerConfig&, const ConnectionOptions&) {
            ++created;
            auto conn = std::make_shared<FakeServerConnection>(name);
            made[name] = conn;
            return std::static_pointer_cast<IServerConnection>(conn);
        };
    }
};

} // anonymous namespace

TEST_CASE("ConnectionPool: same instance for repeated lookups", "[rpc][pool]") {
    CountingFactory factory;
    ConnectionPool pool(TwoServers(), ConnectionOptions{}, factory.Make());

    auto a = pool.GetOrCreate("notes");
    auto b = pool.GetOrCreate("notes");
    REQUIRE(a.IsOk());
    REQUIRE(b.IsOk());
    CHECK(a.Value().get() == b.Value().get());
    CHECK(factory.created == 1);
    CHECK(pool.ActiveCount() == 1);
}

TEST_CASE("ConnectionPool: unknown server", "[rpc][pool]") {
    CountingFactory factory;
    ConnectionPool pool(TwoServers(), ConnectionOptions{}, factory.Make());
    auto r = pool.GetOrCreate("calendar");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NotFound);
    CHECK(r.Error().message == "Unknown server 'calendar'");
    CHECK(factory.created == 0);
}

TEST_CASE("ConnectionPool: names sorted and descriptions", "[rpc][pool]") {
    ConnectionPool pool(TwoServers(), ConnectionOptions{});
    CHECK(pool.ServerNames() == std::vector<std::string>{"notes", "weather"});
    REQUIRE(pool.Describe("weather").has_value());
    CHECK(*pool.Describe("weather") == "Weather lookups");
    CHECK_FALSE(pool.Describe("calendar").has_value());
    CHECK(pool.ActiveCount() == 0);
}

TEST_CASE("ConnectionPool: ShutdownAll stops every connection", "[rpc][pool]") {
    CountingFactory factory;
    ConnectionPool pool(TwoServers(), ConnectionOptions{}, factory.Make());
    REQUIRE(pool.GetOrCreate("notes").IsOk());
    REQUIRE(pool.GetOrCreate("weather").IsOk());

    pool.ShutdownAll();
    CHECK(factory.made["notes"]->ShutdownCount() == 1);
    CHECK(factory.made["weather"]->ShutdownCount() == 1);
    CHECK(pool.ActiveCount() == 0);

    auto after = pool.GetOrCreate("notes");
    REQUIRE(after.IsErr());
    CHECK(after.Error().category == ErrorCategory::Internal);
}
