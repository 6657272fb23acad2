#include "DummyStatsDClient.hpp"

std::shared_ptr<IStatsDClient> DummyStatsDClient::create() {
    return std::make_shared<DummyStatsDClient>();
}

void DummyStatsDClient::increment(const std::string& /* key */, int /* value */) {}

void DummyStatsDClient::decrement(const std::string& /* key */, int /* value */) {}

void DummyStatsDClient::gauge(const std::string& /* key */, double /* value */) {}

void DummyStatsDClient::timing(const std::string& /* key */, std::chrono::milliseconds /* value */) {}

void DummyStatsDClient::set(const std::string& /* key */, const std::string& /* value */) {}
