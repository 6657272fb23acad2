#pragma once

#include <memory>

#include "../interfaces/IStatsDClient.hpp"

// Swallows every metric. Used when STATSD_SERVER is unset and in tests.
class DummyStatsDClient : public IStatsDClient {
public:
    DummyStatsDClient() = default;
    ~DummyStatsDClient() override = default;

    static std::shared_ptr<IStatsDClient> create();

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;
};
