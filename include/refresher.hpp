#ifndef DISCOVERY_REFRESHER_HPP
#define DISCOVERY_REFRESHER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "ssdp_discovery.hpp"

namespace discovery
{

// Keeps a registry warm by running a discovery round every interval on its own thread.
// It shares nothing with other callers but the registry behind the given engine.
class refresher
{
public:

    using round_callback = std::function<void(const std::vector<discovered_device>&)>;

    refresher() = delete;
    refresher(const refresher&) = delete;
    refresher& operator=(const refresher&) = delete;
    refresher(refresher&&) = delete;
    refresher& operator=(refresher&&) = delete;

    refresher(ssdp_discovery& engine, std::chrono::milliseconds window, std::chrono::milliseconds interval,
        round_callback on_round = {});

    // Stops and joins, waits for a running round to finish
    ~refresher();

    void stop();

    size_t rounds() const;

private:

    void run();

    ssdp_discovery& m_engine;

    const std::chrono::milliseconds m_window;

    const std::chrono::milliseconds m_interval;

    round_callback m_on_round;

    mutable std::mutex m_mutex;

    std::condition_variable m_cond;

    bool m_stop = false;

    size_t m_rounds = 0;

    std::thread m_worker;

};

} // namespace discovery

#endif
