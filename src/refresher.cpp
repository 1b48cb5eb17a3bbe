#include "refresher.hpp"

#include "errors.hpp"
#include "log.hpp"

namespace discovery
{

refresher::refresher(ssdp_discovery& engine, std::chrono::milliseconds window, std::chrono::milliseconds interval,
    round_callback on_round)
    : m_engine {engine}, m_window {window}, m_interval {interval}, m_on_round {std::move(on_round)}
{
    m_worker = std::thread {&refresher::run, this};
}

refresher::~refresher()
{
    stop();
}

void refresher::stop()
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_stop = true;
    }
    m_cond.notify_all();

    if(m_worker.joinable())
        m_worker.join();
}

size_t refresher::rounds() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_rounds;
}

void refresher::run()
{
    while(true)
    {
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            if(m_stop)
                return;
        }

        try {
            std::vector<discovered_device> devices = m_engine.discover(m_window);
            if(m_on_round)
                m_on_round(devices);
        } catch(appcast::cast_error& e) {
            // Next round retries
            logging::warning("ssdp", "Background discovery failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock {m_mutex};
        ++m_rounds;
        if(m_cond.wait_for(lock, m_interval, [this]() { return m_stop; }))
            return;
    }
}

} // namespace discovery
