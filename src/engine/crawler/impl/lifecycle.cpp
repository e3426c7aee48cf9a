#include <csignal>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Spinner {
namespace Engine {

using Spinner::Core::Logger;

Crawler::~Crawler() {
    shutdown();
}

void Crawler::request_stop() {
    stop_requested_ = true;
}

void Crawler::init_signals() {
    if (!config_.handle_signals || signal_thread_.joinable())
        return;

    if (ioc_.stopped())
        ioc_.restart();

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number)
                         + " received. Finishing the current page...");
            request_stop();
        }
    });

    signal_thread_ = std::thread([this]() { ioc_.run(); });
}

void Crawler::shutdown() {
    if (!signal_thread_.joinable())
        return;

    boost::system::error_code ec;
    signals_.cancel(ec);
    signals_.clear(ec);
    ioc_.stop();
    signal_thread_.join();
}

}  // namespace Engine
}  // namespace Spinner
