#include "tracker/tracker.hpp"
#include "tracker/internal/trackerThreads.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace csw {

Tracker::Tracker(const Config& config)
    : config(config), registry(std::chrono::milliseconds(config.tracker_ttl_ms)) {}

Tracker::~Tracker() {
    stop();
}

int Tracker::start() {
    if (running.load())
        return EXIT_SUCCESS;

    running = true;
    listener = std::thread(listenThread,
                           std::ref(running),
                           config.tracker_port,
                           std::ref(registry),
                           std::ref(bound_port),
                           std::ref(listener_setup),
                           std::ref(listener_failed),
                           std::cref(config));

    //pause to wait for setup to finish
    while (!listener_setup.load() && !listener_failed.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    if (listener_failed.load()) {
        stop();
        return EXIT_FAILURE;
    }

    std::cout << "[tracker] Listening on port " << bound_port.load()
              << ", registrations live for " << config.tracker_ttl_ms << "ms" << std::endl;
    return EXIT_SUCCESS;
}

void Tracker::stop() {
    running = false;
    if (listener.joinable())
        listener.join();
}

int runTracker(const Config& config, const std::atomic<bool>& shutdown) {
    try {
        Tracker tracker(config);
        if (tracker.start() != EXIT_SUCCESS)
            return EXIT_FAILURE;

        while (!shutdown.load())
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        std::cout << "[tracker] Shutting down..." << std::endl;
        tracker.stop();
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

} //csw
