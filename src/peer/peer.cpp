#include "peer/peer.hpp"
#include "peer/internal/downloadFile.hpp"
#include "peer/internal/peerThreads.hpp"
#include "peer/internal/pieceManager.hpp"
#include "peer/internal/trackerRequests.hpp"
#include "networking/fileParsing.hpp"
#include "networking/internal/fileParsing/fileUtil.hpp"
#include "errorCodes.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace csw {

//how long start() waits for the listener to come up
static constexpr uint64_t LISTENER_SETUP_MS = 5000;

SwarmPeer::SwarmPeer(const Config& config, std::atomic<bool>& shutdown)
    : config(config), shutdown(shutdown) {}

SwarmPeer::~SwarmPeer() {
    stop();
}

int SwarmPeer::start() {
    listener = std::thread(peerListener,
                           std::ref(shutdown),
                           std::ref(listener_port),
                           std::ref(listener_setup),
                           std::ref(listener_failed),
                           std::cref(files),
                           std::ref(files_mtx),
                           std::cref(config));

    //wait while listener sets up
    auto give_up = std::chrono::steady_clock::now() + std::chrono::milliseconds(LISTENER_SETUP_MS);
    while (!listener_setup.load() && !listener_failed.load()
           && std::chrono::steady_clock::now() < give_up)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    if (!listener_setup.load()) {
        std::cerr << "[peer] Could not start serving peers." << std::endl;
        stop();
        return EXIT_FAILURE;
    }

    heartbeat = std::thread(&SwarmPeer::heartbeatLoop, this);
    return EXIT_SUCCESS;
}

SourceInfo SwarmPeer::address() const {
    return SourceInfo{config.listen_ip, listener_port.load()};
}

int SwarmPeer::share(const uint64_t uuid, std::shared_ptr<PieceManager> pm) {
    {
        std::lock_guard<std::mutex> lock(files_mtx);
        files[uuid] = std::move(pm);
    }

    int res = announce(uuid);
    if (res != EXIT_SUCCESS)
        std::cerr << "[peer] Could not register file " << uuid << ": "
                  << errorString(res) << std::endl;
    return res;
}

int SwarmPeer::announce(const uint64_t uuid) {
    std::shared_ptr<PieceManager> pm;
    {
        std::lock_guard<std::mutex> lock(files_mtx);
        auto it = files.find(uuid);
        if (it == files.end())
            return EXIT_FAILURE;
        pm = it->second;
    }

    Registration reg;
    reg.uuid                = uuid;
    reg.record.peer         = address();
    reg.record.availability = pm->availability();
    return registerWithTracker(reg, config);
}

void SwarmPeer::heartbeatLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(heartbeat_mtx);
            heartbeat_cv.wait_for(lock,
                                  std::chrono::milliseconds(config.heartbeat_interval_ms),
                                  [this]() { return shutdown.load(); });
        }
        if (shutdown.load())
            return;

        std::vector<uint64_t> uuids;
        {
            std::lock_guard<std::mutex> lock(files_mtx);
            for (const auto& [uuid, pm] : files)
                uuids.push_back(uuid);
        }

        //a restarted tracker learns about us again here
        for (uint64_t uuid : uuids) {
            int res = announce(uuid);
            if (res != EXIT_SUCCESS)
                std::cerr << "[heartbeat] Re-registering file " << uuid << " failed: "
                          << errorString(res) << std::endl;
        }
    }
}

void SwarmPeer::stop() {
    if (stopped)
        return;
    stopped = true;

    {
        std::lock_guard<std::mutex> lock(heartbeat_mtx);
        shutdown = true;
    }
    heartbeat_cv.notify_all();

    if (heartbeat.joinable())
        heartbeat.join();
    if (listener.joinable())
        listener.join();

    if (!listener_setup.load())
        return;

    std::lock_guard<std::mutex> lock(files_mtx);
    for (const auto& [uuid, pm] : files) {
        int res = deregisterFromTracker({uuid, address()}, config);
        if (res != EXIT_SUCCESS)
            std::cerr << "[peer] Could not deregister file " << uuid << ": "
                      << errorString(res) << std::endl;
    }
}

static void waitForShutdown(const std::atomic<bool>& shutdown) {
    while (!shutdown.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
}

int seedFile(const std::filesystem::path& f_path,
             const Config&                config,
             std::atomic<bool>&           shutdown) {
    auto bytes = readFile(f_path);
    if (!bytes) {
        std::cerr << "[seed] Could not read " << f_path << std::endl;
        return EXIT_FAILURE;
    }

    auto split = splitFile(f_path.filename().string(), bytes.value(), config.chunk_size);
    if (!split) {
        std::cerr << "[seed] Could not chunk " << f_path << std::endl;
        return EXIT_FAILURE;
    }
    const FileDescriptor& descriptor = split->first;

    auto pm = std::make_shared<PieceManager>(descriptor,
                                             std::chrono::milliseconds(config.request_timeout_ms));
    if (pm->loadLocalFile(bytes.value()) != EXIT_SUCCESS)
        return EXIT_FAILURE;

    const uint64_t uuid = fileIdentifier(descriptor);
    std::filesystem::path descriptor_path = f_path;
    descriptor_path += ".cswd";
    if (saveDescriptor(descriptor, descriptor_path) != EXIT_SUCCESS) {
        std::cerr << "[seed] Could not write " << descriptor_path << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "[seed] " << descriptor.f_name << " is file " << uuid << ", "
              << descriptor.chunk_count << " chunks, descriptor at " << descriptor_path << std::endl;

    SwarmPeer peer(config, shutdown);
    if (peer.start() != EXIT_SUCCESS)
        return EXIT_FAILURE;

    int res = peer.share(uuid, pm);
    if (res == TRACKER_UNREACHABLE)
        return res;

    waitForShutdown(shutdown);
    peer.stop();
    return EXIT_SUCCESS;
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * resolveDescriptor
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Turns the --leech argument into a descriptor, loading it from disk when
 *    source names a file, otherwise asking the swarm of the uuid in source.
 *
 * Returns:
 * -> On success:
 *    The descriptor.
 * -> On failure:
 *    std::nullopt, with status set to TRACKER_UNREACHABLE if that was why.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
static std::optional<FileDescriptor> resolveDescriptor(const std::string& source,
                                                       const Config&      config,
                                                       int&               status) {
    status = EXIT_FAILURE;

    std::error_code ec;
    if (std::filesystem::is_regular_file(source, ec)) {
        auto descriptor = loadDescriptor(source);
        if (!descriptor)
            std::cerr << "[leech] " << source << " is not a descriptor file" << std::endl;
        return descriptor;
    }

    uint64_t uuid = 0;
    try {
        size_t used = 0;
        uuid = std::stoull(source, &used);
        if (used != source.size())
            uuid = 0;
    } catch (const std::exception&) {
        uuid = 0;
    }

    if (uuid == 0) {
        std::cerr << "[leech] " << source << " is neither a descriptor file nor a file uuid" << std::endl;
        return std::nullopt;
    }

    //no listener yet, so there's nothing of ours to leave out
    std::vector<PeerRecord> peers;
    status = requestPeerList({uuid, SourceInfo{config.listen_ip, 0}}, peers, config);
    if (status != EXIT_SUCCESS)
        return std::nullopt;

    for (const PeerRecord& p : peers) {
        auto descriptor = fetchDescriptor(p.peer, uuid, config);
        if (descriptor) {
            std::cout << "[leech] Got the descriptor of " << uuid << " from "
                      << p.peer.toString() << std::endl;
            return descriptor;
        }
    }

    std::cerr << "[leech] No peer could provide the descriptor of " << uuid << std::endl;
    status = EXIT_FAILURE;
    return std::nullopt;
}

int leechFile(const std::string&           source,
              const std::filesystem::path& out_path,
              const Config&                config,
              std::atomic<bool>&           shutdown,
              const bool                   keep_seeding) {
    int res = EXIT_FAILURE;
    auto descriptor = resolveDescriptor(source, config, res);
    if (!descriptor)
        return res;

    const uint64_t uuid = fileIdentifier(descriptor.value());
    auto pm = std::make_shared<PieceManager>(descriptor.value(),
                                             std::chrono::milliseconds(config.request_timeout_ms));

    //resume from whatever is already on disk
    std::error_code ec;
    if (std::filesystem::exists(out_path, ec)) {
        auto partial = readFile(out_path);
        //chunks that don't verify are simply downloaded again
        if (partial && pm->loadLocalFile(partial.value()) != EXIT_FAILURE) {
            std::cout << "[leech] Resuming with " << pm->haveCount() << "/"
                      << pm->chunkCount() << " chunks from " << out_path << std::endl;
        }
    }

    SwarmPeer peer(config, shutdown);
    if (peer.start() != EXIT_SUCCESS)
        return EXIT_FAILURE;

    res = peer.share(uuid, pm);
    if (res == TRACKER_UNREACHABLE)
        return res;

    res = attemptFileDownload(uuid, *pm, peer.address(), config, shutdown);
    if (res != EXIT_SUCCESS) {
        std::cerr << "[leech] Download of " << descriptor->f_name << " failed: "
                  << errorString(res) << std::endl;
        return res;
    }

    res = pm->reassemble(out_path);
    if (res != EXIT_SUCCESS) {
        std::cerr << "[leech] Could not write " << out_path << ": " << errorString(res) << std::endl;
        return res;
    }
    std::cout << "[leech] " << descriptor->f_name << " complete, written to " << out_path << std::endl;

    //now a seeder
    res = peer.announce(uuid);
    if (res != EXIT_SUCCESS)
        std::cerr << "[leech] Could not re-register as a seeder: " << errorString(res) << std::endl;

    if (keep_seeding)
        waitForShutdown(shutdown);
    peer.stop();
    return EXIT_SUCCESS;
}

} //csw
