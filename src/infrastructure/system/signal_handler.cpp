// EN: Implementation of the SignalHandler class. Forwards SIGINT/SIGTERM to registered cancellation callbacks.
// FR: Implémentation de la classe SignalHandler. Transmet SIGINT/SIGTERM aux callbacks d'annulation enregistrés.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

namespace CIP {

int SignalHandler::wake_pipe_[2] = {-1, -1};

namespace {
    // EN: Byte written to the self-pipe to stop the dispatcher
    // FR: Octet écrit dans le self-pipe pour arrêter le dispatcher
    constexpr unsigned char STOP_DISPATCHER = 0;

    std::string signalName(int signal_number) {
        switch (signal_number) {
            case SIGINT: return "SIGINT";
            case SIGTERM: return "SIGTERM";
            default: return "SIGNAL_" + std::to_string(signal_number);
        }
    }
}

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::SignalHandler() {
    stats_.created_at = std::chrono::system_clock::now();
}

SignalHandler::~SignalHandler() {
    uninstall();
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_WARN("signal_handler", "SignalHandler already initialized");
        return;
    }

    if (!enabled_.load()) {
        LOG_WARN("signal_handler", "SignalHandler is disabled, skipping initialization");
        return;
    }

    if (pipe(wake_pipe_) == -1) {
        throw std::runtime_error("Failed to create signal pipe: " + std::string(std::strerror(errno)));
    }
    for (int fd : wake_pipe_) {
        int flags = fcntl(fd, F_GETFD, 0);
        if (flags != -1) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &SignalHandler::signalCallback;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &sa, &previous_int_) == -1) {
        close(wake_pipe_[0]);
        close(wake_pipe_[1]);
        wake_pipe_[0] = wake_pipe_[1] = -1;
        throw std::runtime_error("Failed to register SIGINT handler");
    }

    if (sigaction(SIGTERM, &sa, &previous_term_) == -1) {
        // EN: Restore SIGINT handler before throwing
        // FR: Restaure le handler SIGINT avant de lancer l'exception
        sigaction(SIGINT, &previous_int_, nullptr);
        close(wake_pipe_[0]);
        close(wake_pipe_[1]);
        wake_pipe_[0] = wake_pipe_[1] = -1;
        throw std::runtime_error("Failed to register SIGTERM handler");
    }

    dispatcher_ = std::thread(&SignalHandler::dispatchLoop, this);
    initialized_ = true;

    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::uninstall() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_.exchange(false)) {
            return;
        }
        sigaction(SIGINT, &previous_int_, nullptr);
        sigaction(SIGTERM, &previous_term_, nullptr);
    }

    unsigned char stop = STOP_DISPATCHER;
    ssize_t written = write(wake_pipe_[1], &stop, 1);
    if (written != 1) {
        LOG_WARN("signal_handler", "Failed to wake signal dispatcher: " + std::string(std::strerror(errno)));
    }
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    close(wake_pipe_[0]);
    close(wake_pipe_[1]);
    wake_pipe_[0] = wake_pipe_[1] = -1;
}

void SignalHandler::registerCleanupCallback(const std::string& name, CleanupCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(cleanup_callbacks_.begin(), cleanup_callbacks_.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it != cleanup_callbacks_.end()) {
        it->second = std::move(callback);
    } else {
        cleanup_callbacks_.emplace_back(name, std::move(callback));
    }
    stats_.cleanup_callbacks_registered = cleanup_callbacks_.size();

    LOG_DEBUG("signal_handler", "Registered cleanup callback: " + name);
}

void SignalHandler::unregisterCleanupCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(cleanup_callbacks_.begin(), cleanup_callbacks_.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it == cleanup_callbacks_.end()) {
        LOG_WARN("signal_handler", "Cleanup callback not found for unregistration: " + name);
        return;
    }
    cleanup_callbacks_.erase(it);
    stats_.cleanup_callbacks_registered = cleanup_callbacks_.size();
}

void SignalHandler::triggerShutdown(int signal_number) {
    LOG_INFO("signal_handler", "Manual shutdown triggered with signal: " + signalName(signal_number));
    handleSignal(signal_number);
}

bool SignalHandler::isShutdownRequested() const {
    return shutdown_requested_.load();
}

int SignalHandler::lastSignal() const {
    return last_signal_.load();
}

SignalHandlerStats SignalHandler::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void SignalHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    cleanup_callbacks_.clear();
    shutdown_requested_ = false;
    last_signal_ = 0;

    stats_ = SignalHandlerStats{};
    stats_.created_at = std::chrono::system_clock::now();
}

void SignalHandler::setEnabled(bool enabled) {
    enabled_ = enabled;
    LOG_DEBUG("signal_handler", "SignalHandler " + std::string(enabled ? "enabled" : "disabled"));
}

// EN: Only async-signal-safe calls are allowed here.
// FR: Seuls les appels async-signal-safe sont autorisés ici.
void SignalHandler::signalCallback(int signal_number) {
    int saved_errno = errno;
    if (wake_pipe_[1] != -1) {
        unsigned char byte = static_cast<unsigned char>(signal_number);
        ssize_t ignored = write(wake_pipe_[1], &byte, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

void SignalHandler::dispatchLoop() {
    while (true) {
        unsigned char byte = 0;
        ssize_t got = read(wake_pipe_[0], &byte, 1);
        if (got == -1 && errno == EINTR) {
            continue;
        }
        if (got != 1 || byte == STOP_DISPATCHER) {
            return;
        }
        if (enabled_.load()) {
            handleSignal(static_cast<int>(byte));
        }
    }
}

void SignalHandler::handleSignal(int signal_number) {
    bool repeated = shutdown_requested_.exchange(true);
    last_signal_ = signal_number;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.signals_received++;
        stats_.signal_counts[signal_number]++;
    }

    if (repeated) {
        LOG_WARN("signal_handler", "Received " + signalName(signal_number) + " again, re-running cancellation");
    } else {
        LOG_INFO("signal_handler", "Received " + signalName(signal_number) + " - cancelling pipeline");
    }

    executeCleanupCallbacks(signal_number);
    Logger::getInstance().flush();
}

void SignalHandler::executeCleanupCallbacks(int signal_number) {
    std::vector<std::pair<std::string, CleanupCallback>> callbacks_copy;

    // EN: Copy callbacks under lock to avoid holding mutex during execution
    // FR: Copie les callbacks sous verrou pour éviter de garder le mutex pendant l'exécution
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_copy = cleanup_callbacks_;
    }

    size_t executed = 0;
    size_t failed = 0;
    for (const auto& [name, callback] : callbacks_copy) {
        try {
            callback(signal_number);
            executed++;
        } catch (const std::exception& e) {
            failed++;
            LOG_ERROR("signal_handler", "Cleanup callback failed: " + name + " - " + e.what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.callbacks_executed += executed;
    stats_.callbacks_failed += failed;
}

} // namespace CIP
