// EN: Signal Handler for CIPipe - SIGINT/SIGTERM turn into pipeline cancellation
// FR: Gestionnaire de signaux pour CIPipe - SIGINT/SIGTERM déclenchent l'annulation du pipeline

#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace CIP {

// EN: Callback function type for cleanup operations (receives the signal number)
// FR: Type de fonction callback pour les opérations de nettoyage (reçoit le numéro de signal)
using CleanupCallback = std::function<void(int signal_number)>;

// EN: Signal handler statistics for monitoring
// FR: Statistiques du gestionnaire de signaux pour monitoring
struct SignalHandlerStats {
    std::chrono::system_clock::time_point created_at;
    size_t signals_received{0};
    size_t cleanup_callbacks_registered{0};
    size_t callbacks_executed{0};
    size_t callbacks_failed{0};
    std::map<int, size_t> signal_counts; // EN: Count per signal type / FR: Compteur par type de signal
};

// EN: Thread-safe signal handler. The C handler only writes the signal number to a self-pipe;
//     a dispatcher thread runs the registered callbacks outside signal context.
// FR: Gestionnaire de signaux thread-safe. Le handler C écrit seulement le numéro de signal dans un self-pipe ;
//     un thread dispatcher exécute les callbacks enregistrés hors du contexte signal.
class SignalHandler {
public:
    static SignalHandler& getInstance();

    // EN: Install SIGINT/SIGTERM handlers and start the dispatcher thread
    // FR: Installe les handlers SIGINT/SIGTERM et démarre le thread dispatcher
    void initialize();

    // EN: Restore default dispositions and stop the dispatcher
    // FR: Restaure les dispositions par défaut et arrête le dispatcher
    void uninstall();

    // EN: Register a named cleanup callback; callbacks run in registration order
    // FR: Enregistre un callback de nettoyage nommé ; exécutés dans l'ordre d'enregistrement
    void registerCleanupCallback(const std::string& name, CleanupCallback callback);
    void unregisterCleanupCallback(const std::string& name);

    // EN: Synchronously run the shutdown sequence as if the signal had arrived (useful for testing)
    // FR: Exécute de manière synchrone la séquence d'arrêt comme si le signal était arrivé (utile pour les tests)
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const;
    int lastSignal() const;

    SignalHandlerStats getStats() const;

    // EN: Reset the signal handler (mainly for testing)
    // FR: Remet à zéro le gestionnaire de signaux (principalement pour les tests)
    void reset();

    // EN: Enable/disable signal handling (for testing purposes)
    // FR: Active/désactive la gestion des signaux (pour les tests)
    void setEnabled(bool enabled);

    ~SignalHandler();

private:
    SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;
    SignalHandler(SignalHandler&&) = delete;
    SignalHandler& operator=(SignalHandler&&) = delete;

    // EN: Async-signal-safe C handler
    // FR: Handler C async-signal-safe
    static void signalCallback(int signal_number);

    void dispatchLoop();
    void handleSignal(int signal_number);
    void executeCleanupCallbacks(int signal_number);

    mutable std::mutex mutex_;
    SignalHandlerStats stats_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};

    std::vector<std::pair<std::string, CleanupCallback>> cleanup_callbacks_;

    std::thread dispatcher_;
    struct sigaction previous_int_{};
    struct sigaction previous_term_{};

    static int wake_pipe_[2];
};

} // namespace CIP
