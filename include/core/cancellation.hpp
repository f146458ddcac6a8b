#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace CIP {

// EN: Cooperative cancellation flag shared between scheduler, job runner and process runner.
//     A child token is cancelled whenever its parent is.
// FR: Drapeau d'annulation coopérative partagé entre scheduler, job runner et process runner.
//     Un token enfant est annulé dès que son parent l'est.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<CancellationToken> parent);

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // EN: First caller wins; the reason of later calls is ignored
    // FR: Le premier appelant gagne ; la raison des appels suivants est ignorée
    void cancel(const std::string& reason);

    bool isCancelled() const;

    // EN: Reason of this token, or of the nearest cancelled ancestor
    // FR: Raison de ce token, ou de l'ancêtre annulé le plus proche
    std::string reason() const;

    // EN: Sleep up to timeout; returns true if cancelled meanwhile
    // FR: Dort jusqu'au timeout ; retourne true si annulé entre-temps
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::shared_ptr<CancellationToken> parent_;
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::string reason_;
};

} // namespace CIP
