#include "EventLog.hpp"
#include "CryptoBase.hpp"
#include <exception>
#include <iostream>

namespace gavel {

    void EventLog::emit(EventType type, const Identity& subject, Quantity amount, Timestamp timestamp) {
        AuctionEvent event;
        event.type = type;
        event.subject = subject;
        event.amount = amount;
        event.timestamp = timestamp;
        pending.push_back(event);
    }

    void EventLog::publish() {
        if (pending.empty()) return;

        std::vector<AuctionEvent> committed;
        committed.reserve(pending.size());

        for (auto& event : pending) {
            event.sequence = entries.size();
            event.previousHash = entries.empty()
                ? std::vector<uint8_t>(SHA256_HASH_SIZE, 0)
                : entries.back().hash;
            event.hash = computeHash(event);

            entries.push_back(event);
            committed.push_back(event);
        }
        pending.clear();

        // Copia: un suscriptor puede darse de baja durante la notificación
        const auto listeners = subscribers;
        for (const auto& event : committed) {
            for (const auto& kv : listeners) {
                // La llamada ya está confirmada: un suscriptor que falla no la deshace
                try {
                    kv.second(event);
                } catch (const std::exception& e) {
                    std::cerr << "Error: Subscriber " << kv.first << " failed on "
                              << eventTypeToString(event.type) << ": " << e.what() << std::endl;
                }
            }
        }
    }

    void EventLog::discardPending() {
        pending.clear();
    }

    size_t EventLog::subscribe(Subscriber subscriber) {
        const size_t id = nextSubscriberId++;
        subscribers[id] = std::move(subscriber);
        return id;
    }

    void EventLog::unsubscribe(size_t id) {
        subscribers.erase(id);
    }

    std::vector<AuctionEvent> EventLog::events() const {
        return entries;
    }

    std::vector<AuctionEvent> EventLog::eventsOfType(EventType type) const {
        std::vector<AuctionEvent> out;
        for (const auto& event : entries) {
            if (event.type == type) out.push_back(event);
        }
        return out;
    }

    bool EventLog::verifyChain() const {
        return verifyChain(entries);
    }

    bool EventLog::verifyChain(const std::vector<AuctionEvent>& chain) {
        std::vector<uint8_t> expectedPrevious(SHA256_HASH_SIZE, 0);

        for (size_t i = 0; i < chain.size(); ++i) {
            const AuctionEvent& event = chain[i];

            if (event.sequence != i) {
                std::cerr << "Error: Event " << i << " has sequence " << event.sequence << std::endl;
                return false;
            }

            if (event.previousHash != expectedPrevious) {
                std::cerr << "Error: Event " << i << " previous hash mismatch" << std::endl;
                return false;
            }

            if (computeHash(event) != event.hash) {
                std::cerr << "Error: Event " << i << " hash mismatch" << std::endl;
                return false;
            }

            expectedPrevious = event.hash;
        }

        return true;
    }

    std::vector<uint8_t> EventLog::computeHash(const AuctionEvent& event) {
        return CryptoBase::sha256Bytes(event.bytesForHash());
    }

} // namespace gavel
