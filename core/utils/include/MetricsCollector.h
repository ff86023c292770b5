#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace Tessera {

    // Snapshot structs for returning metrics (non-atomic)
    struct TransferMetricsSnapshot {
        uint64_t transfersStarted{0};
        uint64_t chunksAccepted{0};
        uint64_t chunksCorrupted{0};
        uint64_t chunksRejected{0};
        uint64_t backendWriteFailures{0};
        uint64_t bytesPersisted{0};
        uint64_t transfersFinalized{0};
        uint64_t finalizeFailures{0};
        uint64_t transfersAborted{0};
        uint64_t progressWriteFailures{0};
    };

    struct SignalingMetricsSnapshot {
        uint64_t connectionsOpened{0};
        uint64_t connectionsClosed{0};
        uint64_t messagesForwarded{0};
        uint64_t messagesDropped{0};
        uint64_t peerBroadcasts{0};
        uint64_t protocolErrors{0};
        uint64_t connectFailures{0};
        uint64_t reconnectAttempts{0};
        uint64_t outboxEnqueued{0};
        uint64_t outboxFlushed{0};
    };

    // Internal structs with atomics
    struct TransferMetrics {
        std::atomic<uint64_t> transfersStarted{0};
        std::atomic<uint64_t> chunksAccepted{0};
        std::atomic<uint64_t> chunksCorrupted{0};
        std::atomic<uint64_t> chunksRejected{0};
        std::atomic<uint64_t> backendWriteFailures{0};
        std::atomic<uint64_t> bytesPersisted{0};
        std::atomic<uint64_t> transfersFinalized{0};
        std::atomic<uint64_t> finalizeFailures{0};
        std::atomic<uint64_t> transfersAborted{0};
        std::atomic<uint64_t> progressWriteFailures{0};
    };

    struct SignalingMetrics {
        std::atomic<uint64_t> connectionsOpened{0};
        std::atomic<uint64_t> connectionsClosed{0};
        std::atomic<uint64_t> messagesForwarded{0};
        std::atomic<uint64_t> messagesDropped{0};
        std::atomic<uint64_t> peerBroadcasts{0};
        std::atomic<uint64_t> protocolErrors{0};
        std::atomic<uint64_t> connectFailures{0};
        std::atomic<uint64_t> reconnectAttempts{0};
        std::atomic<uint64_t> outboxEnqueued{0};
        std::atomic<uint64_t> outboxFlushed{0};
    };

    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Transfer metrics
        void incrementTransfersStarted();
        void incrementChunksAccepted();
        void incrementChunksCorrupted();
        void incrementChunksRejected();
        void incrementBackendWriteFailures();
        void addBytesPersisted(uint64_t bytes);
        void incrementTransfersFinalized();
        void incrementFinalizeFailures();
        void incrementTransfersAborted();
        void incrementProgressWriteFailures();

        // Signaling metrics (relay side)
        void incrementConnectionsOpened();
        void incrementConnectionsClosed();
        void incrementMessagesForwarded();
        void incrementMessagesDropped();
        void incrementPeerBroadcasts();
        void incrementProtocolErrors();

        // Signaling metrics (client side)
        void incrementConnectFailures();
        void incrementReconnectAttempts();
        void incrementOutboxEnqueued();
        void addOutboxFlushed(uint64_t count);

        TransferMetricsSnapshot getTransferMetrics() const;
        SignalingMetricsSnapshot getSignalingMetrics() const;

        // Human readable multi-line summary
        std::string getMetricsSummary() const;

        // Prometheus-compatible export
        std::string exportPrometheus() const;

        // Reset all metrics
        void reset();

        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        TransferMetrics transferMetrics_;
        SignalingMetrics signalingMetrics_;

        std::chrono::system_clock::time_point startTime_;
    };

} // namespace Tessera
