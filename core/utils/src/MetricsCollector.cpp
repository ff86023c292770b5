#include "MetricsCollector.h"
#include "Version.h"
#include <sstream>
#include <iomanip>

namespace Tessera {

    namespace {

        void writeCounter(std::stringstream& ss, const char* name, const char* help, uint64_t value) {
            ss << "# HELP " << name << " " << help << "\n";
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << value << "\n";
        }

    } // namespace

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::system_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    // Transfer metrics
    void MetricsCollector::incrementTransfersStarted() { transferMetrics_.transfersStarted++; }
    void MetricsCollector::incrementChunksAccepted() { transferMetrics_.chunksAccepted++; }
    void MetricsCollector::incrementChunksCorrupted() { transferMetrics_.chunksCorrupted++; }
    void MetricsCollector::incrementChunksRejected() { transferMetrics_.chunksRejected++; }
    void MetricsCollector::incrementBackendWriteFailures() { transferMetrics_.backendWriteFailures++; }
    void MetricsCollector::addBytesPersisted(uint64_t bytes) { transferMetrics_.bytesPersisted += bytes; }
    void MetricsCollector::incrementTransfersFinalized() { transferMetrics_.transfersFinalized++; }
    void MetricsCollector::incrementFinalizeFailures() { transferMetrics_.finalizeFailures++; }
    void MetricsCollector::incrementTransfersAborted() { transferMetrics_.transfersAborted++; }
    void MetricsCollector::incrementProgressWriteFailures() { transferMetrics_.progressWriteFailures++; }

    // Signaling metrics
    void MetricsCollector::incrementConnectionsOpened() { signalingMetrics_.connectionsOpened++; }
    void MetricsCollector::incrementConnectionsClosed() { signalingMetrics_.connectionsClosed++; }
    void MetricsCollector::incrementMessagesForwarded() { signalingMetrics_.messagesForwarded++; }
    void MetricsCollector::incrementMessagesDropped() { signalingMetrics_.messagesDropped++; }
    void MetricsCollector::incrementPeerBroadcasts() { signalingMetrics_.peerBroadcasts++; }
    void MetricsCollector::incrementProtocolErrors() { signalingMetrics_.protocolErrors++; }
    void MetricsCollector::incrementConnectFailures() { signalingMetrics_.connectFailures++; }
    void MetricsCollector::incrementReconnectAttempts() { signalingMetrics_.reconnectAttempts++; }
    void MetricsCollector::incrementOutboxEnqueued() { signalingMetrics_.outboxEnqueued++; }
    void MetricsCollector::addOutboxFlushed(uint64_t count) { signalingMetrics_.outboxFlushed += count; }

    TransferMetricsSnapshot MetricsCollector::getTransferMetrics() const {
        TransferMetricsSnapshot snapshot;
        snapshot.transfersStarted = transferMetrics_.transfersStarted.load();
        snapshot.chunksAccepted = transferMetrics_.chunksAccepted.load();
        snapshot.chunksCorrupted = transferMetrics_.chunksCorrupted.load();
        snapshot.chunksRejected = transferMetrics_.chunksRejected.load();
        snapshot.backendWriteFailures = transferMetrics_.backendWriteFailures.load();
        snapshot.bytesPersisted = transferMetrics_.bytesPersisted.load();
        snapshot.transfersFinalized = transferMetrics_.transfersFinalized.load();
        snapshot.finalizeFailures = transferMetrics_.finalizeFailures.load();
        snapshot.transfersAborted = transferMetrics_.transfersAborted.load();
        snapshot.progressWriteFailures = transferMetrics_.progressWriteFailures.load();
        return snapshot;
    }

    SignalingMetricsSnapshot MetricsCollector::getSignalingMetrics() const {
        SignalingMetricsSnapshot snapshot;
        snapshot.connectionsOpened = signalingMetrics_.connectionsOpened.load();
        snapshot.connectionsClosed = signalingMetrics_.connectionsClosed.load();
        snapshot.messagesForwarded = signalingMetrics_.messagesForwarded.load();
        snapshot.messagesDropped = signalingMetrics_.messagesDropped.load();
        snapshot.peerBroadcasts = signalingMetrics_.peerBroadcasts.load();
        snapshot.protocolErrors = signalingMetrics_.protocolErrors.load();
        snapshot.connectFailures = signalingMetrics_.connectFailures.load();
        snapshot.reconnectAttempts = signalingMetrics_.reconnectAttempts.load();
        snapshot.outboxEnqueued = signalingMetrics_.outboxEnqueued.load();
        snapshot.outboxFlushed = signalingMetrics_.outboxFlushed.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        std::stringstream ss;

        auto uptime = getUptime();
        auto hours = std::chrono::duration_cast<std::chrono::hours>(uptime).count();
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime % std::chrono::hours(1)).count();

        auto t = getTransferMetrics();
        auto s = getSignalingMetrics();

        ss << "=== Tessera Metrics Summary ===" << std::endl;
        ss << "Uptime: " << hours << "h " << minutes << "m" << std::endl << std::endl;

        ss << "--- Transfer Metrics ---" << std::endl;
        double persistedMB = t.bytesPersisted / (1024.0 * 1024.0);
        ss << std::fixed << std::setprecision(2);
        ss << "  Transfers Started: " << t.transfersStarted << std::endl;
        ss << "  Chunks Accepted: " << t.chunksAccepted << std::endl;
        ss << "  Chunks Corrupted: " << t.chunksCorrupted << std::endl;
        ss << "  Chunks Rejected: " << t.chunksRejected << std::endl;
        ss << "  Backend Write Failures: " << t.backendWriteFailures << std::endl;
        ss << "  Persisted: " << persistedMB << " MB" << std::endl;
        ss << "  Transfers Finalized: " << t.transfersFinalized << std::endl;
        ss << "  Finalize Failures: " << t.finalizeFailures << std::endl;
        ss << "  Transfers Aborted: " << t.transfersAborted << std::endl;
        ss << "  Progress Write Failures: " << t.progressWriteFailures << std::endl << std::endl;

        ss << "--- Signaling Metrics ---" << std::endl;
        ss << "  Connections Opened: " << s.connectionsOpened << std::endl;
        ss << "  Connections Closed: " << s.connectionsClosed << std::endl;
        ss << "  Messages Forwarded: " << s.messagesForwarded << std::endl;
        ss << "  Messages Dropped: " << s.messagesDropped << std::endl;
        ss << "  Peer Broadcasts: " << s.peerBroadcasts << std::endl;
        ss << "  Protocol Errors: " << s.protocolErrors << std::endl;
        ss << "  Connect Failures: " << s.connectFailures << std::endl;
        ss << "  Reconnect Attempts: " << s.reconnectAttempts << std::endl;
        ss << "  Outbox Enqueued: " << s.outboxEnqueued << std::endl;
        ss << "  Outbox Flushed: " << s.outboxFlushed << std::endl;

        return ss.str();
    }

    std::string MetricsCollector::exportPrometheus() const {
        std::stringstream ss;
        auto t = getTransferMetrics();
        auto s = getSignalingMetrics();

        ss << "# HELP tessera_info Tessera build information\n";
        ss << "# TYPE tessera_info gauge\n";
        ss << "tessera_info{version=\"" << Version::toString() << "\"} 1\n";

        writeCounter(ss, "tessera_uptime_seconds", "Process uptime in seconds", getUptime().count());

        writeCounter(ss, "tessera_transfers_started_total", "Transfers initialized for reassembly", t.transfersStarted);
        writeCounter(ss, "tessera_chunks_accepted_total", "Chunks verified and persisted", t.chunksAccepted);
        writeCounter(ss, "tessera_chunks_corrupted_total", "Chunks rejected by checksum", t.chunksCorrupted);
        writeCounter(ss, "tessera_chunks_rejected_total", "Chunks for unknown transfers or out of range indices", t.chunksRejected);
        writeCounter(ss, "tessera_backend_write_failures_total", "Chunk writes the storage backend refused", t.backendWriteFailures);
        writeCounter(ss, "tessera_bytes_persisted_total", "Chunk bytes handed to the storage backend", t.bytesPersisted);
        writeCounter(ss, "tessera_transfers_finalized_total", "Transfers finalized successfully", t.transfersFinalized);
        writeCounter(ss, "tessera_finalize_failures_total", "Finalize attempts that failed", t.finalizeFailures);
        writeCounter(ss, "tessera_transfers_aborted_total", "Transfers aborted by the caller", t.transfersAborted);
        writeCounter(ss, "tessera_progress_write_failures_total", "Resume progress updates that could not be stored", t.progressWriteFailures);

        writeCounter(ss, "tessera_relay_connections_opened_total", "Relay connections registered", s.connectionsOpened);
        writeCounter(ss, "tessera_relay_connections_closed_total", "Relay connections closed", s.connectionsClosed);
        writeCounter(ss, "tessera_relay_messages_forwarded_total", "Directed messages forwarded", s.messagesForwarded);
        writeCounter(ss, "tessera_relay_messages_dropped_total", "Directed messages dropped for absent targets", s.messagesDropped);
        writeCounter(ss, "tessera_relay_peer_broadcasts_total", "Peer list broadcasts", s.peerBroadcasts);
        writeCounter(ss, "tessera_relay_protocol_errors_total", "Malformed or oversized frames", s.protocolErrors);
        writeCounter(ss, "tessera_client_connect_failures_total", "Failed client connection attempts", s.connectFailures);
        writeCounter(ss, "tessera_client_reconnect_attempts_total", "Automatic reconnection attempts", s.reconnectAttempts);
        writeCounter(ss, "tessera_client_outbox_enqueued_total", "Messages queued while disconnected", s.outboxEnqueued);
        writeCounter(ss, "tessera_client_outbox_flushed_total", "Queued messages delivered after reconnect", s.outboxFlushed);

        return ss.str();
    }

    void MetricsCollector::reset() {
        transferMetrics_.transfersStarted = 0;
        transferMetrics_.chunksAccepted = 0;
        transferMetrics_.chunksCorrupted = 0;
        transferMetrics_.chunksRejected = 0;
        transferMetrics_.backendWriteFailures = 0;
        transferMetrics_.bytesPersisted = 0;
        transferMetrics_.transfersFinalized = 0;
        transferMetrics_.finalizeFailures = 0;
        transferMetrics_.transfersAborted = 0;
        transferMetrics_.progressWriteFailures = 0;

        signalingMetrics_.connectionsOpened = 0;
        signalingMetrics_.connectionsClosed = 0;
        signalingMetrics_.messagesForwarded = 0;
        signalingMetrics_.messagesDropped = 0;
        signalingMetrics_.peerBroadcasts = 0;
        signalingMetrics_.protocolErrors = 0;
        signalingMetrics_.connectFailures = 0;
        signalingMetrics_.reconnectAttempts = 0;
        signalingMetrics_.outboxEnqueued = 0;
        signalingMetrics_.outboxFlushed = 0;
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_);
    }

} // namespace Tessera
