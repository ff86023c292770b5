/**
 * @file test_metrics.cpp
 * @brief Process-wide counters and their exports
 */

#include <gtest/gtest.h>
#include "MetricsCollector.h"

#include <string>

using namespace Tessera;

class MetricsCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsCollector::instance().reset();
    }

    void TearDown() override {
        MetricsCollector::instance().reset();
    }

    MetricsCollector& metrics = MetricsCollector::instance();
};

TEST_F(MetricsCollectorTest, SingletonInstance) {
    EXPECT_EQ(&MetricsCollector::instance(), &metrics);
}

TEST_F(MetricsCollectorTest, TransferCounters) {
    metrics.incrementTransfersStarted();
    metrics.incrementChunksAccepted();
    metrics.incrementChunksAccepted();
    metrics.incrementChunksCorrupted();
    metrics.addBytesPersisted(4096);
    metrics.addBytesPersisted(1000);

    auto snapshot = metrics.getTransferMetrics();
    EXPECT_EQ(snapshot.transfersStarted, 1u);
    EXPECT_EQ(snapshot.chunksAccepted, 2u);
    EXPECT_EQ(snapshot.chunksCorrupted, 1u);
    EXPECT_EQ(snapshot.bytesPersisted, 5096u);
    EXPECT_EQ(snapshot.transfersFinalized, 0u);
}

TEST_F(MetricsCollectorTest, SignalingCounters) {
    metrics.incrementConnectionsOpened();
    metrics.incrementMessagesForwarded();
    metrics.incrementMessagesDropped();
    metrics.incrementOutboxEnqueued();
    metrics.incrementOutboxEnqueued();
    metrics.addOutboxFlushed(2);

    auto snapshot = metrics.getSignalingMetrics();
    EXPECT_EQ(snapshot.connectionsOpened, 1u);
    EXPECT_EQ(snapshot.messagesForwarded, 1u);
    EXPECT_EQ(snapshot.messagesDropped, 1u);
    EXPECT_EQ(snapshot.outboxEnqueued, 2u);
    EXPECT_EQ(snapshot.outboxFlushed, 2u);
}

TEST_F(MetricsCollectorTest, PrometheusExport) {
    metrics.incrementChunksAccepted();
    metrics.incrementProtocolErrors();

    std::string text = metrics.exportPrometheus();
    EXPECT_NE(text.find("# TYPE tessera_chunks_accepted_total counter"), std::string::npos);
    EXPECT_NE(text.find("tessera_chunks_accepted_total 1\n"), std::string::npos);
    EXPECT_NE(text.find("tessera_relay_protocol_errors_total 1\n"), std::string::npos);
    EXPECT_NE(text.find("tessera_info{version="), std::string::npos);
}

TEST_F(MetricsCollectorTest, SummaryAndReset) {
    metrics.incrementTransfersAborted();
    metrics.incrementProgressWriteFailures();
    EXPECT_NE(metrics.getMetricsSummary().find("Transfers Aborted: 1"), std::string::npos);
    EXPECT_NE(metrics.exportPrometheus().find("tessera_progress_write_failures_total 1\n"), std::string::npos);

    metrics.reset();
    EXPECT_EQ(metrics.getTransferMetrics().transfersAborted, 0u);
    EXPECT_EQ(metrics.getTransferMetrics().progressWriteFailures, 0u);
    EXPECT_NE(metrics.getMetricsSummary().find("Transfers Aborted: 0"), std::string::npos);
}
