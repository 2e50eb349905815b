#include <gtest/gtest.h>
#include "utilities/metrics.h"

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    MetricsRegistry::Labels labels{{"reason", "QuotaExceeded"}, {"a", "b"}};
    // Map iteration is ordered, so "a" should come before "reason".
    EXPECT_EQ(MetricsRegistry::labelsToString(labels), "{a=\"b\",reason=\"QuotaExceeded\"}");
    EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

TEST(MetricsRegistry, EscapesTenantLabelValues) {
    EXPECT_EQ(MetricsRegistry::labelsToString({{"tenant", "a\"b\\c\nd"}}), "{tenant=\"a\\\"b\\\\c\\nd\"}");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    auto& metrics = MetricsRegistry::instance();
    metrics.reset();
    metrics.setGauge("chunkvault_tenant_used_bytes", 2.5, {{"tenant", "alice"}});
    metrics.incrementCounter("chunkvault_chunks_accepted_total", 3);
    metrics.incrementCounter("chunkvault_chunks_accepted_total");
    metrics.observe("chunkvault_chunk_bytes", 1.5);
    metrics.observe("chunkvault_chunk_bytes", 2.5);

    EXPECT_DOUBLE_EQ(metrics.gaugeValue("chunkvault_tenant_used_bytes", {{"tenant", "alice"}}), 2.5);
    EXPECT_DOUBLE_EQ(metrics.gaugeValue("chunkvault_tenant_used_bytes", {{"tenant", "bob"}}), 0.0);
    EXPECT_DOUBLE_EQ(metrics.counterValue("chunkvault_chunks_accepted_total"), 4.0);
    EXPECT_EQ(metrics.observationCount("chunkvault_chunk_bytes"), 2u);

    std::string text = metrics.toPrometheus();
    EXPECT_NE(text.find("chunkvault_tenant_used_bytes{tenant=\"alice\"} 2.5"), std::string::npos);
    EXPECT_NE(text.find("chunkvault_chunks_accepted_total 4"), std::string::npos);
    EXPECT_NE(text.find("chunkvault_chunk_bytes_sum 4"), std::string::npos);
    EXPECT_NE(text.find("chunkvault_chunk_bytes_count 2"), std::string::npos);
    metrics.reset();
    EXPECT_TRUE(metrics.toPrometheus().empty());
}

TEST(MetricsRegistry, HistogramLabelsFollowSuffix) {
    auto& metrics = MetricsRegistry::instance();
    metrics.reset();
    metrics.observe("latency_seconds", 1.0, {{"op", "merge"}});
    std::string text = metrics.toPrometheus();
    EXPECT_NE(text.find("latency_seconds_sum{op=\"merge\"} 1"), std::string::npos);
    EXPECT_NE(text.find("latency_seconds_count{op=\"merge\"} 1"), std::string::npos);
    metrics.reset();
}
