#ifndef ESQ_DEFS_HPP
#define ESQ_DEFS_HPP

#include <chrono>
#include <cstdint>

namespace esq {
constexpr uint32_t cBatchSize = 1000;
constexpr uint32_t cMaxBatchSize = 10'000;
constexpr uint32_t cDefaultNumLines = 10;
constexpr uint32_t cMaxNumLines = 5000;

// Skew subtracted from "now" so that documents still being indexed are not read
constexpr char cIngestionLatency[] = "1m";
constexpr char cSnapshotKeepAlive[] = "1m";

constexpr std::chrono::milliseconds cPollInterval{1000};
constexpr std::chrono::milliseconds cMaxRetryBackoff{30'000};
constexpr long cConnectTimeoutSeconds = 10;
// Upper bound on requests that can't be aborted by an interrupt
constexpr long cUninterruptibleTimeoutSeconds = 30;

constexpr char cTimestampField[] = "@timestamp";
constexpr char cShardDocField[] = "_shard_doc";
}  // namespace esq

#endif  // ESQ_DEFS_HPP
