#pragma once

#include "BatchEmitter.hpp"
#include "BoundedChannel.hpp"
#include "ConfigData.hpp"
#include "DdmSynthesizer.hpp"
#include "FaultInjector.hpp"
#include "SinkFactory.hpp"
#include "ThreadSafeQueue.hpp"
#include "TimeSeriesScheduler.hpp"
#include "Topology.hpp"
#include <array>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class JobStatus {
    Skipped,
    Completed,
    Failed,
    Cancelled
};

const char* job_status_to_string(JobStatus status);

struct TableReport {
    TableKind kind = TableKind::Grpc;
    JobStatus status = JobStatus::Skipped;
    std::string location;
    int64_t rows = 0;
    int64_t batches = 0;
    int64_t last_batch_index = -1;
    std::string error;
    double elapsed_ms = 0.0;
};

struct GenerationSummary {
    uint64_t seed = 0;
    std::string environment;
    size_t device_count = 0;
    size_t interface_count = 0;
    size_t module_count = 0;
    std::array<TableReport, 5> tables;

    const TableReport& table(TableKind kind) const { return tables[table_index(kind)]; }

    // Every requested table completed
    bool all_completed() const;
    bool any_cancelled() const;
    int64_t total_rows() const;
};

// Runs one job per requested table on a pool of `concurrency` workers. Lifecycle rows are
// predicted on a dedicated thread from the DDM job's observations.
class GenerationEngine {
public:
    static constexpr size_t OBSERVATION_CHANNEL_CAPACITY = 8;

    // Validates the request, resolves the seed and builds the topology.
    // Throws ConfigurationError before anything is written.
    GenerationEngine(const GenerationRequest& request, SinkCreator sink_creator,
                     size_t batch_size = BatchEmitter::DEFAULT_BATCH_SIZE);

    // File sinks under config.output
    explicit GenerationEngine(const ConfigData& config);

    GenerationEngine(const GenerationEngine&) = delete;
    GenerationEngine& operator=(const GenerationEngine&) = delete;

    // Rethrows the first fatal job error (a SchemaViolationError, typically) after all
    // workers have stopped; sink failures and cancellation are reported per table
    GenerationSummary run();

    void request_stop() { stop_.store(true); }
    std::atomic<bool>& stop_flag() { return stop_; }

    uint64_t seed() const { return seed_; }
    const Topology& topology() const { return *topology_; }
    const GenerationRequest& request() const { return request_; }

    // Rows a table will receive; -1 for tables that are not requested
    int64_t planned_rows(TableKind kind) const;

    // Fault decisions hold for one bucket: 30 minutes at most, and never longer than the
    // densest planned table's row spacing, so every row of a key draws its own decision
    int64_t fault_bucket_seconds() const { return injector_->bucket_seconds(); }

private:
    using ObservationChannel = BoundedChannel<DdmObservationBatch>;

    void build_plans();
    int64_t fault_bucket_for_plans() const;
    void worker_loop(ThreadSafeQueue<TableKind>& jobs, std::array<TableReport, 5>& reports);
    void run_table(TableKind kind, TableReport& report, ObservationChannel* channel);
    void run_lifecycle(TableReport& report, ObservationChannel& channel);
    void record_fatal(TableKind kind, std::exception_ptr error);
    bool should_stop() const { return stop_.load() || fatal_.load(); }

    GenerationRequest request_;
    SinkCreator sink_creator_;
    size_t batch_size_;
    uint64_t seed_;
    TopologyPtr topology_;
    std::optional<FaultInjector> injector_;
    std::array<std::optional<SchedulePlan>, 5> plans_;
    std::unique_ptr<ObservationChannel> channel_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> fatal_{false};
    std::mutex fatal_mutex_;
    std::exception_ptr fatal_error_;
};
