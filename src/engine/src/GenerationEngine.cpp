#include "GenerationEngine.hpp"
#include "DdmHistory.hpp"
#include "FaultDecisionCache.hpp"
#include "IdentityGenerator.hpp"
#include "LifecyclePredictor.hpp"
#include "LogUtils.hpp"
#include "RandomUtils.hpp"
#include "SynthesizerFactory.hpp"
#include "TelgenErrors.hpp"
#include "TimeRecorder.hpp"
#include "TopologyBuilder.hpp"
#include <algorithm>
#include <thread>

namespace {

GenerationRequest validated(const GenerationRequest& request) {
    request.validate();
    return request;
}

uint64_t resolve_seed(const GenerationRequest& request) {
    if (request.seed) {
        return *request.seed;
    }
    uint64_t seed = RandomUtils::draw_seed();
    LogUtils::info("No seed given, drew seed {}", seed);
    return seed;
}

const std::vector<InterfaceRef>& keys_for(const Topology& topology, TableKind kind) {
    return requires_optics(kind) ? topology.optical_keys() : topology.interface_keys();
}

}

const char* job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Skipped:   return "skipped";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

bool GenerationSummary::all_completed() const {
    for (const auto& report : tables) {
        if (report.status != JobStatus::Completed && report.status != JobStatus::Skipped) {
            return false;
        }
    }
    return true;
}

bool GenerationSummary::any_cancelled() const {
    for (const auto& report : tables) {
        if (report.status == JobStatus::Cancelled) return true;
    }
    return false;
}

int64_t GenerationSummary::total_rows() const {
    int64_t total = 0;
    for (const auto& report : tables) {
        total += report.rows;
    }
    return total;
}

GenerationEngine::GenerationEngine(const GenerationRequest& request, SinkCreator sink_creator, size_t batch_size)
    : request_(validated(request)),
      sink_creator_(std::move(sink_creator)),
      batch_size_(batch_size),
      seed_(resolve_seed(request_)),
      topology_(TopologyBuilder::build(request_.environment, request_.device_count, seed_, request_.range.start)) {
    if (!sink_creator_) {
        throw std::invalid_argument("GenerationEngine needs a sink creator");
    }
    build_plans();
    injector_.emplace(seed_, request_.fault_ratio, fault_bucket_for_plans());
    LogUtils::debug("Fault decisions are drawn per {}s bucket", injector_->bucket_seconds());

    LogUtils::info("Topology '{}': {} devices, {} interfaces, {} optical modules (seed {})",
                   topology_->environment(), topology_->device_count(), topology_->interface_count(),
                   topology_->module_count(), seed_);
}

GenerationEngine::GenerationEngine(const ConfigData& config)
    : GenerationEngine(config.request, SinkFactory::file_sinks(config.output)) {}

void GenerationEngine::build_plans() {
    for (TableKind kind : ALL_TABLE_KINDS) {
        bool needed = request_.is_enabled(kind) ||
                      (kind == TableKind::Ddm && request_.is_enabled(TableKind::Lifecycle));
        if (kind == TableKind::Lifecycle || !needed) {
            continue;
        }

        const auto& keys = keys_for(*topology_, kind);
        SchedulePlan plan = TimeSeriesScheduler::plan(request_.range, request_.rows_per_table,
                                                      keys.size(), native_step_seconds(kind));
        if (plan.below_native_cadence()) {
            LogUtils::warn("{}: {} rows over {} keys need spacing below the native {}s cadence",
                           table_kind_to_string(kind), request_.rows_per_table, keys.size(),
                           native_step_seconds(kind));
        }
        plans_[table_index(kind)].emplace(std::move(plan));
    }
}

int64_t GenerationEngine::fault_bucket_for_plans() const {
    int64_t bucket = FaultInjector::DEFAULT_BUCKET_SECONDS;
    for (const auto& plan : plans_) {
        if (plan && plan->min_spacing() > 0) {
            bucket = std::min(bucket, plan->min_spacing());
        }
    }
    return bucket;
}

int64_t GenerationEngine::planned_rows(TableKind kind) const {
    if (!request_.is_enabled(kind)) {
        return -1;
    }
    if (kind != TableKind::Lifecycle) {
        return plans_[table_index(kind)]->total_rows();
    }

    int64_t rows = 0;
    const auto k = static_cast<int64_t>(request_.lifecycle_samples_per_prediction);
    for (const auto& key : plans_[table_index(TableKind::Ddm)]->keys()) {
        rows += key.rows / k;
    }
    return rows;
}

GenerationSummary GenerationEngine::run() {
    GenerationSummary summary;
    summary.seed = seed_;
    summary.environment = topology_->environment();
    summary.device_count = topology_->device_count();
    summary.interface_count = topology_->interface_count();
    summary.module_count = topology_->module_count();
    for (TableKind kind : ALL_TABLE_KINDS) {
        summary.tables[table_index(kind)].kind = kind;
    }

    const bool lifecycle = request_.is_enabled(TableKind::Lifecycle);
    if (lifecycle) {
        channel_ = std::make_unique<ObservationChannel>(OBSERVATION_CHANNEL_CAPACITY);
    }

    ThreadSafeQueue<TableKind> jobs;
    for (TableKind kind : ALL_TABLE_KINDS) {
        if (kind == TableKind::Lifecycle) continue;
        if (plans_[table_index(kind)]) {
            jobs.enqueue(kind);
        }
    }
    jobs.stop();

    // The lifecycle consumer gets its own thread so a single worker cannot block on a full channel
    std::thread lifecycle_thread;
    if (lifecycle) {
        lifecycle_thread = std::thread([this, &summary] {
            TableReport& report = summary.tables[table_index(TableKind::Lifecycle)];
            try {
                run_lifecycle(report, *channel_);
            } catch (const std::exception& e) {
                report.status = JobStatus::Failed;
                report.error = e.what();
                channel_->terminate();
                record_fatal(TableKind::Lifecycle, std::current_exception());
            }
        });
    }

    std::vector<std::thread> workers;
    for (size_t i = 0; i < request_.concurrency; ++i) {
        workers.emplace_back([this, &jobs, &summary] { worker_loop(jobs, summary.tables); });
    }
    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }
    if (lifecycle_thread.joinable()) {
        lifecycle_thread.join();
    }
    channel_.reset();

    for (const auto& report : summary.tables) {
        if (report.status == JobStatus::Skipped) continue;
        LogUtils::info("{}: {} rows in {} batches, {} ({}) in {:.1f} ms, {:.0f} rows/s",
                       table_kind_to_string(report.kind), report.rows, report.batches,
                       job_status_to_string(report.status), report.location, report.elapsed_ms,
                       TimeRecorder::throughput(report.rows, report.elapsed_ms));
    }

    if (fatal_error_) {
        std::rethrow_exception(fatal_error_);
    }
    return summary;
}

void GenerationEngine::worker_loop(ThreadSafeQueue<TableKind>& jobs, std::array<TableReport, 5>& reports) {
    while (auto job = jobs.dequeue()) {
        TableKind kind = *job;
        ObservationChannel* channel = kind == TableKind::Ddm ? channel_.get() : nullptr;
        TableReport& report = reports[table_index(kind)];

        try {
            run_table(kind, report, channel);
        } catch (const std::exception& e) {
            report.status = JobStatus::Failed;
            report.error = e.what();
            if (channel) channel->terminate();
            record_fatal(kind, std::current_exception());
        }
    }
}

void GenerationEngine::record_fatal(TableKind kind, std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    fatal_.store(true);
    if (!fatal_error_) {
        fatal_error_ = error;
    }
    LogUtils::error("Generation of {} aborted the run", table_kind_to_string(kind));
}

void GenerationEngine::run_table(TableKind kind, TableReport& report, ObservationChannel* channel) {
    TimeRecorder timer;
    const bool write_output = request_.is_enabled(kind);
    const TableRequest& table = request_.table(kind);

    // DDM that runs only to feed lifecycle prediction
    auto sink = write_output ? sink_creator_(table) : SinkFactory::create_null_sink();
    auto synthesizer = SynthesizerFactory::create(kind, seed_, *topology_);
    const auto& keys = keys_for(*topology_, kind);
    const SchedulePlan& plan = *plans_[table_index(kind)];
    FaultDecisionCache faults(*injector_);
    BatchEmitter emitter(*sink, synthesizer->schema(), batch_size_);

    DdmObservationBatch observations;
    bool forwarding = channel != nullptr;
    if (forwarding) {
        auto* ddm = dynamic_cast<DdmSynthesizer*>(synthesizer.get());
        if (!ddm) {
            throw std::logic_error("Only the DDM job feeds lifecycle prediction");
        }
        ddm->set_observer([&observations](const DdmObservation& obs) { observations.push_back(obs); });
    }

    auto forward = [&]() {
        if (!forwarding || observations.empty()) return;
        if (!channel->push(std::move(observations))) {
            LogUtils::debug("Lifecycle consumer is gone, no longer forwarding observations");
            forwarding = false;
        }
        observations.clear();
        observations.reserve(batch_size_);
    };

    if (write_output) {
        report.location = sink->location();
    }
    LogUtils::debug("Generating {} rows of {} over {} keys", plan.total_rows(), table_kind_to_string(kind),
                    keys.size());

    JobStatus status = JobStatus::Completed;
    try {
        emitter.open();
        auto cursor = plan.cursor();
        while (cursor.has_more()) {
            if (emitter.pending_empty() && should_stop()) {
                status = JobStatus::Cancelled;
                break;
            }
            ScheduledSlot slot = cursor.next();
            const InterfaceRef& key = keys[slot.key_index];
            CommonFieldBlock common = IdentityGenerator::common_fields_for(key, slot.timestamp);
            FaultState fault = faults.decide(common.module_id, slot.timestamp);
            if (emitter.add(synthesizer->synthesize(key, common, fault))) {
                forward();
            }
        }

        if (status == JobStatus::Cancelled) {
            emitter.abandon();
            observations.clear();
            LogUtils::warn("{} cancelled after {} rows", table_kind_to_string(kind), emitter.rows_emitted());
        } else {
            emitter.finish();
            forward();
        }
        if (channel) channel->close();
    } catch (const SinkWriteError& e) {
        status = JobStatus::Failed;
        report.error = e.what();
        LogUtils::error("{} failed after batch {}: {}", table_kind_to_string(kind), e.last_batch_index(), e.what());
        if (channel) channel->terminate();
    }

    report.status = status;
    report.rows = emitter.rows_emitted();
    report.batches = emitter.batches_emitted();
    report.last_batch_index = emitter.last_batch_index();
    report.elapsed_ms = timer.elapsed();
    if (!write_output) {
        // Rows went to the discard sink; only lifecycle output was requested
        report = TableReport{kind};
    }
    LogUtils::debug("Fault memo for {}: {} hits, {} misses", table_kind_to_string(kind), faults.hits(),
                    faults.misses());
}

void GenerationEngine::run_lifecycle(TableReport& report, ObservationChannel& channel) {
    TimeRecorder timer;
    const TableRequest& table = request_.table(TableKind::Lifecycle);
    const size_t cadence = request_.lifecycle_samples_per_prediction;
    const auto& keys = topology_->interface_keys();

    auto sink = sink_creator_(table);
    LifecyclePredictor predictor;
    DdmHistory history(keys.size());
    BatchEmitter emitter(*sink, predictor.schema(), batch_size_);
    report.location = sink->location();

    JobStatus status = JobStatus::Completed;
    try {
        emitter.open();
        bool done = false;
        while (!done) {
            if (emitter.pending_empty() && should_stop()) {
                status = JobStatus::Cancelled;
                break;
            }

            auto result = channel.pop();
            switch (result.status) {
                case ObservationChannel::PopStatus::Timeout:
                    continue;
                case ObservationChannel::PopStatus::Closed:
                    done = true;
                    break;
                case ObservationChannel::PopStatus::Terminated:
                    status = should_stop() ? JobStatus::Cancelled : JobStatus::Failed;
                    report.error = "aborted: DDM generation did not complete";
                    done = true;
                    break;
                case ObservationChannel::PopStatus::Success:
                    for (const auto& obs : *result.data) {
                        size_t seen = history.record(obs);
                        if (seen % cadence != 0) continue;
                        const InterfaceRef& key = keys[obs.key_ordinal];
                        CommonFieldBlock common = IdentityGenerator::common_fields_for(key, obs.timestamp);
                        emitter.add(predictor.predict(key, common, history.view(obs.key_ordinal)));
                    }
                    break;
            }
        }

        if (status == JobStatus::Completed && should_stop()) {
            status = JobStatus::Cancelled;
        }
        if (status == JobStatus::Completed) {
            emitter.finish();
        } else {
            // Unblock the DDM producer
            channel.terminate();
            emitter.abandon();
        }
    } catch (const SinkWriteError& e) {
        status = JobStatus::Failed;
        report.error = e.what();
        LogUtils::error("lifecycle failed after batch {}: {}", e.last_batch_index(), e.what());
        channel.terminate();
    }

    report.status = status;
    report.rows = emitter.rows_emitted();
    report.batches = emitter.batches_emitted();
    report.last_batch_index = emitter.last_batch_index();
    report.elapsed_ms = timer.elapsed();
}
