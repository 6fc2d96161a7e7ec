/*
 * Media Pipeline
 *
 * One running instance of a StreamEntry: a chain of
 *   FrameSource -> EncoderStage -> Payloader
 * per media, paced by dispatch loop timers.
 *
 * Frame ticks are scheduled from the absolute source pts, so pacing does
 * not drift. With a worker pool, encoding runs on a per-chain strand with
 * at most max_in_flight frames outstanding; ticks beyond that are deferred
 * until a completion arrives, never dropped. Completions come back to the
 * loop in frame order, so payloading and packet callbacks always run on the
 * loop thread.
 *
 * A source or encoder failure stops all chains and is reported once through
 * the failure callback (posted, never from inside a tick).
 */

#ifndef PIPELINE_H
#define PIPELINE_H

#include "dispatch_loop.h"
#include "encoder_stage.h"
#include "frame_source.h"
#include "payloader.h"
#include "status.h"
#include "stream_registry.h"
#include "worker_pool.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct PipelineOptions {
    size_t mtu = 1200;                // Max RTP packet size including header
    WorkerPool* pool = nullptr;       // Encode on the loop thread if null
    int max_in_flight = 2;            // Per chain, with a pool
    int64_t initial_sequence = -1;    // -1 = random per chain
    int64_t initial_timestamp = -1;   // -1 = random per chain
};

struct ChainStats {
    uint64_t frames = 0;
    uint64_t units = 0;
    uint64_t keyframes = 0;
    uint64_t packets = 0;
    uint64_t deferred_ticks = 0;
};

// Encoder parameters for a media entry
EncoderParams encoder_params(const config::MediaConfig& media);

class Pipeline {
public:
    using PacketCallback = std::function<void(size_t media_index, const Packet& packet)>;
    using UnitObserver = std::function<void(size_t media_index, const EncodedUnit& unit)>;
    using FailureCallback = std::function<void(const Status& status)>;

    Pipeline(const StreamEntry& entry, DispatchLoop& loop, const PipelineOptions& options);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * Open sources and initialize encoders and payloaders
     * @return SourceUnavailable or EncoderInitFailure naming the media
     */
    Status start();

    // Begin (or resume) producing frames from now
    void activate();

    // Stop producing; pts continue where they left off on the next activate()
    void deactivate();

    bool active() const { return active_; }
    bool failed() const { return failed_; }
    bool started() const { return started_; }

    void set_packet_callback(PacketCallback cb) { packet_cb_ = std::move(cb); }
    void set_unit_observer(UnitObserver cb) { unit_observer_ = std::move(cb); }
    void set_failure_callback(FailureCallback cb) { failure_cb_ = std::move(cb); }

    // Next frame of every video chain becomes a keyframe
    void request_keyframe();

    const StreamEntry& entry() const { return entry_; }
    size_t media_count() const { return chains_.size(); }
    const MediaDescriptor& descriptor(size_t media_index) const;

    // H.264 parameter sets of a chain (without start codes)
    bool parameter_sets(size_t media_index, std::vector<uint8_t>& sps, std::vector<uint8_t>& pps) const;

    ChainStats stats(size_t media_index) const;

    // One-line statistics for periodic logging
    void print_stats() const;

private:
    struct Chain;

    void schedule_tick(const std::shared_ptr<Chain>& chain);
    void on_tick(const std::shared_ptr<Chain>& chain);
    void produce(const std::shared_ptr<Chain>& chain);
    void deliver(Chain& chain, const std::vector<EncodedUnit>& units);
    void on_completion(const std::shared_ptr<Chain>& chain, const Status& status,
                       const std::vector<EncodedUnit>& units);
    void fail(const Status& status);

    StreamEntry entry_;
    DispatchLoop& loop_;
    PipelineOptions options_;
    std::vector<std::shared_ptr<Chain>> chains_;

    bool started_ = false;
    bool active_ = false;
    bool failed_ = false;

    PacketCallback packet_cb_;
    UnitObserver unit_observer_;
    FailureCallback failure_cb_;

    // Posted tasks hold a weak reference; expired means the pipeline is gone
    std::shared_ptr<int> alive_;
};

#endif // PIPELINE_H
