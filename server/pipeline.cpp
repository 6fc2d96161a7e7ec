/*
 * Media Pipeline Implementation
 */

#include "pipeline.h"
#include "config/server_config.h"
#include <cstdio>
#include <random>

struct Pipeline::Chain {
    size_t index = 0;
    MediaDescriptor desc;
    config::MediaConfig cfg;

    std::unique_ptr<FrameSource> source;
    std::shared_ptr<EncoderStage> stage;
    std::unique_ptr<Payloader> payloader;
    std::shared_ptr<Strand> strand;

    Timebase timebase;
    int64_t frame_duration = 1;
    uint64_t next_tick = 0;      // Index of the frame the next timer produces
    int64_t base_us = 0;         // Loop time of tick 0
    DispatchLoop::TimerId timer = 0;

    int in_flight = 0;
    uint64_t deferred = 0;

    ChainStats stats;
};

EncoderParams encoder_params(const config::MediaConfig& media) {
    const config::SourceConfig& src = media.source;

    EncoderParams params;
    params.codec = media.codec;
    params.width = src.width;
    params.height = src.height;
    params.fps_num = src.fps_num;
    params.fps_den = src.fps_den;
    params.sample_rate = src.sample_rate;
    params.channels = src.channels;
    params.frame_samples = src.sample_rate * src.frame_ms / 1000;
    params.bitrate_kbps = media.encoder.bitrate_kbps;
    params.complexity = media.encoder.complexity;
    return params;
}

Pipeline::Pipeline(const StreamEntry& entry, DispatchLoop& loop, const PipelineOptions& options)
    : entry_(entry)
    , loop_(loop)
    , options_(options)
    , alive_(std::make_shared<int>(0))
{
    if (options_.max_in_flight < 1) {
        options_.max_in_flight = 1;
    }
}

Pipeline::~Pipeline() {
    deactivate();
    alive_.reset();
}

Status Pipeline::start() {
    if (started_) {
        return Status::ok();
    }

    std::random_device rd;
    std::mt19937 rng(rd());
    const size_t max_payload = options_.mtu > RTP_HEADER_SIZE ? options_.mtu - RTP_HEADER_SIZE : 0;

    std::vector<std::shared_ptr<Chain>> chains;
    for (size_t i = 0; i < entry_.media.size(); i++) {
        std::shared_ptr<Chain> chain = std::make_shared<Chain>();
        chain->index = i;
        chain->desc = entry_.media[i];
        chain->cfg = entry_.media_config[i];
        const std::string where = entry_.path + " media " + std::to_string(i);

        chain->source = create_frame_source(chain->cfg);
        if (!chain->source) {
            return Status(ErrorCode::SourceUnavailable, where + ": no source for this media");
        }
        if (!chain->source->open()) {
            return Status(ErrorCode::SourceUnavailable,
                          where + ": " + chain->source->name() + ": " + chain->source->last_error());
        }
        chain->timebase = chain->source->timebase();
        chain->frame_duration = chain->source->frame_duration();
        if (chain->frame_duration < 1) {
            chain->frame_duration = 1;
        }

        chain->stage = std::make_shared<EncoderStage>(chain->desc.codec, chain->cfg.encoder,
                                                      create_encoder(chain->desc.codec));
        Status status = chain->stage->init(encoder_params(chain->cfg));
        if (!status.is_ok()) {
            return Status(status.code, where + ": " + status.message);
        }

        uint16_t seq = options_.initial_sequence >= 0
                           ? static_cast<uint16_t>(options_.initial_sequence)
                           : static_cast<uint16_t>(rng());
        uint32_t ts = options_.initial_timestamp >= 0
                          ? static_cast<uint32_t>(options_.initial_timestamp)
                          : static_cast<uint32_t>(rng());
        chain->payloader = create_payloader(chain->desc, max_payload, seq, ts);

        if (options_.pool) {
            chain->strand = std::make_shared<Strand>(*options_.pool);
        }

        if (server_config::g_debug_media) {
            fprintf(stderr, "[Pipeline] %s: %s -> %s pt=%u\n", where.c_str(),
                    chain->source->name().c_str(), chain->desc.rtpmap().c_str(), chain->desc.payload_type);
        }
        chains.push_back(chain);
    }

    chains_ = std::move(chains);
    started_ = true;
    return Status::ok();
}

void Pipeline::activate() {
    if (!started_ || failed_ || active_) {
        return;
    }
    active_ = true;

    const int64_t now = loop_.now_us();
    for (auto& chain : chains_) {
        // Resume the pts timeline at the current time
        uint64_t elapsed_ticks = chain->next_tick * static_cast<uint64_t>(chain->frame_duration);
        chain->base_us = now - static_cast<int64_t>(rescale_ticks(elapsed_ticks, chain->timebase, 1000000));
        schedule_tick(chain);
    }

    if (server_config::g_debug_media) {
        fprintf(stderr, "[Pipeline] %s: active\n", entry_.path.c_str());
    }
}

void Pipeline::deactivate() {
    if (!active_) {
        return;
    }
    active_ = false;

    for (auto& chain : chains_) {
        if (chain->timer) {
            loop_.cancel_timer(chain->timer);
            chain->timer = 0;
        }
        chain->deferred = 0;
    }

    if (server_config::g_debug_media) {
        fprintf(stderr, "[Pipeline] %s: inactive\n", entry_.path.c_str());
    }
}

void Pipeline::request_keyframe() {
    for (auto& chain : chains_) {
        if (chain->desc.kind == MediaKind::Video) {
            chain->stage->request_keyframe();
        }
    }
}

const MediaDescriptor& Pipeline::descriptor(size_t media_index) const {
    return entry_.media.at(media_index);
}

bool Pipeline::parameter_sets(size_t media_index, std::vector<uint8_t>& sps, std::vector<uint8_t>& pps) const {
    if (media_index >= chains_.size()) {
        return false;
    }
    return chains_[media_index]->stage->parameter_sets(sps, pps);
}

ChainStats Pipeline::stats(size_t media_index) const {
    if (media_index >= chains_.size()) {
        return ChainStats();
    }
    return chains_[media_index]->stats;
}

void Pipeline::print_stats() const {
    for (const auto& chain : chains_) {
        fprintf(stderr, "[Pipeline] %s media %zu (%s): frames=%llu units=%llu keyframes=%llu packets=%llu deferred=%llu",
                entry_.path.c_str(), chain->index, codec_name(chain->desc.codec),
                (unsigned long long)chain->stats.frames, (unsigned long long)chain->stats.units,
                (unsigned long long)chain->stats.keyframes, (unsigned long long)chain->stats.packets,
                (unsigned long long)chain->stats.deferred_ticks);
        if (chain->strand) {
            fprintf(stderr, " in_flight=%d queued=%zu", chain->in_flight, chain->strand->pending());
        }
        fprintf(stderr, "\n");
    }
}

void Pipeline::schedule_tick(const std::shared_ptr<Chain>& chain) {
    uint64_t ticks = chain->next_tick * static_cast<uint64_t>(chain->frame_duration);
    int64_t due = chain->base_us + static_cast<int64_t>(rescale_ticks(ticks, chain->timebase, 1000000));

    std::shared_ptr<Chain> c = chain;
    chain->timer = loop_.schedule_at(due, [this, c]() { on_tick(c); });
}

void Pipeline::on_tick(const std::shared_ptr<Chain>& chain) {
    chain->timer = 0;
    if (!active_) {
        return;
    }

    chain->next_tick++;
    schedule_tick(chain);

    if (options_.pool && chain->in_flight >= options_.max_in_flight) {
        chain->deferred++;
        chain->stats.deferred_ticks++;
        return;
    }
    produce(chain);
}

void Pipeline::produce(const std::shared_ptr<Chain>& chain) {
    Frame frame;
    SourceStatus st = chain->source->next_frame(frame);
    if (st == SourceStatus::EndOfStream) {
        fail(Status(ErrorCode::EndOfStream,
                    entry_.path + " media " + std::to_string(chain->index) + ": " + chain->source->name()));
        return;
    }
    if (st != SourceStatus::Ok) {
        fail(Status(ErrorCode::SourceUnavailable,
                    entry_.path + " media " + std::to_string(chain->index) + ": " +
                    chain->source->name() + ": " + chain->source->last_error()));
        return;
    }
    chain->stats.frames++;

    if (!chain->strand) {
        std::vector<EncodedUnit> units;
        Status status = chain->stage->encode(frame, units);
        if (!status.is_ok()) {
            fail(Status(status.code, entry_.path + " media " + std::to_string(chain->index) + ": " + status.message));
            return;
        }
        deliver(*chain, units);
        return;
    }

    // Offload: encode on the chain's strand, complete on the loop
    chain->in_flight++;
    std::shared_ptr<EncoderStage> stage = chain->stage;
    std::shared_ptr<Frame> input = std::make_shared<Frame>(std::move(frame));
    std::weak_ptr<int> alive = alive_;
    std::weak_ptr<Chain> weak_chain = chain;
    DispatchLoop* loop = &loop_;
    Pipeline* self = this;

    bool queued = chain->strand->post([stage, input, alive, weak_chain, loop, self]() {
        std::shared_ptr<std::vector<EncodedUnit>> units = std::make_shared<std::vector<EncodedUnit>>();
        Status status = stage->encode(*input, *units);
        loop->post([alive, weak_chain, self, status, units]() {
            if (alive.expired()) {
                return;
            }
            std::shared_ptr<Chain> c = weak_chain.lock();
            if (c) {
                self->on_completion(c, status, *units);
            }
        });
    });

    if (!queued) {
        chain->in_flight--;
        fail(Status(ErrorCode::Shutdown, entry_.path + ": encoder pool stopped"));
    }
}

void Pipeline::on_completion(const std::shared_ptr<Chain>& chain, const Status& status,
                             const std::vector<EncodedUnit>& units) {
    chain->in_flight--;
    if (failed_) {
        return;
    }
    if (!status.is_ok()) {
        fail(Status(status.code, entry_.path + " media " + std::to_string(chain->index) + ": " + status.message));
        return;
    }

    deliver(*chain, units);

    if (active_ && chain->deferred > 0) {
        chain->deferred--;
        produce(chain);
    }
}

void Pipeline::deliver(Chain& chain, const std::vector<EncodedUnit>& units) {
    std::vector<Packet> packets;
    for (const auto& unit : units) {
        chain.stats.units++;
        if (unit.is_keyframe && chain.desc.kind == MediaKind::Video) {
            chain.stats.keyframes++;
        }
        if (unit_observer_) {
            unit_observer_(chain.index, unit);
        }

        packets.clear();
        chain.payloader->payload(unit, packets);
        chain.stats.packets += packets.size();
        if (packet_cb_) {
            for (const auto& pkt : packets) {
                packet_cb_(chain.index, pkt);
            }
        }
    }
}

void Pipeline::fail(const Status& status) {
    if (failed_) {
        return;
    }
    deactivate();
    failed_ = true;

    fprintf(stderr, "[Pipeline] %s: %s\n", entry_.path.c_str(), status.to_string().c_str());

    std::weak_ptr<int> alive = alive_;
    loop_.post([this, alive, status]() {
        if (alive.expired()) {
            return;
        }
        // The callback may destroy this pipeline
        FailureCallback cb = failure_cb_;
        if (cb) {
            cb(status);
        }
    });
}
