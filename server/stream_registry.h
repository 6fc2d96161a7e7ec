/*
 * Stream Registry
 *
 * Mount path -> StreamEntry. Filled once before the dispatch loop starts,
 * then sealed; after that it is read-only and needs no locking.
 */

#ifndef STREAM_REGISTRY_H
#define STREAM_REGISTRY_H

#include "media_types.h"
#include "config/stream_config.h"
#include <map>
#include <string>
#include <vector>

struct StreamEntry {
    std::string path;
    std::vector<MediaDescriptor> media;
    std::vector<config::MediaConfig> media_config;  // Parallel to `media`
    bool shared = true;
};

// Descriptor for media entry `index` of a stream (payload type and clock
// rate resolved, default fmtp parameters filled in)
MediaDescriptor describe_media(const config::MediaConfig& media, size_t index);

class StreamRegistry {
public:
    /**
     * Register a mount
     * @throws ConfigError on duplicate or malformed path, inconsistent
     *         descriptors, or after seal()
     */
    const StreamEntry& register_stream(const std::string& path,
                                       const std::vector<MediaDescriptor>& media,
                                       const std::vector<config::MediaConfig>& media_config,
                                       bool shared);

    // Register a mount from its config entry
    const StreamEntry& register_stream(const config::StreamConfig& stream);

    // Register every stream of a table
    void load(const config::StreamsConfig& cfg);

    // Returns nullptr if not registered
    const StreamEntry* lookup(const std::string& path) const;

    // Freeze the registry; later registrations are configuration errors
    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }

    std::vector<std::string> paths() const;
    size_t size() const { return entries_.size(); }

    // Mount table for the startup summary
    void print_table() const;

private:
    std::map<std::string, StreamEntry> entries_;
    bool sealed_ = false;
};

#endif // STREAM_REGISTRY_H
