/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Polls the binary configuration file and keeps the last configuration that
    decoded cleanly. Readers take a snapshot; a reload swaps the snapshot in
    one step or not at all.
*/

#ifndef SPLITRANDR_CONFIG_STORE_H
#define SPLITRANDR_CONFIG_STORE_H

#include <stdint.h>
#include <time.h>
#include <sys/types.h>
#include <memory>
#include <string>
#include <vector>

#include "config-codec.h"

namespace splitrandr
{

struct LoadedConfig
{
    std::vector<DecodedEntry> entries;
    std::vector<uint8_t>      raw;
    // Bumped on every successful swap, lets dependents rebuild lazily
    unsigned                  generation = 0;
};

class ConfigStore
{
public:
    enum class PollResult
    {
        Unchanged,
        Loaded,
        Removed,
        Rejected
    };

    explicit ConfigStore(std::string path);

    // Cheap when the file is unchanged: one stat() call
    PollResult poll();

    std::shared_ptr<const LoadedConfig> current() const;

    // True once any configuration (or its absence) was accepted
    bool bound() const { return bound_; }

    std::string const& path() const { return path_; }

private:
    bool readFile(std::vector<uint8_t>& data, int& error) const;
    void install(std::vector<DecodedEntry>&& entries, std::vector<uint8_t>&& raw);

    std::string                         path_;
    std::shared_ptr<const LoadedConfig> current_;
    bool                                bound_ = false;
    bool                                statValid_ = false;
    struct timespec                     mtime_ = {0, 0};
    off_t                               size_ = 0;
    unsigned                            generation_ = 0;
};

} // namespace splitrandr

#endif // SPLITRANDR_CONFIG_STORE_H
