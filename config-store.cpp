/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <sys/mman.h>
#include <sys/stat.h>

#include "config-store.h"
#include "log.h"

namespace splitrandr
{

ConfigStore::ConfigStore(std::string path)
    : path_(std::move(path))
    , current_(std::make_shared<LoadedConfig>())
{
}

std::shared_ptr<const LoadedConfig> ConfigStore::current() const
{
    return std::atomic_load(&current_);
}

bool ConfigStore::readFile(std::vector<uint8_t>& data, int& error) const
{
    const int fd = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if(fd < 0)
    {
        error = errno;
        return false;
    }

    struct stat st;
    if(fstat(fd, &st) < 0)
    {
        error = errno;
        close(fd);
        return false;
    }
    data.clear();
    if(st.st_size == 0)
    {
        close(fd);
        return true;
    }

    void* const map = mmap(nullptr, st.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
    if(map == MAP_FAILED)
    {
        error = errno;
        close(fd);
        return false;
    }
    const auto bytes = static_cast<const uint8_t*>(map);
    data.assign(bytes, bytes + st.st_size);
    munmap(map, st.st_size);
    close(fd);
    return true;
}

void ConfigStore::install(std::vector<DecodedEntry>&& entries, std::vector<uint8_t>&& raw)
{
    auto next = std::make_shared<LoadedConfig>();
    next->entries = std::move(entries);
    next->raw = std::move(raw);
    next->generation = ++generation_;
    std::atomic_store(&current_, std::shared_ptr<const LoadedConfig>(std::move(next)));
    bound_ = true;
}

ConfigStore::PollResult ConfigStore::poll()
{
    struct stat st;
    if(stat(path_.c_str(), &st) < 0)
    {
        if(errno != ENOENT)
        {
            Debug::log(WARN, "cannot stat %s: %s, keeping the previous configuration", path_.c_str(), strerror(errno));
            return PollResult::Rejected;
        }
        const bool hadConfig = statValid_ || !bound_;
        statValid_ = false;
        if(!hadConfig)
            return PollResult::Unchanged;
        install(std::vector<DecodedEntry>(), std::vector<uint8_t>());
        Debug::log(LOG, "%s absent, passing outputs through unsplit", path_.c_str());
        return PollResult::Removed;
    }

    if(statValid_ && st.st_mtim.tv_sec == mtime_.tv_sec && st.st_mtim.tv_nsec == mtime_.tv_nsec &&
       st.st_size == size_)
        return PollResult::Unchanged;

    // Remember the stamp even if the contents are rejected, so a broken file
    // is reported once rather than on every call
    statValid_ = true;
    mtime_ = st.st_mtim;
    size_ = st.st_size;

    std::vector<uint8_t> raw;
    int error = 0;
    if(!readFile(raw, error))
    {
        Debug::log(WARN, "cannot read %s: %s, keeping the previous configuration", path_.c_str(), strerror(error));
        return PollResult::Rejected;
    }

    const auto previous = current();
    if(bound_ && previous->raw == raw)
        return PollResult::Unchanged;

    std::vector<DecodedEntry> entries;
    size_t failed = 0;
    const auto status = decode_config(raw.data(), raw.size(), entries, &failed);
    if(status != DecodeStatus::Ok)
    {
        Debug::log(WARN, "%s entry %zu: %s, keeping the previous configuration", path_.c_str(), failed,
                   decode_status_name(status));
        return PollResult::Rejected;
    }
    for(const auto& entry : entries)
    {
        if(entry.geometryFallback)
            Debug::log(WARN, "%s: split geometry of %s is inconsistent, treating it as unsplit", path_.c_str(),
                       entry.config.name.c_str());
    }

    install(std::move(entries), std::move(raw));
    Debug::log(LOG, "loaded %s (%zu outputs)", path_.c_str(), current()->entries.size());
    return PollResult::Loaded;
}

} // namespace splitrandr
