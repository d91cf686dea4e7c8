#pragma once

#include "bridge/dispatch.hpp"
#include "bridge/host_environment.hpp"
#include "bridge/surface_session.hpp"
#include "host_config.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace webbridge::ipc {

/**
 * Sink for surfaces living in another process: synthesized scripts wait
 * here until the wrapper drains them. Once capacity is reached the oldest
 * script is dropped for each new one.
 */
class OutboxSink final : public DispatchSink {
public:
    static constexpr size_t kDefaultCapacity = 1024;

    explicit OutboxSink(size_t capacity = kDefaultCapacity);

    void deliver(const std::string& callback, const std::string& json) override;

    std::vector<std::string> drain();

private:
    size_t capacity_;
    std::mutex mutex_;
    std::deque<std::string> scripts_;
    size_t dropped_ = 0;
};

/**
 * One content surface known to the host.
 */
struct SurfaceInstance {
    std::string instance_id;
    std::optional<std::string> parent_id;
    std::string created_at;

    std::shared_ptr<OutboxSink> outbox;
    std::unique_ptr<SurfaceSession> session;
};

/**
 * Host-wide context
 * Shared configuration plus the table of live surfaces, keyed by instance_id.
 */
struct HostContext {
    HostContext(std::shared_ptr<const HostConfig> config, std::shared_ptr<const HostEnvironment> environment);

    std::mutex mutex;
    std::shared_ptr<const HostConfig> config;
    std::shared_ptr<const HostEnvironment> environment;
    std::unordered_map<std::string, std::shared_ptr<SurfaceInstance>> instances;

    std::shared_ptr<SurfaceInstance> get_instance(const std::string& instance_id);

    // nullptr if the id is taken or parent_id names no live instance.
    std::shared_ptr<SurfaceInstance> create_instance(const std::string& instance_id,
                                                     const std::optional<std::string>& parent_id);

    bool remove_instance(const std::string& instance_id);

    std::vector<std::string> list_instances();
};

} // namespace webbridge::ipc
