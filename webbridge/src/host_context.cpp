#include "host_context.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iterator>
#include <utility>

namespace webbridge::ipc {

namespace {

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

} // namespace

OutboxSink::OutboxSink(size_t capacity) : capacity_(capacity > 0 ? capacity : kDefaultCapacity) {}

void OutboxSink::deliver(const std::string& callback, const std::string& json) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (scripts_.size() >= capacity_) {
        scripts_.pop_front();
        if (dropped_++ == 0) {
            LOG4CPLUS_WARN(ipc_logger(), "Outbox full (" << capacity_ << " scripts), dropping oldest undrained replies");
        }
    }
    scripts_.push_back(make_script(callback, json));
}

std::vector<std::string> OutboxSink::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dropped_ > 0) {
        LOG4CPLUS_WARN(ipc_logger(), "Outbox dropped " << dropped_ << " scripts before drain");
        dropped_ = 0;
    }
    std::vector<std::string> out(std::make_move_iterator(scripts_.begin()), std::make_move_iterator(scripts_.end()));
    scripts_.clear();
    return out;
}

HostContext::HostContext(std::shared_ptr<const HostConfig> config, std::shared_ptr<const HostEnvironment> environment)
    : config(std::move(config)), environment(std::move(environment)) {}

std::shared_ptr<SurfaceInstance> HostContext::get_instance(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = instances.find(instance_id);
    if (it != instances.end()) {
        return it->second;
    }
    return nullptr;
}

std::shared_ptr<SurfaceInstance> HostContext::create_instance(const std::string& instance_id,
                                                              const std::optional<std::string>& parent_id) {
    std::lock_guard<std::mutex> lock(mutex);
    if (instances.count(instance_id) != 0) {
        return nullptr;
    }

    auto inst = std::make_shared<SurfaceInstance>();
    inst->instance_id = instance_id;
    inst->parent_id = parent_id;
    inst->created_at = now_iso();
    inst->outbox = std::make_shared<OutboxSink>();

    if (parent_id) {
        auto parent = instances.find(*parent_id);
        if (parent == instances.end()) {
            return nullptr;
        }
        inst->session = parent->second->session->open_child(instance_id, inst->outbox);
    } else {
        inst->session = std::make_unique<SurfaceSession>(instance_id, config, environment, inst->outbox);
    }

    instances[instance_id] = inst;
    LOG4CPLUS_INFO(ipc_logger(), "Surface created: " << instance_id
                                                     << (parent_id ? " (child of " + *parent_id + ")" : std::string()));
    return inst;
}

bool HostContext::remove_instance(const std::string& instance_id) {
    std::shared_ptr<SurfaceInstance> removed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = instances.find(instance_id);
        if (it == instances.end()) {
            return false;
        }
        removed = std::move(it->second);
        instances.erase(it);
    }
    removed->session->close();
    LOG4CPLUS_INFO(ipc_logger(), "Surface removed: " << instance_id);
    return true;
}

std::vector<std::string> HostContext::list_instances() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> ids;
    ids.reserve(instances.size());
    for (const auto& entry : instances) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace webbridge::ipc
