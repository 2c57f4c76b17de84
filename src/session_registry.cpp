#include "session_registry.hpp"

#include <memory>
#include <mutex>
#include <utility>

namespace infer {

SessionRegistry& SessionRegistry::instance() {
    static SessionRegistry registry;
    return registry;
}

SessionRegistry::Handle SessionRegistry::add(std::unique_ptr<InferenceSession> session) {
    std::shared_ptr<InferenceSession> shared(std::move(session));

    std::lock_guard<std::mutex> lock(mutex_);
    Handle handle = next_handle_++;
    sessions_[handle] = std::move(shared);
    return handle;
}

std::shared_ptr<InferenceSession> SessionRegistry::find(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(handle);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionRegistry::remove(Handle handle) {
    std::shared_ptr<InferenceSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(handle);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    // 释放在锁外进行, 等待该会话上正在执行的 run 结束
    session->release();
    return true;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace infer
