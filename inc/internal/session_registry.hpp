#ifndef INFER_SESSION_REGISTRY_HPP
#define INFER_SESSION_REGISTRY_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "inference_session.hpp"

namespace infer {

// =============================================================================
// Session Registry (C 句柄登记表)
// =============================================================================
//
// C 接口发出的每个句柄都在此登记。句柄是单调递增的编号, 不是会话地址,
// 永不复用: 会话销毁后即使新会话分配到同一地址, 旧句柄依然无效。释放时先移出登记表再销毁会话,
// 因此重复释放是空操作, 释放后的句柄查找会失败 (INVALID_HANDLE)。
// 查找返回 shared_ptr, 正在执行的 run 在其他线程释放句柄时仍持有会话。
//

class SessionRegistry {
public:
    using Handle = std::uintptr_t;

    /// @brief 从不发出的句柄值 (对应 C 的 NULL)
    static constexpr Handle INVALID = 0;

    static SessionRegistry& instance();

    /// @brief 登记会话, 返回其句柄
    Handle add(std::unique_ptr<InferenceSession> session);

    /// @brief 查找会话, 未登记 (或已移除) 时返回 nullptr
    std::shared_ptr<InferenceSession> find(Handle handle) const;

    /// @brief 移除并释放会话
    /// @return 句柄此前是否已登记
    bool remove(Handle handle);

    size_t size() const;

private:
    SessionRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<Handle, std::shared_ptr<InferenceSession>> sessions_;
    Handle next_handle_ = 1;
};

}  // namespace infer

#endif  // INFER_SESSION_REGISTRY_HPP
