#pragma once

#include <string>
#include <utility>

namespace kvplane {

class KvRouter;

/// Move-only handle on a load reservation; frees it on destruction unless
/// released earlier. Holds a non-owning router pointer: every lease must be
/// released or destroyed before the KvRouter that issued it.
class RoutingLease {
public:
    RoutingLease() = default;
    RoutingLease(KvRouter* router, std::string request_id)
        : router_(router)
        , request_id_(std::move(request_id)) {}

    RoutingLease(const RoutingLease&) = delete;
    RoutingLease& operator=(const RoutingLease&) = delete;

    RoutingLease(RoutingLease&& other) noexcept
        : router_(other.router_)
        , request_id_(std::move(other.request_id_)) {
        other.router_ = nullptr;
    }

    RoutingLease& operator=(RoutingLease&& other) noexcept {
        if (this != &other) {
            release();
            router_ = other.router_;
            request_id_ = std::move(other.request_id_);
            other.router_ = nullptr;
        }
        return *this;
    }

    ~RoutingLease() { release(); }

    /// Prefill finished; keep the decode part of the reservation.
    void markPrefillComplete();

    /// Free the reservation now. Safe to call more than once.
    void release();

    bool active() const { return router_ != nullptr; }
    const std::string& requestId() const { return request_id_; }

private:
    KvRouter* router_{nullptr};
    std::string request_id_;
};

}  // namespace kvplane
