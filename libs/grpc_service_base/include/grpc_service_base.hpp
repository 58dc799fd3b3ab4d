#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

namespace ridematch::platform {

struct GrpcServiceConfig {
    std::string listen_address = "0.0.0.0:50070";
    int num_threads = 4;
    bool enable_health_check = true;
    bool enable_reflection = true;
    int max_message_size_bytes = 4 * 1024 * 1024;
    int keepalive_time_ms = 10000;
    int keepalive_timeout_ms = 20000;
    /// In-flight calls get this long to finish on shutdown
    int shutdown_deadline_ms = 5000;
};

/**
 * Hosts a set of gRPC services on one listening port.
 *
 * Register every service, start(), then wait(). SIGINT and SIGTERM trigger
 * a graceful shutdown from a helper thread, after which wait() returns.
 * Only the most recently started server reacts to signals.
 */
class GrpcServiceBase {
public:
    explicit GrpcServiceBase(GrpcServiceConfig config);
    ~GrpcServiceBase();

    GrpcServiceBase(const GrpcServiceBase&) = delete;
    GrpcServiceBase& operator=(const GrpcServiceBase&) = delete;

    /// Not owned; must outlive the server. Ignored once started.
    void register_service(grpc::Service* service);

    /// Runs before the server drains, on whichever thread shuts it down
    void set_shutdown_callback(std::function<void()> callback) {
        shutdown_callback_ = std::move(callback);
    }

    bool start();
    void wait();
    void shutdown();

    /// Listen address with the port actually bound (differs when port 0 was asked)
    const std::string& bound_address() const { return bound_address_; }

private:
    static void on_signal(int signum);

    GrpcServiceConfig config_;
    std::vector<grpc::Service*> services_;
    std::unique_ptr<grpc::Server> server_;
    std::string bound_address_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::function<void()> shutdown_callback_;

    static std::atomic<GrpcServiceBase*> signal_target_;
};

}  // namespace ridematch::platform
