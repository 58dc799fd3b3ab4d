#include "grpc_service_base.hpp"

#include <chrono>
#include <csignal>
#include <thread>

#include <glog/logging.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/resource_quota.h>

namespace ridematch::platform {

namespace {

/// Replace the port of host:port
std::string with_port(const std::string& address, int port) {
    auto colon = address.rfind(':');
    std::string host = colon == std::string::npos ? address : address.substr(0, colon);
    return host + ":" + std::to_string(port);
}

}  // namespace

std::atomic<GrpcServiceBase*> GrpcServiceBase::signal_target_{nullptr};

void GrpcServiceBase::on_signal(int signum) {
    GrpcServiceBase* server = signal_target_.load();
    if (!server || server->stopping_.exchange(true)) {
        return;
    }
    // Server::Shutdown waits for handlers, so it cannot run inside the signal
    std::thread([server, signum]() {
        LOG(INFO) << "Signal " << signum << " received, stopping gRPC server";
        server->shutdown();
    }).detach();
}

GrpcServiceBase::GrpcServiceBase(GrpcServiceConfig config)
    : config_(std::move(config)) {}

GrpcServiceBase::~GrpcServiceBase() {
    shutdown();
    GrpcServiceBase* self = this;
    signal_target_.compare_exchange_strong(self, nullptr);
}

void GrpcServiceBase::register_service(grpc::Service* service) {
    if (running_.load()) {
        LOG(WARNING) << "Service registered after start is ignored";
        return;
    }
    services_.push_back(service);
}

bool GrpcServiceBase::start() {
    if (running_.load()) {
        LOG(WARNING) << "gRPC server already running on " << bound_address_;
        return false;
    }
    if (services_.empty()) {
        LOG(ERROR) << "Refusing to start gRPC server without services";
        return false;
    }

    // Both are process-wide and must be set before the builder exists
    if (config_.enable_health_check) {
        grpc::EnableDefaultHealthCheckService(true);
    }
    if (config_.enable_reflection) {
        grpc::reflection::InitProtoReflectionServerBuilderPlugin();
    }

    grpc::ServerBuilder builder;
    int port = 0;
    builder.AddListeningPort(config_.listen_address, grpc::InsecureServerCredentials(), &port);
    builder.SetMaxReceiveMessageSize(config_.max_message_size_bytes);
    builder.SetMaxSendMessageSize(config_.max_message_size_bytes);
    builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, config_.keepalive_time_ms);
    builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, config_.keepalive_timeout_ms);
    builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

    grpc::ResourceQuota quota("ridematch-grpc");
    quota.SetMaxThreads(config_.num_threads);
    builder.SetResourceQuota(quota);

    for (auto* service : services_) {
        builder.RegisterService(service);
    }

    server_ = builder.BuildAndStart();
    if (!server_ || port == 0) {
        LOG(ERROR) << "Could not bind gRPC server to " << config_.listen_address;
        server_.reset();
        return false;
    }

    bound_address_ = with_port(config_.listen_address, port);
    stopping_.store(false);
    running_.store(true);

    signal_target_.store(this);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    LOG(INFO) << "gRPC server started on " << bound_address_ << " with "
              << services_.size() << " services";
    return true;
}

void GrpcServiceBase::wait() {
    if (server_) {
        server_->Wait();
    }
}

void GrpcServiceBase::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    stopping_.store(true);

    if (shutdown_callback_) {
        shutdown_callback_();
    }

    auto deadline = std::chrono::system_clock::now() +
                    std::chrono::milliseconds(config_.shutdown_deadline_ms);
    server_->Shutdown(deadline);
    LOG(INFO) << "gRPC server on " << bound_address_ << " stopped";
}

}  // namespace ridematch::platform
