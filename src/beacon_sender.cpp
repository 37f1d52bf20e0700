#include "simpdiscover/simpdiscover.h"

#include "logging.h"
#include "udp_socket.h"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace simpdiscover {
namespace {

struct SenderMetricsAtomic {
  std::atomic<uint64_t> packets_sent{0};
  std::atomic<uint64_t> send_errors{0};

  SenderMetrics Snapshot() const {
    SenderMetrics snapshot;
    snapshot.packets_sent = packets_sent.load();
    snapshot.send_errors = send_errors.load();
    return snapshot;
  }
};

}  // namespace

struct BeaconSender::Impl {
  explicit Impl(SenderConfig config) : config_(std::move(config)) {}

  bool Open(Error* error) {
    if (socket_.fd() >= 0) {
      return true;
    }
    std::string message;
    if (!config_.Validate(&message)) {
      return Fail(ErrorCode::kInvalidConfig, message, error);
    }
    if (!internal::MakeSockaddr(config_.broadcast_address,
                                config_.broadcast_port, &destination_)) {
      return Fail(ErrorCode::kInvalidConfig,
                  "broadcast_address must be a valid IPv4 address", error);
    }
    // Port 0: the sending socket only originates broadcasts.
    if (!socket_.Open(0, config_.bind_address, true, false)) {
      return Fail(socket_.last_error_code(), socket_.last_error(), error);
    }
    {
      std::ostringstream oss;
      oss << "Socket bound to: " << config_.bind_address << ":"
          << socket_.local_port();
      internal::LogInfo(oss.str(), config_.log_callback, config_.verbose);
    }
    internal::LogInfo("Broadcast mode set to ON", config_.log_callback,
                      config_.verbose);
    payload_ = EncodeBeacon(config_.service_port, config_.service_name);
    {
      std::lock_guard<std::mutex> lock(loop_mutex_);
      stop_requested_ = false;
    }
    return true;
  }

  void Close() {
    Stop();
    socket_.Close();
    payload_.clear();
  }

  std::optional<size_t> SendOne(Error* error) {
    if (socket_.fd() < 0) {
      Fail(ErrorCode::kNotOpen, "sender is not open", error);
      return std::nullopt;
    }
    internal::LogInfo("Sending beacon to: '" + Destination() + "'",
                      config_.log_callback, config_.verbose);
    const ssize_t result = socket_.SendTo(payload_, destination_);
    if (result < 0 || static_cast<size_t>(result) != payload_.size()) {
      metrics_.send_errors.fetch_add(1);
      std::ostringstream oss;
      if (result < 0) {
        oss << "Failed to send beacon to " << Destination() << ": "
            << std::strerror(errno);
      } else {
        oss << "Partial send of beacon to " << Destination() << ": " << result
            << " of " << payload_.size() << " bytes";
      }
      Fail(ErrorCode::kIo, oss.str(), error);
      return std::nullopt;
    }
    metrics_.packets_sent.fetch_add(1);
    return static_cast<size_t>(result);
  }

  // A Stop() issued before the loop starts is honoured.
  bool SendLoop(std::chrono::milliseconds period, Error* error) {
    return RunLoop(period, error);
  }

  bool Start(Error* error) {
    if (socket_.fd() < 0) {
      return Fail(ErrorCode::kNotOpen, "sender is not open", error);
    }
    if (running_.exchange(true)) {
      return true;
    }
    if (send_thread_.joinable()) {
      send_thread_.join();
    }
    {
      std::lock_guard<std::mutex> lock(loop_mutex_);
      stop_requested_ = false;
    }
    try {
      send_thread_ = std::thread([this]() {
        // A failed send was already logged and recorded by Fail().
        RunLoop(config_.send_period, nullptr);
        running_ = false;
      });
    } catch (const std::system_error& ex) {
      running_ = false;
      return Fail(ErrorCode::kIo,
                  std::string("thread start failed: ") + ex.what(), error);
    }
    return true;
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(loop_mutex_);
      stop_requested_ = true;
    }
    loop_cv_.notify_all();
    if (send_thread_.joinable()) {
      send_thread_.join();
    }
    running_ = false;
  }

  bool IsOpen() const { return socket_.fd() >= 0; }
  bool IsRunning() const { return running_.load(); }
  uint16_t LocalPort() const { return socket_.local_port(); }
  const std::vector<uint8_t>& Payload() const { return payload_; }

  std::string Destination() const {
    return config_.broadcast_address + ":" +
           std::to_string(config_.broadcast_port);
  }

  Error GetLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

  SenderMetrics GetMetrics() const { return metrics_.Snapshot(); }

 private:
  // Send, sleep for `period`, repeat until a send fails or Stop() is called.
  bool RunLoop(std::chrono::milliseconds period, Error* error) {
    while (true) {
      if (!SendOne(error)) {
        return false;
      }
      std::unique_lock<std::mutex> lock(loop_mutex_);
      if (loop_cv_.wait_for(lock, period, [this]() { return stop_requested_; })) {
        return true;
      }
    }
  }

  bool Fail(ErrorCode code, const std::string& message, Error* error) {
    Error failure{code, message};
    internal::LogError(message, config_.log_callback);
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_error_ = failure;
    }
    if (error) {
      *error = std::move(failure);
    }
    return false;
  }

  SenderConfig config_;
  internal::UdpSocket socket_;
  std::vector<uint8_t> payload_;
  sockaddr_in destination_{};

  std::atomic<bool> running_{false};
  std::mutex loop_mutex_;
  std::condition_variable loop_cv_;
  bool stop_requested_ = false;
  std::thread send_thread_;

  mutable std::mutex error_mutex_;
  Error last_error_;
  SenderMetricsAtomic metrics_;
};

BeaconSender::BeaconSender(SenderConfig config)
    : impl_(new Impl(std::move(config))) {}

BeaconSender::~BeaconSender() { impl_->Close(); }

bool BeaconSender::Open(Error* error) { return impl_->Open(error); }
void BeaconSender::Close() { impl_->Close(); }

std::optional<size_t> BeaconSender::SendOne(Error* error) {
  return impl_->SendOne(error);
}

bool BeaconSender::SendLoop(std::chrono::milliseconds period, Error* error) {
  return impl_->SendLoop(period, error);
}

bool BeaconSender::Start(Error* error) { return impl_->Start(error); }
void BeaconSender::Stop() { impl_->Stop(); }

bool BeaconSender::is_open() const { return impl_->IsOpen(); }
bool BeaconSender::is_running() const { return impl_->IsRunning(); }
uint16_t BeaconSender::local_port() const { return impl_->LocalPort(); }

const std::vector<uint8_t>& BeaconSender::payload() const {
  return impl_->Payload();
}

std::string BeaconSender::destination() const { return impl_->Destination(); }

Error BeaconSender::GetLastError() const { return impl_->GetLastError(); }

SenderMetrics BeaconSender::GetMetrics() const { return impl_->GetMetrics(); }

}  // namespace simpdiscover
