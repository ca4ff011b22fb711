// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Implementation of the threaded synchronization service.
 *
 * Receive and poll threads only enqueue events. The control thread owns
 * the controller and processes events strictly in arrival order, with a
 * liveness tick at least once per second. Clock actions leave the control
 * thread through the action dispatcher; their outcomes come back as events
 * so the controller commits a step or frequency only once it is applied.
 */

#include "dantesync/sync_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "dantetime/platform/network_interface.hpp"
#include "dantetime/system_clock.hpp"
#include "internal/action_dispatcher.hpp"
#include "internal/ntp_client.hpp"
#include "internal/ptp_receiver.hpp"

namespace {

constexpr int64_t kTickIntervalNs = 1000000000LL;
constexpr int kNtpTimeoutMs = 1000;

}  // namespace

// ---------------- Impl ----------------
struct dantesync::SyncService::Impl {
  struct Event {
    enum class Kind { Ptp, Ntp, ActionOutcome };
    Kind kind = Kind::Ptp;
    PtpSample ptp;
    NtpSample ntp;
    internal::ActionDispatcher::Outcome outcome;
    int64_t at_ns = 0;  ///< Monotonic enqueue time
  };

  Options opts{Options::Builder().Build()};
  mutable std::mutex opts_mtx;

  dantetime::TimeStepper* stepper = nullptr;

  std::unique_ptr<internal::ActionDispatcher> dispatcher;
  std::unique_ptr<SyncController> controller;
  internal::PtpReceiver ptp_receiver;

  // Event queue feeding the control thread
  std::mutex queue_mtx;
  std::condition_variable queue_cv;
  std::deque<Event> queue;

  std::atomic<bool> running{false};
  std::thread control_thread;
  std::thread ntp_thread;

  // Interruptible wait for the NTP poll thread
  std::mutex ntp_wait_mtx;
  std::condition_variable ntp_wait_cv;

  mutable std::mutex err_mtx;
  std::string start_error;

  Options::LogCallback log_callback_;

  void Enqueue(Event ev);
  void ControlLoop();
  void Dispatch(const Event& ev);
  void NtpLoop(const std::string& server, uint16_t port);
  bool OpenPtp(const Options& snapshot, std::string* err);
  void Log(const std::string& msg);
};

void dantesync::SyncService::Impl::Enqueue(Event ev) {
  if (!running.load(std::memory_order_acquire)) return;
  ev.at_ns = dantetime::MonotonicNowNs();
  {
    std::lock_guard<std::mutex> lk(queue_mtx);
    queue.push_back(std::move(ev));
  }
  queue_cv.notify_one();
}

void dantesync::SyncService::Impl::ControlLoop() {
  int64_t next_tick_ns = dantetime::MonotonicNowNs();
  std::unique_lock<std::mutex> lk(queue_mtx);
  while (running.load(std::memory_order_acquire)) {
    const int64_t wait_ns =
        std::max<int64_t>(0, next_tick_ns - dantetime::MonotonicNowNs());
    queue_cv.wait_for(lk, std::chrono::nanoseconds(wait_ns), [this]() {
      return !queue.empty() || !running.load(std::memory_order_acquire);
    });
    if (!running.load(std::memory_order_acquire)) break;

    if (!queue.empty()) {
      Event ev = std::move(queue.front());
      queue.pop_front();
      lk.unlock();
      Dispatch(ev);
      lk.lock();
    }

    const int64_t now_ns = dantetime::MonotonicNowNs();
    if (now_ns >= next_tick_ns) {
      lk.unlock();
      controller->Tick(now_ns);
      lk.lock();
      next_tick_ns = now_ns + kTickIntervalNs;
    }
  }
}

void dantesync::SyncService::Impl::Dispatch(const Event& ev) {
  switch (ev.kind) {
    case Event::Kind::Ptp:
      controller->OnPtpSample(ev.ptp, ev.at_ns);
      break;
    case Event::Kind::Ntp:
      controller->OnNtpSample(ev.ntp, ev.at_ns);
      break;
    case Event::Kind::ActionOutcome:
      if (ev.outcome.kind ==
          internal::ActionDispatcher::Outcome::Kind::Step) {
        controller->OnStepResult(ev.outcome.ok, ev.outcome.error, ev.at_ns);
      } else {
        controller->OnFrequencyResult(ev.outcome.ppm, ev.outcome.ok,
                                      ev.outcome.error, ev.at_ns);
      }
      break;
  }
}

void dantesync::SyncService::Impl::NtpLoop(const std::string& server,
                                           uint16_t port) {
  while (running.load(std::memory_order_acquire)) {
    internal::NtpClient::Result r =
        internal::NtpClient::Exchange(server, port, stepper, kNtpTimeoutMs);
    if (r.success) {
      Event ev;
      ev.kind = Event::Kind::Ntp;
      ev.ntp.offset_s = r.offset_s;
      ev.ntp.round_trip_delay_s = r.delay_s;
      Enqueue(std::move(ev));
    } else {
      Log("NTP exchange with " + server + " failed: " + r.error);
    }

    const int interval_s = controller->NtpPollIntervalS();
    std::unique_lock<std::mutex> lk(ntp_wait_mtx);
    ntp_wait_cv.wait_for(lk, std::chrono::seconds(interval_s), [this]() {
      return !running.load(std::memory_order_acquire);
    });
  }
}

bool dantesync::SyncService::Impl::OpenPtp(const Options& snapshot,
                                           std::string* err) {
  std::vector<dantetime::platform::NetworkInterface> ifaces;
  std::string list_err;
  dantetime::platform::NetworkInterface chosen;
  std::string address;
  if (!dantetime::platform::ListInterfaces(&ifaces, &list_err)) {
    Log("Interface enumeration failed (" + list_err +
        "), joining on the default interface");
  } else if (dantetime::platform::SelectInterface(
                 ifaces, snapshot.Interface(), &chosen)) {
    address = chosen.address;
    Log("Listening for PTP on " + chosen.name + " (" + chosen.address + ")");
  } else if (!snapshot.Interface().empty()) {
    if (err) *err = "interface '" + snapshot.Interface() + "' not usable";
    return false;
  } else {
    Log("No usable interface found, joining on the default interface");
  }

  return ptp_receiver.Open(
      address,
      [this](const PtpSample& s) {
        Event ev;
        ev.kind = Event::Kind::Ptp;
        ev.ptp = s;
        Enqueue(std::move(ev));
      },
      log_callback_, err);
}

void dantesync::SyncService::Impl::Log(const std::string& msg) {
  if (log_callback_) log_callback_("[SyncService] " + msg);
}

// ---------------- SyncService ----------------
dantesync::SyncService::SyncService() : p_(new Impl()) {}
dantesync::SyncService::~SyncService() { Stop(); }

bool dantesync::SyncService::Start(dantetime::TimeStepper* stepper,
                                   dantetime::FrequencyAdjuster* adjuster,
                                   const Options& opt) {
  Stop();
  if (!stepper || !adjuster) {
    std::lock_guard<std::mutex> lk(p_->err_mtx);
    p_->start_error = "clock capabilities missing";
    return false;
  }

  {
    std::lock_guard<std::mutex> lk(p_->opts_mtx);
    p_->opts = opt;
  }
  {
    std::lock_guard<std::mutex> lk(p_->err_mtx);
    p_->start_error.clear();
  }
  p_->log_callback_ = opt.LogSink();
  p_->stepper = stepper;
  {
    std::lock_guard<std::mutex> lk(p_->queue_mtx);
    p_->queue.clear();
  }

  Impl* impl = p_.get();
  p_->dispatcher.reset(new internal::ActionDispatcher(
      stepper, adjuster, opt.ActionTimeoutMs(), opt.FailureThreshold(),
      opt.LogSink(),
      [impl](const internal::ActionDispatcher::Outcome& o) {
        Impl::Event ev;
        ev.kind = Impl::Event::Kind::ActionOutcome;
        ev.outcome = o;
        impl->Enqueue(std::move(ev));
      }));
  p_->controller.reset(new SyncController(p_->dispatcher->AsyncStepper(),
                                          p_->dispatcher->AsyncAdjuster(),
                                          opt, ClockActionMode::Queued));
  p_->dispatcher->Start();
  p_->running.store(true, std::memory_order_release);

  if (opt.ListenPtp()) {
    std::string err;
    if (!p_->OpenPtp(opt, &err)) {
      p_->Log("PTP listener failed: " + err);
      {
        std::lock_guard<std::mutex> lk(p_->err_mtx);
        p_->start_error = "PTP listener failed: " + err;
      }
      p_->running.store(false, std::memory_order_release);
      p_->dispatcher->Stop();
      return false;
    }
  }

  p_->control_thread = std::thread([this]() { p_->ControlLoop(); });

  if (!opt.SkipNtp() && !opt.NtpServer().empty()) {
    const std::string server = opt.NtpServer();
    const uint16_t port = opt.NtpPort();
    p_->ntp_thread =
        std::thread([this, server, port]() { p_->NtpLoop(server, port); });
  } else {
    p_->Log("NTP polling disabled");
  }

  std::ostringstream oss;
  oss << "Started (" << opt << ")";
  p_->Log(oss.str());
  return true;
}

void dantesync::SyncService::Stop() {
  if (!p_->running.exchange(false)) return;

  // Producers first so nothing new arrives.
  p_->ptp_receiver.Close();
  p_->ntp_wait_cv.notify_all();
  if (p_->ntp_thread.joinable()) p_->ntp_thread.join();

  p_->queue_cv.notify_all();
  if (p_->control_thread.joinable()) p_->control_thread.join();
  {
    std::lock_guard<std::mutex> lk(p_->queue_mtx);
    p_->queue.clear();
  }

  if (p_->dispatcher) p_->dispatcher->Stop();
  p_->Log("Stopped");
}

void dantesync::SyncService::SubmitPtpSample(const PtpSample& sample) {
  Impl::Event ev;
  ev.kind = Impl::Event::Kind::Ptp;
  ev.ptp = sample;
  p_->Enqueue(std::move(ev));
}

void dantesync::SyncService::SubmitNtpSample(const NtpSample& sample) {
  Impl::Event ev;
  ev.kind = Impl::Event::Kind::Ntp;
  ev.ntp = sample;
  p_->Enqueue(std::move(ev));
}

dantesync::Status dantesync::SyncService::GetStatus() const {
  Status st;
  if (p_->controller) st = p_->controller->GetStatus();
  if (p_->dispatcher) {
    const internal::ActionDispatcher::Stats ds = p_->dispatcher->GetStats();
    if (ds.fault) {
      st.clock_control_fault = true;
      if (!ds.last_error.empty()) st.last_error = ds.last_error;
    } else if (st.last_error.empty()) {
      st.last_error = ds.last_error;
    }
  }
  std::lock_guard<std::mutex> lk(p_->err_mtx);
  if (!p_->start_error.empty()) st.last_error = p_->start_error;
  return st;
}

dantesync::Options dantesync::SyncService::GetOptions() const {
  std::lock_guard<std::mutex> lk(p_->opts_mtx);
  return p_->opts;
}

dantetime::TimeQuerySnapshot dantesync::ToQuerySnapshot(const Status& s) {
  dantetime::TimeQuerySnapshot q;
  q.ptp_offset_ns = s.ptp_offset_ns;
  q.drift_ppm = s.smoothed_rate_ppm;
  q.frequency_ppm = s.frequency_ppm;
  q.mode = static_cast<uint8_t>(s.mode);
  q.locked = s.is_locked;
  q.grandmaster = s.grandmaster;
  return q;
}
