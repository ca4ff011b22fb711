// Copyright (c) 2025 <Your Name>
#include <utility>

#include "dantetime/time_query_server.hpp"

namespace dantetime {

Options::Builder::Builder() = default;

Options::Builder& Options::Builder::Snapshot(SnapshotProvider provider) {
  snapshot_provider_ = std::move(provider);
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  return Options(snapshot_provider_, log_sink_cb_);
}

Options::Options() = default;

Options::Options(SnapshotProvider provider, LogCallback log_cb)
    : snapshot_provider_(std::move(provider)),
      log_callback_(std::move(log_cb)) {}

const Options::SnapshotProvider& Options::Snapshot() const {
  return snapshot_provider_;
}

const Options::LogCallback& Options::LogSink() const { return log_callback_; }

}  // namespace dantetime
