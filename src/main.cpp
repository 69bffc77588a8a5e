#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <signal.h>

#include "config.hpp"
#include "dispatch/dispatcher.hpp"
#include "dispatch/frame_queue.hpp"
#include "encoder/frame_encoder.hpp"
#include "encoder/test_pattern_source.hpp"
#include "errors.hpp"
#include "pose/pose_codec.hpp"
#include "pose/pose_correlator.hpp"
#include "reassembly/connection_buffer.hpp"
#include "session/connection.hpp"
#include "session/pose_channel.hpp"
#include "transport/endpoint.hpp"
#include "transport/framed_stream.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitAbnormal = 2;
constexpr int kExitAllocation = 3;

constexpr std::chrono::milliseconds kAcceptSlice{200};
constexpr std::chrono::milliseconds kPopSlice{200};

std::atomic<bool> g_stop{false};

void log_err(const std::string &msg) {
  std::cerr << "frame-relay: " << msg << "\n";
}

void on_signal(int) { g_stop.store(true); }

void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

// Sleeps in short slices so a stop request is noticed promptly.
void sleep_unless_stopped(std::chrono::milliseconds total) {
  const auto deadline = std::chrono::steady_clock::now() + total;
  while (!g_stop.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
      .count();
}

/**
 * @brief Owns the threads serving accepted connections of one listener.
 *
 * Each connection runs on its own thread. stop() cancels the ones still
 * open and joins everything.
 */
template <typename Session> class SessionPool {
public:
  ~SessionPool() { stop(); }

  void start(std::unique_ptr<Session> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked();
    Entry &e = entries_.emplace_back();
    e.session = std::move(session);
    Session *s = e.session.get();
    std::atomic<bool> *done = &e.done;
    e.thread = std::thread([s, done] {
      s->run();
      done->store(true);
    });
  }

  void stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &e : entries_) {
      e.session->cancel();
    }
    for (auto &e : entries_) {
      if (e.thread.joinable()) {
        e.thread.join();
      }
    }
    entries_.clear();
  }

private:
  struct Entry {
    std::unique_ptr<Session> session;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void reap_locked() {
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->done.load()) {
        it->thread.join();
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::mutex mutex_;
  std::list<Entry> entries_;
};

// Accepts pose publishers until stop and feeds them to the dispatcher.
void serve_pose_channel(const frame_relay::RelayConfig &config,
                        dispatch::Dispatcher &dispatcher) {
  SessionPool<session::PoseChannel> pool;
  try {
    transport::StreamListener listener(*config.pose.endpoint,
                                       std::chrono::milliseconds(0));
    log_err("pose channel listening on " + listener.endpoint().to_string() +
            " (format=" + pose::pose_format_name(config.pose.format) + ")");
    while (!g_stop.load()) {
      auto stream = listener.accept(kAcceptSlice);
      if (!stream) {
        continue;
      }
      log_err("pose publisher connected: " + stream->describe());
      pool.start(std::make_unique<session::PoseChannel>(
          std::move(stream), dispatcher, config.pose.max_message_bytes));
    }
  } catch (const frame_relay::TransportError &e) {
    log_err(std::string("pose channel stopped: ") + e.what());
  }
  pool.stop();
}

int run_receive(const frame_relay::RelayConfig &config) {
  pose::PoseCorrelator correlator;
  dispatch::Dispatcher dispatcher(&correlator, config.pose.format);
  dispatch::FrameQueue queue(config.dispatch.queue_depth);
  dispatcher.set_frame_queue(&queue);
  dispatcher.set_unknown_message_callback([](const pose::UnknownMessage &m) {
    log_err("unknown side-channel message (" + std::to_string(m.raw.size()) +
            " bytes): " + m.reason);
  });
  dispatcher.set_connection_ended_callback(
      [](const session::ConnectionOutcome &o) {
        if (o.abrupt()) {
          std::string msg = "connection " + o.peer + " ended abruptly (" +
                            session::end_reason_name(o.reason);
          if (o.unread_bytes > 0) {
            msg += ", " + std::to_string(o.unread_bytes) + " unread bytes";
          }
          msg += ")";
          if (!o.message.empty()) {
            msg += ": " + o.message;
          }
          log_err(msg);
        }
      });

  std::thread consumer([&queue, &correlator] {
    uint64_t consumed = 0;
    while (true) {
      auto frame = queue.pop(kPopSlice);
      if (!frame) {
        if (queue.closed()) {
          break;
        }
        continue;
      }
      ++consumed;
      if (auto pose = correlator.current()) {
        if (pose->id && frame->pose_id > *pose->id) {
          log_err("frame " + std::to_string(frame->sequence) +
                  " stamped with pose " + std::to_string(frame->pose_id) +
                  " ahead of local pose " + std::to_string(*pose->id));
        }
      }
    }
    log_err("consumer done after " + std::to_string(consumed) + " frames");
  });

  std::thread pose_thread;
  if (config.pose.endpoint) {
    pose_thread = std::thread(
        [&config, &dispatcher] { serve_pose_channel(config, dispatcher); });
  }

  int rc = kExitOk;
  {
    SessionPool<session::Connection> pool;
    try {
      transport::StreamListener listener(config.stream.endpoint,
                                         config.stream.idle_timeout);
      log_err("receiving on " + listener.endpoint().to_string() +
              " (variant=" +
              wire::header_variant_name(config.stream.header_variant) +
              ", buffer=" + std::to_string(config.stream.buffer_capacity_bytes) +
              " bytes)");

      while (!g_stop.load()) {
        auto stream = listener.accept(kAcceptSlice);
        if (!stream) {
          continue;
        }
        log_err("connection accepted: " + stream->describe());
        try {
          pool.start(std::make_unique<session::Connection>(
              std::move(stream), config.sizing_policy(),
              config.stream.buffer_capacity_bytes, dispatcher,
              config.dispatch.log_every_n_frames));
        } catch (const frame_relay::AllocationError &e) {
          log_err(std::string("dropping connection: ") + e.what());
        }
      }
    } catch (const frame_relay::TransportError &e) {
      log_err(std::string("listener failed: ") + e.what());
      rc = kExitAbnormal;
    }
    g_stop.store(true);
    pool.stop();
  }

  queue.close();
  consumer.join();
  if (pose_thread.joinable()) {
    pose_thread.join();
  }

  log_err("received " + std::to_string(dispatcher.frames_dispatched()) +
          " frames, dropped " + std::to_string(dispatcher.dropped_frames()) +
          ", poses accepted " + std::to_string(correlator.accepted_count()) +
          " rejected " + std::to_string(correlator.rejected_count()));
  return rc;
}

int run_send(const frame_relay::RelayConfig &config, uint64_t frame_limit,
             double fps) {
  pose::PoseCorrelator correlator;
  dispatch::Dispatcher dispatcher(&correlator, config.pose.format);

  encoder::EncoderOptions opts;
  opts.variant = config.stream.header_variant;
  opts.max_chunk_bytes = config.stream.max_chunk_bytes;
  uint32_t width = config.source.width;
  uint32_t height = config.source.height;
  if (config.stream.fixed_frame) {
    opts.fixed_width = width = config.stream.fixed_frame->width;
    opts.fixed_height = height = config.stream.fixed_frame->height;
  }

  encoder::FrameEncoder frame_encoder(opts, &correlator);
  encoder::TestPatternSource source(width, height, frame_limit);
  encoder::RawFrame raw;

  std::thread pose_thread;
  if (config.pose.endpoint) {
    pose_thread = std::thread(
        [&config, &dispatcher] { serve_pose_channel(config, dispatcher); });
  }

  const auto start = std::chrono::steady_clock::now();
  const auto period =
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(
          std::chrono::duration<double>(1.0 / fps));
  const bool reconnect = config.session.reconnect_backoff.count() > 0;

  int rc = kExitOk;
  bool have_frame = false;
  std::unique_ptr<transport::ByteStream> stream;
  auto next_tick = std::chrono::steady_clock::now();

  while (!g_stop.load()) {
    if (!stream) {
      std::string err;
      stream = transport::connect_endpoint(config.stream.endpoint,
                                           config.stream.idle_timeout, err);
      if (!stream) {
        log_err("connect to " + config.stream.endpoint.to_string() +
                " failed: " + err);
        if (!reconnect) {
          rc = kExitAbnormal;
          break;
        }
        sleep_unless_stopped(config.session.reconnect_backoff);
        continue;
      }
      log_err("connected to " + stream->describe() + " (variant=" +
              wire::header_variant_name(opts.variant) + ")");
    }

    if (!have_frame) {
      if (!source.next_frame(raw)) {
        break;
      }
      have_frame = true;
    }

    try {
      frame_encoder.send(*stream, raw.pixels.data(), raw.pixels.size(),
                         raw.width, raw.height, seconds_since(start));
      have_frame = false;
    } catch (const frame_relay::TransportError &e) {
      log_err(e.what());
      stream.reset();
      if (!reconnect) {
        rc = kExitAbnormal;
        break;
      }
      sleep_unless_stopped(config.session.reconnect_backoff);
      continue;
    } catch (const frame_relay::ProtocolError &e) {
      log_err(std::string("cannot encode frame: ") + e.what());
      rc = kExitAbnormal;
      break;
    }

    const uint64_t sent = frame_encoder.frames_encoded();
    if (config.dispatch.log_every_n_frames > 0 &&
        sent % config.dispatch.log_every_n_frames == 0) {
      log_err("sent " + std::to_string(sent) + " frames");
    }

    next_tick += period;
    std::this_thread::sleep_until(next_tick);
  }

  if (stream) {
    stream->close();
  }
  g_stop.store(true);
  if (pose_thread.joinable()) {
    pose_thread.join();
  }

  log_err("sent " + std::to_string(frame_encoder.frames_encoded()) +
          " frames, poses accepted " +
          std::to_string(correlator.accepted_count()) + " rejected " +
          std::to_string(correlator.rejected_count()));
  return rc;
}

// Synthetic head motion: slow yaw about the vertical axis.
pose::PoseSample synthetic_pose(uint64_t id, double timestamp) {
  const double yaw = 0.5 * std::sin(timestamp);
  pose::PoseSample s;
  s.timestamp = timestamp;
  s.id = id;
  s.transform = {std::cos(yaw),  0.0, std::sin(yaw), 0.0, //
                 0.0,            1.0, 0.0,           1.6, //
                 -std::sin(yaw), 0.0, std::cos(yaw), 0.0};
  return s;
}

int run_publish_poses(const frame_relay::RelayConfig &config,
                      uint64_t pose_limit, double rate) {
  if (!config.pose.endpoint) {
    log_err("FATAL: mode=publish-poses requires pose.endpoint");
    return kExitUsage;
  }

  const auto start = std::chrono::steady_clock::now();
  const auto period =
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(
          std::chrono::duration<double>(1.0 / rate));
  const bool reconnect = config.session.reconnect_backoff.count() > 0;

  std::unique_ptr<transport::ByteStream> stream;
  uint64_t published = 0;
  auto next_tick = std::chrono::steady_clock::now();

  while (!g_stop.load() && (pose_limit == 0 || published < pose_limit)) {
    std::string err;
    if (!stream) {
      stream = transport::connect_endpoint(*config.pose.endpoint,
                                           std::chrono::milliseconds(0), err);
      if (!stream) {
        log_err("connect to " + config.pose.endpoint->to_string() +
                " failed: " + err);
        if (!reconnect) {
          return kExitAbnormal;
        }
        sleep_unless_stopped(config.session.reconnect_backoff);
        continue;
      }
      log_err("publishing poses to " + stream->describe());
    }

    const std::vector<uint8_t> msg = pose::encode_pose_message(
        synthetic_pose(published + 1, seconds_since(start)), config.pose.format);
    if (!transport::write_frame(*stream, msg.data(), msg.size(), err,
                                config.pose.max_message_bytes)) {
      log_err("write_frame error: " + err);
      stream.reset();
      if (!reconnect) {
        return kExitAbnormal;
      }
      sleep_unless_stopped(config.session.reconnect_backoff);
      continue;
    }
    ++published;

    next_tick += period;
    std::this_thread::sleep_until(next_tick);
  }

  log_err("published " + std::to_string(published) + " poses");
  return kExitOk;
}

void print_usage() {
  log_err("Usage: frame-relay --config <path/to/config.yaml> "
          "--mode receive|send|publish-poses [--frames N] [--fps F]");
}

} // namespace

int main(int argc, char **argv) {
  // Parse command-line arguments
  std::optional<std::string> config_path;
  std::string mode = "receive";
  uint64_t frame_limit = 0;
  double fps = 30.0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      mode = argv[++i];
    } else if (arg == "--frames" && i + 1 < argc) {
      try {
        frame_limit = std::stoull(argv[++i]);
      } catch (const std::exception &) {
        log_err("invalid --frames value");
        return kExitUsage;
      }
    } else if (arg == "--fps" && i + 1 < argc) {
      try {
        fps = std::stod(argv[++i]);
      } catch (const std::exception &) {
        log_err("invalid --fps value");
        return kExitUsage;
      }
      if (!(fps > 0.0 && fps <= 1000.0)) {
        log_err("--fps must be in (0, 1000]");
        return kExitUsage;
      }
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return kExitOk;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return kExitUsage;
    }
  }

  // Require configuration file
  if (!config_path) {
    log_err("FATAL: --config argument is required");
    print_usage();
    return kExitUsage;
  }
  if (mode != "receive" && mode != "send" && mode != "publish-poses") {
    log_err("FATAL: invalid --mode '" + mode + "'");
    print_usage();
    return kExitUsage;
  }

  // Load configuration
  frame_relay::RelayConfig config;
  try {
    log_err("loading configuration from: " + *config_path);
    config = frame_relay::load_config(*config_path);
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to load configuration: " + std::string(e.what()));
    return kExitUsage;
  }

  install_signal_handlers();

  if (mode == "receive") {
    // Fail at startup rather than on the first connection.
    try {
      reassembly::ConnectionBuffer probe(config.stream.buffer_capacity_bytes);
    } catch (const frame_relay::AllocationError &e) {
      log_err(std::string("FATAL: ") + e.what());
      return kExitAllocation;
    }
    return run_receive(config);
  }
  if (mode == "send") {
    try {
      return run_send(config, frame_limit, fps);
    } catch (const std::invalid_argument &e) {
      log_err(std::string("FATAL: ") + e.what());
      return kExitUsage;
    }
  }
  return run_publish_poses(config, frame_limit, fps);
}
