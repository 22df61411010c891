#pragma once

#include "backtest/feed/i_data_feed.hpp"
#include "backtest/feed/price_history.hpp"

#include <zmq.hpp>

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// ZmqDataFeed — ZeroMQ bridge for streaming historical market data
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded market data and
//         dividends and hands them to the Backtester one message at a time.
//
// @details
// A publisher process (a replay script, another service) reads historical
// data and publishes one JSON message per time step on a PUB socket. The
// message format is documented in backtest/codec/event_json.hpp.
//
// streamNext() blocks on the socket until a message yields at least one
// wanted event, the publisher sends {"type": "end_of_stream"}, or no message
// arrives for idle_timeout. The last two end the stream: every later call
// returns an empty batch.
//
// Malformed messages are logged to std::cerr and skipped; a bad tick never
// aborts the run.
//
// Receive timeout (ZMQ_RCVTIMEO):
//   The socket is configured with a short receive timeout so that recv()
//   returns periodically even when the publisher is silent. The feed adds
//   up the silent intervals and gives up once they reach idle_timeout.
//
// Prices:
//   Every decoded market update is recorded in a PriceHistory, so
//   latestPrice() answers from what the feed has already delivered. It can
//   never see a price the Backtester has not been handed.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII; destroyed in dtor).
// -----------------------------------------------------------------------------
class ZmqDataFeed final : public IDataFeed {
 public:
  static constexpr const char* kDefaultEndpoint = "tcp://127.0.0.1:5555";

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Creates the ZMQ context and SUB socket and connects to the
  //         publisher endpoint.
  //
  // @param  endpoint      ZMQ endpoint to connect to.
  // @param  idle_timeout  Silence after which the stream is considered
  //                       finished. Must be positive.
  //
  // @throws ContractViolation if idle_timeout is not positive.
  //         DataError if the socket cannot connect to endpoint.
  // -------------------------------------------------------------------------
  explicit ZmqDataFeed(const std::string& endpoint = kDefaultEndpoint,
                       std::chrono::milliseconds idle_timeout =
                           std::chrono::milliseconds{5000});

  ~ZmqDataFeed() override = default;

  ZmqDataFeed(const ZmqDataFeed&) = delete;
  ZmqDataFeed& operator=(const ZmqDataFeed&) = delete;
  ZmqDataFeed(ZmqDataFeed&&) = delete;
  ZmqDataFeed& operator=(ZmqDataFeed&&) = delete;

  std::vector<Event> streamNext() override;

  std::optional<double> latestPrice(const std::string& ticker,
                                    Timestamp as_of) const override;

  void subscribe(const std::vector<std::string>& tickers) override;

  bool finished() const { return finished_; }
  std::size_t messagesReceived() const { return messages_received_; }
  std::size_t messagesDropped() const { return messages_dropped_; }

 private:
  // Receive timeout in milliseconds. Bounds how long a single recv() waits
  // before the idle counter is checked.
  static constexpr int kRecvTimeoutMs = 100;

  bool wanted(const Event& event) const;

  std::string endpoint_;
  std::chrono::milliseconds idle_timeout_;

  // Context is created first and destroyed last (reverse member order).
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  PriceHistory prices_;
  std::set<std::string> subscribed_;

  bool finished_{false};
  std::size_t messages_received_{0};
  std::size_t messages_dropped_{0};
};

}  // namespace backtest
