#include "backtest/feed/zmq_data_feed.hpp"
#include "backtest/codec/event_json.hpp"
#include "backtest/core/errors.hpp"

#include <iostream>
#include <utility>

namespace backtest {

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
ZmqDataFeed::ZmqDataFeed(const std::string& endpoint,
                         std::chrono::milliseconds idle_timeout)
    : endpoint_(endpoint), idle_timeout_(idle_timeout) {
  if (idle_timeout_.count() <= 0) {
    throw ContractViolation("ZmqDataFeed idle timeout must be positive");
  }

  // Subscribe to all messages; ticker filtering happens after decoding
  // because one message may carry several tickers.
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  try {
    socket_.connect(endpoint_);
  } catch (const zmq::error_t& e) {
    throw DataError("cannot connect to " + endpoint_ + ": " + e.what());
  }
  std::cout << "[ZmqDataFeed] Connected to " << endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// streamNext(): receive until a message yields a batch, or the stream ends
// -----------------------------------------------------------------------------
std::vector<Event> ZmqDataFeed::streamNext() {
  std::vector<Event> batch;
  if (finished_) {
    return batch;
  }

  std::chrono::milliseconds idle{0};

  while (!finished_) {
    zmq::message_t msg;

    // recv() returns an empty result when ZMQ_RCVTIMEO expires.
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      throw DataError("receive failed on " + endpoint_ + ": " + e.what());
    }

    if (!result.has_value()) {
      idle += std::chrono::milliseconds{kRecvTimeoutMs};
      if (idle >= idle_timeout_) {
        std::cout << "[ZmqDataFeed] No data for " << idle_timeout_.count()
                  << " ms; ending stream\n";
        finished_ = true;
      }
      continue;
    }

    idle = std::chrono::milliseconds{0};
    ++messages_received_;
    const std::string payload = msg.to_string();

    FeedMessage decoded;
    try {
      decoded = decodeFeedMessage(payload);
    } catch (const DataError& e) {
      ++messages_dropped_;
      std::cerr << "[ZmqDataFeed] " << e.what() << " (payload: " << payload
                << ")\n";
      continue;
    }

    for (auto& event : decoded.events) {
      if (const auto* md = std::get_if<MarketUpdateEvent>(&event)) {
        prices_.record(md->ticker, md->timestamp, md->price);
      }
      if (wanted(event)) {
        batch.push_back(std::move(event));
      }
    }

    if (decoded.end_of_stream) {
      std::cout << "[ZmqDataFeed] End of stream after " << messages_received_
                << " messages\n";
      finished_ = true;
    }
    if (!batch.empty()) {
      break;
    }
  }
  return batch;
}

std::optional<double> ZmqDataFeed::latestPrice(const std::string& ticker,
                                               Timestamp as_of) const {
  return prices_.latest(ticker, as_of);
}

void ZmqDataFeed::subscribe(const std::vector<std::string>& tickers) {
  subscribed_.insert(tickers.begin(), tickers.end());
}

bool ZmqDataFeed::wanted(const Event& event) const {
  return subscribed_.empty() || subscribed_.count(eventTicker(event)) != 0;
}

}  // namespace backtest
