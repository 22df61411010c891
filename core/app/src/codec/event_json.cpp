#include "backtest/codec/event_json.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <utility>

namespace backtest {

namespace {

// -----------------------------------------------------------------------------
// Field helpers. nlohmann's at()/get() throw json::exception; callers wrap
// everything in decodeFeedMessage().
// -----------------------------------------------------------------------------
Timestamp readTimestamp(const nlohmann::json& j, const char* ms_key,
                        const char* text_key) {
  if (j.contains(ms_key)) {
    return ms_to_timestamp(j.at(ms_key).get<std::int64_t>());
  }
  if (j.contains(text_key)) {
    return parseTimestamp(j.at(text_key).get<std::string>());
  }
  throw DataError(std::string("missing '") + ms_key + "' or '" + text_key + "'");
}

std::string readTicker(const nlohmann::json& j) {
  std::string ticker;
  if (j.contains("symbol")) {
    ticker = j.at("symbol").get<std::string>();
  } else if (j.contains("ticker")) {
    ticker = j.at("ticker").get<std::string>();
  } else {
    throw DataError("missing 'symbol'");
  }
  if (ticker.empty()) {
    throw DataError("empty 'symbol'");
  }
  return ticker;
}

double optionalNumber(const nlohmann::json& j, const char* key) {
  return j.contains(key) ? j.at(key).get<double>() : 0.0;
}

void timestampFields(nlohmann::json& j, Timestamp ts) {
  j["timestamp"] = formatTimestamp(ts);
  j["timestamp_ms"] = timestamp_to_ms(ts);
}

// -----------------------------------------------------------------------------
// decodeObject: one JSON object → zero or one event
// -----------------------------------------------------------------------------
void decodeObject(const nlohmann::json& j, FeedMessage& out) {
  if (!j.is_object()) {
    throw DataError("feed message element is not a JSON object");
  }
  const std::string type = j.value("type", std::string("market"));

  if (type == "end_of_stream") {
    out.end_of_stream = true;
    return;
  }

  if (type == "market") {
    MarketUpdateEvent md;
    md.timestamp = readTimestamp(j, "timestamp_ms", "timestamp");
    md.ticker = readTicker(j);
    if (j.contains("price")) {
      md.price = j.at("price").get<double>();
    } else if (j.contains("close")) {
      md.price = j.at("close").get<double>();
    } else {
      throw DataError("market message for " + md.ticker + " has no 'price'");
    }
    if (!std::isfinite(md.price) || md.price < 0.0) {
      throw DataError("invalid price for " + md.ticker);
    }
    md.open = optionalNumber(j, "open");
    md.high = optionalNumber(j, "high");
    md.low = optionalNumber(j, "low");
    md.volume = optionalNumber(j, "volume");
    out.events.emplace_back(std::move(md));
    return;
  }

  if (type == "dividend") {
    DividendEvent div;
    div.timestamp = readTimestamp(j, "timestamp_ms", "timestamp");
    div.ex_date = div.timestamp;
    div.ticker = readTicker(j);
    div.dividend_per_share = j.at("dividend_per_share").get<double>();
    if (!std::isfinite(div.dividend_per_share) || div.dividend_per_share < 0.0) {
      throw DataError("invalid dividend for " + div.ticker);
    }
    div.payment_date = div.ex_date;
    if (j.contains("payment_date_ms") || j.contains("payment_date")) {
      div.payment_date = readTimestamp(j, "payment_date_ms", "payment_date");
    }
    out.events.emplace_back(std::move(div));
    return;
  }

  throw DataError("unknown feed message type '" + type + "'");
}

}  // namespace

// -----------------------------------------------------------------------------
// decodeFeedMessage
// -----------------------------------------------------------------------------
FeedMessage decodeFeedMessage(const std::string& payload) {
  FeedMessage out;
  try {
    const auto json = nlohmann::json::parse(payload);
    if (json.is_array()) {
      for (const auto& element : json) {
        decodeObject(element, out);
      }
    } else {
      decodeObject(json, out);
    }
  } catch (const nlohmann::json::exception& e) {
    throw DataError(std::string("malformed feed message: ") + e.what());
  }
  return out;
}

// -----------------------------------------------------------------------------
// encodeFeedEvent
// -----------------------------------------------------------------------------
nlohmann::json encodeFeedEvent(const Event& event) {
  nlohmann::json j;
  if (const auto* md = std::get_if<MarketUpdateEvent>(&event)) {
    j["type"] = "market";
    j["timestamp_ms"] = timestamp_to_ms(md->timestamp);
    j["symbol"] = md->ticker;
    j["price"] = md->price;
    j["open"] = md->open;
    j["high"] = md->high;
    j["low"] = md->low;
    j["volume"] = md->volume;
    return j;
  }
  if (const auto* div = std::get_if<DividendEvent>(&event)) {
    j["type"] = "dividend";
    j["timestamp_ms"] = timestamp_to_ms(div->timestamp);
    j["symbol"] = div->ticker;
    j["dividend_per_share"] = div->dividend_per_share;
    j["payment_date_ms"] = timestamp_to_ms(div->payment_date);
    return j;
  }
  throw ContractViolation(std::string("cannot encode ") + eventKindName(event) +
                          " event for the feed");
}

// -----------------------------------------------------------------------------
// Result records
// -----------------------------------------------------------------------------
nlohmann::json transactionToJson(const domain::Transaction& tx) {
  nlohmann::json j;
  timestampFields(j, tx.timestamp);
  j["ticker"] = tx.ticker;
  j["side"] = domain::toString(tx.side);
  j["quantity"] = tx.quantity;
  j["price"] = tx.price;
  j["commission"] = tx.commission;
  if (tx.order_id) {
    j["order_id"] = *tx.order_id;
  } else {
    j["order_id"] = nullptr;
  }
  return j;
}

nlohmann::json snapshotToJson(const Snapshot& snapshot) {
  nlohmann::json j;
  timestampFields(j, snapshot.timestamp);
  j["net_value"] = snapshot.net_value;
  j["cash"] = snapshot.cash;
  j["holdings_value"] = snapshot.holdings_value;

  nlohmann::json holdings = nlohmann::json::array();
  for (const auto& h : snapshot.holdings) {
    nlohmann::json hj;
    hj["ticker"] = h.ticker;
    hj["quantity"] = h.quantity;
    hj["average_cost"] = h.average_cost;
    hj["last_price"] = h.last_price;
    hj["market_value"] = h.market_value;
    holdings.push_back(std::move(hj));
  }
  j["holdings"] = std::move(holdings);
  return j;
}

nlohmann::json dividendRecordToJson(const DividendRecord& record) {
  nlohmann::json j;
  timestampFields(j, record.timestamp);
  j["ticker"] = record.ticker;
  j["quantity_held"] = record.quantity_held;
  j["dividend_per_share"] = record.dividend_per_share;
  j["amount"] = record.amount;
  return j;
}

}  // namespace backtest
