#pragma once

// ============================================================================
// AcquisitionRecord <-> 扁平 JSON 数组(导出/导入)
// 字段名固定, 金额/价格为字符串, 其余整数, 保证字节级往返一致
// ============================================================================

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "types.hpp"

namespace record_json {

using ordered_json = nlohmann::ordered_json;

inline ordered_json to_json(const AcquisitionRecord &r) {
  ordered_json j;
  j["transactionHash"] = r.transaction_hash;
  j["exchangeName"] = r.exchange_name;
  j["targetToken"] = r.target_token;
  j["counterToken"] = r.counter_token;
  j["amountAcquired"] = r.amount_acquired;
  j["amountSpent"] = r.amount_spent;
  j["targetDecimals"] = r.target_decimals;
  j["counterDecimals"] = r.counter_decimals;
  j["blockTimestamp"] = r.block_timestamp;
  j["operationType"] = r.operation_type;
  j["programIdentifier"] = r.program_identifier;
  j["blockHeight"] = r.block_height;
  j["sequenceNumber"] = r.sequence_number;
  j["acquirerAddress"] = r.acquirer_address;
  j["unitPrice"] = r.unit_price;
  j["confidenceLevel"] = confidence_name(r.confidence_level);
  return j;
}

inline AcquisitionRecord from_json(const ordered_json &j) {
  if (!j.is_object())
    throw TrackerError("record must be a JSON object");

  AcquisitionRecord r;
  std::optional<Confidence> confidence;
  try {
    r.transaction_hash = j.at("transactionHash").get<std::string>();
    r.exchange_name = j.at("exchangeName").get<std::string>();
    r.target_token = j.at("targetToken").get<std::string>();
    r.counter_token = j.at("counterToken").get<std::string>();
    r.amount_acquired = j.at("amountAcquired").get<std::string>();
    r.amount_spent = j.at("amountSpent").get<std::string>();
    r.target_decimals = j.at("targetDecimals").get<int>();
    r.counter_decimals = j.at("counterDecimals").get<int>();
    r.block_timestamp = j.at("blockTimestamp").get<int64_t>();
    r.operation_type = j.at("operationType").get<std::string>();
    r.program_identifier = j.at("programIdentifier").get<std::string>();
    r.block_height = j.at("blockHeight").get<BlockHeight>();
    r.sequence_number = j.at("sequenceNumber").get<uint64_t>();
    r.acquirer_address = j.at("acquirerAddress").get<std::string>();
    r.unit_price = j.at("unitPrice").get<std::string>();
    confidence = parse_confidence(j.at("confidenceLevel").get<std::string>());
  } catch (const nlohmann::json::exception &e) {
    throw TrackerError(std::string("malformed record: ") + e.what());
  }

  if (!confidence)
    throw TrackerError("malformed record: unknown confidenceLevel");
  r.confidence_level = *confidence;
  return r;
}

inline std::string export_records(const std::vector<AcquisitionRecord> &records) {
  ordered_json arr = ordered_json::array();
  for (const auto &r : records)
    arr.push_back(to_json(r));
  return arr.dump();
}

inline std::vector<AcquisitionRecord> import_records(const std::string &text) {
  ordered_json arr;
  try {
    arr = ordered_json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw TrackerError(std::string("invalid export JSON: ") + e.what());
  }
  if (!arr.is_array())
    throw TrackerError("export JSON must be an array");

  std::vector<AcquisitionRecord> records;
  records.reserve(arr.size());
  for (const auto &item : arr)
    records.push_back(from_json(item));
  return records;
}

} // namespace record_json
