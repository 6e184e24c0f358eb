#pragma once

// ============================================================================
// Database - DuckDB 归档: ring buffer 溢出记录 + 结束会话的记录
// 写连接 / 读连接分开, 各自一把锁
// ============================================================================

#include <duckdb.hpp>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

using json = nlohmann::json;

namespace sql {

inline std::string escape_raw(const std::string &s) {
  std::string r;
  r.reserve(s.size());
  for (char c : s) {
    if (c == '\'')
      r += "''";
    else
      r += c;
  }
  return r;
}

inline std::string quote(const std::string &s) { return "'" + escape_raw(s) + "'"; }

} // namespace sql

inline constexpr const char *ACQUISITION_RECORD_DDL = R"(
CREATE TABLE IF NOT EXISTS acquisition_record (
    session_id VARCHAR NOT NULL,
    sequence_number BIGINT NOT NULL,
    transaction_hash VARCHAR NOT NULL,
    exchange_name VARCHAR,
    target_token VARCHAR NOT NULL,
    counter_token VARCHAR,
    amount_acquired VARCHAR,
    amount_spent VARCHAR,
    target_decimals INTEGER,
    counter_decimals INTEGER,
    block_timestamp BIGINT,
    operation_type VARCHAR,
    program_identifier VARCHAR,
    block_height BIGINT,
    acquirer_address VARCHAR,
    unit_price VARCHAR,
    confidence_level VARCHAR,
    archived_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    PRIMARY KEY (session_id, sequence_number)
))";

class Database {
public:
  explicit Database(const std::string &path) {
    db_ = std::make_unique<duckdb::DuckDB>(path);
    conn_ = std::make_unique<duckdb::Connection>(*db_);
    read_conn_ = std::make_unique<duckdb::Connection>(*db_);
  }

  void init_schema() {
    execute(ACQUISITION_RECORD_DDL);
    execute("CREATE INDEX IF NOT EXISTS idx_acquisition_token ON acquisition_record(target_token)");
  }

  // 同一 (session, sequence) 重复归档不报错
  void archive_records(const std::string &session_id, const std::vector<AcquisitionRecord> &records) {
    if (records.empty())
      return;

    std::string insert_sql =
        "INSERT INTO acquisition_record (session_id, sequence_number, transaction_hash, exchange_name, "
        "target_token, counter_token, amount_acquired, amount_spent, target_decimals, counter_decimals, "
        "block_timestamp, operation_type, program_identifier, block_height, acquirer_address, unit_price, "
        "confidence_level) VALUES ";
    for (size_t i = 0; i < records.size(); ++i) {
      const auto &r = records[i];
      if (i > 0)
        insert_sql += ", ";
      insert_sql += "(" + sql::quote(session_id) + ", " + std::to_string(r.sequence_number) + ", " +
                    sql::quote(r.transaction_hash) + ", " + sql::quote(r.exchange_name) + ", " +
                    sql::quote(r.target_token) + ", " + sql::quote(r.counter_token) + ", " +
                    sql::quote(r.amount_acquired) + ", " + sql::quote(r.amount_spent) + ", " +
                    std::to_string(r.target_decimals) + ", " + std::to_string(r.counter_decimals) + ", " +
                    std::to_string(r.block_timestamp) + ", " + sql::quote(r.operation_type) + ", " +
                    sql::quote(r.program_identifier) + ", " + std::to_string(r.block_height) + ", " +
                    sql::quote(r.acquirer_address) + ", " + sql::quote(r.unit_price) + ", " +
                    sql::quote(confidence_name(r.confidence_level)) + ")";
    }
    insert_sql += " ON CONFLICT DO NOTHING";

    std::lock_guard<std::mutex> lock(write_mutex_);
    check(conn_->Query("BEGIN TRANSACTION"), "begin");
    auto result = conn_->Query(insert_sql);
    if (result->HasError()) {
      conn_->Query("ROLLBACK");
      throw std::runtime_error("archive_records failed: " + result->GetError());
    }
    check(conn_->Query("COMMIT"), "commit");
  }

  // 某个 token 的历史记录(所有会话), 按区块高度排序
  std::vector<AcquisitionRecord> load_records(const std::string &token, int limit = 1000) {
    std::string q =
        "SELECT transaction_hash, exchange_name, target_token, counter_token, amount_acquired, amount_spent, "
        "target_decimals, counter_decimals, block_timestamp, operation_type, program_identifier, block_height, "
        "sequence_number, acquirer_address, unit_price, confidence_level "
        "FROM acquisition_record WHERE target_token = " +
        sql::quote(token) + " ORDER BY block_height, session_id, sequence_number LIMIT " + std::to_string(limit);

    std::lock_guard<std::mutex> rlock(read_mutex_);
    auto result = read_conn_->Query(q);
    check(result, "load_records");

    std::vector<AcquisitionRecord> records;
    records.reserve(result->RowCount());
    for (size_t row = 0; row < result->RowCount(); ++row) {
      AcquisitionRecord r;
      r.transaction_hash = text(*result, 0, row);
      r.exchange_name = text(*result, 1, row);
      r.target_token = text(*result, 2, row);
      r.counter_token = text(*result, 3, row);
      r.amount_acquired = text(*result, 4, row);
      r.amount_spent = text(*result, 5, row);
      r.target_decimals = static_cast<int>(integer(*result, 6, row));
      r.counter_decimals = static_cast<int>(integer(*result, 7, row));
      r.block_timestamp = integer(*result, 8, row);
      r.operation_type = text(*result, 9, row);
      r.program_identifier = text(*result, 10, row);
      r.block_height = static_cast<BlockHeight>(integer(*result, 11, row));
      r.sequence_number = static_cast<uint64_t>(integer(*result, 12, row));
      r.acquirer_address = text(*result, 13, row);
      r.unit_price = text(*result, 14, row);
      r.confidence_level = parse_confidence(text(*result, 15, row)).value_or(Confidence::MEDIUM);
      records.push_back(std::move(r));
    }
    return records;
  }

  // 多次出现在不同会话里的 acquirer
  json repeat_acquirers(int min_sessions = 2, int limit = 100) {
    return query_json(
        "SELECT acquirer_address, COUNT(DISTINCT session_id) AS sessions, "
        "COUNT(DISTINCT target_token) AS tokens, COUNT(*) AS acquisitions, "
        "MIN(block_height) AS first_height, MAX(block_height) AS last_height "
        "FROM acquisition_record WHERE acquirer_address <> 'unknown' "
        "GROUP BY acquirer_address HAVING COUNT(DISTINCT session_id) >= " +
        std::to_string(min_sessions) + " ORDER BY sessions DESC, acquisitions DESC LIMIT " + std::to_string(limit));
  }

  void execute(const std::string &q) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    check(conn_->Query(q), "execute");
  }

  json query_json(const std::string &q) {
    std::lock_guard<std::mutex> rlock(read_mutex_);
    auto result = read_conn_->Query(q);
    check(result, "query_json");

    json rows = json::array();
    auto &types = result->types;
    auto names = result->names;

    for (size_t row = 0; row < result->RowCount(); ++row) {
      json obj = json::object();
      for (size_t col = 0; col < result->ColumnCount(); ++col) {
        auto value = result->GetValue(col, row);
        if (value.IsNull()) {
          obj[names[col]] = nullptr;
        } else {
          switch (types[col].id()) {
          case duckdb::LogicalTypeId::BOOLEAN:
            obj[names[col]] = value.GetValue<bool>();
            break;
          case duckdb::LogicalTypeId::TINYINT:
          case duckdb::LogicalTypeId::SMALLINT:
          case duckdb::LogicalTypeId::INTEGER:
            obj[names[col]] = value.GetValue<int32_t>();
            break;
          case duckdb::LogicalTypeId::BIGINT:
            obj[names[col]] = value.GetValue<int64_t>();
            break;
          case duckdb::LogicalTypeId::FLOAT:
          case duckdb::LogicalTypeId::DOUBLE:
            obj[names[col]] = value.GetValue<double>();
            break;
          default:
            obj[names[col]] = value.ToString();
            break;
          }
        }
      }
      rows.push_back(std::move(obj));
    }
    return rows;
  }

private:
  static void check(const duckdb::unique_ptr<duckdb::MaterializedQueryResult> &result, const char *what) {
    if (result->HasError())
      throw std::runtime_error(std::string(what) + " failed: " + result->GetError());
  }

  static std::string text(duckdb::MaterializedQueryResult &result, size_t col, size_t row) {
    auto v = result.GetValue(col, row);
    return v.IsNull() ? std::string() : v.ToString();
  }

  static int64_t integer(duckdb::MaterializedQueryResult &result, size_t col, size_t row) {
    auto v = result.GetValue(col, row);
    return v.IsNull() ? 0 : v.GetValue<int64_t>();
  }

  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> conn_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::mutex write_mutex_;
  std::mutex read_mutex_;
};
