#include "fixture/fixture.h"
#include "common/byte_codec.h"
#include "fixture/codec.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace periwinkle {
namespace fixture {

namespace {

void put_meta(ByteWriter &writer, const svm::AccountMeta &meta) {
  writer.put_key(meta.pubkey);
  writer.put_bool(meta.is_signer);
  writer.put_bool(meta.is_writable);
}

bool get_meta(ByteReader &reader, svm::AccountMeta &meta) {
  return reader.get_key(meta.pubkey) && reader.get_bool(meta.is_signer) &&
         reader.get_bool(meta.is_writable);
}

void put_accounts(ByteWriter &writer,
                  const std::vector<svm::KeyedAccount> &accounts) {
  writer.put_u64(accounts.size());
  for (const auto &account : accounts) {
    codec::put_account(writer, account);
  }
}

bool get_accounts(ByteReader &reader, std::vector<svm::KeyedAccount> &accounts) {
  uint64_t count = 0;
  if (!reader.get_u64(count) || count > reader.remaining()) {
    return false;
  }
  accounts.clear();
  for (uint64_t i = 0; i < count; ++i) {
    svm::KeyedAccount account;
    if (!codec::get_account(reader, account)) {
      return false;
    }
    accounts.push_back(std::move(account));
  }
  return true;
}

json accounts_to_json(const std::vector<svm::KeyedAccount> &accounts) {
  json j = json::array();
  for (const auto &account : accounts) {
    j.push_back(codec::account_to_json(account));
  }
  return j;
}

std::vector<svm::KeyedAccount> accounts_from_json(const json &value) {
  std::vector<svm::KeyedAccount> accounts;
  for (const auto &entry : value) {
    accounts.push_back(codec::account_from_json(entry));
  }
  return accounts;
}

const char *outcome_kind_name(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::SUCCESS:
    return "success";
  case OutcomeKind::FAILURE:
    return "failure";
  case OutcomeKind::UNKNOWN_ERROR:
    return "unknown_error";
  case OutcomeKind::UNKNOWN_PROGRAM:
    return "unknown_program";
  case OutcomeKind::CONTRACT_VIOLATION:
    return "contract_violation";
  }
  return "unknown";
}

OutcomeKind outcome_kind_from_name(const std::string &name) {
  for (uint8_t k = 0; k <= static_cast<uint8_t>(OutcomeKind::CONTRACT_VIOLATION);
       ++k) {
    OutcomeKind kind = static_cast<OutcomeKind>(k);
    if (name == outcome_kind_name(kind)) {
      return kind;
    }
  }
  throw std::invalid_argument("unknown outcome kind: " + name);
}

} // namespace

bool Context::operator==(const Context &other) const {
  return compute_budget == other.compute_budget &&
         feature_set == other.feature_set && sysvars == other.sysvars &&
         program_id == other.program_id &&
         instruction_accounts == other.instruction_accounts &&
         instruction_data == other.instruction_data &&
         accounts == other.accounts;
}

bool Effects::operator==(const Effects &other) const {
  return compute_units_consumed == other.compute_units_consumed &&
         execution_time == other.execution_time && outcome == other.outcome &&
         return_data == other.return_data &&
         resulting_accounts == other.resulting_accounts;
}

// ============================================================================
// Binary codec
// ============================================================================

std::vector<uint8_t> Fixture::encode() const {
  ByteWriter writer;
  codec::write_header(writer, codec::Layout::NATIVE);

  codec::put_compute_budget(writer, input.compute_budget);
  codec::put_feature_set(writer, input.feature_set);
  codec::put_sysvars(writer, input.sysvars);
  writer.put_key(input.program_id);
  writer.put_u64(input.instruction_accounts.size());
  for (const auto &meta : input.instruction_accounts) {
    put_meta(writer, meta);
  }
  writer.put_bytes(input.instruction_data);
  put_accounts(writer, input.accounts);

  writer.put_u64(output.compute_units_consumed);
  writer.put_u64(output.execution_time);
  writer.put_u8(static_cast<uint8_t>(output.outcome.kind));
  writer.put_u32(output.outcome.error_index);
  writer.put_u32(output.outcome.custom_code);
  writer.put_u64(output.outcome.program_result);
  writer.put_bytes(output.return_data);
  put_accounts(writer, output.resulting_accounts);

  return writer.take();
}

Result<Fixture> Fixture::decode(const std::vector<uint8_t> &blob) {
  ByteReader reader(blob);
  auto header = codec::read_header(reader, codec::Layout::NATIVE);
  if (header.is_err()) {
    return Result<Fixture>(header.error());
  }

  Fixture fixture;
  Context &in = fixture.input;
  Effects &out = fixture.output;

  uint64_t meta_count = 0;
  bool ok = codec::get_compute_budget(reader, in.compute_budget) &&
            codec::get_feature_set(reader, in.feature_set) &&
            codec::get_sysvars(reader, in.sysvars) &&
            reader.get_key(in.program_id) && reader.get_u64(meta_count) &&
            meta_count <= reader.remaining();
  for (uint64_t i = 0; ok && i < meta_count; ++i) {
    svm::AccountMeta meta;
    ok = get_meta(reader, meta);
    in.instruction_accounts.push_back(std::move(meta));
  }

  uint8_t kind = 0;
  ok = ok && reader.get_bytes(in.instruction_data) &&
       get_accounts(reader, in.accounts) &&
       reader.get_u64(out.compute_units_consumed) &&
       reader.get_u64(out.execution_time) && reader.get_u8(kind) &&
       reader.get_u32(out.outcome.error_index) &&
       reader.get_u32(out.outcome.custom_code) &&
       reader.get_u64(out.outcome.program_result) &&
       reader.get_bytes(out.return_data) &&
       get_accounts(reader, out.resulting_accounts);

  if (!ok) {
    return Result<Fixture>("truncated or malformed fixture blob");
  }
  if (kind > static_cast<uint8_t>(OutcomeKind::CONTRACT_VIOLATION)) {
    return Result<Fixture>("invalid outcome kind " + std::to_string(kind));
  }
  if (reader.remaining() != 0) {
    return Result<Fixture>("trailing bytes after fixture");
  }
  out.outcome.kind = static_cast<OutcomeKind>(kind);
  return Result<Fixture>(std::move(fixture));
}

// ============================================================================
// JSON codec
// ============================================================================

std::string Fixture::to_json() const {
  json j;

  json &in = j["input"];
  in["compute_budget"] = codec::compute_budget_to_json(input.compute_budget);
  in["feature_set"] = codec::feature_set_to_json(input.feature_set);
  in["sysvars"] = codec::sysvars_to_json(input.sysvars);
  in["program_id"] = codec::key_to_json(input.program_id);
  in["instruction_accounts"] = json::array();
  for (const auto &meta : input.instruction_accounts) {
    in["instruction_accounts"].push_back(
        {{"pubkey", codec::key_to_json(meta.pubkey)},
         {"is_signer", meta.is_signer},
         {"is_writable", meta.is_writable}});
  }
  in["instruction_data"] = codec::bytes_to_json(input.instruction_data);
  in["accounts"] = accounts_to_json(input.accounts);

  json &out = j["output"];
  out["compute_units_consumed"] = output.compute_units_consumed;
  out["execution_time"] = output.execution_time;
  out["outcome"] = {{"kind", outcome_kind_name(output.outcome.kind)},
                    {"error_index", output.outcome.error_index},
                    {"custom_code", output.outcome.custom_code},
                    {"program_result", output.outcome.program_result}};
  out["return_data"] = codec::bytes_to_json(output.return_data);
  out["resulting_accounts"] = accounts_to_json(output.resulting_accounts);

  return j.dump(2);
}

Result<Fixture> Fixture::from_json(const std::string &json_str) {
  try {
    json j = json::parse(json_str);
    Fixture fixture;

    const json &in = j.at("input");
    fixture.input.compute_budget =
        codec::compute_budget_from_json(in.at("compute_budget"));
    fixture.input.feature_set = codec::feature_set_from_json(in.at("feature_set"));
    fixture.input.sysvars = codec::sysvars_from_json(in.at("sysvars"));
    fixture.input.program_id = codec::key_from_json(in.at("program_id"));
    for (const auto &meta : in.at("instruction_accounts")) {
      svm::AccountMeta account_meta;
      account_meta.pubkey = codec::key_from_json(meta.at("pubkey"));
      account_meta.is_signer = meta.at("is_signer").get<bool>();
      account_meta.is_writable = meta.at("is_writable").get<bool>();
      fixture.input.instruction_accounts.push_back(std::move(account_meta));
    }
    fixture.input.instruction_data = codec::bytes_from_json(in.at("instruction_data"));
    fixture.input.accounts = accounts_from_json(in.at("accounts"));

    const json &out = j.at("output");
    fixture.output.compute_units_consumed =
        out.at("compute_units_consumed").get<uint64_t>();
    fixture.output.execution_time = out.value("execution_time", uint64_t{0});
    const json &outcome = out.at("outcome");
    fixture.output.outcome.kind =
        outcome_kind_from_name(outcome.at("kind").get<std::string>());
    fixture.output.outcome.error_index = outcome.value("error_index", uint32_t{0});
    fixture.output.outcome.custom_code = outcome.value("custom_code", uint32_t{0});
    fixture.output.outcome.program_result =
        outcome.at("program_result").get<uint64_t>();
    fixture.output.return_data = codec::bytes_from_json(out.at("return_data"));
    fixture.output.resulting_accounts =
        accounts_from_json(out.at("resulting_accounts"));

    return Result<Fixture>(std::move(fixture));
  } catch (const json::exception &e) {
    return Result<Fixture>(std::string("JSON parsing error: ") + e.what());
  } catch (const std::invalid_argument &e) {
    return Result<Fixture>(std::string("Invalid fixture field: ") + e.what());
  }
}

} // namespace fixture
} // namespace periwinkle
