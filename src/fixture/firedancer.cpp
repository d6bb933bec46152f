#include "fixture/firedancer.h"
#include "common/byte_codec.h"
#include "fixture/codec.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace periwinkle {
namespace fixture {
namespace firedancer {

namespace {

void put_fd_account(ByteWriter &writer, const FdAccount &account) {
  codec::put_account(writer, svm::KeyedAccount{account.address, account.account});
  writer.put_bool(account.seed_addr.has_value());
  if (account.seed_addr) {
    writer.put_key(account.seed_addr->base);
    writer.put_string(account.seed_addr->seed);
    writer.put_key(account.seed_addr->owner);
  }
}

bool get_fd_account(ByteReader &reader, FdAccount &account) {
  svm::KeyedAccount keyed;
  bool has_seed = false;
  if (!codec::get_account(reader, keyed) || !reader.get_bool(has_seed)) {
    return false;
  }
  account.address = std::move(keyed.pubkey);
  account.account = std::move(keyed.account);
  if (has_seed) {
    SeedAddress seed;
    if (!reader.get_key(seed.base) || !reader.get_string(seed.seed) ||
        !reader.get_key(seed.owner)) {
      return false;
    }
    account.seed_addr = std::move(seed);
  }
  return true;
}

void put_fd_accounts(ByteWriter &writer, const std::vector<FdAccount> &accounts) {
  writer.put_u64(accounts.size());
  for (const auto &account : accounts) {
    put_fd_account(writer, account);
  }
}

bool get_fd_accounts(ByteReader &reader, std::vector<FdAccount> &accounts) {
  uint64_t count = 0;
  if (!reader.get_u64(count) || count > reader.remaining()) {
    return false;
  }
  accounts.clear();
  for (uint64_t i = 0; i < count; ++i) {
    FdAccount account;
    if (!get_fd_account(reader, account)) {
      return false;
    }
    accounts.push_back(std::move(account));
  }
  return true;
}

json fd_accounts_to_json(const std::vector<FdAccount> &accounts) {
  json j = json::array();
  for (const auto &account : accounts) {
    json entry =
        codec::account_to_json(svm::KeyedAccount{account.address, account.account});
    if (account.seed_addr) {
      entry["seed_addr"] = {{"base", codec::key_to_json(account.seed_addr->base)},
                            {"seed", account.seed_addr->seed},
                            {"owner", codec::key_to_json(account.seed_addr->owner)}};
    }
    j.push_back(std::move(entry));
  }
  return j;
}

std::vector<FdAccount> fd_accounts_from_json(const json &value) {
  std::vector<FdAccount> accounts;
  for (const auto &entry : value) {
    svm::KeyedAccount keyed = codec::account_from_json(entry);
    FdAccount account{std::move(keyed.pubkey), std::move(keyed.account),
                      std::nullopt};
    if (entry.contains("seed_addr")) {
      const json &seed = entry.at("seed_addr");
      account.seed_addr = SeedAddress{codec::key_from_json(seed.at("base")),
                                      seed.at("seed").get<std::string>(),
                                      codec::key_from_json(seed.at("owner"))};
    }
    accounts.push_back(std::move(account));
  }
  return accounts;
}

} // namespace

bool Context::operator==(const Context &other) const {
  return program_id == other.program_id && accounts == other.accounts &&
         instr_accounts == other.instr_accounts && data == other.data &&
         cu_avail == other.cu_avail && slot == other.slot &&
         features == other.features;
}

bool Effects::operator==(const Effects &other) const {
  return result == other.result && custom_err == other.custom_err &&
         modified_accounts == other.modified_accounts &&
         cu_avail == other.cu_avail && return_data == other.return_data;
}

// ============================================================================
// Binary codec
// ============================================================================

std::vector<uint8_t> Fixture::encode() const {
  ByteWriter writer;
  codec::write_header(writer, codec::Layout::FIREDANCER);

  writer.put_string(metadata.fn_entrypoint);

  writer.put_key(input.program_id);
  put_fd_accounts(writer, input.accounts);
  writer.put_u64(input.instr_accounts.size());
  for (const auto &instr_account : input.instr_accounts) {
    writer.put_u32(instr_account.index);
    writer.put_bool(instr_account.is_writable);
    writer.put_bool(instr_account.is_signer);
  }
  writer.put_bytes(input.data);
  writer.put_u64(input.cu_avail);
  writer.put_u64(input.slot);
  writer.put_u64(input.features.size());
  for (uint64_t feature : input.features) {
    writer.put_u64(feature);
  }

  writer.put_i32(output.result);
  writer.put_u64(output.custom_err);
  put_fd_accounts(writer, output.modified_accounts);
  writer.put_u64(output.cu_avail);
  writer.put_bytes(output.return_data);

  return writer.take();
}

Result<Fixture> Fixture::decode(const std::vector<uint8_t> &blob) {
  ByteReader reader(blob);
  auto header = codec::read_header(reader, codec::Layout::FIREDANCER);
  if (header.is_err()) {
    return Result<Fixture>(header.error());
  }

  Fixture fixture;
  Context &in = fixture.input;
  Effects &out = fixture.output;

  uint64_t count = 0;
  bool ok = reader.get_string(fixture.metadata.fn_entrypoint) &&
            reader.get_key(in.program_id) && get_fd_accounts(reader, in.accounts) &&
            reader.get_u64(count) && count <= reader.remaining();
  for (uint64_t i = 0; ok && i < count; ++i) {
    InstrAccount instr_account;
    ok = reader.get_u32(instr_account.index) &&
         reader.get_bool(instr_account.is_writable) &&
         reader.get_bool(instr_account.is_signer);
    in.instr_accounts.push_back(instr_account);
  }

  ok = ok && reader.get_bytes(in.data) && reader.get_u64(in.cu_avail) &&
       reader.get_u64(in.slot) && reader.get_u64(count) &&
       count <= reader.remaining();
  for (uint64_t i = 0; ok && i < count; ++i) {
    uint64_t feature = 0;
    ok = reader.get_u64(feature);
    in.features.push_back(feature);
  }

  ok = ok && reader.get_i32(out.result) && reader.get_u64(out.custom_err) &&
       get_fd_accounts(reader, out.modified_accounts) &&
       reader.get_u64(out.cu_avail) && reader.get_bytes(out.return_data);

  if (!ok) {
    return Result<Fixture>("truncated or malformed fixture blob");
  }
  if (reader.remaining() != 0) {
    return Result<Fixture>("trailing bytes after fixture");
  }
  for (const auto &instr_account : in.instr_accounts) {
    if (instr_account.index >= in.accounts.size()) {
      return Result<Fixture>("instruction account index " +
                             std::to_string(instr_account.index) +
                             " out of range");
    }
  }
  return Result<Fixture>(std::move(fixture));
}

// ============================================================================
// JSON codec
// ============================================================================

std::string Fixture::to_json() const {
  json j;
  j["metadata"] = {{"fn_entrypoint", metadata.fn_entrypoint}};

  json &in = j["input"];
  in["program_id"] = codec::key_to_json(input.program_id);
  in["accounts"] = fd_accounts_to_json(input.accounts);
  in["instr_accounts"] = json::array();
  for (const auto &instr_account : input.instr_accounts) {
    in["instr_accounts"].push_back({{"index", instr_account.index},
                                    {"is_writable", instr_account.is_writable},
                                    {"is_signer", instr_account.is_signer}});
  }
  in["data"] = codec::bytes_to_json(input.data);
  in["cu_avail"] = input.cu_avail;
  in["slot_context"] = {{"slot", input.slot}};
  in["epoch_context"] = {{"features", input.features}};

  json &out = j["output"];
  out["result"] = output.result;
  out["custom_err"] = output.custom_err;
  out["modified_accounts"] = fd_accounts_to_json(output.modified_accounts);
  out["cu_avail"] = output.cu_avail;
  out["return_data"] = codec::bytes_to_json(output.return_data);

  return j.dump(2);
}

Result<Fixture> Fixture::from_json(const std::string &json_str) {
  try {
    json j = json::parse(json_str);
    Fixture fixture;

    if (j.contains("metadata")) {
      fixture.metadata.fn_entrypoint =
          j.at("metadata").value("fn_entrypoint", std::string(INSTR_ENTRYPOINT));
    }

    const json &in = j.at("input");
    fixture.input.program_id = codec::key_from_json(in.at("program_id"));
    fixture.input.accounts = fd_accounts_from_json(in.at("accounts"));
    for (const auto &entry : in.at("instr_accounts")) {
      InstrAccount instr_account;
      instr_account.index = entry.at("index").get<uint32_t>();
      instr_account.is_writable = entry.value("is_writable", false);
      instr_account.is_signer = entry.value("is_signer", false);
      if (instr_account.index >= fixture.input.accounts.size()) {
        return Result<Fixture>("instruction account index " +
                               std::to_string(instr_account.index) +
                               " out of range");
      }
      fixture.input.instr_accounts.push_back(instr_account);
    }
    fixture.input.data = codec::bytes_from_json(in.at("data"));
    fixture.input.cu_avail = in.at("cu_avail").get<uint64_t>();
    fixture.input.slot = in.at("slot_context").at("slot").get<uint64_t>();
    fixture.input.features =
        in.at("epoch_context").at("features").get<std::vector<uint64_t>>();

    const json &out = j.at("output");
    fixture.output.result = out.at("result").get<int32_t>();
    fixture.output.custom_err = out.value("custom_err", uint64_t{0});
    fixture.output.modified_accounts =
        fd_accounts_from_json(out.at("modified_accounts"));
    fixture.output.cu_avail = out.at("cu_avail").get<uint64_t>();
    fixture.output.return_data = codec::bytes_from_json(out.at("return_data"));

    return Result<Fixture>(std::move(fixture));
  } catch (const json::exception &e) {
    return Result<Fixture>(std::string("JSON parsing error: ") + e.what());
  } catch (const std::invalid_argument &e) {
    return Result<Fixture>(std::string("Invalid fixture field: ") + e.what());
  }
}

} // namespace firedancer
} // namespace fixture
} // namespace periwinkle
