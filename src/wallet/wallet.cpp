// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/wallet.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace lightwallet {
namespace wallet {

namespace {

constexpr int SNAPSHOT_VERSION = 1;

using json = nlohmann::json;

json CoinEntryToJson(const chain::CoinId &id, const chain::Coin &coin) {
  json entry;
  entry["id"] = id.GetHex();
  entry["value"] = coin.value;
  entry["owner"] = coin.owner.ToString();
  return entry;
}

// Parse {"id", "value", "owner"}; nullopt (logged) if malformed or owned by an
// address the wallet does not track
std::optional<std::pair<chain::CoinId, chain::Coin>>
CoinEntryFromJson(const json &entry, const std::set<chain::Address> &tracked) {
  if (!entry.is_object() || !entry.contains("id") ||
      !entry.contains("value") || !entry.contains("owner") ||
      !entry["id"].is_string() || !entry["value"].is_number_unsigned() ||
      !entry["owner"].is_string()) {
    LOG_WALLET_ERROR("Snapshot coin entry malformed: {}", entry.dump());
    return std::nullopt;
  }

  auto id = uint256::FromHex(entry["id"].get<std::string>());
  if (!id) {
    LOG_WALLET_ERROR("Snapshot coin id is not a 256-bit hex string: {}",
                     entry["id"].get<std::string>());
    return std::nullopt;
  }

  auto owner = chain::Address::FromString(entry["owner"].get<std::string>());
  if (!owner) {
    LOG_WALLET_ERROR("Snapshot coin owner unparseable: {}",
                     entry["owner"].get<std::string>());
    return std::nullopt;
  }
  if (tracked.count(*owner) == 0) {
    LOG_WALLET_ERROR("Snapshot coin {} owned by untracked address {}",
                     id->ToString().substr(0, 16), owner->ToString());
    return std::nullopt;
  }

  return std::make_pair(chain::CoinId(uint256(*id)),
                        chain::Coin(entry["value"].get<uint64_t>(), *owner));
}

std::optional<chain::BlockId> BlockIdFromJson(const json &value) {
  if (!value.is_string()) {
    return std::nullopt;
  }
  auto id = uint256::FromHex(value.get<std::string>());
  if (!id) {
    return std::nullopt;
  }
  return chain::BlockId(uint256(*id));
}

bool CoinListFromJson(const json &list, const std::set<chain::Address> &tracked,
                      std::vector<std::pair<chain::CoinId, chain::Coin>> &out) {
  if (!list.is_array()) {
    LOG_WALLET_ERROR("Snapshot coin list is not an array");
    return false;
  }
  for (const auto &entry : list) {
    auto parsed = CoinEntryFromJson(entry, tracked);
    if (!parsed) {
      return false;
    }
    out.push_back(std::move(*parsed));
  }
  return true;
}

} // namespace

Wallet::Wallet(const std::vector<chain::Address> &addresses,
               WalletConfig config)
    : config_(config), addresses_(addresses.begin(), addresses.end()),
      synchronizer_(addresses_, config_, notifications_),
      builder_(state_.utxos, addresses_) {
  state_.undo.SetMaxDepth(config_.max_undo_depth);
  LOG_WALLET_DEBUG("Wallet created tracking {} addresses", addresses_.size());
}

WalletResult<uint64_t>
Wallet::TotalAssetsOf(const chain::Address &address) const {
  if (!Tracks(address)) {
    return WalletError::FOREIGN_ADDRESS;
  }
  return state_.utxos.SumOwnedBy(address);
}

WalletResult<CoinValueSet>
Wallet::AllCoinsOf(const chain::Address &address) const {
  if (!Tracks(address)) {
    return WalletError::FOREIGN_ADDRESS;
  }
  return state_.utxos.ValuesOwnedBy(address);
}

uint64_t Wallet::NetWorth() const {
  // The store only ever holds coins of tracked addresses
  return state_.utxos.TotalValue();
}

WalletResult<chain::Coin> Wallet::CoinDetails(const chain::CoinId &id) const {
  std::optional<chain::Coin> coin = state_.utxos.Get(id);
  if (!coin) {
    return WalletError::UNKNOWN_COIN;
  }
  return *coin;
}

WalletResult<chain::Transaction>
Wallet::CreateManualTransaction(const std::vector<chain::CoinId> &input_ids,
                                const std::vector<chain::Coin> &outputs) const {
  return builder_.CreateManual(input_ids, outputs);
}

WalletResult<chain::Transaction>
Wallet::CreateAutomaticTransaction(const chain::Address &recipient,
                                   uint64_t payment, uint64_t tip) const {
  return builder_.CreateAutomatic(recipient, payment, tip);
}

SyncResult Wallet::Sync(const ledger::LedgerSource &ledger) {
  return synchronizer_.Sync(ledger, state_);
}

bool Wallet::Save(const std::string &filepath) const {
  try {
    LOG_WALLET_TRACE("Saving wallet snapshot ({} coins, {} undo records) to {}",
                     state_.utxos.Size(), state_.undo.Size(), filepath);

    json root;
    root["version"] = SNAPSHOT_VERSION;
    root["height"] = state_.cursor.height;
    root["block_id"] = state_.cursor.block_id.GetHex();

    json coins = json::array();
    for (const auto &[id, coin] : state_.utxos) {
      coins.push_back(CoinEntryToJson(id, coin));
    }
    root["coins"] = coins;

    json undo = json::array();
    for (const auto &record : state_.undo) {
      json record_data;
      record_data["height"] = record.height;
      record_data["block_id"] = record.block_id.GetHex();
      record_data["parent_id"] = record.parent_id.GetHex();

      json inserted = json::array();
      for (const auto &[id, coin] : record.inserted) {
        inserted.push_back(CoinEntryToJson(id, coin));
      }
      record_data["inserted"] = inserted;

      json removed = json::array();
      for (const auto &[id, coin] : record.removed) {
        removed.push_back(CoinEntryToJson(id, coin));
      }
      record_data["removed"] = removed;

      undo.push_back(record_data);
    }
    root["undo"] = undo;

    if (!util::atomic_write_file(filepath, root.dump(2))) {
      LOG_WALLET_ERROR("Failed to write wallet snapshot: {}", filepath);
      return false;
    }

    LOG_WALLET_DEBUG("Saved wallet snapshot at height {} to {}",
                     state_.cursor.height, filepath);
    return true;

  } catch (const std::exception &e) {
    LOG_WALLET_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

bool Wallet::Load(const std::string &filepath) {
  try {
    std::optional<std::string> contents = util::read_file_string(filepath);
    if (!contents) {
      LOG_WALLET_DEBUG("Wallet snapshot not readable: {}", filepath);
      return false;
    }

    json root = json::parse(*contents, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded() || !root.is_object()) {
      LOG_WALLET_ERROR("Wallet snapshot is not valid JSON: {}", filepath);
      return false;
    }

    int version = root.value("version", 0);
    if (version != SNAPSHOT_VERSION) {
      LOG_WALLET_ERROR("Unsupported wallet snapshot version: {}", version);
      return false;
    }

    for (const char *field : {"height", "block_id", "coins", "undo"}) {
      if (!root.contains(field)) {
        LOG_WALLET_ERROR("Wallet snapshot missing required field '{}'", field);
        return false;
      }
    }
    if (!root["height"].is_number_unsigned() || !root["undo"].is_array()) {
      LOG_WALLET_ERROR("Wallet snapshot has malformed 'height' or 'undo'");
      return false;
    }

    // Build into a fresh state; only swap in once everything checks out
    WalletState loaded;
    loaded.undo.SetMaxDepth(config_.max_undo_depth);

    auto tip = BlockIdFromJson(root["block_id"]);
    if (!tip) {
      LOG_WALLET_ERROR("Wallet snapshot has malformed 'block_id'");
      return false;
    }
    loaded.cursor = ChainCursor{root["height"].get<uint64_t>(), *tip};
    if (loaded.cursor.height == 0 &&
        loaded.cursor.block_id != chain::GenesisBlockId()) {
      LOG_WALLET_ERROR("Wallet snapshot cursor at height 0 is not genesis");
      return false;
    }

    std::vector<std::pair<chain::CoinId, chain::Coin>> coins;
    if (!CoinListFromJson(root["coins"], addresses_, coins)) {
      return false;
    }
    for (const auto &[id, coin] : coins) {
      loaded.utxos.Insert(id, coin);
    }

    for (const auto &record_data : root["undo"]) {
      if (!record_data.is_object() || !record_data.contains("height") ||
          !record_data["height"].is_number_unsigned() ||
          !record_data.contains("block_id") ||
          !record_data.contains("parent_id") ||
          !record_data.contains("inserted") ||
          !record_data.contains("removed")) {
        LOG_WALLET_ERROR("Wallet snapshot undo record malformed");
        return false;
      }

      BlockUndo record;
      record.height = record_data["height"].get<uint64_t>();
      auto block_id = BlockIdFromJson(record_data["block_id"]);
      auto parent_id = BlockIdFromJson(record_data["parent_id"]);
      if (!block_id || !parent_id || record.height == 0) {
        LOG_WALLET_ERROR("Wallet snapshot undo record malformed");
        return false;
      }
      record.block_id = *block_id;
      record.parent_id = *parent_id;

      if (!CoinListFromJson(record_data["inserted"], addresses_,
                            record.inserted) ||
          !CoinListFromJson(record_data["removed"], addresses_,
                            record.removed)) {
        return false;
      }

      const BlockUndo *previous = loaded.undo.Back();
      if (previous && (record.height != previous->height + 1 ||
                       record.parent_id != previous->block_id)) {
        LOG_WALLET_ERROR("Wallet snapshot undo records are not a chain at "
                         "height {}",
                         record.height);
        return false;
      }
      loaded.undo.Push(std::move(record));
    }

    const BlockUndo *newest = loaded.undo.Back();
    if (newest && (newest->height != loaded.cursor.height ||
                   newest->block_id != loaded.cursor.block_id)) {
      LOG_WALLET_ERROR("Wallet snapshot undo log does not end at the cursor");
      return false;
    }

    state_ = std::move(loaded);

    LOG_WALLET_DEBUG("Loaded wallet snapshot at height {} ({} coins, {} undo "
                     "records) from {}",
                     state_.cursor.height, state_.utxos.Size(),
                     state_.undo.Size(), filepath);
    return true;

  } catch (const std::exception &e) {
    LOG_WALLET_ERROR("Exception during Load: {}", e.what());
    return false;
  }
}

} // namespace wallet
} // namespace lightwallet
