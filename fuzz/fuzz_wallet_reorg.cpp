// Copyright (c) 2025 The Unicity Foundation
// Fuzz target for wallet synchronization across reorganizations
//
// Drives a MemoryLedger through fuzzer-chosen block additions, forks and
// best-block switches, syncing a wallet incrementally in between. After every
// sync the wallet must equal a fresh wallet replaying the canonical chain:
// - Undo log rollback (including same-block create/spend)
// - Pruned undo log falling back to rescan
// - Full rescan policy

#include "chain/address.hpp"
#include "chain/transaction.hpp"
#include "ledger/memory_ledger.hpp"
#include "wallet/wallet.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

using namespace lightwallet;
using namespace lightwallet::chain;
using namespace lightwallet::ledger;
using namespace lightwallet::wallet;

// Fuzz input parser
class FuzzInput {
public:
    FuzzInput(const uint8_t* data, size_t size)
        : data_(data), size_(size), offset_(0) {}

    uint8_t ReadByte() {
        if (offset_ >= size_) return 0;
        return data_[offset_++];
    }

    bool ReadBool() {
        return (ReadByte() & 1) != 0;
    }

    size_t Remaining() const {
        return (offset_ < size_) ? (size_ - offset_) : 0;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

namespace {

const Address kAddresses[] = {Address::Alice(), Address::Bob(), Address::Charlie()};

// Build a body of up to 3 transactions minting or spending from `pool`.
// Spends may reference coins on other branches or already spent ones.
std::vector<Transaction> BuildFuzzBody(FuzzInput& input,
                                       const std::vector<CoinId>& pool,
                                       uint64_t marker) {
    std::vector<Transaction> body;

    // Keeps sibling blocks with identical fuzzed content distinct
    Transaction tag;
    tag.inputs.push_back(Input::Dummy());
    tag.outputs.emplace_back(1, Address::Custom(marker));
    body.push_back(tag);

    uint8_t tx_count = input.ReadByte() % 4;
    for (uint8_t i = 0; i < tx_count; ++i) {
        Transaction tx;
        if (!pool.empty() && input.ReadBool()) {
            const CoinId& spent = pool[input.ReadByte() % pool.size()];
            tx.inputs.emplace_back(spent, Signature::Invalid());
        } else {
            tx.inputs.push_back(Input::Dummy());
        }
        uint8_t output_count = 1 + input.ReadByte() % 2;
        for (uint8_t o = 0; o < output_count; ++o) {
            const Address& owner = kAddresses[input.ReadByte() % 3];
            tx.outputs.emplace_back(1 + input.ReadByte(), owner);
        }
        body.push_back(tx);
    }
    return body;
}

void RecordOutputs(const std::vector<Transaction>& body, uint64_t height,
                   std::vector<CoinId>& pool) {
    for (const auto& tx : body) {
        for (uint64_t i = 0; i < tx.outputs.size(); ++i) {
            pool.push_back(tx.GetCoinId(height, i));
        }
    }
}

// Crash (so the fuzzer keeps the input) if the wallet drifted from replay
void CheckAgainstReplay(const Wallet& wallet, const MemoryLedger& ledger) {
    Wallet fresh({Address::Alice(), Address::Bob()});
    fresh.Sync(ledger);
    if (fresh.BestHash() != wallet.BestHash() ||
        fresh.BestHeight() != wallet.BestHeight() ||
        !(fresh.Utxos() == wallet.Utxos())) {
        std::abort();
    }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 4) return 0;

    FuzzInput input(data, size);

    WalletConfig config;
    config.rollback_policy = input.ReadBool() ? RollbackPolicy::FULL_RESCAN
                                              : RollbackPolicy::UNDO_LOG;
    config.max_undo_depth = input.ReadByte() % 8; // 0 = unlimited
    config.suspicious_rollback_depth = 1 + input.ReadByte() % 16;

    MemoryLedger ledger;
    Wallet wallet({Address::Alice(), Address::Bob()}, config);

    std::vector<BlockId> known{GenesisBlockId()};
    std::vector<CoinId> pool;
    uint64_t marker = 0;

    while (input.Remaining() >= 4) {
        uint8_t action = input.ReadByte() % 4;

        switch (action) {
        case 0: { // Extend the canonical chain
            auto body = BuildFuzzBody(input, pool, ++marker);
            uint64_t height = ledger.GetBestHeight() + 1;
            RecordOutputs(body, height, pool);
            known.push_back(ledger.AddBlockAsBest(ledger.GetBestId(), std::move(body)));
            break;
        }

        case 1: { // Fork off any known block and make it best
            const BlockId& parent = known[input.ReadByte() % known.size()];
            auto parent_block = ledger.WholeBlock(parent);
            if (!parent_block) break;
            auto body = BuildFuzzBody(input, pool, ++marker);
            RecordOutputs(body, parent_block->number + 1, pool);
            known.push_back(ledger.AddBlockAsBest(parent, std::move(body)));
            break;
        }

        case 2: { // Switch best to any known block (possibly shorter)
            ledger.SetBest(known[input.ReadByte() % known.size()]);
            break;
        }

        case 3: { // Sync and compare
            wallet.Sync(ledger);
            CheckAgainstReplay(wallet, ledger);
            break;
        }
        }
    }

    wallet.Sync(ledger);
    CheckAgainstReplay(wallet, ledger);
    return 0;
}
