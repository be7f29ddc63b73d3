// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for incremental synchronization against a ledger source

#include <catch2/catch_test_macros.hpp>
#include "infra/test_ledgers.hpp"
#include "ledger/memory_ledger.hpp"
#include "wallet/wallet.hpp"

using namespace lightwallet;
using namespace lightwallet::chain;
using namespace lightwallet::ledger;
using namespace lightwallet::test;
using namespace lightwallet::wallet;

TEST_CASE("Fresh wallet sits at genesis", "[sync]") {
    Wallet wallet({Address::Alice()});

    REQUIRE(wallet.BestHeight() == 0);
    REQUIRE(wallet.BestHash() == GenesisBlockId());
    REQUIRE(wallet.NetWorth() == 0);
    REQUIRE(wallet.UndoDepth() == 0);

    MemoryLedger ledger;
    SyncResult result = wallet.Sync(ledger);
    REQUIRE(result.blocks_connected == 0);
    REQUIRE(result.blocks_disconnected == 0);
    REQUIRE_FALSE(result.halted);
    REQUIRE(wallet.BestHash() == GenesisBlockId());
}

TEST_CASE("Minted coin shows up after sync", "[sync]") {
    MemoryLedger ledger;
    Transaction mint = MintTx(Coin(100, Address::Alice()));
    BlockId b1 = ledger.AddBlockAsBest(GenesisBlockId(), {mint});

    Wallet wallet({Address::Alice(), Address::Bob()});
    SyncResult result = wallet.Sync(ledger);

    REQUIRE(result.blocks_connected == 1);
    REQUIRE(result.final_height == 1);
    REQUIRE(wallet.BestHeight() == 1);
    REQUIRE(wallet.BestHash() == b1);
    REQUIRE(wallet.TotalAssetsOf(Address::Alice()).Value() == 100);
    REQUIRE(wallet.TotalAssetsOf(Address::Bob()).Value() == 0);
    REQUIRE(wallet.NetWorth() == 100);

    CoinId coin_id = mint.GetCoinId(1, 0);
    auto details = wallet.CoinDetails(coin_id);
    REQUIRE(details.IsOk());
    REQUIRE(details.Value() == Coin(100, Address::Alice()));

    auto coins = wallet.AllCoinsOf(Address::Alice());
    REQUIRE(coins.IsOk());
    REQUIRE(coins.Value() == CoinValueSet{{coin_id, 100}});
}

TEST_CASE("Outputs to untracked owners are ignored", "[sync]") {
    MemoryLedger ledger;
    ledger.AddBlockAsBest(GenesisBlockId(),
                          {MintTx({Coin(10, Address::Alice()),
                                   Coin(20, Address::Charlie()),
                                   Coin(30, Address::Bob())})});

    Wallet wallet({Address::Alice(), Address::Bob()});
    wallet.Sync(ledger);

    REQUIRE(wallet.NetWorth() == 40);
    REQUIRE(wallet.Utxos().Size() == 2);
    REQUIRE(wallet.TotalAssetsOf(Address::Charlie()).Is(WalletError::FOREIGN_ADDRESS));
    REQUIRE(wallet.AllCoinsOf(Address::Charlie()).Is(WalletError::FOREIGN_ADDRESS));
}

TEST_CASE("Spending an untracked or unknown coin is not an error", "[sync]") {
    MemoryLedger ledger;
    Transaction spend = SpendTx({CoinId(uint256S("abcdef"))}, Address::Eve(),
                                {Coin(5, Address::Alice())});
    ledger.AddBlockAsBest(GenesisBlockId(), {spend});

    Wallet wallet({Address::Alice()});
    SyncResult result = wallet.Sync(ledger);
    REQUIRE_FALSE(result.halted);
    REQUIRE(wallet.TotalAssetsOf(Address::Alice()).Value() == 5);
}

TEST_CASE("Coins created and spent in the same block", "[sync]") {
    MemoryLedger ledger;

    Transaction mint = MintTx(Coin(50, Address::Alice()));
    CoinId intermediate = mint.GetCoinId(1, 0);
    Transaction spend = SpendTx({intermediate}, Address::Alice(),
                                {Coin(50, Address::Bob())});
    CoinId final_coin = spend.GetCoinId(1, 0);

    BlockId b1 = ledger.AddBlockAsBest(GenesisBlockId(), {mint, spend});

    Wallet wallet({Address::Alice(), Address::Bob()});
    wallet.Sync(ledger);

    REQUIRE(wallet.CoinDetails(intermediate).Is(WalletError::UNKNOWN_COIN));
    REQUIRE(wallet.CoinDetails(final_coin).Value() == Coin(50, Address::Bob()));
    REQUIRE(wallet.TotalAssetsOf(Address::Alice()).Value() == 0);
    REQUIRE(wallet.TotalAssetsOf(Address::Bob()).Value() == 50);

    SECTION("Undoing the block leaves nothing behind") {
        BlockId other = ledger.AddBlock(GenesisBlockId(), {MarkerTx(1)});
        ledger.SetBest(other);

        SyncResult result = wallet.Sync(ledger);
        REQUIRE(result.blocks_disconnected == 1);
        REQUIRE(result.blocks_connected == 1);
        REQUIRE(wallet.BestHash() == other);
        REQUIRE(wallet.NetWorth() == 0);
        REQUIRE(wallet.Utxos().Empty());
        REQUIRE(MatchesFreshReplay(wallet, ledger));

        // And back again
        ledger.SetBest(b1);
        wallet.Sync(ledger);
        REQUIRE(wallet.TotalAssetsOf(Address::Bob()).Value() == 50);
        REQUIRE(MatchesFreshReplay(wallet, ledger));
    }
}

TEST_CASE("Spends across blocks are undone on reorg", "[sync]") {
    MemoryLedger ledger;

    Transaction mint = MintTx(Coin(100, Address::Alice()));
    CoinId alice_coin = mint.GetCoinId(1, 0);
    BlockId b1 = ledger.AddBlockAsBest(GenesisBlockId(), {mint});

    Transaction pay = SpendTx({alice_coin}, Address::Alice(),
                              {Coin(60, Address::Bob()), Coin(40, Address::Alice())});
    ledger.AddBlockAsBest(b1, {pay});

    Wallet wallet({Address::Alice(), Address::Bob()});
    wallet.Sync(ledger);
    REQUIRE(wallet.TotalAssetsOf(Address::Alice()).Value() == 40);
    REQUIRE(wallet.TotalAssetsOf(Address::Bob()).Value() == 60);
    REQUIRE(wallet.CoinDetails(alice_coin).Is(WalletError::UNKNOWN_COIN));

    // Competing block 2 without the payment
    BlockId b2_alt = ledger.AddBlockAsBest(b1, {MarkerTx(2)});
    SyncResult result = wallet.Sync(ledger);

    REQUIRE(result.blocks_disconnected == 1);
    REQUIRE(result.blocks_connected == 1);
    REQUIRE(wallet.BestHash() == b2_alt);
    REQUIRE(wallet.TotalAssetsOf(Address::Alice()).Value() == 100);
    REQUIRE(wallet.TotalAssetsOf(Address::Bob()).Value() == 0);
    REQUIRE(wallet.CoinDetails(alice_coin).Value() == Coin(100, Address::Alice()));
}

TEST_CASE("Repeated sync without ledger change is a no-op", "[sync]") {
    QueryCounter counter;
    MemoryLedger ledger(&counter);
    BlockId b1 = ledger.AddBlockAsBest(GenesisBlockId(), {MintTx(Coin(7, Address::Alice()))});
    ExtendChain(ledger, b1, 3, 10);

    Wallet wallet({Address::Alice()});
    wallet.Sync(ledger);
    const uint64_t height = wallet.BestHeight();
    const BlockId hash = wallet.BestHash();
    const uint64_t worth = wallet.NetWorth();

    counter.Reset();
    SyncResult result = wallet.Sync(ledger);

    REQUIRE(result.blocks_connected == 0);
    REQUIRE(result.blocks_disconnected == 0);
    REQUIRE_FALSE(result.rescanned);
    REQUIRE(wallet.BestHeight() == height);
    REQUIRE(wallet.BestHash() == hash);
    REQUIRE(wallet.NetWorth() == worth);
    // One check of the tip, one probe above it
    REQUIRE(counter.best_block_queries == 2);
    REQUIRE(counter.whole_block_queries == 0);
}

TEST_CASE("Growth costs queries proportional to new blocks only", "[sync]") {
    QueryCounter counter;
    MemoryLedger ledger(&counter);

    const int initial = 20;
    BlockId tip = ExtendChain(ledger, GenesisBlockId(), initial, 0);

    Wallet wallet({Address::Alice()});
    wallet.Sync(ledger);
    REQUIRE(wallet.BestHeight() == initial);

    for (int m : {1, 5, 13}) {
        tip = ExtendChain(ledger, tip, m, 1000 * static_cast<uint64_t>(m));
        counter.Reset();

        SyncResult result = wallet.Sync(ledger);
        REQUIRE(result.blocks_connected == static_cast<uint64_t>(m));
        REQUIRE(counter.whole_block_queries == static_cast<uint64_t>(m));
        REQUIRE(counter.Total() == 2 * static_cast<uint64_t>(m) + 2);
        REQUIRE(wallet.BestHash() == tip);
    }
}

TEST_CASE("Unavailable block halts the pass but keeps progress", "[sync]") {
    MemoryLedger ledger;
    BlockId b1 = ledger.AddBlockAsBest(GenesisBlockId(), {MintTx(Coin(1, Address::Alice()))});
    BlockId b2 = ledger.AddBlockAsBest(b1, {MintTx(Coin(2, Address::Alice()))});
    BlockId b3 = ledger.AddBlockAsBest(b2, {MintTx(Coin(4, Address::Alice()))});
    BlockId b4 = ledger.AddBlockAsBest(b3, {MintTx(Coin(8, Address::Alice()))});

    FlakyLedger flaky(ledger);
    flaky.MakeUnavailable(b3);

    Wallet wallet({Address::Alice()});
    SyncResult result = wallet.Sync(flaky);

    REQUIRE(result.halted);
    REQUIRE(result.blocks_connected == 2);
    REQUIRE(wallet.BestHeight() == 2);
    REQUIRE(wallet.BestHash() == b2);
    REQUIRE(wallet.NetWorth() == 3);

    // Still unavailable: nothing changes, nothing breaks
    result = wallet.Sync(flaky);
    REQUIRE(result.halted);
    REQUIRE(wallet.BestHash() == b2);

    flaky.MakeAllAvailable();
    result = wallet.Sync(flaky);
    REQUIRE_FALSE(result.halted);
    REQUIRE(result.blocks_connected == 2);
    REQUIRE(wallet.BestHash() == b4);
    REQUIRE(wallet.NetWorth() == 15);
    REQUIRE(MatchesFreshReplay(wallet, ledger));
}

TEST_CASE("Ledger reorganizing between queries never leaves mixed state", "[sync]") {
    MemoryLedger ledger;

    // Chain A: a1 a2 a3 a4, minting to Alice
    BlockId a1 = ledger.AddBlockAsBest(GenesisBlockId(), {MintTx(Coin(1, Address::Alice()))});
    BlockId a2 = ledger.AddBlockAsBest(a1, {MintTx(Coin(2, Address::Alice()))});
    BlockId a3 = ledger.AddBlockAsBest(a2, {MintTx(Coin(4, Address::Alice()))});
    ledger.AddBlockAsBest(a3, {MintTx(Coin(8, Address::Alice()))});

    // Chain B forks after a1: b2 b3 b4 b5, minting to Bob
    BlockId b2 = ledger.AddBlock(a1, {MintTx(Coin(16, Address::Bob()))});
    BlockId b3 = ledger.AddBlock(b2, {MintTx(Coin(32, Address::Bob()))});
    BlockId b4 = ledger.AddBlock(b3, {MintTx(Coin(64, Address::Bob()))});
    BlockId b5 = ledger.AddBlock(b4, {MintTx(Coin(128, Address::Bob()))});

    // Switch to B right after the wallet fetched a2
    ShiftingLedger shifting(ledger, 2, b5);

    Wallet wallet({Address::Alice(), Address::Bob()});
    SyncResult result = wallet.Sync(shifting);

    REQUIRE(shifting.Shifted());
    REQUIRE_FALSE(result.halted);
    REQUIRE(result.blocks_disconnected == 1);
    REQUIRE(wallet.BestHeight() == 5);
    REQUIRE(wallet.BestHash() == b5);
    REQUIRE(wallet.TotalAssetsOf(Address::Alice()).Value() == 1);
    REQUIRE(wallet.TotalAssetsOf(Address::Bob()).Value() == 16 + 32 + 64 + 128);
    REQUIRE(MatchesFreshReplay(wallet, ledger));
}

namespace {

// Reports a canonical block at height 2 that does not extend height 1
class DisjointLedger : public LedgerSource {
public:
    DisjointLedger(const MemoryLedger& inner, BlockId h1, BlockId h2)
        : inner_(inner), h1_(h1), h2_(h2) {}

    std::optional<BlockId> BestBlockAtHeight(uint64_t height) const override {
        if (height == 0) return GenesisBlockId();
        if (height == 1) return h1_;
        if (height == 2) return h2_;
        return std::nullopt;
    }

    std::optional<Block> WholeBlock(const BlockId& id) const override {
        return inner_.WholeBlock(id);
    }

private:
    const MemoryLedger& inner_;
    BlockId h1_;
    BlockId h2_;
};

} // namespace

TEST_CASE("Ledger that never settles halts after bounded rounds", "[sync]") {
    MemoryLedger ledger;
    BlockId a1 = ledger.AddBlock(GenesisBlockId(), {MarkerTx(1)});
    BlockId x1 = ledger.AddBlock(GenesisBlockId(), {MarkerTx(2)});
    BlockId x2 = ledger.AddBlock(x1, {MarkerTx(3)});

    DisjointLedger disjoint(ledger, a1, x2);

    WalletConfig config;
    config.max_reconcile_rounds = 3;
    Wallet wallet({Address::Alice()}, config);

    SyncResult result = wallet.Sync(disjoint);
    REQUIRE(result.halted);
    REQUIRE(wallet.BestHeight() == 1);
    REQUIRE(wallet.BestHash() == a1);
}

TEST_CASE("Pruned undo log falls back to rescan", "[sync]") {
    MemoryLedger ledger;
    BlockId a1 = ledger.AddBlockAsBest(GenesisBlockId(), {MintTx(Coin(5, Address::Alice()))});
    ExtendChain(ledger, a1, 5, 100);

    WalletConfig config;
    config.max_undo_depth = 2;
    Wallet wallet({Address::Alice()}, config);
    wallet.Sync(ledger);
    REQUIRE(wallet.BestHeight() == 6);
    REQUIRE(wallet.UndoDepth() == 2);

    SECTION("Shallow reorg still uses the undo log") {
        BlockId fork_parent = *ledger.BestBlockAtHeight(5);
        BlockId alt = ledger.AddBlockAsBest(fork_parent, {MintTx(Coin(9, Address::Alice()))});

        SyncResult result = wallet.Sync(ledger);
        REQUIRE_FALSE(result.rescanned);
        REQUIRE(result.blocks_disconnected == 1);
        REQUIRE(wallet.BestHash() == alt);
        REQUIRE(wallet.NetWorth() == 14);
        REQUIRE(MatchesFreshReplay(wallet, ledger));
    }

    SECTION("Reorg below the retained records rescans from genesis") {
        BlockId alt = ExtendChain(ledger, GenesisBlockId(), 4, 500);

        SyncResult result = wallet.Sync(ledger);
        REQUIRE(result.rescanned);
        REQUIRE(wallet.BestHash() == alt);
        REQUIRE(wallet.BestHeight() == 4);
        REQUIRE(wallet.NetWorth() == 0);
        REQUIRE(MatchesFreshReplay(wallet, ledger));
    }
}

TEST_CASE("Full rescan policy replays from genesis on any mismatch", "[sync]") {
    MemoryLedger ledger;
    BlockId a1 = ledger.AddBlockAsBest(GenesisBlockId(), {MintTx(Coin(5, Address::Alice()))});
    BlockId a2 = ledger.AddBlockAsBest(a1, {MintTx(Coin(6, Address::Alice()))});

    WalletConfig config;
    config.rollback_policy = RollbackPolicy::FULL_RESCAN;
    Wallet wallet({Address::Alice()}, config);
    wallet.Sync(ledger);
    REQUIRE(wallet.NetWorth() == 11);

    SECTION("No mismatch, no rescan") {
        ledger.AddBlockAsBest(a2, {MarkerTx(1)});
        SyncResult result = wallet.Sync(ledger);
        REQUIRE_FALSE(result.rescanned);
        REQUIRE(result.blocks_connected == 1);
    }

    SECTION("Mismatch rescans") {
        BlockId alt = ledger.AddBlockAsBest(a1, {MintTx(Coin(7, Address::Alice()))});
        SyncResult result = wallet.Sync(ledger);
        REQUIRE(result.rescanned);
        REQUIRE(result.blocks_disconnected == 0);
        REQUIRE(result.blocks_connected == 2);
        REQUIRE(wallet.BestHash() == alt);
        REQUIRE(wallet.NetWorth() == 12);
        REQUIRE(MatchesFreshReplay(wallet, ledger));
    }
}
