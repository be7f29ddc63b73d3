// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for manual and automatic transaction building

#include <catch2/catch_test_macros.hpp>
#include "infra/test_ledgers.hpp"
#include "ledger/memory_ledger.hpp"
#include "wallet/tx_builder.hpp"
#include "wallet/wallet.hpp"
#include <limits>

using namespace lightwallet;
using namespace lightwallet::chain;
using namespace lightwallet::ledger;
using namespace lightwallet::test;
using namespace lightwallet::wallet;

namespace {

CoinId Id(uint8_t n) { return CoinId(uint256(n)); }

uint64_t OutputTotal(const Transaction& tx) {
    uint64_t total = 0;
    for (const auto& out : tx.outputs) {
        total += out.value;
    }
    return total;
}

} // namespace

TEST_CASE("Manual transaction errors", "[txbuilder]") {
    UtxoStore store;
    store.Insert(Id(1), Coin(10, Address::Alice()));
    std::set<Address> tracked{Address::Alice()};
    TransactionBuilder builder(store, tracked);

    SECTION("No inputs") {
        auto result = builder.CreateManual({}, {Coin(10, Address::Bob())});
        REQUIRE(result.Is(WalletError::ZERO_INPUTS));
    }

    SECTION("Unknown coin") {
        auto result = builder.CreateManual({Id(2)}, {});
        REQUIRE(result.Is(WalletError::UNKNOWN_COIN));
    }

    SECTION("Unknown coin among known ones") {
        auto result = builder.CreateManual({Id(1), Id(2)}, {Coin(5, Address::Bob())});
        REQUIRE(result.Is(WalletError::UNKNOWN_COIN));
    }

    SECTION("Zero-value output") {
        auto result = builder.CreateManual({Id(1)}, {Coin(5, Address::Bob()), Coin(0, Address::Bob())});
        REQUIRE(result.Is(WalletError::ZERO_COIN_VALUE));
    }

    SECTION("Inputs are checked before outputs") {
        auto result = builder.CreateManual({Id(9)}, {Coin(0, Address::Bob())});
        REQUIRE(result.Is(WalletError::UNKNOWN_COIN));
    }
}

TEST_CASE("Manual transaction contents", "[txbuilder]") {
    UtxoStore store;
    store.Insert(Id(1), Coin(10, Address::Alice()));
    store.Insert(Id(2), Coin(15, Address::Bob()));
    std::set<Address> tracked{Address::Alice(), Address::Bob()};
    TransactionBuilder builder(store, tracked);

    auto result = builder.CreateManual({Id(2), Id(1)},
                                       {Coin(20, Address::Charlie()), Coin(3, Address::Dave())});
    REQUIRE(result.IsOk());
    const Transaction& tx = result.Value();

    REQUIRE(tx.inputs.size() == 2);
    REQUIRE(tx.inputs[0].coin_id == Id(2));
    REQUIRE(tx.inputs[0].signature == Signature::ValidBy(Address::Bob()));
    REQUIRE(tx.inputs[1].coin_id == Id(1));
    REQUIRE(tx.inputs[1].signature == Signature::ValidBy(Address::Alice()));

    REQUIRE(tx.outputs == std::vector<Coin>{Coin(20, Address::Charlie()), Coin(3, Address::Dave())});

    // Building never touches the store
    REQUIRE(store.Size() == 2);
}

TEST_CASE("Automatic transaction errors", "[txbuilder]") {
    UtxoStore store;
    store.Insert(Id(1), Coin(10, Address::Alice()));
    store.Insert(Id(2), Coin(20, Address::Alice()));
    std::set<Address> tracked{Address::Alice()};
    TransactionBuilder builder(store, tracked);

    SECTION("Zero payment") {
        REQUIRE(builder.CreateAutomatic(Address::Bob(), 0, 0).Is(WalletError::ZERO_COIN_VALUE));
        REQUIRE(builder.CreateAutomatic(Address::Bob(), 0, 5).Is(WalletError::ZERO_COIN_VALUE));
    }

    SECTION("Overspend") {
        REQUIRE(builder.CreateAutomatic(Address::Bob(), 31, 0).Is(WalletError::INSUFFICIENT_FUNDS));
        REQUIRE(builder.CreateAutomatic(Address::Bob(), 25, 6).Is(WalletError::INSUFFICIENT_FUNDS));
    }

    SECTION("Payment plus tip overflowing is insufficient funds") {
        const uint64_t max = std::numeric_limits<uint64_t>::max();
        REQUIRE(builder.CreateAutomatic(Address::Bob(), max, 1).Is(WalletError::INSUFFICIENT_FUNDS));
    }

    SECTION("Empty store") {
        UtxoStore empty;
        TransactionBuilder poor(empty, tracked);
        REQUIRE(poor.CreateAutomatic(Address::Bob(), 1, 0).Is(WalletError::INSUFFICIENT_FUNDS));
    }
}

TEST_CASE("Automatic transaction selection and change", "[txbuilder]") {
    UtxoStore store;
    store.Insert(Id(3), Coin(30, Address::Bob()));
    store.Insert(Id(1), Coin(10, Address::Bob()));
    store.Insert(Id(2), Coin(20, Address::Alice()));
    std::set<Address> tracked{Address::Bob(), Address::Alice()};
    TransactionBuilder builder(store, tracked);

    SECTION("Exact amount: no change output") {
        auto result = builder.CreateAutomatic(Address::Charlie(), 25, 5);
        REQUIRE(result.IsOk());
        const Transaction& tx = result.Value();
        REQUIRE(tx.inputs.size() == 2);
        REQUIRE(tx.inputs[0].coin_id == Id(1));
        REQUIRE(tx.inputs[1].coin_id == Id(2));
        REQUIRE(tx.outputs == std::vector<Coin>{Coin(25, Address::Charlie())});
    }

    SECTION("Surplus goes back to the smallest tracked address") {
        auto result = builder.CreateAutomatic(Address::Charlie(), 12, 3);
        REQUIRE(result.IsOk());
        const Transaction& tx = result.Value();
        REQUIRE(tx.inputs.size() == 2);
        REQUIRE(tx.outputs.size() == 2);
        REQUIRE(tx.outputs[0] == Coin(12, Address::Charlie()));
        REQUIRE(tx.outputs[1] == Coin(15, Address::Alice()));
        // Tip is the implicit difference
        REQUIRE(30 - OutputTotal(tx) == 3);
    }

    SECTION("Inputs are signed by their owners") {
        auto result = builder.CreateAutomatic(Address::Charlie(), 60, 0);
        REQUIRE(result.IsOk());
        const Transaction& tx = result.Value();
        REQUIRE(tx.inputs.size() == 3);
        REQUIRE(tx.inputs[0].signature == Signature::ValidBy(Address::Bob()));
        REQUIRE(tx.inputs[1].signature == Signature::ValidBy(Address::Alice()));
        REQUIRE(tx.inputs[2].signature == Signature::ValidBy(Address::Bob()));
        REQUIRE(tx.outputs.size() == 1);
    }
}

TEST_CASE("Change is exact when selected coins exceed 64 bits", "[txbuilder]") {
    const uint64_t half = uint64_t{1} << 63;
    UtxoStore store;
    store.Insert(Id(1), Coin(half, Address::Alice()));
    store.Insert(Id(2), Coin(half, Address::Alice()));
    std::set<Address> tracked{Address::Alice()};
    TransactionBuilder builder(store, tracked);

    // 2^64 selected, 2^63 + 1 required
    auto result = builder.CreateAutomatic(Address::Bob(), half, 1);
    REQUIRE(result.IsOk());
    const Transaction& tx = result.Value();
    REQUIRE(tx.inputs.size() == 2);
    REQUIRE(tx.outputs.size() == 2);
    REQUIRE(tx.outputs[0] == Coin(half, Address::Bob()));
    REQUIRE(tx.outputs[1] == Coin(half - 1, Address::Alice()));
}

TEST_CASE("Change with no tracked address", "[txbuilder]") {
    // A store can only hold coins of tracked addresses when filled by a
    // wallet, but the builder guards the change owner on its own
    UtxoStore store;
    store.Insert(Id(1), Coin(10, Address::Alice()));
    std::set<Address> none;
    TransactionBuilder builder(store, none);

    REQUIRE(builder.CreateAutomatic(Address::Bob(), 4, 0).Is(WalletError::NO_OWNED_ADDRESSES));
    REQUIRE(builder.CreateAutomatic(Address::Bob(), 10, 0).IsOk());
}

TEST_CASE("Built transaction is accepted back into the wallet", "[txbuilder]") {
    MemoryLedger ledger;
    BlockId b1 = ledger.AddBlockAsBest(GenesisBlockId(), {MintTx(Coin(100, Address::Alice()))});

    Wallet wallet({Address::Alice(), Address::Bob()});
    wallet.Sync(ledger);

    auto tx = wallet.CreateAutomaticTransaction(Address::Charlie(), 30, 10);
    REQUIRE(tx.IsOk());
    REQUIRE(wallet.NetWorth() == 100);

    ledger.AddBlockAsBest(b1, {tx.Value()});
    wallet.Sync(ledger);

    REQUIRE(wallet.NetWorth() == 60);
    REQUIRE(wallet.TotalAssetsOf(Address::Alice()).Value() == 60);
    REQUIRE(wallet.TotalAssetsOf(Address::Bob()).Value() == 0);
}
