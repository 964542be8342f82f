#include "errors.hpp"
#include "wallet_registry.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace {

Wallet make_wallet(const std::string& address, Chain chain, const std::string& label) {
    Wallet wallet;
    wallet.address = address;
    wallet.chain = chain;
    wallet.label = label;
    return wallet;
}

} // namespace

TEST(WalletRegistryTest, AddAndLookupIgnoresCase) {
    InMemoryWalletRegistry registry;
    auto added = registry.add_wallet(make_wallet("0xABCdef", Chain::Ethereum, "Whale"));

    EXPECT_GT(added.added_at, 0);
    EXPECT_TRUE(registry.is_tracked(Chain::Ethereum, "0xabcdef"));
    EXPECT_TRUE(registry.is_tracked(Chain::Ethereum, "0xABCDEF"));
    EXPECT_FALSE(registry.is_tracked(Chain::Base, "0xabcdef"));

    auto found = registry.get_wallet(Chain::Ethereum, "0xabcDEF");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->label, std::optional<std::string>("Whale"));
}

TEST(WalletRegistryTest, SameAddressOnTwoChains) {
    InMemoryWalletRegistry registry;
    registry.add_wallet(make_wallet("0xabc", Chain::Ethereum, "L1"));
    registry.add_wallet(make_wallet("0xABC", Chain::Base, "L2"));
    registry.add_wallet(make_wallet("0xAbC", Chain::Ethereum, "L1 renamed"));

    EXPECT_EQ(registry.size(), 2u);
    auto eth = registry.get_wallets(Chain::Ethereum);
    ASSERT_EQ(eth.size(), 1u);
    EXPECT_EQ(eth[0].label, std::optional<std::string>("L1 renamed"));
    EXPECT_EQ(registry.get_addresses(Chain::Base), (std::vector<std::string>{"0xabc"}));
    EXPECT_EQ(registry.get_all_wallets().size(), 2u);
}

TEST(WalletRegistryTest, RemoveWallet) {
    InMemoryWalletRegistry registry;
    registry.add_wallet(make_wallet("0xabc", Chain::Ethereum, "Gone"));

    EXPECT_TRUE(registry.remove_wallet(Chain::Ethereum, "0xABC"));
    EXPECT_FALSE(registry.remove_wallet(Chain::Ethereum, "0xabc"));
    EXPECT_FALSE(registry.get_wallet(Chain::Ethereum, "0xabc").has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(WalletRegistryTest, SeedsDefaultEthereumWallets) {
    InMemoryWalletRegistry registry;
    registry.seed_default_wallets();

    EXPECT_EQ(registry.get_wallets(Chain::Ethereum).size(), 5u);
    EXPECT_TRUE(registry.get_wallets(Chain::Base).empty());
    EXPECT_TRUE(registry.is_tracked(Chain::Ethereum, "0xd8da6bf26964af9d7eed9e03e53415d37aa96045"));
}

class WalletFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("whale_wallets_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                  "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json")).string();
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    std::string path_;
};

TEST_F(WalletFileTest, LoadsEntries) {
    write(R"([
        {"address": "0xAAA", "chain": "ethereum", "label": "One", "tags": ["fund"], "source": "manual"},
        {"address": "0xBBB", "chain": "base"},
        {"address": "0xCCC"}
    ])");

    InMemoryWalletRegistry registry;
    EXPECT_EQ(registry.load_from_file(path_), 3u);
    EXPECT_EQ(registry.get_wallets(Chain::Ethereum).size(), 2u);

    auto one = registry.get_wallet(Chain::Ethereum, "0xaaa");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->tags, (std::vector<std::string>{"fund"}));
    EXPECT_EQ(one->source, std::optional<std::string>("manual"));
    EXPECT_FALSE(registry.get_wallet(Chain::Base, "0xbbb")->label.has_value());
}

TEST_F(WalletFileTest, RejectsBadFiles) {
    InMemoryWalletRegistry registry;

    EXPECT_THROW(registry.load_from_file(path_ + ".missing"), ConfigurationError);

    write("{not json");
    EXPECT_THROW(registry.load_from_file(path_), ConfigurationError);

    write(R"({"address": "0xAAA"})");
    EXPECT_THROW(registry.load_from_file(path_), ConfigurationError);

    write(R"([{"label": "no address"}])");
    EXPECT_THROW(registry.load_from_file(path_), ConfigurationError);

    write(R"([{"address": "0xAAA", "chain": "dogechain"}])");
    EXPECT_THROW(registry.load_from_file(path_), ConfigurationError);
}
