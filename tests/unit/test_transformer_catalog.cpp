/**
 * @file test_transformer_catalog.cpp
 * @brief Unit tests for TransformerCatalog
 */

#include <framework/mapr_test.hpp>

#include <memory>
#include <thread>
#include <vector>

using namespace mapr::test;

class TransformerCatalogTest : public ::testing::Test {
protected:
    TransformerCatalog catalog_;
    TypePairKey user_key_  = TypePairKey::of<User, UserDto>();
    TypePairKey order_key_ = TypePairKey::of<Order, OrderDto>();
};

TEST_F(TransformerCatalogTest, EmptyCatalogProvidesNothing) {
    EXPECT_EQ(catalog_.size(), 0u);
    EXPECT_FALSE(catalog_.contains(user_key_));
    EXPECT_EQ(catalog_.provide(user_key_), nullptr);
    EXPECT_EQ(catalog_.stats().misses.load(), 1u);
}

TEST_F(TransformerCatalogTest, FirstAddWins) {
    EXPECT_TRUE(catalog_.add(registration_for<UserToDto>()));
    EXPECT_FALSE(catalog_.add(registration_for<UserToDtoUpperCase>()));

    EXPECT_EQ(catalog_.size(), 1u);
    EXPECT_EQ(catalog_.implementation_name(user_key_), std::optional<std::string>("UserToDto"));

    auto instance = catalog_.provide(user_key_);
    ASSERT_NE(instance, nullptr);
    EXPECT_EQ(instance->name(), "UserToDto");
}

TEST_F(TransformerCatalogTest, AddAllCountsAdded) {
    auto batch = discover<UserToDto, OrderToDto, UserToDtoUpperCase>();
    EXPECT_EQ(catalog_.add_all(batch), 2u);
    EXPECT_TRUE(catalog_.contains(user_key_));
    EXPECT_TRUE(catalog_.contains(order_key_));
}

TEST_F(TransformerCatalogTest, SingletonReturnsSameInstance) {
    catalog_.add(registration_for<UserToDto>());

    auto a = catalog_.provide(user_key_);
    auto b = catalog_.provide(user_key_);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(catalog_.stats().instances_created.load(), 1u);
    EXPECT_EQ(catalog_.stats().provides.load(), 2u);
}

TEST_F(TransformerCatalogTest, TransientReturnsNewInstances) {
    catalog_.add(registration_for<UserToDto>(), ServiceLifetime::TRANSIENT);

    auto a = catalog_.provide(user_key_);
    auto b = catalog_.provide(user_key_);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a, b);
    EXPECT_EQ(catalog_.stats().instances_created.load(), 2u);
}

TEST_F(TransformerCatalogTest, FactoryReturningNullProvidesNothing) {
    TransformerRegistration registration{user_key_, "Broken",
                                         [] { return std::shared_ptr<const ITransformer>(); }};
    catalog_.add(std::move(registration));

    EXPECT_EQ(catalog_.provide(user_key_), nullptr);
    EXPECT_EQ(catalog_.stats().instances_created.load(), 0u);
}

TEST_F(TransformerCatalogTest, RemoveAndClear) {
    catalog_.add(registration_for<UserToDto>());
    catalog_.add(registration_for<OrderToDto>());

    EXPECT_TRUE(catalog_.remove(user_key_));
    EXPECT_FALSE(catalog_.remove(user_key_));
    EXPECT_EQ(catalog_.provide(user_key_), nullptr);
    EXPECT_FALSE(catalog_.implementation_name(user_key_).has_value());

    catalog_.clear();
    EXPECT_EQ(catalog_.size(), 0u);
}

TEST_F(TransformerCatalogTest, ConcurrentSingletonProvide) {
    catalog_.add(registration_for<UserToDto>());

    constexpr int NUM_THREADS = 8;
    std::vector<std::shared_ptr<const ITransformer>> results(NUM_THREADS);
    std::vector<std::thread> threads;
    StartGate gate;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&, i] {
            gate.wait();
            results[i] = catalog_.provide(user_key_);
        });
    }
    gate.open();
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& result : results) {
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result, results.front());
    }
}
