#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "aspect/repository.hpp"
#include "examples/catalog.pb.h"
#include "test_services.hpp"

using namespace aspect;
using examples::Product;

// =============================================================================
// InMemoryRepository Tests
// =============================================================================

class InMemoryRepositoryTest : public ::testing::Test {
protected:
    Product make_product(const std::string& id, const std::string& name, int64_t price_cents = 100) {
        Product product;
        product.set_id(id);
        product.set_name(name);
        product.set_price_cents(price_cents);
        return product;
    }

    InMemoryRepository<Product> repository_;
};

TEST_F(InMemoryRepositoryTest, Add_ShouldStoreAndReturnEntity) {
    // When a product is added
    auto stored = repository_.add(make_product("p-1", "Lamp")).get();

    // Then it can be read back by id
    EXPECT_EQ(stored.id(), "p-1");
    auto found = repository_.get_by_id("p-1").get();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name(), "Lamp");
    EXPECT_EQ(repository_.size(), 1u);
}

TEST_F(InMemoryRepositoryTest, Add_EmptyId_ShouldGenerateId) {
    auto stored = repository_.add(make_product("", "Chair")).get();

    EXPECT_EQ(stored.id().size(), 36u);
    EXPECT_TRUE(repository_.get_by_id(stored.id()).get().has_value());
}

TEST_F(InMemoryRepositoryTest, Add_ExistingId_ShouldFailWithDuplicate) {
    repository_.add(make_product("p-1", "Lamp")).get();

    auto outcome = repository_.add(make_product("p-1", "Other"));

    EXPECT_EQ(outcome.settlement(), Settlement::Failed);
    EXPECT_THROW(outcome.get(), DuplicateEntityError);
}

TEST_F(InMemoryRepositoryTest, Update_ShouldReplaceEntity) {
    repository_.add(make_product("p-1", "Lamp")).get();

    auto updated = repository_.update(make_product("p-1", "Lamp v2", 250)).get();

    EXPECT_EQ(updated.name(), "Lamp v2");
    EXPECT_EQ(repository_.get_by_id("p-1").get()->price_cents(), 250);
}

TEST_F(InMemoryRepositoryTest, UpdateOrRemove_Missing_ShouldFailWithNotFound) {
    EXPECT_THROW(repository_.update(make_product("missing", "x")).get(), EntityNotFoundError);
    EXPECT_THROW(repository_.remove("missing").get(), EntityNotFoundError);
}

TEST_F(InMemoryRepositoryTest, Remove_ShouldDeleteEntity) {
    repository_.add(make_product("p-1", "Lamp")).get();

    repository_.remove("p-1").get();

    EXPECT_FALSE(repository_.get_by_id("p-1").get().has_value());
    EXPECT_TRUE(repository_.get_all().get().empty());
}

TEST_F(InMemoryRepositoryTest, GetAll_ShouldReturnEveryEntity) {
    repository_.add(make_product("a", "A")).get();
    repository_.add(make_product("b", "B")).get();

    auto all = repository_.get_all().get();

    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id(), "a");
    EXPECT_EQ(all[1].id(), "b");
}

TEST_F(InMemoryRepositoryTest, CancelledToken_ShouldSettleCancelledWithoutChange) {
    CancellationSource source;
    source.cancel();

    auto outcome = repository_.add(make_product("p-1", "Lamp"), source.token());

    EXPECT_EQ(outcome.settlement(), Settlement::Cancelled);
    EXPECT_EQ(repository_.size(), 0u);
}

// =============================================================================
// RepositoryProxy Tests
// =============================================================================

TEST(RepositoryProxyTest, Proxy_ShouldForwardEveryOperation) {
    // Given a repository proxy with a recording interceptor
    auto journal = std::make_shared<fixtures::Journal>();
    auto operations = std::make_shared<std::vector<std::string>>();
    auto capture = std::make_shared<FunctionInterceptor>("capture");
    capture->on_before([operations](MethodCallContext& ctx) { operations->push_back(ctx.method().name); });
    auto target = std::make_shared<InMemoryRepository<Product>>();
    auto repository = make_proxy<Repository<Product>>(target, std::vector<InterceptorRegistration>{
        fixtures::register_all({capture})});

    // When every operation is called through the proxy
    Product product;
    product.set_id("p-1");
    product.set_name("Lamp");
    repository->add(product).get();
    product.set_name("Lamp v2");
    repository->update(product).get();
    EXPECT_EQ(repository->get_by_id("p-1").get()->name(), "Lamp v2");
    EXPECT_EQ(repository->get_all().get().size(), 1u);
    repository->remove("p-1").get();

    // Then each reached the target through the chain
    std::vector<std::string> expected = {"add", "update", "get_by_id", "get_all", "remove"};
    EXPECT_EQ(*operations, expected);
    EXPECT_EQ(target->size(), 0u);
}

TEST(RepositoryProxyTest, Service_ShouldNameEntityType) {
    auto target = std::make_shared<InMemoryRepository<Product>>();
    RepositoryProxy<Product> proxy(target, std::make_shared<const ChainExecutor>());

    EXPECT_EQ(proxy.service(), "Repository<Product>");
}
