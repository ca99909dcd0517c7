#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "aspect/proxy.hpp"
#include "test_services.hpp"

using namespace aspect;
using fixtures::Journal;
using fixtures::RecordingInterceptor;

// =============================================================================
// Proxy Construction Tests
// =============================================================================

TEST(ProxyConstructionTest, NullTarget_ShouldThrowInvalidArgument) {
    std::shared_ptr<fixtures::Calculator> missing;
    EXPECT_THROW(make_proxy<fixtures::Calculator>(missing, std::vector<InterceptorRegistration>{}),
                 InvalidArgumentError);
}

TEST(ProxyConstructionTest, NullExecutor_ShouldThrowInvalidArgument) {
    auto target = std::make_shared<fixtures::SimpleCalculator>();
    std::shared_ptr<const ChainExecutor> missing;
    EXPECT_THROW(make_proxy<fixtures::Calculator>(target, missing), InvalidArgumentError);
}

TEST(ProxyConstructionTest, Proxy_ShouldExposeBinding) {
    auto target = std::make_shared<fixtures::SimpleCalculator>();
    auto executor = std::make_shared<const ChainExecutor>();

    fixtures::CalculatorProxy proxy(target, executor);

    EXPECT_EQ(proxy.target(), target);
    EXPECT_EQ(proxy.executor(), executor);
    EXPECT_EQ(proxy.service(), "fixtures::Calculator");
}

// =============================================================================
// Immediate Operation Tests
// =============================================================================

class ImmediateProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        journal_ = std::make_shared<Journal>();
        target_ = std::make_shared<fixtures::SimpleCalculator>();
    }

    std::shared_ptr<fixtures::Calculator> proxy_with(std::vector<InterceptorRegistration> registrations) {
        return make_proxy<fixtures::Calculator>(target_, std::move(registrations));
    }

    std::shared_ptr<Journal> journal_;
    std::shared_ptr<fixtures::SimpleCalculator> target_;
};

TEST_F(ImmediateProxyTest, NoInterceptors_ShouldBehaveLikeTarget) {
    // Given a proxy without interceptors
    auto proxy = proxy_with({});

    // Then results and exceptions match the target's
    EXPECT_EQ(proxy->add(2, 3), 5);
    EXPECT_EQ(proxy->label(), "simple");
    EXPECT_EQ(proxy->echo("hi"), "hi");
    EXPECT_THROW(proxy->divide(1, 0), std::domain_error);
    proxy->reset();
    EXPECT_EQ(target_->resets.load(), 1);
    EXPECT_EQ(target_->calls.load(), 3);
}

TEST_F(ImmediateProxyTest, HookSequence_ShouldWrapEachCall) {
    auto proxy = proxy_with({fixtures::register_all({
        std::make_shared<RecordingInterceptor>("B", 2, journal_),
        std::make_shared<RecordingInterceptor>("A", 1, journal_)})});

    EXPECT_EQ(proxy->add(2, 3), 5);

    std::vector<std::string> expected = {"A.Before", "B.Before", "B.After", "A.After"};
    EXPECT_EQ(journal_->entries(), expected);
    EXPECT_EQ(target_->calls.load(), 1);
}

TEST_F(ImmediateProxyTest, Descriptor_ShouldDescribeOperation) {
    // Given an interceptor that captures the descriptor
    MethodDescriptor seen;
    auto capture = std::make_shared<FunctionInterceptor>("capture");
    capture->on_before([&](MethodCallContext& ctx) { seen = ctx.method(); });
    auto proxy = proxy_with({fixtures::register_all({capture})});

    // When an operation is called
    proxy->divide(8, 2);

    // Then the descriptor names the interface, the operation and its arity
    EXPECT_EQ(seen.service, "fixtures::Calculator");
    EXPECT_EQ(seen.name, "divide");
    EXPECT_EQ(seen.arity, 2u);
    EXPECT_FALSE(seen.is_suspending());
}

TEST_F(ImmediateProxyTest, BeforeHook_ShouldChangeArgumentsSeenByTarget) {
    auto rewrite = std::make_shared<FunctionInterceptor>("rewrite");
    rewrite->on_before([](MethodCallContext& ctx) {
        ctx.set_argument(0, ctx.argument<std::string>(0) + "!");
    });
    auto proxy = proxy_with({fixtures::register_all({rewrite})});

    EXPECT_EQ(proxy->echo("hello"), "hello!");
}

TEST_F(ImmediateProxyTest, BeforeHook_WrongArgumentType_ShouldFailAtHook) {
    // Given a Before hook that stores a string literal where a std::string belongs
    auto rewrite = std::make_shared<FunctionInterceptor>("rewrite", 0);
    rewrite->on_before([](MethodCallContext& ctx) { ctx.set_argument(0, "rewritten"); });
    auto proxy = proxy_with({fixtures::register_all({
        rewrite, std::make_shared<RecordingInterceptor>("A", 1, journal_)})});

    // When the call runs, then the hook's write is rejected before the real call
    EXPECT_THROW(proxy->echo("hello"), InvalidArgumentError);

    // And later Before hooks never ran
    std::vector<std::string> expected = {"A.OnException"};
    EXPECT_EQ(journal_->entries(), expected);
}

TEST_F(ImmediateProxyTest, ConcurrentCalls_ShouldUseSeparateContexts) {
    // Given an interceptor that stashes the first argument in the call's items
    // and returns it from the transform
    auto stash = std::make_shared<FunctionInterceptor>("stash");
    stash->on_before([](MethodCallContext& ctx) { ctx.set_item("caller", ctx.argument<int>(0)); })
          .on_transform([](MethodCallContext& ctx, std::any previous) {
              const int* caller = ctx.item<int>("caller");
              if (!caller || ctx.items().size() != 1) return std::any(-1);
              return std::any(*caller);
          });
    auto proxy = proxy_with({fixtures::register_all({stash})});
    std::atomic<int> mismatches{0};

    // When several threads call the same proxy at once
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int k = 0; k < 500; ++k) {
                int value = t * 1000 + k;
                if (proxy->add(value, 1) != value) ++mismatches;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Then every call reached the target and none observed another call's items
    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(target_->calls.load(), 4000);
}

TEST_F(ImmediateProxyTest, Failure_ShouldSurfaceTargetException) {
    auto proxy = proxy_with({fixtures::register_all({
        std::make_shared<RecordingInterceptor>("A", 1, journal_)})});

    try {
        proxy->divide(1, 0);
        FAIL() << "expected std::domain_error";
    } catch (const std::domain_error& e) {
        EXPECT_STREQ(e.what(), "division by zero");
    }

    std::vector<std::string> expected = {"A.Before", "A.OnException"};
    EXPECT_EQ(journal_->entries(), expected);
}

TEST_F(ImmediateProxyTest, TransformResult_ShouldChangeReturnedValue) {
    auto prefix = std::make_shared<FunctionInterceptor>("prefix");
    prefix->on_transform([](MethodCallContext&, std::any previous) {
        return std::any("proxied:" + std::any_cast<std::string>(previous));
    });
    auto proxy = proxy_with({fixtures::register_all({prefix})});

    EXPECT_EQ(proxy->label(), "proxied:simple");
}

TEST_F(ImmediateProxyTest, MethodFilter_ShouldLimitInterceptedOperations) {
    // Given an interceptor registered for "divide" only
    InterceptorRegistration registration;
    registration.add_interceptor(std::make_shared<RecordingInterceptor>("D", 1, journal_))
                .with_method_filter(filters::named("divide"));
    auto proxy = proxy_with({registration});

    // When other operations are called
    proxy->add(1, 1);
    proxy->reset();
    EXPECT_TRUE(journal_->entries().empty());

    // Then only "divide" is intercepted
    proxy->divide(4, 2);
    std::vector<std::string> expected = {"D.Before", "D.After"};
    EXPECT_EQ(journal_->entries(), expected);
}

// =============================================================================
// Suspending Operation Tests
// =============================================================================

class SuspendingProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        journal_ = std::make_shared<Journal>();
        target_ = std::make_shared<fixtures::ManualInventory>();
        proxy_ = make_proxy<fixtures::Inventory>(target_, std::vector<InterceptorRegistration>{
            fixtures::register_all({std::make_shared<RecordingInterceptor>("A", 1, journal_),
                                    std::make_shared<RecordingInterceptor>("B", 2, journal_)})});
    }

    std::shared_ptr<Journal> journal_;
    std::shared_ptr<fixtures::ManualInventory> target_;
    std::shared_ptr<fixtures::Inventory> proxy_;
};

TEST_F(SuspendingProxyTest, Call_ShouldReturnBeforeOperationSettles) {
    // When a suspending operation is called
    auto outcome = proxy_->reserve("SKU-1", 3, CancellationToken());

    // Then the arguments reached the target and the outcome is pending
    EXPECT_EQ(target_->last_sku, "SKU-1");
    EXPECT_EQ(target_->last_quantity, 3);
    EXPECT_EQ(outcome.settlement(), Settlement::Pending);
    std::vector<std::string> started = {"A.Before", "B.Before"};
    EXPECT_EQ(journal_->entries(), started);

    // When the target settles
    target_->reserve_promise.resolve(3);

    // Then the After phase ran and the caller sees the value
    EXPECT_EQ(outcome.get(), 3);
    std::vector<std::string> finished = {"A.Before", "B.Before", "B.After", "A.After"};
    EXPECT_EQ(journal_->entries(), finished);
}

TEST_F(SuspendingProxyTest, Failure_ShouldSurfaceSameException) {
    auto outcome = proxy_->release("SKU-2", CancellationToken());
    auto original = std::make_exception_ptr(std::runtime_error("not reserved"));

    target_->release_promise.fail(original);

    EXPECT_EQ(outcome.error(), original);
    EXPECT_THROW(outcome.get(), std::runtime_error);
    std::vector<std::string> expected = {"A.Before", "B.Before", "A.OnException", "B.OnException"};
    EXPECT_EQ(journal_->entries(), expected);
}

TEST_F(SuspendingProxyTest, Cancellation_ShouldSurfaceAsCancellation) {
    // Given a pending call with a cancellable token
    CancellationSource source;
    auto outcome = proxy_->reserve("SKU-3", 1, source.token());

    // When the caller cancels
    source.cancel();

    // Then the outcome is cancelled and no After hook ran
    EXPECT_EQ(outcome.settlement(), Settlement::Cancelled);
    EXPECT_THROW(outcome.get(), CancelledError);
    std::vector<std::string> expected = {"A.Before", "B.Before", "A.OnException", "B.OnException"};
    EXPECT_EQ(journal_->entries(), expected);
}

TEST_F(SuspendingProxyTest, Descriptor_ShouldMarkOperationSuspending) {
    MethodDescriptor seen;
    auto capture = std::make_shared<FunctionInterceptor>("capture");
    capture->on_before([&](MethodCallContext& ctx) { seen = ctx.method(); });
    auto proxy = make_proxy<fixtures::Inventory>(target_, std::vector<InterceptorRegistration>{
        fixtures::register_all({capture})});

    proxy->release("SKU-4", CancellationToken());

    EXPECT_EQ(seen.name, "release");
    EXPECT_EQ(seen.arity, 2u);
    EXPECT_TRUE(seen.is_suspending());
}
