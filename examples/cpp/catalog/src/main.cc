#include "pricing.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace aspect;
using aspect::history::DefaultUserContextAccessor;
using aspect::history::HistoryInterceptor;
using aspect::history::InMemoryHistoryRecorder;
using aspect::interceptors::LoggingInterceptor;

int main() {
    auto options = InterceptionOptions::from_env();
    options.apply();

    auto recorder = std::make_shared<InMemoryHistoryRecorder<examples::Product>>();
    auto history = std::make_shared<HistoryInterceptor<examples::Product>>(
        recorder, std::make_shared<DefaultUserContextAccessor>(options.default_actor));
    auto logging = std::make_shared<LoggingInterceptor>(0, "catalog");

    auto products = InterceptorBuilder<Repository<examples::Product>>()
        .with_options(options)
        .add_interceptor(logging)
        .create_group()
            .add_interceptor(history)
            .with_method_filter(filters::any_of({"add", "update", "remove"}))
        .end_group()
        .build(std::make_shared<InMemoryRepository<examples::Product>>());

    examples::Product lamp;
    lamp.set_sku("LAMP-01");
    lamp.set_name("Desk lamp");
    lamp.set_price_cents(4999);

    try {
        auto created = products->add(lamp).get();
        log_info("catalog", "product_created", {{"id", created.id()}, {"name", created.name()}});

        created.set_price_cents(3999);
        products->update(created).get();
        products->remove(created.id()).get();

        for (const auto& entry : recorder->get_all(created.id())) {
            log_info("catalog", "history_entry",
                     {{"action", HistoryAction_Name(entry.record.action())},
                      {"actor", entry.record.actor()},
                      {"price_cents", entry.snapshot.price_cents()}});
        }
    } catch (const std::exception& e) {
        log_error("catalog", "catalog_demo_failed", {{"error", e.what()}});
        return 1;
    }

    InterceptorRegistration pricing;
    pricing.add_interceptor(catalog::make_volume_discount(10, 15))
           .with_method_filter(filters::named("quote"));
    auto calculator = make_proxy<catalog::PriceCalculator>(
        std::make_shared<catalog::ListPriceCalculator>(),
        std::vector<InterceptorRegistration>{pricing}, options);

    for (int32_t quantity : {1, 10}) {
        log_info("catalog", "price_quoted",
                 {{"quantity", quantity},
                  {"total_cents", calculator->quote(lamp, quantity)},
                  {"currency", calculator->currency()}});
    }

    return 0;
}
