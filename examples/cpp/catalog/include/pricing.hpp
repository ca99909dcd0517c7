#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "aspect/aspect.hpp"
#include "examples/catalog.pb.h"

namespace catalog {

/**
 * Quotes order line prices. Every operation completes immediately.
 */
class PriceCalculator {
public:
    virtual ~PriceCalculator() = default;

    virtual int64_t quote(const examples::Product& product, int32_t quantity) = 0;

    virtual std::string currency() const = 0;
};

/**
 * Quotes the list price: price_cents * quantity.
 */
class ListPriceCalculator : public PriceCalculator {
public:
    int64_t quote(const examples::Product& product, int32_t quantity) override;

    std::string currency() const override { return "USD"; }
};

class PriceCalculatorProxy : public aspect::Proxy<PriceCalculator> {
public:
    ASPECT_PROXY(PriceCalculatorProxy, catalog::PriceCalculator)

    int64_t quote(const examples::Product& product, int32_t quantity) override {
        return ASPECT_FORWARD(quote)(product, quantity);
    }

    std::string currency() const override {
        return ASPECT_FORWARD(currency)();
    }
};

/**
 * Applies a percentage discount to quotes of at least min_quantity units.
 */
std::shared_ptr<aspect::Interceptor> make_volume_discount(int32_t min_quantity, int32_t percent);

}  // namespace catalog

ASPECT_DECLARE_PROXY(catalog::PriceCalculator, catalog::PriceCalculatorProxy)
